/*
 * Command-line options - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <devtask/cli/config.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace devtask {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    bool dry_run = false;
    bool silent = false;
    bool list = false;
    bool help = false;
    bool no_color = false;
    std::vector<std::string> goals; // task names in the order given
};

// args excludes the program name. Throws UsageError on an unknown option.
CliOptions parse_args(const std::vector<std::string>& args);

// Flags given on the command line win over the rc file.
Config apply_overrides(Config cfg, const CliOptions& opts);

std::string usage_text(const std::string& prog);

} // namespace devtask
