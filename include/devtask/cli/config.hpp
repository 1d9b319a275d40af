/*
 * User configuration (~/.devtaskrc) - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <iosfwd>
#include <string>

namespace devtask {

struct Config {
    bool color = true;         // ANSI colors on status lines
    bool echo_commands = true; // print each command before it runs
};

// key=value lines, '#' comments; unknown keys are ignored.
Config parse_config(std::istream& in, Config base = {});

// Missing or unreadable file leaves the defaults untouched.
Config load_config(const std::string& path);

// $HOME/.devtaskrc, or empty when HOME is unset.
std::string default_config_path();

} // namespace devtask
