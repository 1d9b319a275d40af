/*
 * Command-line front-end - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <devtask/cli/config.hpp>
#include <devtask/exec/runner.hpp>
#include <devtask/task/catalog.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace devtask {

// Parse args (program name excluded), dispatch the goals and map the outcome
// to a process exit status: the failing command's status, 0 on success, 2 for
// an unknown task or a usage error.
int run_cli(const std::vector<std::string>& args, const Catalog& catalog, CommandRunner& runner,
            Config cfg, std::ostream& out, std::ostream& err);

} // namespace devtask
