/*
 * Command-line options implementation - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devtask/cli/options.hpp>

namespace devtask {

CliOptions parse_args(const std::vector<std::string>& args) {
    CliOptions o;
    bool only_goals = false;
    for (auto &a : args) {
        if (only_goals || a.empty() || a[0] != '-') { o.goals.push_back(a); continue; }
        if (a=="--") only_goals=true;
        else if (a=="-n"||a=="--dry-run") o.dry_run=true;
        else if (a=="-s"||a=="--silent") o.silent=true;
        else if (a=="-l"||a=="--list") o.list=true;
        else if (a=="-h"||a=="--help") o.help=true;
        else if (a=="--no-color") o.no_color=true;
        else throw UsageError("unknown option: " + a);
    }
    return o;
}

Config apply_overrides(Config cfg, const CliOptions& opts) {
    if (opts.silent) cfg.echo_commands = false;
    if (opts.no_color) cfg.color = false;
    return cfg;
}

std::string usage_text(const std::string& prog) {
    return "Usage: " + prog + " [options] [task ...]\n"
           "Runs each task's commands in order, stopping at the first failure.\n"
           "With no task the default task is run.\n"
           "\n"
           "Options:\n"
           "  -n, --dry-run   print the commands without running them\n"
           "  -s, --silent    do not echo commands before running them\n"
           "  -l, --list      list tasks and their commands\n"
           "      --no-color  disable colored output\n"
           "  -h, --help      show this help\n"
           "\n"
           "Configuration: ~/.devtaskrc (color=, echo_commands=)\n";
}

} // namespace devtask
