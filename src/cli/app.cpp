/*
 * Command-line front-end implementation - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devtask/cli/app.hpp>
#include <devtask/cli/options.hpp>
#include <devtask/dispatch/dispatcher.hpp>
#include <ostream>

namespace devtask {

static const char* kProg = "devtask";

int run_cli(const std::vector<std::string>& args, const Catalog& catalog, CommandRunner& runner,
            Config cfg, std::ostream& out, std::ostream& err) {
    CliOptions opts;
    try {
        opts = parse_args(args);
    } catch (const UsageError& e) {
        err << kProg << ": " << e.what() << '\n' << usage_text(kProg);
        return 2;
    }
    if (opts.help) { out << usage_text(kProg); return 0; }

    cfg = apply_overrides(cfg, opts);
    DispatchOptions dopts;
    dopts.echo = cfg.echo_commands;
    dopts.dry_run = opts.dry_run;
    dopts.color = cfg.color;
    Dispatcher dispatcher(catalog, runner, out, err, dopts);

    if (opts.list) { dispatcher.list(out); return 0; }
    try {
        return dispatcher.run_goals(opts.goals);
    } catch (const TaskNotFound& e) {
        err << kProg << ": " << e.what() << " (known tasks:";
        for (auto &n : catalog.names()) err << ' ' << n;
        err << ")" << std::endl;
        return 2;
    }
}

} // namespace devtask
