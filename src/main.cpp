/*
 * devtask - run the fmt / lint / test tasks of a source tree
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devtask/cli/app.hpp>
#include <devtask/cli/config.hpp>
#include <devtask/exec/process_runner.hpp>
#include <devtask/lex/lexer.hpp>
#include <devtask/task/catalog.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto cfg = devtask::load_config(devtask::default_config_path());
    if (!isatty(STDOUT_FILENO)) cfg.color = false;

    try {
        const devtask::Catalog catalog = devtask::builtin_catalog();
        devtask::ProcessRunner runner(std::cerr);
        return devtask::run_cli(args, catalog, runner, cfg, std::cout, std::cerr);
    } catch (const devtask::CommandSyntaxError& e) {
        std::cerr << "devtask: invalid task catalog: " << e.what() << std::endl;
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "devtask: invalid task catalog: " << e.what() << std::endl;
        return 2;
    }
}
