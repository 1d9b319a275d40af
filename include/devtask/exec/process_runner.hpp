/*
 * POSIX process runner - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <devtask/exec/runner.hpp>
#include <iosfwd>

namespace devtask {

// Forks one child per command. The child inherits cwd, environment and stdio;
// the parent blocks until it exits. While waiting the parent ignores SIGINT and
// SIGQUIT so a terminal interrupt only reaches the child, and forwards SIGTERM
// and SIGHUP to it. The child's resulting status then aborts the task.
class ProcessRunner : public CommandRunner {
public:
    explicit ProcessRunner(std::ostream& err);
    int run(const Command& cmd) override;
private:
    std::ostream& m_err;
};

// Decode a waitpid() status into an exit code.
int decode_wait_status(int st);

} // namespace devtask
