/*
 * Command runner interface - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <devtask/task/catalog.hpp>

namespace devtask {

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    // Run one command to completion and return its exit status
    // (0 = success, 128+N = killed by signal N, 127 = not found).
    virtual int run(const Command& cmd) = 0;
};

} // namespace devtask
