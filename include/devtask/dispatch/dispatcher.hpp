/*
 * Task Dispatcher - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <devtask/task/catalog.hpp>
#include <devtask/exec/runner.hpp>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace devtask {

class TaskNotFound : public std::runtime_error {
public:
    explicit TaskNotFound(const std::string& name)
        : std::runtime_error("no such task '" + name + "'"), m_name(name) {}
    const std::string& task_name() const { return m_name; }
private:
    std::string m_name;
};

struct DispatchOptions {
    bool echo = true;     // print each command-line before running it
    bool dry_run = false; // print only, run nothing
    bool color = false;
};

class Dispatcher {
public:
    // Echo lines go to log, failure reports to err.
    Dispatcher(const Catalog& catalog, CommandRunner& runner, std::ostream& log, std::ostream& err,
               DispatchOptions opts = {});

    // Run one task: commands in order, stopping at the first non-zero status,
    // which is returned. Throws TaskNotFound before running anything.
    int run(const std::string& task_name);

    // Run several tasks in order; all names are checked first. An empty list
    // runs the default task.
    int run_goals(const std::vector<std::string>& goals);

    // Print tasks and their commands in declaration order.
    void list(std::ostream& out) const;

private:
    int run_task(const Task& task);
    std::string colored(const std::string& s, const char* code) const;

    const Catalog& m_catalog;
    CommandRunner& m_runner;
    std::ostream& m_log;
    std::ostream& m_err;
    DispatchOptions m_opts;
};

} // namespace devtask
