/*
 * Task Catalog - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstddef>
#include <initializer_list>

namespace devtask {

// A single external program invocation. Immutable once built.
class Command {
public:
    // Splits text into argv; throws CommandSyntaxError if malformed.
    explicit Command(std::string text);
    const std::string& text() const { return m_text; }
    const std::vector<std::string>& argv() const { return m_argv; }
    const std::string& program() const { return m_argv.front(); }
private:
    std::string m_text;
    std::vector<std::string> m_argv;
};

struct Task {
    std::string name;
    std::vector<Command> commands; // executed in order, fail-fast
};

struct TaskSpec {
    std::string name;
    std::vector<std::string> commands;
};

// Fixed mapping from task name to its command sequence.
// Built once; there is no way to add or remove tasks afterwards.
class Catalog {
public:
    // Throws std::invalid_argument on an empty catalog, an empty task name or a
    // duplicate name, CommandSyntaxError on a malformed command.
    explicit Catalog(std::vector<Task> tasks);
    Catalog(std::initializer_list<TaskSpec> specs);

    const Task* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }
    // First declared task, run when no goal is given.
    const Task& default_task() const { return m_tasks.front(); }
    const std::vector<Task>& tasks() const { return m_tasks; }
    std::vector<std::string> names() const;
    std::size_t size() const { return m_tasks.size(); }
private:
    void index();

    std::vector<Task> m_tasks;                  // declaration order
    std::map<std::string, std::size_t> m_index; // name -> position in m_tasks
};

// fmt, lint and test for a Python tree: black, ruff and pytest.
// Built once by main and passed down by const reference.
Catalog builtin_catalog();

} // namespace devtask
