/*
 * Task Catalog implementation - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devtask/task/catalog.hpp>
#include <devtask/lex/lexer.hpp>
#include <stdexcept>

namespace devtask {

Command::Command(std::string text) : m_text(std::move(text)), m_argv(split_command(m_text)) {}

static std::vector<Task> from_specs(std::initializer_list<TaskSpec> specs) {
    std::vector<Task> tasks;
    tasks.reserve(specs.size());
    for (auto &s : specs) {
        Task t; t.name = s.name;
        for (auto &c : s.commands) t.commands.emplace_back(c);
        tasks.push_back(std::move(t));
    }
    return tasks;
}

Catalog::Catalog(std::vector<Task> tasks) : m_tasks(std::move(tasks)) { index(); }

Catalog::Catalog(std::initializer_list<TaskSpec> specs) : m_tasks(from_specs(specs)) { index(); }

void Catalog::index() {
    if (m_tasks.empty()) throw std::invalid_argument("task catalog is empty");
    for (std::size_t i=0;i<m_tasks.size();++i) {
        const auto &name = m_tasks[i].name;
        if (name.empty()) throw std::invalid_argument("task name must not be empty");
        if (!m_index.emplace(name, i).second) throw std::invalid_argument("duplicate task name: " + name);
    }
}

const Task* Catalog::find(const std::string& name) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) return nullptr;
    return &m_tasks[it->second];
}

std::vector<std::string> Catalog::names() const {
    std::vector<std::string> out; out.reserve(m_tasks.size());
    for (auto &t : m_tasks) out.push_back(t.name);
    return out;
}

Catalog builtin_catalog() {
    return Catalog{
        {"fmt",  {"black .", "ruff check . --fix"}},
        {"lint", {"ruff check ."}},
        {"test", {"pytest -q"}},
    };
}

} // namespace devtask
