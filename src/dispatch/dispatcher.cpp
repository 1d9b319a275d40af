/*
 * Task Dispatcher implementation - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devtask/dispatch/dispatcher.hpp>
#include <ostream>

namespace devtask {

Dispatcher::Dispatcher(const Catalog& catalog, CommandRunner& runner, std::ostream& log, std::ostream& err,
                       DispatchOptions opts)
    : m_catalog(catalog), m_runner(runner), m_log(log), m_err(err), m_opts(opts) {}

std::string Dispatcher::colored(const std::string& s, const char* code) const {
    if (!m_opts.color) return s;
    return std::string("\x1b[")+code+"m"+s+"\x1b[0m";
}

int Dispatcher::run(const std::string& task_name) {
    const Task* task = m_catalog.find(task_name);
    if (!task) throw TaskNotFound(task_name);
    return run_task(*task);
}

int Dispatcher::run_goals(const std::vector<std::string>& goals) {
    if (goals.empty()) return run_task(m_catalog.default_task());
    std::vector<const Task*> tasks;
    tasks.reserve(goals.size());
    for (auto &g : goals) {
        const Task* t = m_catalog.find(g);
        if (!t) throw TaskNotFound(g);
        tasks.push_back(t);
    }
    for (auto *t : tasks) {
        int status = run_task(*t);
        if (status != 0) return status;
    }
    return 0;
}

int Dispatcher::run_task(const Task& task) {
    for (auto &cmd : task.commands) {
        if (m_opts.echo || m_opts.dry_run) m_log << colored(cmd.text(), "1") << std::endl;
        if (m_opts.dry_run) continue;
        int status = m_runner.run(cmd);
        if (status != 0) {
            m_err << colored("devtask: [" + task.name + "] '" + cmd.text() + "' failed with exit status " +
                             std::to_string(status), "31") << std::endl;
            return status;
        }
    }
    return 0;
}

void Dispatcher::list(std::ostream& out) const {
    const auto &def = m_catalog.default_task().name;
    for (auto &t : m_catalog.tasks()) {
        out << colored(t.name, "36") << (t.name == def ? " (default)" : "") << ":\n";
        for (auto &c : t.commands) out << "    " << c.text() << '\n';
    }
}

} // namespace devtask
