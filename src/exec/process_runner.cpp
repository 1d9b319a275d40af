/*
 * POSIX process runner implementation - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devtask/exec/process_runner.hpp>
#include <devtask/exec/path.hpp>
#include <unistd.h>
#include <sys/wait.h>
#include <csignal>
#include <cerrno>
#include <cstdio>
#include <ostream>
#include <vector>

namespace devtask {

namespace {

// Child being waited for, and the last termination signal received meanwhile.
volatile sig_atomic_t g_child_pid = 0;
volatile sig_atomic_t g_pending_signal = 0;

void forward_signal(int sig) {
    g_pending_signal = sig;
    pid_t pid = g_child_pid;
    if (pid > 0) kill(pid, sig);
}

// For its lifetime: SIGINT/SIGQUIT are ignored (the terminal delivers them to
// the child directly), SIGTERM/SIGHUP are forwarded to the child.
// Previous dispositions are restored on destruction.
class SignalGuard {
public:
    SignalGuard() {
        g_child_pid = 0;
        g_pending_signal = 0;
        struct sigaction ign{};
        ign.sa_handler = SIG_IGN;
        sigemptyset(&ign.sa_mask);
        sigaction(SIGINT, &ign, &m_old_int);
        sigaction(SIGQUIT, &ign, &m_old_quit);
        struct sigaction fwd{};
        fwd.sa_handler = forward_signal;
        sigemptyset(&fwd.sa_mask);
        sigaction(SIGTERM, &fwd, &m_old_term);
        sigaction(SIGHUP, &fwd, &m_old_hup);
    }
    ~SignalGuard() {
        sigaction(SIGINT, &m_old_int, nullptr);
        sigaction(SIGQUIT, &m_old_quit, nullptr);
        sigaction(SIGTERM, &m_old_term, nullptr);
        sigaction(SIGHUP, &m_old_hup, nullptr);
        g_child_pid = 0;
    }
    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

    // A signal that arrived between fork() and this call is sent now.
    void watch(pid_t pid) {
        g_child_pid = pid;
        int sig = g_pending_signal;
        if (sig != 0) kill(pid, sig);
    }
    int pending() const { return g_pending_signal; }
private:
    struct sigaction m_old_int{};
    struct sigaction m_old_quit{};
    struct sigaction m_old_term{};
    struct sigaction m_old_hup{};
};

} // namespace

int decode_wait_status(int st) {
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128+WTERMSIG(st);
    return 1;
}

ProcessRunner::ProcessRunner(std::ostream& err) : m_err(err) {}

int ProcessRunner::run(const Command& cmd) {
    const auto &argv = cmd.argv();
    auto exe = resolve_executable(argv[0]);
    if (!exe) { m_err << argv[0] << ": command not found" << std::endl; return 127; }

    // Built before fork: the child only calls async-signal-safe functions.
    std::vector<char*> cargv; cargv.reserve(argv.size()+1);
    for (auto &s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    m_err.flush();
    SignalGuard guard;
    pid_t pid = fork();
    if (pid < 0) { perror("fork"); return 1; }
    if (pid == 0) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGQUIT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        std::signal(SIGHUP, SIG_DFL);
        execv(exe->c_str(), cargv.data());
        int code = (errno == EACCES) ? 126 : 127;
        perror("execv");
        _exit(code);
    }
    guard.watch(pid);
    int st=0;
    while (waitpid(pid,&st,0)<0) {
        if (errno != EINTR) { perror("waitpid"); return 1; }
    }
    int status = decode_wait_status(st);
    // A child that handled the signal and exited 0 must still stop the task.
    if (status == 0 && guard.pending() != 0) status = 128+guard.pending();
    return status;
}

} // namespace devtask
