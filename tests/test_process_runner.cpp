/*
 * Process runner tests - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <devtask/exec/process_runner.hpp>
#include <devtask/dispatch/dispatcher.hpp>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <sys/wait.h>

static bool file_exists(const std::string& path) {
    std::ifstream in(path);
    return in.good();
}

static void note_signal(int) {}

using namespace devtask;

TEST(ProcessRunner, ExitStatusPropagated) {
    std::ostringstream err;
    ProcessRunner r(err);
    EXPECT_EQ(r.run(Command("sh -c 'exit 0'")), 0);
    EXPECT_EQ(r.run(Command("sh -c 'exit 1'")), 1);
    EXPECT_EQ(r.run(Command("sh -c 'exit 7'")), 7);
}

TEST(ProcessRunner, CommandNotFound) {
    std::ostringstream err;
    ProcessRunner r(err);
    EXPECT_EQ(r.run(Command("devtask-no-such-program --flag")), 127);
    EXPECT_NE(err.str().find("devtask-no-such-program: command not found"), std::string::npos);
}

TEST(ProcessRunner, KilledBySignal) {
    std::ostringstream err;
    ProcessRunner r(err);
    EXPECT_EQ(r.run(Command("sh -c 'kill -TERM $$'")), 128 + 15);
}

TEST(ProcessRunner, InheritsWorkingDirectory) {
    const std::string outfile = "devtask_runner_cwd.txt";
    unlink(outfile.c_str());
    std::ostringstream err;
    ProcessRunner r(err);
    EXPECT_EQ(r.run(Command("sh -c 'pwd > " + outfile + "'")), 0);
    std::ifstream in(outfile);
    ASSERT_TRUE(in.good());
    std::string line; std::getline(in, line);
    char buf[4096];
    ASSERT_NE(getcwd(buf, sizeof(buf)), nullptr);
    EXPECT_EQ(line, std::string(buf));
    in.close();
    unlink(outfile.c_str());
}

TEST(ProcessRunner, InheritsEnvironment) {
    setenv("DEVTASK_RUNNER_ENV", "y", 1);
    std::ostringstream err;
    ProcessRunner r(err);
    EXPECT_EQ(r.run(Command("sh -c 'test \"$DEVTASK_RUNNER_ENV\" = y'")), 0);
    unsetenv("DEVTASK_RUNNER_ENV");
    EXPECT_EQ(r.run(Command("sh -c 'test \"$DEVTASK_RUNNER_ENV\" = y'")), 1);
}

TEST(ProcessRunner, InterruptedChildStopsTask) {
    const std::string marker = "devtask_runner_after_int.txt";
    std::remove(marker.c_str());
    Catalog cat{{"fmt", {"sh -c 'kill -INT $$'", "touch " + marker}}};
    std::ostringstream log, err;
    ProcessRunner runner(err);
    Dispatcher d(cat, runner, log, err);
    EXPECT_EQ(d.run("fmt"), 128 + SIGINT);
    EXPECT_FALSE(file_exists(marker));
}

TEST(ProcessRunner, SignalDispositionsRestored) {
    struct sigaction mine{};
    mine.sa_handler = note_signal;
    sigemptyset(&mine.sa_mask);
    struct sigaction old_int{}, old_term{};
    sigaction(SIGINT, &mine, &old_int);
    sigaction(SIGTERM, &mine, &old_term);

    std::ostringstream err;
    ProcessRunner r(err);
    EXPECT_EQ(r.run(Command("sh -c 'exit 0'")), 0);

    struct sigaction now_int{}, now_term{};
    sigaction(SIGINT, nullptr, &now_int);
    sigaction(SIGTERM, nullptr, &now_term);
    EXPECT_EQ(now_int.sa_handler, &note_signal);
    EXPECT_EQ(now_term.sa_handler, &note_signal);

    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGTERM, &old_term, nullptr);
}

TEST(ProcessRunner, TerminationForwardedToChild) {
    const std::string marker = "devtask_runner_after_term.txt";
    const std::string next = "devtask_runner_next_cmd.txt";
    std::remove(marker.c_str());
    std::remove(next.c_str());

    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        Catalog cat{{"fmt", {"sh -c 'sleep 2 && touch " + marker + "'", "touch " + next}}};
        std::ostringstream log, err;
        ProcessRunner runner(err);
        Dispatcher d(cat, runner, log, err);
        _exit(d.run("fmt"));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    ASSERT_EQ(kill(pid, SIGTERM), 0);
    int st = 0;
    ASSERT_EQ(waitpid(pid, &st, 0), pid);
    ASSERT_TRUE(WIFEXITED(st));
    EXPECT_EQ(WEXITSTATUS(st), 128 + SIGTERM);

    // the interrupted command would have finished by now
    std::this_thread::sleep_for(std::chrono::milliseconds(2500));
    EXPECT_FALSE(file_exists(marker));
    EXPECT_FALSE(file_exists(next));
    std::remove(marker.c_str());
    std::remove(next.c_str());
}

TEST(DecodeWaitStatus, ExitAndSignal) {
    EXPECT_EQ(decode_wait_status(3 << 8), 3);
    EXPECT_EQ(decode_wait_status(9), 128 + 9);
}
