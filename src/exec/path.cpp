/*
 * PATH resolution implementation - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devtask/exec/path.hpp>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace devtask {

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    if ((st.st_mode & S_IXUSR) || (st.st_mode & S_IXGRP) || (st.st_mode & S_IXOTH)) return true;
    return false;
}

std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& search_path) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd; else return std::nullopt;
    }
    std::vector<std::string> parts;
    size_t start=0;
    while (true) {
        size_t colon = search_path.find(':', start);
        if (colon == std::string::npos) { parts.push_back(search_path.substr(start)); break; }
        parts.push_back(search_path.substr(start, colon-start));
        start = colon+1;
    }
    for (auto &d : parts) {
        // empty entry means the current directory, as in execvp
        std::string full = (d.empty() ? std::string(".") : d) + '/' + cmd;
        if (is_executable(full)) return full;
    }
    return std::nullopt;
}

std::string default_search_path() {
    size_t n = confstr(_CS_PATH, nullptr, 0);
    if (n == 0) return "/bin:/usr/bin";
    std::vector<char> buf(n);
    confstr(_CS_PATH, buf.data(), n);
    return std::string(buf.data());
}

std::optional<std::string> resolve_executable(const std::string& cmd) {
    const char* pathEnv = std::getenv("PATH");
    // like execvp: no PATH means the system default search path
    if (!pathEnv) return resolve_executable(cmd, default_search_path());
    return resolve_executable(cmd, pathEnv);
}

} // namespace devtask
