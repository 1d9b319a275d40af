/*
 * User configuration implementation - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devtask/cli/config.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <istream>

namespace devtask {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

static bool truthy(const std::string& v){ return v=="1"||v=="true"||v=="on"; }

Config parse_config(std::istream& in, Config cfg) {
    std::string line;
    while (std::getline(in,line)) {
        line = trim(line);
        if (line.empty()||line[0]=='#') continue;
        auto eq=line.find('='); if (eq==std::string::npos) continue;
        auto key=trim(line.substr(0,eq)); auto val=trim(line.substr(eq+1));
        if (key=="color") cfg.color=truthy(val);
        else if (key=="echo_commands") cfg.echo_commands=truthy(val);
    }
    return cfg;
}

Config load_config(const std::string& path) {
    if (path.empty()) return {};
    std::ifstream in(path);
    if (!in) return {};
    return parse_config(in);
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.devtaskrc";
}

} // namespace devtask
