/*
 * PATH resolution utilities - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace devtask {

// Resolve a program name against the given search path (colon separated).
// A name containing '/' is returned as-is when it names an executable file.
std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& search_path);

// Same, using the PATH of the current environment, or default_search_path()
// when PATH is unset.
std::optional<std::string> resolve_executable(const std::string& cmd);

// confstr(_CS_PATH), the search path execvp uses without PATH.
std::string default_search_path();

} // namespace devtask
