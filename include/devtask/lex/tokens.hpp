/*
 * Token Definitions - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Token kinds produced when a declared command-line is split into words.
 * Operators are recognized only so they can be rejected: commands are
 * executed directly, never through /bin/sh.
 */
#pragma once
#include <string>
#include <cstddef>
#include <vector>

namespace devtask {

enum class TokenKind {
    Word,
    Operator,
    Eof
};

struct Token {
    TokenKind kind;
    std::string lexeme;
    std::size_t pos;
};

using TokenStream = std::vector<Token>;

} // namespace devtask
