/*
 * Command Lexer - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Converts a declared command-line ("ruff check . --fix") into the argv the
 * process runner executes. Quoting follows POSIX shell words: single quotes are
 * literal, double quotes honour \" \\ and \$, an unquoted backslash escapes the
 * next character. Shell operators are reported as Operator tokens.
 */
#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <stdexcept>
#include "devtask/lex/tokens.hpp"

namespace devtask {

class CommandSyntaxError : public std::runtime_error {
public:
    CommandSyntaxError(const std::string& what, std::size_t pos)
        : std::runtime_error(what), m_pos(pos) {}
    std::size_t position() const { return m_pos; }
private:
    std::size_t m_pos;
};

class Lexer {
public:
    explicit Lexer(std::string input);
    // Throws CommandSyntaxError on an unterminated quote or a trailing backslash.
    TokenStream run();
private:
    Token next();
    char peek() const;
    char get();
    bool eof() const;
    void skip_space();
    Token lex_word();
    Token lex_operator();

    std::string m_input;
    std::size_t m_pos = 0; // current index
};

// Split a command-line into words. Throws CommandSyntaxError on operators,
// unterminated quotes, a trailing backslash or an empty command.
std::vector<std::string> split_command(const std::string& text);

} // namespace devtask
