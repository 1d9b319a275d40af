/*
 * Command Lexer implementation - DevTask
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cctype>
#include <devtask/lex/lexer.hpp>

namespace devtask {

static bool is_operator_char(char c) {
    return c=='|'||c=='&'||c==';'||c=='<'||c=='>'||c=='('||c==')';
}

Lexer::Lexer(std::string input) : m_input(std::move(input)) {}

char Lexer::peek() const { return eof() ? '\0' : m_input[m_pos]; }
char Lexer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Lexer::eof() const { return m_pos >= m_input.size(); }

void Lexer::skip_space() { while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) get(); }

Token Lexer::lex_operator() {
    std::size_t start = m_pos;
    char c = get();
    std::string op(1, c);
    // && || >> are reported as one operator
    if ((c=='&' || c=='|' || c=='>') && peek()==c) op.push_back(get());
    return {TokenKind::Operator, op, start};
}

Token Lexer::lex_word() {
    std::size_t start = m_pos; std::string out; bool in_single=false, in_double=false;
    std::size_t quote_pos = 0;
    while (!eof()) {
        char c = peek();
        if (!in_single && !in_double) {
            if (std::isspace(static_cast<unsigned char>(c))) break;
            if (is_operator_char(c)) break;
            if (c=='\'') { in_single=true; quote_pos=m_pos; get(); continue; }
            if (c=='"') { in_double=true; quote_pos=m_pos; get(); continue; }
            if (c=='\\') {
                std::size_t esc = m_pos; get();
                if (eof()) throw CommandSyntaxError("trailing backslash at position " + std::to_string(esc), esc);
                out.push_back(get()); continue;
            }
            out.push_back(get());
        } else if (in_single) {
            get(); if (c=='\'') { in_single=false; continue; } out.push_back(c);
        } else if (in_double) {
            get(); if (c=='"') { in_double=false; continue; }
            if (c=='\\' && !eof()) { char n=peek(); if (n=='"'||n=='\\'||n=='$') { out.push_back(n); get(); continue; }}
            out.push_back(c);
        }
    }
    if (in_single || in_double) {
        throw CommandSyntaxError(std::string("unterminated ") + (in_single ? "single" : "double") +
                                 " quote at position " + std::to_string(quote_pos), quote_pos);
    }
    return {TokenKind::Word, out, start};
}

Token Lexer::next() {
    skip_space(); if (eof()) return {TokenKind::Eof, "", m_pos};
    if (is_operator_char(peek())) return lex_operator();
    return lex_word();
}

TokenStream Lexer::run() {
    TokenStream ts; while (true) { Token t = next(); ts.push_back(t); if (t.kind==TokenKind::Eof) break; }
    return ts;
}

std::vector<std::string> split_command(const std::string& text) {
    Lexer lx(text);
    auto ts = lx.run();
    std::vector<std::string> argv;
    for (auto &t : ts) {
        if (t.kind == TokenKind::Operator) {
            throw CommandSyntaxError("shell operator '" + t.lexeme + "' at position " +
                                     std::to_string(t.pos) + " is not supported in a command", t.pos);
        }
        if (t.kind == TokenKind::Word) argv.push_back(t.lexeme);
    }
    if (argv.empty()) throw CommandSyntaxError("empty command", 0);
    return argv;
}

} // namespace devtask
