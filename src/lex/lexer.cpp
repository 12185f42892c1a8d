/*
 * Run command lexer implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/lex/lexer.hpp>
#include <cctype>
#include <cstring>

namespace projhost {

namespace {
// Longest spelling first: "2>&1" before "2>", ">>" before ">".
constexpr const char* kOperators[] = {"2>&1", "&&", "||", ">>", "2>", "|", "&", ";", "(", ")", "<", ">"};

bool ends_word(char c) { return c != '\0' && std::strchr("|&;<>()", c) != nullptr; }
bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
} // namespace

Lexer::Lexer(std::string input) : m_input(std::move(input)) {}

bool Lexer::at_operator(Token& out) {
    for (const char* op : kOperators) {
        std::size_t len = std::strlen(op);
        if (m_input.compare(m_pos, len, op) != 0) continue;
        out = Token{TokenKind::Operator, op, m_pos};
        m_pos += len;
        return true;
    }
    return false;
}

void Lexer::read_single_quoted(std::string& out) {
    ++m_pos;
    std::size_t close = m_input.find('\'', m_pos);
    if (close == std::string::npos) {
        out.append(m_input, m_pos, std::string::npos);
        m_pos = m_input.size();
        m_unterminated = true;
        return;
    }
    out.append(m_input, m_pos, close - m_pos);
    m_pos = close + 1;
}

void Lexer::read_double_quoted(std::string& out) {
    ++m_pos;
    while (m_pos < m_input.size()) {
        char c = m_input[m_pos++];
        if (c == '"') return;
        if (c == '\\' && m_pos < m_input.size() && std::strchr("\"\\$", m_input[m_pos])) c = m_input[m_pos++];
        out.push_back(c);
    }
    m_unterminated = true;
}

Token Lexer::read_word() {
    Token t{TokenKind::Word, "", m_pos};
    while (m_pos < m_input.size()) {
        char c = m_input[m_pos];
        if (is_space(c) || ends_word(c)) break;
        if (c == '$' && m_pos + 1 < m_input.size() && m_input[m_pos+1] == '(') {
            // keep $(...) whole so the caller can name it for what it is
            std::size_t depth = 0, i = m_pos + 1;
            for (; i < m_input.size(); ++i) {
                if (m_input[i] == '(') ++depth;
                else if (m_input[i] == ')' && --depth == 0) break;
            }
            std::size_t end = i < m_input.size() ? i + 1 : i;
            t.lexeme.append(m_input, m_pos, end - m_pos);
            m_pos = end;
        }
        else if (c == '\'') { read_single_quoted(t.lexeme); t.expand = false; }
        else if (c == '"') read_double_quoted(t.lexeme);
        else if (c == '\\') { ++m_pos; if (m_pos < m_input.size()) t.lexeme.push_back(m_input[m_pos++]); }
        else { t.lexeme.push_back(c); ++m_pos; }
    }
    if (!m_seen_program && is_assignment(t.lexeme)) t.kind = TokenKind::Assign;
    else m_seen_program = true;
    return t;
}

bool Lexer::is_assignment(const std::string& word) const {
    auto eq = word.find('=');
    if (eq == std::string::npos || eq == 0) return false;
    if (!std::isalpha(static_cast<unsigned char>(word[0])) && word[0] != '_') return false;
    for (std::size_t i = 1; i < eq; ++i)
        if (!std::isalnum(static_cast<unsigned char>(word[i])) && word[i] != '_') return false;
    return true;
}

TokenStream Lexer::run() {
    m_pos = 0; m_seen_program = false; m_unterminated = false;
    TokenStream ts;
    while (true) {
        while (m_pos < m_input.size() && is_space(m_input[m_pos])) ++m_pos;
        if (m_pos >= m_input.size()) break;
        Token op{TokenKind::Eof, "", m_pos};
        // "2>" only counts as an operator where a word would start
        if (at_operator(op)) ts.push_back(op);
        else ts.push_back(read_word());
    }
    ts.push_back(Token{TokenKind::Eof, "", m_pos});
    return ts;
}

} // namespace projhost
