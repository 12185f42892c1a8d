/*
 * Run command lexer - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Splits a run command line into words the way a POSIX shell would quote
 *   them: '...' is literal, "..." keeps \" \\ \$ escapes, a bare backslash
 *   escapes the next character. NAME=VALUE words ahead of the program name
 *   become Assign tokens.
 */
#pragma once
#include <string>
#include <cstddef>
#include "projhost/lex/tokens.hpp"

namespace projhost {

class Lexer {
public:
    explicit Lexer(std::string input);
    TokenStream run();
    // True if a quote was still open at end of input (set by run()).
    bool unterminated_quote() const { return m_unterminated; }
private:
    bool at_operator(Token& out);
    Token read_word();
    void read_single_quoted(std::string& out);
    void read_double_quoted(std::string& out);
    bool is_assignment(const std::string& word) const;

    std::string m_input;
    std::size_t m_pos = 0;
    bool m_seen_program = false;
    bool m_unterminated = false;
};

} // namespace projhost
