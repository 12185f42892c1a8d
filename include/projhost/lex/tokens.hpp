/*
 * Run command token definitions - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Tokens of a project's run command. Run commands are exec'd directly,
 *   never through a shell, so shell operators (| || & && ; ( ) < > >> 2>
 *   2>&1) are recognised only to be refused and share one kind.
 */
#pragma once
#include <string>
#include <cstddef>
#include <vector>

namespace projhost {

enum class TokenKind {
    Word,
    Assign,     // NAME=VALUE before the program name
    Operator,
    Eof
};

struct Token {
    TokenKind kind;
    std::string lexeme;   // unquoted text for words, spelling for operators
    std::size_t pos;      // byte offset in the command line
    bool expand = true;   // false when any part was single-quoted
};

using TokenStream = std::vector<Token>;

} // namespace projhost
