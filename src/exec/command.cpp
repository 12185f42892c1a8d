/*
 * Run command parsing implementation - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <projhost/exec/command.hpp>
#include <projhost/expand/expand.hpp>
#include <projhost/lex/lexer.hpp>

namespace projhost {

std::optional<CommandSpec> parse_run_command(const std::string& line, std::string& err) {
    Lexer lx(line);
    auto ts = lx.run();
    if (lx.unterminated_quote()) { err = "unterminated quote"; return std::nullopt; }
    CommandSpec spec;
    for (auto &t : ts) {
        if (t.kind == TokenKind::Eof) break;
        if (t.kind != TokenKind::Word && t.kind != TokenKind::Assign) {
            err = "shell operator '" + t.lexeme + "' is not supported (commands run without a shell)";
            return std::nullopt;
        }
        if (t.expand && has_command_substitution(t.lexeme)) {
            err = "command substitution is not supported";
            return std::nullopt;
        }
        if (t.kind == TokenKind::Assign) {
            auto eq = t.lexeme.find('=');
            std::string key = t.lexeme.substr(0, eq);
            std::string raw = t.lexeme.substr(eq+1);
            spec.env.emplace_back(key, t.expand ? expand_word(raw) : raw);
        } else {
            spec.argv.push_back(t.expand ? expand_word(t.lexeme) : t.lexeme);
        }
    }
    if (spec.argv.empty() || spec.argv[0].empty()) { err = "empty command"; return std::nullopt; }
    return spec;
}

} // namespace projhost
