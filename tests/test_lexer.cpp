/*
 * Lexer tests - ProjHost
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <projhost/lex/lexer.hpp>
#include <projhost/lex/tokens.hpp>

using namespace projhost;

TEST(LexerBasic, QuotedAndOperators) {
    std::string line = "echo \"ciao mondo\" && ls -l | grep cpp";
    Lexer lx(line);
    auto ts = lx.run();
    std::vector<TokenKind> kinds;
    for (auto &t : ts) kinds.push_back(t.kind);
    ASSERT_EQ(kinds.size(), 9u);
    EXPECT_EQ(kinds[0], TokenKind::Word);
    EXPECT_EQ(ts[1].lexeme, "ciao mondo");
    EXPECT_EQ(kinds[2], TokenKind::Operator);
    EXPECT_EQ(ts[2].lexeme, "&&");
    EXPECT_EQ(ts[5].lexeme, "|");
    EXPECT_EQ(ts[5].pos, 27u);
    EXPECT_EQ(kinds.back(), TokenKind::Eof);
}

TEST(LexerAssign, OnlyBeforeProgram) {
    Lexer lx("PORT=8080 DEBUG=1 python3 main.py X=1");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 6u);
    EXPECT_EQ(ts[0].kind, TokenKind::Assign);
    EXPECT_EQ(ts[1].kind, TokenKind::Assign);
    EXPECT_EQ(ts[2].kind, TokenKind::Word);
    EXPECT_EQ(ts[4].kind, TokenKind::Word);
    EXPECT_EQ(ts[4].lexeme, "X=1");
}

TEST(LexerAssign, NotANameIsAWord) {
    Lexer lx("1X=2 =3 run");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 4u);
    EXPECT_EQ(ts[0].kind, TokenKind::Word);
    EXPECT_EQ(ts[1].kind, TokenKind::Word);
}

TEST(LexerRedir, Redirections) {
    Lexer lx("echo hi > out.txt 2>&1 >>more");
    auto ts = lx.run();
    std::vector<std::string> ops;
    for (auto &t : ts) if (t.kind == TokenKind::Operator) ops.push_back(t.lexeme);
    std::vector<std::string> expect{">", "2>&1", ">>"};
    EXPECT_EQ(ops, expect);
}

TEST(LexerQuotes, SingleQuotesDisableExpansion) {
    Lexer lx("echo '$HOME' \"$HOME\" a\\ b \"say \\\"hi\\\"\"");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 6u);
    EXPECT_EQ(ts[1].lexeme, "$HOME");
    EXPECT_FALSE(ts[1].expand);
    EXPECT_TRUE(ts[2].expand);
    EXPECT_EQ(ts[3].lexeme, "a b");
    EXPECT_EQ(ts[4].lexeme, "say \"hi\"");
}

TEST(LexerQuotes, Unterminated) {
    Lexer lx("python3 'main.py");
    lx.run();
    EXPECT_TRUE(lx.unterminated_quote());
    Lexer dq("python3 \"main.py");
    dq.run();
    EXPECT_TRUE(dq.unterminated_quote());
    Lexer ok("python3 'main.py'");
    ok.run();
    EXPECT_FALSE(ok.unterminated_quote());
}

TEST(LexerDigits, WordStartingWithTwo) {
    Lexer lx("sleep 2 2>err.log");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 5u);
    EXPECT_EQ(ts[1].kind, TokenKind::Word);
    EXPECT_EQ(ts[1].lexeme, "2");
    EXPECT_EQ(ts[2].kind, TokenKind::Operator);
    EXPECT_EQ(ts[2].lexeme, "2>");
}

TEST(LexerSubst, KeptInOneWord) {
    Lexer lx("python3 $(which main) x");
    auto ts = lx.run();
    ASSERT_EQ(ts.size(), 4u);
    EXPECT_EQ(ts[1].lexeme, "$(which main)");
}
