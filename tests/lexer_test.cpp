#include <gtest/gtest.h>

#include "lang/lexer.hpp"

using mathguard::lang::Lexer;
using mathguard::lang::SyntaxError;
using mathguard::lang::Token;
using mathguard::lang::TokenKind;

namespace {

std::vector<TokenKind> Kinds(const std::vector<Token>& tokens) {
    std::vector<TokenKind> kinds;
    for (const auto& token : tokens) {
        kinds.push_back(token.kind);
    }
    return kinds;
}

}  // namespace

TEST(LexerTest, SimpleAssignment) {
    const auto tokens = Lexer("x = 1\n").Tokenize();
    const std::vector<TokenKind> expected{
        TokenKind::kName, TokenKind::kOp, TokenKind::kNumber, TokenKind::kNewline, TokenKind::kEnd};
    EXPECT_EQ(Kinds(tokens), expected);
    EXPECT_EQ(tokens[0].text, "x");
    EXPECT_EQ(tokens[1].text, "=");
    EXPECT_EQ(tokens[2].text, "1");
}

TEST(LexerTest, MissingTrailingNewlineIsSynthesized) {
    const auto tokens = Lexer("y").Tokenize();
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].kind, TokenKind::kNewline);
    EXPECT_EQ(tokens[2].kind, TokenKind::kEnd);
}

TEST(LexerTest, IndentAndDedent) {
    const auto tokens = Lexer("def f():\n    return 1\nz = 2\n").Tokenize();
    int indents = 0;
    int dedents = 0;
    for (const auto& token : tokens) {
        indents += token.kind == TokenKind::kIndent;
        dedents += token.kind == TokenKind::kDedent;
    }
    EXPECT_EQ(indents, 1);
    EXPECT_EQ(dedents, 1);
}

TEST(LexerTest, NewlinesInsideBracketsAreIgnored) {
    const auto tokens = Lexer("x = [1,\n     2]\n").Tokenize();
    int newlines = 0;
    for (const auto& token : tokens) {
        newlines += token.kind == TokenKind::kNewline;
    }
    EXPECT_EQ(newlines, 1);
}

TEST(LexerTest, CommentsAndBlankLines) {
    const auto tokens = Lexer("# leading\n\nx = 1  # trailing\n\n").Tokenize();
    EXPECT_EQ(tokens.front().kind, TokenKind::kName);
    EXPECT_EQ(tokens[tokens.size() - 2].kind, TokenKind::kNewline);
}

TEST(LexerTest, StringEscapesAreDecoded) {
    const auto tokens = Lexer("s = 'a\\tb'\n").Tokenize();
    ASSERT_EQ(tokens[2].kind, TokenKind::kString);
    EXPECT_EQ(tokens[2].text, "a\tb");
}

TEST(LexerTest, RawStringKeepsBackslashes) {
    const auto tokens = Lexer("s = r'a\\tb'\n").Tokenize();
    ASSERT_EQ(tokens[2].kind, TokenKind::kString);
    EXPECT_EQ(tokens[2].text, "a\\tb");
}

TEST(LexerTest, FStringBodyIsKeptUndecoded) {
    const auto tokens = Lexer("s = f'{x}!'\n").Tokenize();
    ASSERT_EQ(tokens[2].kind, TokenKind::kFString);
    EXPECT_EQ(tokens[2].text, "{x}!");
}

TEST(LexerTest, NumberForms) {
    const auto tokens = Lexer("a = 0x1F + 1_000 + 2.5e-3 + 3j\n").Tokenize();
    EXPECT_EQ(tokens[2].text, "0x1F");
    EXPECT_EQ(tokens[4].text, "1_000");
    EXPECT_EQ(tokens[6].text, "2.5e-3");
}

TEST(LexerTest, OperatorsAreGreedy) {
    const auto tokens = Lexer("a **= b // c\n").Tokenize();
    EXPECT_EQ(tokens[1].text, "**=");
    EXPECT_EQ(tokens[3].text, "//");
}

TEST(LexerTest, TracksLocations) {
    const auto tokens = Lexer("x = 1\nyy = 2\n").Tokenize();
    const Token& yy = tokens[4];
    EXPECT_EQ(yy.text, "yy");
    EXPECT_EQ(yy.loc.line, 2);
    EXPECT_EQ(yy.loc.column, 0);
}

TEST(LexerTest, Errors) {
    EXPECT_THROW(Lexer("s = 'open\n").Tokenize(), SyntaxError);
    EXPECT_THROW(Lexer("x = (1, 2\n").Tokenize(), SyntaxError);
    EXPECT_THROW(Lexer("x = 1)\n").Tokenize(), SyntaxError);
    EXPECT_THROW(Lexer("x = $\n").Tokenize(), SyntaxError);
    EXPECT_THROW(Lexer("if x:\n        a = 1\n    b = 2\n").Tokenize(), SyntaxError);
    EXPECT_THROW(Lexer("b = b'bytes'\n").Tokenize(), SyntaxError);
    EXPECT_THROW(Lexer("x = (1, 2]\n").Tokenize(), SyntaxError);
}

TEST(LexerTest, UnclosedBracketIsReportedWhereItOpens) {
    try {
        Lexer("def solve(:\n    return 1\n\n").Tokenize();
        FAIL() << "expected a syntax error";
    } catch (const SyntaxError& ex) {
        EXPECT_EQ(ex.location().line, 1);
        EXPECT_EQ(ex.location().column, 9);
    }
}
