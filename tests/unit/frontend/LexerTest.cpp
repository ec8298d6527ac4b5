#include <gtest/gtest.h>

#include "lexer.hpp"

namespace badlang::frontend
{
namespace
{
    TEST(LexerTest, LexesFunctionHeader)
    {
        const std::string source = "fun int add(int a, bool b) {}";

        Lexer lexer{source};
        lexer.lex();

        ASSERT_TRUE(lexer.diagnostics().empty());
        const auto& tokens = lexer.tokens();
        ASSERT_EQ(tokens.size(), 13u);
        EXPECT_EQ(tokens[0].kind, TokenKind::KeywordFun);
        EXPECT_EQ(tokens[1].kind, TokenKind::KeywordInt);
        EXPECT_EQ(tokens[2].kind, TokenKind::Identifier);
        EXPECT_EQ(tokens[2].text, "add");
        EXPECT_EQ(tokens[3].kind, TokenKind::LeftParen);
        EXPECT_EQ(tokens[7].kind, TokenKind::KeywordBool);
        EXPECT_EQ(tokens[9].kind, TokenKind::RightParen);
        EXPECT_EQ(tokens.back().kind, TokenKind::EndOfFile);
    }

    TEST(LexerTest, RecognizesPrintKeywordsAndOperators)
    {
        const std::string source = "println x % 2 <= 3 && !y || a != b;";

        Lexer lexer{source};
        lexer.lex();

        ASSERT_TRUE(lexer.diagnostics().empty());
        const auto& tokens = lexer.tokens();
        ASSERT_GE(tokens.size(), 14u);
        EXPECT_EQ(tokens[0].kind, TokenKind::KeywordPrintLine);
        EXPECT_EQ(tokens[2].kind, TokenKind::Percent);
        EXPECT_EQ(tokens[4].kind, TokenKind::LessEquals);
        EXPECT_EQ(tokens[6].kind, TokenKind::AmpersandAmpersand);
        EXPECT_EQ(tokens[7].kind, TokenKind::Bang);
        EXPECT_EQ(tokens[9].kind, TokenKind::PipePipe);
        EXPECT_EQ(tokens[11].kind, TokenKind::BangEquals);
        EXPECT_EQ(tokens[13].kind, TokenKind::Semicolon);
    }

    TEST(LexerTest, TracksLinesAndColumnsAcrossComments)
    {
        const std::string source = "// header\n/* block\n   comment */ int  count;";

        Lexer lexer{source};
        lexer.lex();

        ASSERT_TRUE(lexer.diagnostics().empty());
        const auto& tokens = lexer.tokens();
        ASSERT_EQ(tokens.size(), 4u);
        EXPECT_EQ(tokens[0].kind, TokenKind::KeywordInt);
        EXPECT_EQ(tokens[0].span.begin.line, 3u);
        EXPECT_EQ(tokens[0].span.begin.column, 15u);
        EXPECT_EQ(tokens[1].text, "count");
        EXPECT_EQ(tokens[1].span.begin.column, 20u);
        EXPECT_EQ(tokens[1].span.end.column, 25u);
    }

    TEST(LexerTest, ReportsUnexpectedCharacter)
    {
        Lexer lexer{"int x = 3 # 4;"};
        lexer.lex();

        ASSERT_EQ(lexer.diagnostics().size(), 1u);
        EXPECT_EQ(lexer.diagnostics().front().code, "BAD-E2000");
        EXPECT_EQ(lexer.diagnostics().front().span.begin.column, 11u);
    }

    TEST(LexerTest, ReportsLoneAmpersand)
    {
        Lexer lexer{"bool x = a & b;"};
        lexer.lex();

        ASSERT_EQ(lexer.diagnostics().size(), 1u);
        EXPECT_EQ(lexer.diagnostics().front().code, "BAD-E2000");
    }

    TEST(LexerTest, ReportsUnterminatedBlockComment)
    {
        Lexer lexer{"int x; /* never closed"};
        lexer.lex();

        ASSERT_EQ(lexer.diagnostics().size(), 1u);
        EXPECT_EQ(lexer.diagnostics().front().code, "BAD-E2001");
    }

    TEST(LexerTest, AcceptsLargestWordAndRejectsOverflow)
    {
        Lexer fits{"2147483647"};
        fits.lex();
        ASSERT_TRUE(fits.diagnostics().empty());
        EXPECT_EQ(fits.tokens().front().text, "2147483647");

        Lexer overflows{"2147483648"};
        overflows.lex();
        ASSERT_EQ(overflows.diagnostics().size(), 1u);
        EXPECT_EQ(overflows.diagnostics().front().code, "BAD-E2002");
    }
} // namespace
} // namespace badlang::frontend
