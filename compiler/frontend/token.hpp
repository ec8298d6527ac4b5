#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace badlang::frontend
{
    enum class TokenKind : std::uint16_t
    {
        EndOfFile,
        Identifier,
        IntegerLiteral,

        // Keywords
        KeywordFun,
        KeywordInt,
        KeywordBool,
        KeywordTrue,
        KeywordFalse,
        KeywordIf,
        KeywordElse,
        KeywordWhile,
        KeywordReturn,
        KeywordPrint,
        KeywordPrintSpace,
        KeywordPrintLine,

        // Punctuation
        LeftBrace,
        RightBrace,
        LeftParen,
        RightParen,
        Comma,
        Semicolon,
        Equals,
        Plus,
        Minus,
        Asterisk,
        Slash,
        Percent,
        Bang,
        AmpersandAmpersand,
        PipePipe,
        LessThan,
        GreaterThan,
        LessEquals,
        GreaterEquals,
        EqualsEquals,
        BangEquals
    };

    struct SourceLocation
    {
        std::uint32_t line{1};
        std::uint32_t column{1};
    };

    /// Half-open on the column axis: `end` points one past the last character.
    struct SourceSpan
    {
        SourceLocation begin{};
        SourceLocation end{};
    };

    struct Token
    {
        TokenKind kind{TokenKind::EndOfFile};
        SourceSpan span{};
        std::string text{};
    };

    [[nodiscard]] std::string_view toString(TokenKind kind);
} // namespace badlang::frontend
