#pragma once

#include "token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace badlang::frontend
{
    struct Diagnostic
    {
        std::string code;
        std::string message;
        SourceSpan span;
    };

    /**
     * Converts source text into tokens. Lexing stops at the first malformed input; at most one
     * diagnostic is ever recorded and the token stream is then incomplete.
     */
    class Lexer
    {
    public:
        explicit Lexer(std::string_view source);

        [[nodiscard]] const std::vector<Token>& tokens() const noexcept;
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

        void lex();

    private:
        void pushToken(TokenKind kind, SourceLocation start, SourceLocation end, std::string_view text);
        void lexIdentifierOrKeyword();
        void lexNumber();
        void lexSlashOrComment();
        void lexPair(char second, TokenKind paired, TokenKind single);
        void lexDoubled(char ch, TokenKind kind);
        void emitSingle(TokenKind kind);
        void report(std::string_view code, std::string_view message, SourceLocation start);
        bool match(char expected);
        char peek() const;
        char peekNext() const;
        char advance();
        bool isAtEnd() const;
        void advanceLine();

    private:
        std::string_view m_source;
        std::vector<Token> m_tokens;
        std::vector<Diagnostic> m_diagnostics;
        std::size_t m_current{0};
        SourceLocation m_location{};
    };
} // namespace badlang::frontend
