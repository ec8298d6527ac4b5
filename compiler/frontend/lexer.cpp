#include "lexer.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <string>

namespace
{
    using namespace badlang::frontend;

    bool isIdentifierStart(char ch)
    {
        return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
    }

    bool isIdentifierPart(char ch)
    {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
    }

    TokenKind keywordLookup(std::string_view text)
    {
        if (text == "fun") return TokenKind::KeywordFun;
        if (text == "int") return TokenKind::KeywordInt;
        if (text == "bool") return TokenKind::KeywordBool;
        if (text == "true") return TokenKind::KeywordTrue;
        if (text == "false") return TokenKind::KeywordFalse;
        if (text == "if") return TokenKind::KeywordIf;
        if (text == "else") return TokenKind::KeywordElse;
        if (text == "while") return TokenKind::KeywordWhile;
        if (text == "return") return TokenKind::KeywordReturn;
        if (text == "print") return TokenKind::KeywordPrint;
        if (text == "printsp") return TokenKind::KeywordPrintSpace;
        if (text == "println") return TokenKind::KeywordPrintLine;
        return TokenKind::Identifier;
    }
} // namespace

namespace badlang::frontend
{
    Lexer::Lexer(std::string_view source)
        : m_source(source)
        , m_location{1, 1}
    {
    }

    const std::vector<Token>& Lexer::tokens() const noexcept
    {
        return m_tokens;
    }

    const std::vector<Diagnostic>& Lexer::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    void Lexer::lex()
    {
        m_tokens.clear();
        m_diagnostics.clear();
        m_current = 0;
        m_location = {1, 1};

        while (!isAtEnd() && m_diagnostics.empty())
        {
            const char ch = peek();
            if (std::isspace(static_cast<unsigned char>(ch)))
            {
                advance();
                if (ch == '\n')
                {
                    advanceLine();
                }
                continue;
            }

            const SourceLocation startLocation = m_location;

            if (isIdentifierStart(ch))
            {
                lexIdentifierOrKeyword();
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(ch)))
            {
                lexNumber();
                continue;
            }

            switch (ch)
            {
            case '(':
                emitSingle(TokenKind::LeftParen);
                break;
            case ')':
                emitSingle(TokenKind::RightParen);
                break;
            case '{':
                emitSingle(TokenKind::LeftBrace);
                break;
            case '}':
                emitSingle(TokenKind::RightBrace);
                break;
            case ',':
                emitSingle(TokenKind::Comma);
                break;
            case ';':
                emitSingle(TokenKind::Semicolon);
                break;
            case '+':
                emitSingle(TokenKind::Plus);
                break;
            case '-':
                emitSingle(TokenKind::Minus);
                break;
            case '*':
                emitSingle(TokenKind::Asterisk);
                break;
            case '%':
                emitSingle(TokenKind::Percent);
                break;
            case '/':
                lexSlashOrComment();
                break;
            case '=':
                lexPair('=', TokenKind::EqualsEquals, TokenKind::Equals);
                break;
            case '!':
                lexPair('=', TokenKind::BangEquals, TokenKind::Bang);
                break;
            case '<':
                lexPair('=', TokenKind::LessEquals, TokenKind::LessThan);
                break;
            case '>':
                lexPair('=', TokenKind::GreaterEquals, TokenKind::GreaterThan);
                break;
            case '&':
                lexDoubled('&', TokenKind::AmpersandAmpersand);
                break;
            case '|':
                lexDoubled('|', TokenKind::PipePipe);
                break;
            default:
                advance();
                report("BAD-E2000", "Unexpected character '" + std::string(1, ch) + "' in source.", startLocation);
                break;
            }
        }

        if (!m_diagnostics.empty())
        {
            return;
        }

        SourceLocation eofLocation = m_location;
        pushToken(TokenKind::EndOfFile, eofLocation, eofLocation, "");
    }

    void Lexer::pushToken(TokenKind kind, SourceLocation start, SourceLocation end, std::string_view text)
    {
        Token token;
        token.kind = kind;
        token.span = {start, end};
        token.text = std::string{text};
        m_tokens.emplace_back(std::move(token));
    }

    void Lexer::lexIdentifierOrKeyword()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume first character
        while (isIdentifierPart(peek()))
        {
            advance();
        }

        const std::string_view text = m_source.substr(startIndex, m_current - startIndex);
        pushToken(keywordLookup(text), startLocation, m_location, text);
    }

    void Lexer::lexNumber()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        std::int64_t value = 0;
        bool overflow = false;
        while (std::isdigit(static_cast<unsigned char>(peek())))
        {
            value = value * 10 + (advance() - '0');
            if (value > std::numeric_limits<std::int32_t>::max())
            {
                overflow = true;
                value = 0;
            }
        }

        if (overflow)
        {
            report("BAD-E2002", "Integer literal does not fit in a 32-bit word.", startLocation);
            return;
        }

        const std::string_view text = m_source.substr(startIndex, m_current - startIndex);
        pushToken(TokenKind::IntegerLiteral, startLocation, m_location, text);
    }

    void Lexer::lexSlashOrComment()
    {
        const SourceLocation startLocation = m_location;
        advance(); // consume '/'

        if (match('/'))
        {
            while (!isAtEnd() && peek() != '\n')
            {
                advance();
            }
            return;
        }

        if (match('*'))
        {
            while (!isAtEnd())
            {
                if (peek() == '\n')
                {
                    advance();
                    advanceLine();
                    continue;
                }

                if (peek() == '*' && peekNext() == '/')
                {
                    advance();
                    advance();
                    return;
                }

                advance();
            }

            report("BAD-E2001", "Unterminated block comment.", startLocation);
            return;
        }

        pushToken(TokenKind::Slash, startLocation, m_location, "/");
    }

    void Lexer::lexPair(char second, TokenKind paired, TokenKind single)
    {
        const SourceLocation startLocation = m_location;
        const std::size_t startIndex = m_current;
        advance();
        const TokenKind kind = match(second) ? paired : single;
        pushToken(kind, startLocation, m_location, m_source.substr(startIndex, m_current - startIndex));
    }

    void Lexer::lexDoubled(char ch, TokenKind kind)
    {
        const SourceLocation startLocation = m_location;
        advance();
        if (!match(ch))
        {
            report("BAD-E2000", "Unexpected character '" + std::string(1, ch) + "'; did you mean '" +
                                    std::string(2, ch) + "'?",
                   startLocation);
            return;
        }
        pushToken(kind, startLocation, m_location, std::string(2, ch));
    }

    void Lexer::emitSingle(TokenKind kind)
    {
        const SourceLocation startLocation = m_location;
        advance();
        pushToken(kind, startLocation, m_location, m_source.substr(m_current - 1, 1));
    }

    void Lexer::report(std::string_view code, std::string_view message, SourceLocation start)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::string{message};
        diag.span = {start, m_location};
        m_diagnostics.emplace_back(std::move(diag));
    }

    bool Lexer::match(char expected)
    {
        if (isAtEnd()) return false;
        if (m_source[m_current] != expected) return false;
        advance();
        return true;
    }

    char Lexer::peek() const
    {
        if (isAtEnd()) return '\0';
        return m_source[m_current];
    }

    char Lexer::peekNext() const
    {
        if (m_current + 1 >= m_source.size()) return '\0';
        return m_source[m_current + 1];
    }

    char Lexer::advance()
    {
        const char ch = m_source[m_current++];
        if (ch != '\n')
        {
            ++m_location.column;
        }
        return ch;
    }

    bool Lexer::isAtEnd() const
    {
        return m_current >= m_source.size();
    }

    void Lexer::advanceLine()
    {
        ++m_location.line;
        m_location.column = 1;
    }
} // namespace badlang::frontend
