#pragma once

#include "ast.hpp"
#include "lexer.hpp"

#include <string_view>
#include <vector>

namespace badlang::frontend
{
    /**
     * Recursive-descent parser. The first unexpected token records a single diagnostic and abandons the
     * parse; the returned program is then empty.
     */
    class Parser
    {
    public:
        explicit Parser(const std::vector<Token>& tokens);

        [[nodiscard]] Program parse();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        const Token& peek() const;
        const Token& peekNext() const;
        const Token& previous() const;
        const Token& advance();
        bool isAtEnd() const;
        bool check(TokenKind kind) const;
        bool checkType() const;
        bool match(TokenKind kind);
        const Token* consume(TokenKind kind, std::string_view messageCode, std::string_view expected);
        void fail(std::string_view code, std::string_view expected, const Token& found);
        void fail(std::string_view code, std::string_view message, SourceSpan span);
        [[nodiscard]] SourceSpan spanFrom(const Token& begin, const Token& end) const;
        [[nodiscard]] SourceSpan mergeSpans(const SourceSpan& a, const SourceSpan& b) const;

        StatementPtr parseDeclaration(bool topLevel);
        StatementPtr parseFunction();
        StatementPtr parseVariable();
        StatementPtr parseStatement();
        StatementPtr parseBlock();
        StatementPtr parseIf();
        StatementPtr parseWhile();
        StatementPtr parseReturn();
        StatementPtr parsePrint(StatementKind kind, bool valueRequired);
        StatementPtr parseAssignment();
        StatementPtr parseExpressionStatement();
        bool parseType(ScalarType& type);

        ExpressionPtr parseExpression();
        ExpressionPtr parseOr();
        ExpressionPtr parseAnd();
        ExpressionPtr parseEquality();
        ExpressionPtr parseComparison();
        ExpressionPtr parseTerm();
        ExpressionPtr parseFactor();
        ExpressionPtr parseUnary();
        ExpressionPtr parsePrimary();
        ExpressionPtr parseCall(const Token& callee);
        ExpressionPtr makeBinary(Operator op, ExpressionPtr left, ExpressionPtr right) const;

    private:
        const std::vector<Token>& m_tokens;
        std::size_t m_current{0};
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace badlang::frontend
