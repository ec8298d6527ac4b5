#pragma once

#include "../common/scalar_type.hpp"
#include "token.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace badlang::frontend
{
    using common::ScalarType;

    enum class Operator : std::uint8_t
    {
        Plus,
        Minus,
        Multiply,
        Divide,
        Modulo,
        And,
        Or,
        Not,
        Equal,
        NotEqual,
        Less,
        LessEqual,
        Greater,
        GreaterEqual
    };

    [[nodiscard]] std::string_view toString(Operator op) noexcept;

    enum class ExpressionKind : std::uint8_t
    {
        Literal,
        Variable,
        Unary,
        Binary,
        Call
    };

    struct Expression
    {
        ExpressionKind kind{ExpressionKind::Literal};
        SourceSpan span{};

        // Literal
        ScalarType literalType{ScalarType::Integer};
        std::int32_t integerValue{0};
        bool booleanValue{false};

        // Variable reference or call target
        std::string name;

        // Unary and binary
        Operator op{Operator::Plus};
        std::unique_ptr<Expression> operand;
        std::unique_ptr<Expression> left;
        std::unique_ptr<Expression> right;

        // Call
        std::vector<std::unique_ptr<Expression>> arguments;
    };

    using ExpressionPtr = std::unique_ptr<Expression>;

    enum class StatementKind : std::uint8_t
    {
        Block,
        Expression,
        Variable,
        Function,
        Assign,
        If,
        While,
        Return,
        Print,
        PrintSpace,
        PrintLine
    };

    struct Parameter
    {
        std::string name;
        ScalarType type{ScalarType::Integer};
        SourceSpan span{};
    };

    struct Statement
    {
        StatementKind kind{StatementKind::Block};
        SourceSpan span{};

        // Declared, assigned or called name
        std::string name;
        // Variable type or function return type
        ScalarType type{ScalarType::Integer};
        // Variable declarator or function header (name through parameter list)
        SourceSpan headerSpan{};

        // Initializer, assigned value, condition, returned or printed value (may be null)
        std::unique_ptr<Expression> expression;

        std::vector<Parameter> parameters;
        // Block statements or function body
        std::vector<std::unique_ptr<Statement>> body;

        std::unique_ptr<Statement> thenBranch;
        std::unique_ptr<Statement> elseBranch;
        std::unique_ptr<Statement> loopBody;
    };

    using StatementPtr = std::unique_ptr<Statement>;

    struct Program
    {
        std::vector<StatementPtr> statements;
    };

    [[nodiscard]] ExpressionPtr cloneExpression(const Expression& expression);
    [[nodiscard]] StatementPtr cloneStatement(const Statement& statement);
} // namespace badlang::frontend
