#include "ast.hpp"

namespace badlang::frontend
{
    std::string_view toString(Operator op) noexcept
    {
        switch (op)
        {
        case Operator::Plus: return "+";
        case Operator::Minus: return "-";
        case Operator::Multiply: return "*";
        case Operator::Divide: return "/";
        case Operator::Modulo: return "%";
        case Operator::And: return "&&";
        case Operator::Or: return "||";
        case Operator::Not: return "!";
        case Operator::Equal: return "==";
        case Operator::NotEqual: return "!=";
        case Operator::Less: return "<";
        case Operator::LessEqual: return "<=";
        case Operator::Greater: return ">";
        case Operator::GreaterEqual: return ">=";
        }
        return "?";
    }

    ExpressionPtr cloneExpression(const Expression& expression)
    {
        auto copy = std::make_unique<Expression>();
        copy->kind = expression.kind;
        copy->span = expression.span;
        copy->literalType = expression.literalType;
        copy->integerValue = expression.integerValue;
        copy->booleanValue = expression.booleanValue;
        copy->name = expression.name;
        copy->op = expression.op;
        if (expression.operand)
        {
            copy->operand = cloneExpression(*expression.operand);
        }
        if (expression.left)
        {
            copy->left = cloneExpression(*expression.left);
        }
        if (expression.right)
        {
            copy->right = cloneExpression(*expression.right);
        }
        copy->arguments.reserve(expression.arguments.size());
        for (const auto& argument : expression.arguments)
        {
            copy->arguments.emplace_back(cloneExpression(*argument));
        }
        return copy;
    }

    StatementPtr cloneStatement(const Statement& statement)
    {
        auto copy = std::make_unique<Statement>();
        copy->kind = statement.kind;
        copy->span = statement.span;
        copy->name = statement.name;
        copy->type = statement.type;
        copy->headerSpan = statement.headerSpan;
        copy->parameters = statement.parameters;
        if (statement.expression)
        {
            copy->expression = cloneExpression(*statement.expression);
        }
        copy->body.reserve(statement.body.size());
        for (const auto& child : statement.body)
        {
            copy->body.emplace_back(cloneStatement(*child));
        }
        if (statement.thenBranch)
        {
            copy->thenBranch = cloneStatement(*statement.thenBranch);
        }
        if (statement.elseBranch)
        {
            copy->elseBranch = cloneStatement(*statement.elseBranch);
        }
        if (statement.loopBody)
        {
            copy->loopBody = cloneStatement(*statement.loopBody);
        }
        return copy;
    }
} // namespace badlang::frontend
