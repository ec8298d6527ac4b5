#include "layout_builder.hpp"

#include <limits>

namespace badlang::mir
{
    namespace
    {
        using frontend::Expression;
        using frontend::ExpressionKind;
        using frontend::Operator;
        using frontend::Statement;
        using frontend::StatementKind;

        std::int32_t wrap(std::int64_t value)
        {
            return static_cast<std::int32_t>(static_cast<std::uint32_t>(value & 0xFFFFFFFF));
        }

        std::optional<std::int32_t> foldBinary(Operator op, std::int32_t left, std::int32_t right)
        {
            switch (op)
            {
            case Operator::Plus: return wrap(static_cast<std::int64_t>(left) + right);
            case Operator::Minus: return wrap(static_cast<std::int64_t>(left) - right);
            case Operator::Multiply: return wrap(static_cast<std::int64_t>(left) * right);
            case Operator::Divide:
            case Operator::Modulo:
                if (right == 0 || (left == std::numeric_limits<std::int32_t>::min() && right == -1))
                {
                    return std::nullopt;
                }
                return op == Operator::Divide ? left / right : left % right;
            case Operator::And: return (left != 0 && right != 0) ? 1 : 0;
            case Operator::Or: return (left != 0 || right != 0) ? 1 : 0;
            case Operator::Equal: return left == right ? 1 : 0;
            case Operator::NotEqual: return left != right ? 1 : 0;
            case Operator::Less: return left < right ? 1 : 0;
            case Operator::LessEqual: return left <= right ? 1 : 0;
            case Operator::Greater: return left > right ? 1 : 0;
            case Operator::GreaterEqual: return left >= right ? 1 : 0;
            case Operator::Not: break;
            }
            return std::nullopt;
        }

        class LayoutWalker
        {
        public:
            LayoutWalker(FlatSymbolTable& globals, std::vector<LoweringDiagnostic>& diagnostics)
                : m_globals(globals)
                , m_diagnostics(diagnostics)
            {
            }

            bool run(const frontend::Program& program)
            {
                for (const auto& statement : program.statements)
                {
                    visitTopLevel(*statement);
                }
                return !m_failed;
            }

        private:
            void report(std::string code, std::string detail)
            {
                LoweringDiagnostic diagnostic;
                diagnostic.code = std::move(code);
                diagnostic.functionName = m_functionName;
                diagnostic.detail = std::move(detail);
                m_diagnostics.emplace_back(std::move(diagnostic));
                m_failed = true;
            }

            void visitTopLevel(const Statement& statement)
            {
                if (statement.kind == StatementKind::Function)
                {
                    visitFunction(statement);
                    return;
                }

                if (statement.kind == StatementKind::Variable)
                {
                    if (!common::isConcrete(statement.type))
                    {
                        report("BAD-E4002", "Global '" + statement.name + "' has no concrete type.");
                        return;
                    }

                    std::optional<std::int32_t> initialValue;
                    if (statement.expression)
                    {
                        initialValue = foldConstant(*statement.expression, m_globals);
                    }
                    if (!m_globals.putVariable(statement.name, statement.type, initialValue))
                    {
                        report("BAD-E4001", "Name '" + statement.name + "' is declared more than once.");
                    }
                }
            }

            void visitFunction(const Statement& function)
            {
                m_functionName = function.name;
                m_current = m_globals.putFunction(function.name, function.type);
                if (m_current == nullptr)
                {
                    report("BAD-E4001", "Function '" + function.name + "' is declared more than once.");
                    m_functionName.clear();
                    return;
                }

                for (const auto& parameter : function.parameters)
                {
                    if (!m_current->putParameter(parameter.name, parameter.type))
                    {
                        report("BAD-E4001", "Parameter '" + parameter.name + "' is declared more than once.");
                    }
                }

                for (const auto& statement : function.body)
                {
                    visitLocal(*statement);
                }

                m_current = nullptr;
                m_functionName.clear();
            }

            void visitLocal(const Statement& statement)
            {
                switch (statement.kind)
                {
                case StatementKind::Variable:
                    if (!common::isConcrete(statement.type))
                    {
                        report("BAD-E4002", "Local '" + statement.name + "' has no concrete type.");
                    }
                    else if (!m_current->putVariable(statement.name, statement.type))
                    {
                        report("BAD-E4001", "Name '" + statement.name + "' is declared more than once.");
                    }
                    break;
                case StatementKind::Block:
                    for (const auto& child : statement.body)
                    {
                        visitLocal(*child);
                    }
                    break;
                case StatementKind::If:
                    visitLocal(*statement.thenBranch);
                    if (statement.elseBranch)
                    {
                        visitLocal(*statement.elseBranch);
                    }
                    break;
                case StatementKind::While:
                    visitLocal(*statement.loopBody);
                    break;
                case StatementKind::Function:
                    report("BAD-E4003", "Function '" + statement.name + "' is nested inside another function.");
                    break;
                case StatementKind::Expression:
                case StatementKind::Assign:
                case StatementKind::Return:
                case StatementKind::Print:
                case StatementKind::PrintSpace:
                case StatementKind::PrintLine:
                    break;
                }
            }

            FlatSymbolTable& m_globals;
            FlatSymbolTable* m_current{nullptr};
            std::vector<LoweringDiagnostic>& m_diagnostics;
            std::string m_functionName;
            bool m_failed{false};
        };
    } // namespace

    std::optional<std::int32_t> foldConstant(const Expression& expression, const FlatSymbolTable& globals)
    {
        switch (expression.kind)
        {
        case ExpressionKind::Literal:
            if (expression.literalType == common::ScalarType::Boolean)
            {
                return expression.booleanValue ? 1 : 0;
            }
            return expression.integerValue;
        case ExpressionKind::Variable:
        {
            const SymbolEntry* entry = globals.find(expression.name);
            if (entry == nullptr || entry->kind != SymbolKind::Variable)
            {
                return std::nullopt;
            }
            // An uninitialized global starts at zero.
            return entry->initialValue.value_or(0);
        }
        case ExpressionKind::Unary:
        {
            const auto operand = foldConstant(*expression.operand, globals);
            if (!operand.has_value())
            {
                return std::nullopt;
            }
            switch (expression.op)
            {
            case Operator::Minus: return wrap(-static_cast<std::int64_t>(*operand));
            case Operator::Plus: return *operand;
            case Operator::Not: return *operand == 0 ? 1 : 0;
            default: return std::nullopt;
            }
        }
        case ExpressionKind::Binary:
        {
            const auto left = foldConstant(*expression.left, globals);
            const auto right = foldConstant(*expression.right, globals);
            if (!left.has_value() || !right.has_value())
            {
                return std::nullopt;
            }
            return foldBinary(expression.op, *left, *right);
        }
        case ExpressionKind::Call:
            return std::nullopt;
        }
        return std::nullopt;
    }

    bool buildLayout(const frontend::Program& program, FlatSymbolTable& globals,
                     std::vector<LoweringDiagnostic>& diagnostics)
    {
        LayoutWalker walker{globals, diagnostics};
        return walker.run(program);
    }
} // namespace badlang::mir
