#include "identifier_flattener.hpp"

#include "../semantic/scope_environment.hpp"

#include <string>

namespace badlang::mir
{
    namespace
    {
        using frontend::Expression;
        using frontend::ExpressionKind;
        using frontend::Statement;
        using frontend::StatementKind;
        using semantic::IdentifierKind;
        using semantic::IdentifierRecord;
        using semantic::ScopeEnvironment;

        class Flattener
        {
        public:
            explicit Flattener(std::string_view entryName)
                : m_entryName(entryName)
            {
            }

            void run(frontend::Program& program)
            {
                // Functions are visible before their declaration, so they are named up front.
                for (const auto& statement : program.statements)
                {
                    if (statement->kind == StatementKind::Function)
                    {
                        bind(statement->name, IdentifierKind::Function);
                    }
                }

                for (auto& statement : program.statements)
                {
                    visitStatement(*statement);
                }
            }

        private:
            std::string bind(const std::string& name, IdentifierKind kind)
            {
                IdentifierRecord record;
                record.kind = kind;
                record.initialized = true;
                if (kind == IdentifierKind::Function && name == m_entryName)
                {
                    record.uniqueName = name;
                }
                else
                {
                    // The entry keeps its source name, so no generated name may take it.
                    do
                    {
                        record.uniqueName = name + "_" + std::to_string(m_counter++);
                    } while (record.uniqueName == m_entryName);
                }

                std::string uniqueName = record.uniqueName;
                m_environment.declare(name, std::move(record));
                return uniqueName;
            }

            void rename(std::string& name) const
            {
                const IdentifierRecord* record = m_environment.lookup(name);
                if (record != nullptr)
                {
                    name = record->uniqueName;
                }
            }

            void visitNested(Statement& statement)
            {
                m_environment.pushScope();
                visitStatement(statement);
                m_environment.popScope();
            }

            void visitStatement(Statement& statement)
            {
                switch (statement.kind)
                {
                case StatementKind::Block:
                    m_environment.pushScope();
                    for (auto& child : statement.body)
                    {
                        visitStatement(*child);
                    }
                    m_environment.popScope();
                    break;
                case StatementKind::Function:
                    rename(statement.name);
                    m_environment.pushScope(statement.type);
                    for (auto& parameter : statement.parameters)
                    {
                        parameter.name = bind(parameter.name, IdentifierKind::Variable);
                    }
                    for (auto& child : statement.body)
                    {
                        visitStatement(*child);
                    }
                    m_environment.popScope();
                    break;
                case StatementKind::Variable:
                    // Renamed before the declaration so a self-reference stays dangling.
                    if (statement.expression)
                    {
                        visitExpression(*statement.expression);
                    }
                    statement.name = bind(statement.name, IdentifierKind::Variable);
                    break;
                case StatementKind::Assign:
                    visitExpression(*statement.expression);
                    rename(statement.name);
                    break;
                case StatementKind::If:
                    visitExpression(*statement.expression);
                    visitNested(*statement.thenBranch);
                    if (statement.elseBranch)
                    {
                        visitNested(*statement.elseBranch);
                    }
                    break;
                case StatementKind::While:
                    visitExpression(*statement.expression);
                    visitNested(*statement.loopBody);
                    break;
                case StatementKind::Expression:
                case StatementKind::Return:
                case StatementKind::Print:
                case StatementKind::PrintSpace:
                case StatementKind::PrintLine:
                    if (statement.expression)
                    {
                        visitExpression(*statement.expression);
                    }
                    break;
                }
            }

            void visitExpression(Expression& expression)
            {
                switch (expression.kind)
                {
                case ExpressionKind::Literal:
                    break;
                case ExpressionKind::Variable:
                    rename(expression.name);
                    break;
                case ExpressionKind::Unary:
                    visitExpression(*expression.operand);
                    break;
                case ExpressionKind::Binary:
                    visitExpression(*expression.left);
                    visitExpression(*expression.right);
                    break;
                case ExpressionKind::Call:
                    rename(expression.name);
                    for (auto& argument : expression.arguments)
                    {
                        visitExpression(*argument);
                    }
                    break;
                }
            }

            std::string_view m_entryName;
            ScopeEnvironment m_environment;
            std::size_t m_counter{0};
        };
    } // namespace

    frontend::Program flattenIdentifiers(const frontend::Program& program, std::string_view entryName)
    {
        frontend::Program flattened;
        flattened.statements.reserve(program.statements.size());
        for (const auto& statement : program.statements)
        {
            flattened.statements.emplace_back(frontend::cloneStatement(*statement));
        }

        Flattener flattener{entryName};
        flattener.run(flattened);
        return flattened;
    }
} // namespace badlang::mir
