#include "declaration_collector.hpp"

namespace badlang::semantic
{
    using frontend::Expression;
    using frontend::ExpressionKind;
    using frontend::Statement;
    using frontend::StatementKind;

    DeclarationCollector::DeclarationCollector(const std::vector<std::string>& sourceLines, std::string entryName)
        : m_sourceLines(sourceLines)
        , m_entryName(std::move(entryName))
    {
    }

    void DeclarationCollector::collect(const frontend::Program& program)
    {
        for (const auto& statement : program.statements)
        {
            switch (statement->kind)
            {
            case StatementKind::Function:
                collectFunction(*statement);
                break;
            case StatementKind::Variable:
                if (statement->expression)
                {
                    std::vector<Problem> problems;
                    checkConstantInitializer(*statement->expression, problems);
                    addError(ErrorKind::Scope, std::move(problems));
                }
                break;
            default:
                addError(ErrorKind::Scope,
                         {Problem{statement->span, "Global statements are not allowed; all executable statements must "
                                                   "appear inside of a function."}});
                break;
            }
        }

        const IdentifierRecord* entry = m_globals.lookup(m_entryName);
        if (entry == nullptr || entry->kind != IdentifierKind::Function)
        {
            const Problem problem{SourceSpan{}, "No " + m_entryName + " function found; program must have a " +
                                                    m_entryName + " function as the entry point."};
            m_errors.emplace_back(ErrorKind::Scope, std::vector<Problem>{problem}, 1, std::vector<std::string>{});
            ++m_problemCount;
        }
    }

    void DeclarationCollector::collectFunction(const Statement& function)
    {
        if (m_globals.isDeclaredInScope(function.name))
        {
            addError(ErrorKind::Name, {Problem{function.headerSpan, "Function '" + function.name +
                                                                        "' was previously declared; functions "
                                                                        "cannot be redeclared."}});
            return;
        }

        IdentifierRecord record;
        record.kind = IdentifierKind::Function;
        record.type = function.type;
        record.parameters = function.parameters;
        record.initialized = false;
        m_globals.declare(function.name, std::move(record));
    }

    void DeclarationCollector::checkConstantInitializer(const Expression& expression,
                                                        std::vector<Problem>& problems) const
    {
        switch (expression.kind)
        {
        case ExpressionKind::Call:
            problems.push_back(Problem{expression.span, "Global variable initial values must be constant; this is "
                                                        "not a constant value."});
            break;
        case ExpressionKind::Unary:
            checkConstantInitializer(*expression.operand, problems);
            break;
        case ExpressionKind::Binary:
            checkConstantInitializer(*expression.left, problems);
            checkConstantInitializer(*expression.right, problems);
            break;
        case ExpressionKind::Literal:
        case ExpressionKind::Variable:
            break;
        }
    }

    void DeclarationCollector::addError(ErrorKind kind, std::vector<Problem> problems)
    {
        if (problems.empty())
        {
            return;
        }
        m_problemCount += problems.size();
        m_errors.emplace_back(makeError(kind, std::move(problems), m_sourceLines));
    }
} // namespace badlang::semantic
