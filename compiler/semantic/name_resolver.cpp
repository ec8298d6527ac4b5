#include "name_resolver.hpp"

#include "../common/spelling.hpp"

namespace badlang::semantic
{
    using frontend::Expression;
    using frontend::ExpressionKind;
    using frontend::Statement;
    using frontend::StatementKind;

    namespace
    {
        SourceSpan calleeSpan(const Expression& call)
        {
            SourceSpan span = call.span;
            span.end = span.begin;
            span.end.column += static_cast<std::uint32_t>(call.name.size());
            return span;
        }
    } // namespace

    NameResolver::NameResolver(ScopeEnvironment globals, const std::vector<std::string>& sourceLines)
        : m_environment(std::move(globals))
        , m_sourceLines(sourceLines)
    {
    }

    void NameResolver::resolve(const frontend::Program& program)
    {
        for (const auto& statement : program.statements)
        {
            visitStatement(*statement);
        }
    }

    void NameResolver::visitStatement(const Statement& statement)
    {
        switch (statement.kind)
        {
        case StatementKind::Block:
            visitBlock(statement);
            break;
        case StatementKind::Function:
            visitFunction(statement);
            break;
        case StatementKind::Variable:
            visitVariable(statement);
            break;
        case StatementKind::Assign:
            visitAssign(statement);
            break;
        case StatementKind::If:
        {
            std::vector<Problem> problems;
            visitExpression(*statement.expression, problems);
            addProblems(std::move(problems));

            m_environment.pushScope();
            visitStatement(*statement.thenBranch);
            m_environment.popScope();

            if (statement.elseBranch)
            {
                m_environment.pushScope();
                visitStatement(*statement.elseBranch);
                m_environment.popScope();
            }
            break;
        }
        case StatementKind::While:
        {
            std::vector<Problem> problems;
            visitExpression(*statement.expression, problems);
            addProblems(std::move(problems));

            m_environment.pushScope();
            visitStatement(*statement.loopBody);
            m_environment.popScope();
            break;
        }
        case StatementKind::Expression:
        case StatementKind::Return:
        case StatementKind::Print:
        case StatementKind::PrintSpace:
        case StatementKind::PrintLine:
            visitExpressionStatement(statement);
            break;
        }
    }

    void NameResolver::visitBlock(const Statement& block)
    {
        m_environment.pushScope();
        for (const auto& statement : block.body)
        {
            visitStatement(*statement);
        }
        m_environment.popScope();
    }

    void NameResolver::visitFunction(const Statement& function)
    {
        std::vector<Problem> problems;

        if (m_pendingCollisions.erase(function.name) > 0)
        {
            problems.push_back(Problem{function.headerSpan, "Identifier " + function.name +
                                                                " was previously used to define a variable; "
                                                                "variables and functions cannot share names."});
        }

        m_environment.pushScope(function.type);

        for (const auto& parameter : function.parameters)
        {
            const IdentifierRecord* existing = m_environment.lookup(parameter.name);
            if (existing != nullptr && existing->kind == IdentifierKind::Function)
            {
                problems.push_back(Problem{parameter.span, "Parameter " + parameter.name +
                                                               " shares an identifier with a function; parameters "
                                                               "and functions cannot share names."});
            }
            else if (m_environment.isDeclaredInScope(parameter.name))
            {
                problems.push_back(Problem{parameter.span, "Parameter " + parameter.name +
                                                               " is already used for this function; cannot have "
                                                               "duplicate parameter names."});
            }
            else
            {
                IdentifierRecord record;
                record.kind = IdentifierKind::Variable;
                record.type = parameter.type;
                record.initialized = true;
                m_environment.declare(parameter.name, std::move(record));
            }
        }
        addProblems(std::move(problems));

        // Signature checked: later variables with this name now collide with it.
        m_environment.markInitialized(function.name);

        for (const auto& statement : function.body)
        {
            visitStatement(*statement);
        }

        m_environment.popScope();
    }

    void NameResolver::visitVariable(const Statement& variable)
    {
        std::vector<Problem> problems;

        // The initializer sees only bindings made before this declaration.
        if (variable.expression)
        {
            visitExpression(*variable.expression, problems);
        }

        const IdentifierRecord* inScope = m_environment.lookupInScope(variable.name);
        const IdentifierRecord* visible = m_environment.lookup(variable.name);

        if (inScope != nullptr && (inScope->kind == IdentifierKind::Variable || inScope->initialized))
        {
            problems.push_back(Problem{variable.headerSpan, "Variable '" + variable.name +
                                                                "' was previously declared in this scope; cannot "
                                                                "redeclare variables."});
        }
        else if (visible != nullptr && visible->kind == IdentifierKind::Function && visible->initialized)
        {
            problems.push_back(Problem{variable.headerSpan, "Variable '" + variable.name +
                                                                "' was previously declared as a function; variables "
                                                                "and functions cannot share identifiers."});
        }
        else if (inScope != nullptr)
        {
            // Same frame as a function that is declared further down; reported at that function.
            m_pendingCollisions.insert(variable.name);
        }
        else
        {
            IdentifierRecord record;
            record.kind = IdentifierKind::Variable;
            record.type = variable.type;
            record.initialized = variable.expression != nullptr;
            m_environment.declare(variable.name, std::move(record));
        }

        addProblems(std::move(problems));
    }

    void NameResolver::visitAssign(const Statement& assign)
    {
        std::vector<Problem> problems;

        const IdentifierRecord* target = m_environment.lookup(assign.name);
        if (target == nullptr)
        {
            problems.push_back(
                Problem{assign.headerSpan, undeclaredMessage("Variable", assign.name, IdentifierKind::Variable)});
        }
        else if (target->kind == IdentifierKind::Function)
        {
            problems.push_back(Problem{assign.headerSpan, "Identifier '" + assign.name +
                                                              "' was declared as a function but assigned as a "
                                                              "variable."});
        }

        visitExpression(*assign.expression, problems);
        addProblems(std::move(problems));

        if (target != nullptr && target->kind == IdentifierKind::Variable)
        {
            m_environment.markInitialized(assign.name);
        }
    }

    void NameResolver::visitExpressionStatement(const Statement& statement)
    {
        if (!statement.expression)
        {
            return;
        }

        std::vector<Problem> problems;
        visitExpression(*statement.expression, problems);
        addProblems(std::move(problems));
    }

    void NameResolver::visitExpression(const Expression& expression, std::vector<Problem>& problems)
    {
        switch (expression.kind)
        {
        case ExpressionKind::Literal:
            break;
        case ExpressionKind::Variable:
            visitVariableReference(expression, problems);
            break;
        case ExpressionKind::Unary:
            visitExpression(*expression.operand, problems);
            break;
        case ExpressionKind::Binary:
            visitExpression(*expression.left, problems);
            visitExpression(*expression.right, problems);
            break;
        case ExpressionKind::Call:
            visitCall(expression, problems);
            break;
        }
    }

    void NameResolver::visitVariableReference(const Expression& expression, std::vector<Problem>& problems)
    {
        const IdentifierRecord* record = m_environment.lookup(expression.name);
        if (record == nullptr)
        {
            problems.push_back(
                Problem{expression.span, undeclaredMessage("Variable", expression.name, IdentifierKind::Variable)});
        }
        else if (record->kind == IdentifierKind::Function)
        {
            problems.push_back(Problem{expression.span, "Function '" + expression.name +
                                                            "' was referenced without being called. Must use '()' "
                                                            "to call a function (i.e., '[identifier]()')."});
        }
        else if (!record->initialized)
        {
            problems.push_back(
                Problem{expression.span, "Variable '" + expression.name + "' was used but never initialized."});
        }
    }

    void NameResolver::visitCall(const Expression& expression, std::vector<Problem>& problems)
    {
        const IdentifierRecord* record = m_environment.lookup(expression.name);
        if (record == nullptr)
        {
            problems.push_back(Problem{calleeSpan(expression),
                                       undeclaredMessage("Function", expression.name, IdentifierKind::Function)});
        }
        else if (record->kind != IdentifierKind::Function)
        {
            problems.push_back(Problem{calleeSpan(expression), "Identifier '" + expression.name +
                                                                   "' was declared as a variable but used as a "
                                                                   "function."});
        }

        for (const auto& argument : expression.arguments)
        {
            visitExpression(*argument, problems);
        }
    }

    std::string NameResolver::undeclaredMessage(std::string_view noun, const std::string& name,
                                                IdentifierKind vocabulary) const
    {
        std::string message = std::string{noun} + " '" + name + "' was used but never declared.";
        const auto suggestion = common::suggestCorrection(name, m_environment.visibleNames(vocabulary));
        if (suggestion.has_value())
        {
            message += " Did you mean '" + *suggestion + "'?";
        }
        return message;
    }

    void NameResolver::addProblems(std::vector<Problem> problems)
    {
        if (problems.empty())
        {
            return;
        }
        m_problemCount += problems.size();
        m_errors.emplace_back(makeError(ErrorKind::Name, std::move(problems), m_sourceLines));
    }
} // namespace badlang::semantic
