#include "type_resolver.hpp"

namespace badlang::semantic
{
    using common::toString;
    using frontend::Expression;
    using frontend::ExpressionKind;
    using frontend::Operator;
    using frontend::Statement;
    using frontend::StatementKind;

    namespace
    {
        std::string operandMessage(Operator op, ScalarType expected, ScalarType actual)
        {
            return "Operator '" + std::string{frontend::toString(op)} + "' expects expressions of type " +
                   std::string{toString(expected)} + ", but got expression of type " + std::string{toString(actual)} +
                   ".";
        }
    } // namespace

    TypeResolver::TypeResolver(ScopeEnvironment globals, const std::vector<std::string>& sourceLines)
        : m_environment(std::move(globals))
        , m_sourceLines(sourceLines)
    {
    }

    void TypeResolver::resolve(const frontend::Program& program)
    {
        for (const auto& statement : program.statements)
        {
            visitStatement(*statement);
        }
    }

    ScalarType TypeResolver::typeOf(const Expression& expression, std::vector<Problem>& problems)
    {
        return visitExpression(expression, problems);
    }

    void TypeResolver::visitStatement(const Statement& statement)
    {
        switch (statement.kind)
        {
        case StatementKind::Block:
            m_environment.pushScope();
            for (const auto& child : statement.body)
            {
                visitStatement(*child);
            }
            m_environment.popScope();
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
        case StatementKind::Return:
            visitReturn(statement);
            break;
        case StatementKind::If:
            visitCondition(*statement.expression);
            visitNestedStatement(*statement.thenBranch);
            if (statement.elseBranch)
            {
                visitNestedStatement(*statement.elseBranch);
            }
            break;
        case StatementKind::While:
            visitCondition(*statement.expression);
            visitNestedStatement(*statement.loopBody);
            break;
        case StatementKind::Expression:
        case StatementKind::Print:
        case StatementKind::PrintSpace:
        case StatementKind::PrintLine:
            if (statement.expression)
            {
                std::vector<Problem> problems;
                visitExpression(*statement.expression, problems);
                addProblems(std::move(problems));
            }
            break;
        }
    }

    void TypeResolver::visitNestedStatement(const Statement& statement)
    {
        m_environment.pushScope();
        visitStatement(statement);
        m_environment.popScope();
    }

    void TypeResolver::visitFunction(const Statement& function)
    {
        m_environment.pushScope(function.type);

        for (const auto& parameter : function.parameters)
        {
            IdentifierRecord record;
            record.kind = IdentifierKind::Variable;
            record.type = parameter.type;
            record.initialized = true;
            m_environment.declare(parameter.name, std::move(record));
        }

        for (const auto& statement : function.body)
        {
            visitStatement(*statement);
        }

        m_environment.popScope();
    }

    void TypeResolver::visitVariable(const Statement& variable)
    {
        std::vector<Problem> problems;

        if (variable.expression)
        {
            const ScalarType initializerType = visitExpression(*variable.expression, problems);
            if (common::isConcrete(initializerType) && initializerType != variable.type)
            {
                problems.push_back(Problem{variable.expression->span,
                                           "Variable '" + variable.name + "' expected value of type " +
                                               std::string{toString(variable.type)} + ", but value is of type " +
                                               std::string{toString(initializerType)} + "."});
            }
        }

        IdentifierRecord record;
        record.kind = IdentifierKind::Variable;
        record.type = variable.type;
        record.initialized = variable.expression != nullptr;
        m_environment.declare(variable.name, std::move(record));

        addProblems(std::move(problems));
    }

    void TypeResolver::visitAssign(const Statement& assign)
    {
        std::vector<Problem> problems;

        const ScalarType valueType = visitExpression(*assign.expression, problems);
        const IdentifierRecord* target = m_environment.lookup(assign.name);
        if (target != nullptr && target->kind == IdentifierKind::Variable && common::isConcrete(valueType) &&
            valueType != target->type)
        {
            problems.push_back(Problem{assign.expression->span,
                                       "Variable " + assign.name + " expected value of type " +
                                           std::string{toString(target->type)} + ", but value is of type " +
                                           std::string{toString(valueType)} + "."});
        }

        addProblems(std::move(problems));
    }

    void TypeResolver::visitReturn(const Statement& statement)
    {
        std::vector<Problem> problems;

        const ScalarType valueType = visitExpression(*statement.expression, problems);
        const auto functionType = m_environment.enclosingReturnType();
        if (!functionType.has_value())
        {
            problems.push_back(Problem{statement.span, "Return statements can only be used within functions."});
        }
        else if (common::isConcrete(valueType) && valueType != *functionType)
        {
            problems.push_back(Problem{statement.span, "Function is of type " + std::string{toString(*functionType)} +
                                                           ", but return value is of type " +
                                                           std::string{toString(valueType)} + "."});
        }

        addProblems(std::move(problems));
    }

    void TypeResolver::visitCondition(const Expression& condition)
    {
        std::vector<Problem> problems;

        const ScalarType conditionType = visitExpression(condition, problems);
        if (conditionType == ScalarType::Integer)
        {
            problems.push_back(Problem{condition.span, "Conditional expressions need to be of type bool, but this "
                                                       "expression is of type int."});
        }

        addProblems(std::move(problems));
    }

    ScalarType TypeResolver::visitExpression(const Expression& expression, std::vector<Problem>& problems)
    {
        switch (expression.kind)
        {
        case ExpressionKind::Literal:
            return expression.literalType;
        case ExpressionKind::Variable:
        {
            // Undeclared names and bare function references are name errors.
            const IdentifierRecord* record = m_environment.lookup(expression.name);
            if (record == nullptr || record->kind != IdentifierKind::Variable)
            {
                return ScalarType::Error;
            }
            return record->type;
        }
        case ExpressionKind::Unary:
            return visitUnary(expression, problems);
        case ExpressionKind::Binary:
            return visitBinary(expression, problems);
        case ExpressionKind::Call:
            return visitCall(expression, problems);
        }
        return ScalarType::Error;
    }

    ScalarType TypeResolver::visitUnary(const Expression& expression, std::vector<Problem>& problems)
    {
        const ScalarType operandType = visitExpression(*expression.operand, problems);
        if (!common::isConcrete(operandType))
        {
            return ScalarType::Error;
        }

        const ScalarType expected = expression.op == Operator::Not ? ScalarType::Boolean : ScalarType::Integer;
        if (operandType != expected)
        {
            problems.push_back(Problem{expression.span, "Operator '" + std::string{frontend::toString(expression.op)} +
                                                            "' expects expression of type " +
                                                            std::string{toString(expected)} +
                                                            ", but got expression of type " +
                                                            std::string{toString(operandType)} + "."});
            return ScalarType::Error;
        }
        return expected;
    }

    ScalarType TypeResolver::visitBinary(const Expression& expression, std::vector<Problem>& problems)
    {
        const ScalarType left = visitExpression(*expression.left, problems);
        const ScalarType right = visitExpression(*expression.right, problems);

        if (!common::isConcrete(left) && !common::isConcrete(right))
        {
            return ScalarType::Error;
        }

        switch (expression.op)
        {
        case Operator::Plus:
        case Operator::Minus:
        case Operator::Multiply:
        case Operator::Divide:
        case Operator::Modulo:
            return visitOperands(expression, ScalarType::Integer, ScalarType::Integer, left, right, problems);
        case Operator::Less:
        case Operator::LessEqual:
        case Operator::Greater:
        case Operator::GreaterEqual:
            return visitOperands(expression, ScalarType::Integer, ScalarType::Boolean, left, right, problems);
        case Operator::And:
        case Operator::Or:
            return visitOperands(expression, ScalarType::Boolean, ScalarType::Boolean, left, right, problems);
        case Operator::Equal:
        case Operator::NotEqual:
            if (!common::isConcrete(left) || !common::isConcrete(right))
            {
                return ScalarType::Error;
            }
            if (left != right)
            {
                problems.push_back(Problem{expression.span,
                                           "Operator '" + std::string{frontend::toString(expression.op)} +
                                               "' expects expressions of the same type, but left expression is of "
                                               "type " +
                                               std::string{toString(left)} + " while right expression is of type " +
                                               std::string{toString(right)} + "."});
                return ScalarType::Error;
            }
            return ScalarType::Boolean;
        case Operator::Not:
            break;
        }

        problems.push_back(Problem{expression.span, "Unsupported operator used in binary expression."});
        return ScalarType::Error;
    }

    ScalarType TypeResolver::visitOperands(const Expression& expression, ScalarType operandType, ScalarType resultType,
                                           ScalarType left, ScalarType right, std::vector<Problem>& problems)
    {
        const bool badLeft = common::isConcrete(left) && left != operandType;
        const bool badRight = common::isConcrete(right) && right != operandType;

        if (badLeft)
        {
            problems.push_back(Problem{expression.left->span, operandMessage(expression.op, operandType, left)});
        }
        if (badRight)
        {
            problems.push_back(Problem{expression.right->span, operandMessage(expression.op, operandType, right)});
        }

        if (badLeft || badRight || !common::isConcrete(left) || !common::isConcrete(right))
        {
            return ScalarType::Error;
        }
        return resultType;
    }

    ScalarType TypeResolver::visitCall(const Expression& expression, std::vector<Problem>& problems)
    {
        std::vector<ScalarType> argumentTypes;
        argumentTypes.reserve(expression.arguments.size());
        for (const auto& argument : expression.arguments)
        {
            argumentTypes.push_back(visitExpression(*argument, problems));
        }

        const IdentifierRecord* record = m_environment.lookup(expression.name);
        if (record == nullptr || record->kind != IdentifierKind::Function)
        {
            return ScalarType::Error;
        }

        const auto& parameters = record->parameters;
        if (parameters.size() != argumentTypes.size())
        {
            problems.push_back(Problem{expression.span, "Function " + expression.name + " expects " +
                                                            std::to_string(parameters.size()) +
                                                            " parameters, but was given " +
                                                            std::to_string(argumentTypes.size()) + "."});
            return record->type;
        }

        for (std::size_t index = 0; index < parameters.size(); ++index)
        {
            const ScalarType argumentType = argumentTypes[index];
            if (common::isConcrete(argumentType) && argumentType != parameters[index].type)
            {
                problems.push_back(Problem{expression.arguments[index]->span,
                                           "Parameter '" + parameters[index].name + "' is of type " +
                                               std::string{toString(parameters[index].type)} +
                                               ", but was given value of type " + std::string{toString(argumentType)} +
                                               "."});
            }
        }

        return record->type;
    }

    void TypeResolver::addProblems(std::vector<Problem> problems)
    {
        if (problems.empty())
        {
            return;
        }
        m_problemCount += problems.size();
        m_errors.emplace_back(makeError(ErrorKind::Type, std::move(problems), m_sourceLines));
    }
} // namespace badlang::semantic
