#pragma once

#include "diagnostic.hpp"
#include "scope_environment.hpp"

#include <string>
#include <vector>

namespace badlang::semantic
{
    /**
     * Computes the scalar type of every expression and checks operator, call, declaration, assignment,
     * return and condition typing. An operand that already resolved to ScalarType::Error is never reported
     * again by its parent.
     */
    class TypeResolver
    {
    public:
        TypeResolver(ScopeEnvironment globals, const std::vector<std::string>& sourceLines);

        void resolve(const frontend::Program& program);

        [[nodiscard]] const std::vector<Error>& errors() const noexcept { return m_errors; }
        [[nodiscard]] std::size_t problemCount() const noexcept { return m_problemCount; }

        /// Types a standalone expression against the current scope without recording an error.
        [[nodiscard]] ScalarType typeOf(const frontend::Expression& expression, std::vector<Problem>& problems);

    private:
        void visitStatement(const frontend::Statement& statement);
        void visitNestedStatement(const frontend::Statement& statement);
        void visitFunction(const frontend::Statement& function);
        void visitVariable(const frontend::Statement& variable);
        void visitAssign(const frontend::Statement& assign);
        void visitReturn(const frontend::Statement& statement);
        void visitCondition(const frontend::Expression& condition);

        ScalarType visitExpression(const frontend::Expression& expression, std::vector<Problem>& problems);
        ScalarType visitUnary(const frontend::Expression& expression, std::vector<Problem>& problems);
        ScalarType visitBinary(const frontend::Expression& expression, std::vector<Problem>& problems);
        ScalarType visitOperands(const frontend::Expression& expression, ScalarType operandType, ScalarType resultType,
                                 ScalarType left, ScalarType right, std::vector<Problem>& problems);
        ScalarType visitCall(const frontend::Expression& expression, std::vector<Problem>& problems);

        void addProblems(std::vector<Problem> problems);

        ScopeEnvironment m_environment;
        const std::vector<std::string>& m_sourceLines;
        std::vector<Error> m_errors;
        std::size_t m_problemCount{0};
    };
} // namespace badlang::semantic
