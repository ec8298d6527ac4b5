#pragma once

#include "diagnostic.hpp"
#include "scope_environment.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace badlang::semantic
{
    /**
     * Binds identifier uses to declarations over its own copy of the collected global scope. Each statement's
     * problems become one Name error; checking never stops early.
     */
    class NameResolver
    {
    public:
        NameResolver(ScopeEnvironment globals, const std::vector<std::string>& sourceLines);

        void resolve(const frontend::Program& program);

        [[nodiscard]] const std::vector<Error>& errors() const noexcept { return m_errors; }
        [[nodiscard]] std::size_t problemCount() const noexcept { return m_problemCount; }

    private:
        void visitStatement(const frontend::Statement& statement);
        void visitBlock(const frontend::Statement& block);
        void visitFunction(const frontend::Statement& function);
        void visitVariable(const frontend::Statement& variable);
        void visitAssign(const frontend::Statement& assign);
        void visitExpressionStatement(const frontend::Statement& statement);
        void visitExpression(const frontend::Expression& expression, std::vector<Problem>& problems);
        void visitVariableReference(const frontend::Expression& expression, std::vector<Problem>& problems);
        void visitCall(const frontend::Expression& expression, std::vector<Problem>& problems);

        [[nodiscard]] std::string undeclaredMessage(std::string_view noun, const std::string& name,
                                                    IdentifierKind vocabulary) const;
        void addProblems(std::vector<Problem> problems);

        ScopeEnvironment m_environment;
        const std::vector<std::string>& m_sourceLines;
        std::vector<Error> m_errors;
        std::size_t m_problemCount{0};
        // Global variables that reused the name of a function whose declaration has not been visited yet.
        std::unordered_set<std::string> m_pendingCollisions;
    };
} // namespace badlang::semantic
