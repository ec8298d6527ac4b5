#pragma once

#include "diagnostic.hpp"
#include "scope_environment.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace badlang::semantic
{
    /**
     * Registers every top-level function signature in a fresh global scope so later passes accept forward
     * calls. Also rejects executable statements at the top level, calls inside global initializers, duplicate
     * functions and a missing entry point.
     */
    class DeclarationCollector
    {
    public:
        explicit DeclarationCollector(const std::vector<std::string>& sourceLines, std::string entryName = "main");

        void collect(const frontend::Program& program);

        [[nodiscard]] const ScopeEnvironment& globals() const noexcept { return m_globals; }
        [[nodiscard]] const std::vector<Error>& errors() const noexcept { return m_errors; }
        [[nodiscard]] std::size_t problemCount() const noexcept { return m_problemCount; }

    private:
        void collectFunction(const frontend::Statement& function);
        void checkConstantInitializer(const frontend::Expression& expression, std::vector<Problem>& problems) const;
        void addError(ErrorKind kind, std::vector<Problem> problems);

        const std::vector<std::string>& m_sourceLines;
        std::string m_entryName;
        ScopeEnvironment m_globals;
        std::vector<Error> m_errors;
        std::size_t m_problemCount{0};
    };
} // namespace badlang::semantic
