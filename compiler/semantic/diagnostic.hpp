#pragma once

#include "../frontend/token.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace badlang::semantic
{
    using frontend::SourceLocation;
    using frontend::SourceSpan;

    enum class ErrorKind : std::uint8_t
    {
        Name,
        Type,
        Parse,
        Lex,
        Scope
    };

    [[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

    struct Problem
    {
        SourceSpan span;
        std::string message;
    };

    /**
     * One or more problems of the same kind raised while checking a single statement, together with the
     * source lines they cover. An error built without lines (a program-level problem) renders its messages
     * only.
     */
    class Error
    {
    public:
        Error(ErrorKind kind, std::vector<Problem> problems, std::uint32_t firstLine, std::vector<std::string> lines);

        [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }
        [[nodiscard]] const std::vector<Problem>& problems() const noexcept { return m_problems; }
        [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return m_lines; }

        /// Smallest starting line among the problems.
        [[nodiscard]] std::uint32_t startLine() const noexcept;

        [[nodiscard]] std::string render() const;

    private:
        ErrorKind m_kind;
        std::vector<Problem> m_problems;
        std::uint32_t m_firstLine;
        std::vector<std::string> m_lines;
    };

    [[nodiscard]] std::vector<std::string> splitSourceLines(std::string_view source);

    /// Builds an error whose line window covers every problem span, clamped to the available source lines.
    [[nodiscard]] Error makeError(ErrorKind kind, std::vector<Problem> problems,
                                  const std::vector<std::string>& sourceLines);

    /// Interleaves per-pass lists by start line; ties keep list order, then order within a list.
    [[nodiscard]] std::vector<Error> mergeBySourceLine(const std::vector<std::vector<Error>>& lists);

    [[nodiscard]] std::size_t countProblems(const std::vector<Error>& errors) noexcept;
} // namespace badlang::semantic
