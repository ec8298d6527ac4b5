#include "diagnostic.hpp"

#include <algorithm>
#include <sstream>

namespace badlang::semantic
{
    namespace
    {
        constexpr std::string_view kRule = "~~~~~~~~~~~~~~~~~~~";

        void trimTrailingSpaces(std::string& text)
        {
            const auto last = text.find_last_not_of(' ');
            text.erase(last == std::string::npos ? 0 : last + 1);
        }

        bool coversColumn(const Problem& problem, std::uint32_t line, std::size_t index, std::size_t lineLength)
        {
            const SourceSpan& span = problem.span;
            if (line < span.begin.line || line > span.end.line)
            {
                return false;
            }

            const std::size_t first = (line == span.begin.line) ? span.begin.column - 1 : 0;
            const std::size_t last = (line == span.end.line) ? span.end.column - 1 : lineLength;
            return index >= first && index < last;
        }
    } // namespace

    std::string_view toString(ErrorKind kind) noexcept
    {
        switch (kind)
        {
        case ErrorKind::Name: return "Name Error";
        case ErrorKind::Type: return "Type Error";
        case ErrorKind::Parse: return "Syntax Error";
        case ErrorKind::Lex: return "Lexical Error";
        case ErrorKind::Scope: return "Scope Error";
        }
        return "Unknown Error";
    }

    Error::Error(ErrorKind kind, std::vector<Problem> problems, std::uint32_t firstLine, std::vector<std::string> lines)
        : m_kind(kind)
        , m_problems(std::move(problems))
        , m_firstLine(firstLine)
        , m_lines(std::move(lines))
    {
    }

    std::uint32_t Error::startLine() const noexcept
    {
        if (m_problems.empty())
        {
            return m_firstLine;
        }

        std::uint32_t line = m_problems.front().span.begin.line;
        for (const auto& problem : m_problems)
        {
            line = std::min(line, problem.span.begin.line);
        }
        return line;
    }

    std::string Error::render() const
    {
        std::ostringstream out;
        out << toString(m_kind) << '\n' << kRule << '\n';

        if (m_lines.empty())
        {
            for (const auto& problem : m_problems)
            {
                out << problem.message << '\n';
            }
            return out.str();
        }

        for (std::size_t lineIndex = 0; lineIndex < m_lines.size(); ++lineIndex)
        {
            const std::uint32_t lineNumber = m_firstLine + static_cast<std::uint32_t>(lineIndex);
            const std::string& line = m_lines[lineIndex];
            const std::string gutter = std::string(std::to_string(lineNumber).size(), ' ') + " | ";

            out << lineNumber << " | " << line << '\n';

            std::string carets = gutter;
            for (std::size_t index = 0; index < line.size(); ++index)
            {
                const bool covered = std::any_of(m_problems.begin(), m_problems.end(), [&](const Problem& problem) {
                    return coversColumn(problem, lineNumber, index, line.size());
                });
                carets.push_back(covered ? '^' : ' ');
            }
            trimTrailingSpaces(carets);
            out << carets << '\n';

            std::vector<const Problem*> onLine;
            for (const auto& problem : m_problems)
            {
                if (problem.span.begin.line == lineNumber)
                {
                    onLine.push_back(&problem);
                }
            }
            std::stable_sort(onLine.begin(), onLine.end(), [](const Problem* a, const Problem* b) {
                return a->span.begin.column < b->span.begin.column;
            });

            // Rightmost message first; earlier problems keep a '|' marker above their own message.
            for (std::size_t row = 0; row < onLine.size(); ++row)
            {
                const std::size_t target = onLine.size() - 1 - row;
                std::string text = gutter;
                for (std::size_t index = 0; index <= target; ++index)
                {
                    const std::size_t column = gutter.size() + onLine[index]->span.begin.column - 1;
                    if (text.size() < column)
                    {
                        text.append(column - text.size(), ' ');
                    }
                    if (index < target)
                    {
                        text.push_back('|');
                    }
                    else
                    {
                        text += onLine[index]->message;
                    }
                }
                out << text << '\n';
            }
        }

        return out.str();
    }

    std::vector<std::string> splitSourceLines(std::string_view source)
    {
        std::vector<std::string> lines;
        std::size_t start = 0;
        while (start < source.size())
        {
            std::size_t end = source.find('\n', start);
            if (end == std::string_view::npos)
            {
                end = source.size();
            }

            std::string line{source.substr(start, end - start)};
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            lines.emplace_back(std::move(line));
            start = end + 1;
        }
        return lines;
    }

    Error makeError(ErrorKind kind, std::vector<Problem> problems, const std::vector<std::string>& sourceLines)
    {
        if (problems.empty())
        {
            return Error(kind, std::move(problems), 1, {});
        }

        std::uint32_t first = problems.front().span.begin.line;
        std::uint32_t last = problems.front().span.end.line;
        for (const auto& problem : problems)
        {
            first = std::min(first, problem.span.begin.line);
            last = std::max(last, std::max(problem.span.begin.line, problem.span.end.line));
        }

        first = std::max<std::uint32_t>(first, 1);
        last = std::min<std::uint32_t>(last, static_cast<std::uint32_t>(sourceLines.size()));

        std::vector<std::string> window;
        for (std::uint32_t line = first; line <= last; ++line)
        {
            window.push_back(sourceLines[line - 1]);
        }

        return Error(kind, std::move(problems), first, std::move(window));
    }

    std::vector<Error> mergeBySourceLine(const std::vector<std::vector<Error>>& lists)
    {
        std::vector<Error> merged;
        for (const auto& list : lists)
        {
            merged.insert(merged.end(), list.begin(), list.end());
        }

        std::stable_sort(merged.begin(), merged.end(), [](const Error& a, const Error& b) {
            return a.startLine() < b.startLine();
        });
        return merged;
    }

    std::size_t countProblems(const std::vector<Error>& errors) noexcept
    {
        std::size_t count = 0;
        for (const auto& error : errors)
        {
            count += error.problems().size();
        }
        return count;
    }
} // namespace badlang::semantic
