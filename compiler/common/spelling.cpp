#include "spelling.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace badlang::common
{
    namespace
    {
        std::string toLowerCopy(std::string_view text)
        {
            std::string result;
            result.reserve(text.size());
            for (const char ch : text)
            {
                result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
            }
            return result;
        }
    } // namespace

    std::size_t editDistance(std::string_view first, std::string_view second)
    {
        // Single rolling row of the dynamic-programming table.
        std::vector<std::size_t> row(second.size() + 1);
        for (std::size_t column = 0; column <= second.size(); ++column)
        {
            row[column] = column;
        }

        for (std::size_t line = 1; line <= first.size(); ++line)
        {
            std::size_t diagonal = row[0];
            row[0] = line;
            for (std::size_t column = 1; column <= second.size(); ++column)
            {
                const std::size_t above = row[column];
                if (first[line - 1] == second[column - 1])
                {
                    row[column] = diagonal;
                }
                else
                {
                    row[column] = 1 + std::min({diagonal, above, row[column - 1]});
                }
                diagonal = above;
            }
        }

        return row[second.size()];
    }

    std::optional<std::string> suggestCorrection(std::string_view input, const std::vector<std::string>& vocabulary)
    {
        const std::string loweredInput = toLowerCopy(input);
        const std::size_t threshold = std::max<std::size_t>(1, input.size() / 2);

        std::optional<std::string> bestMatch;
        std::size_t bestDistance = std::numeric_limits<std::size_t>::max();

        for (const auto& word : vocabulary)
        {
            const std::size_t distance = editDistance(loweredInput, toLowerCopy(word));
            if (distance < bestDistance)
            {
                bestDistance = distance;
                bestMatch = word;
            }
        }

        if (!bestMatch.has_value() || bestDistance > threshold)
        {
            return std::nullopt;
        }
        return bestMatch;
    }
} // namespace badlang::common
