#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace badlang::common
{
    /**
     * Levenshtein distance between two strings (insertions, deletions and substitutions all cost one).
     */
    [[nodiscard]] std::size_t editDistance(std::string_view first, std::string_view second);

    /**
     * Pick the closest vocabulary word to `input`, comparing case-insensitively. A word qualifies when its
     * distance is at most max(1, input.size() / 2); among qualifying words the smallest distance wins and
     * ties keep the earliest word in `vocabulary`.
     */
    [[nodiscard]] std::optional<std::string> suggestCorrection(std::string_view input,
                                                               const std::vector<std::string>& vocabulary);
} // namespace badlang::common
