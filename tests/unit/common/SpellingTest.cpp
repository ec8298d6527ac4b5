#include <gtest/gtest.h>

#include "spelling.hpp"

namespace badlang::common
{
namespace
{
    TEST(SpellingTest, ComputesEditDistance)
    {
        EXPECT_EQ(editDistance("", ""), 0u);
        EXPECT_EQ(editDistance("abc", ""), 3u);
        EXPECT_EQ(editDistance("kitten", "sitting"), 3u);
        EXPECT_EQ(editDistance("coutn", "count"), 2u);
    }

    TEST(SpellingTest, SuggestsClosestWord)
    {
        const std::vector<std::string> vocabulary{"total", "count", "index"};

        const auto suggestion = suggestCorrection("coutn", vocabulary);
        ASSERT_TRUE(suggestion.has_value());
        EXPECT_EQ(*suggestion, "count");
    }

    TEST(SpellingTest, ComparesCaseInsensitively)
    {
        const auto suggestion = suggestCorrection("COUNT", {"count"});
        ASSERT_TRUE(suggestion.has_value());
        EXPECT_EQ(*suggestion, "count");
    }

    TEST(SpellingTest, RejectsDistantWords)
    {
        EXPECT_FALSE(suggestCorrection("xyz123", {"count", "total"}).has_value());
        EXPECT_FALSE(suggestCorrection("a", {}).has_value());
    }

    TEST(SpellingTest, KeepsEarliestWordOnTie)
    {
        const auto suggestion = suggestCorrection("cat", {"bat", "hat"});
        ASSERT_TRUE(suggestion.has_value());
        EXPECT_EQ(*suggestion, "bat");
    }
} // namespace
} // namespace badlang::common
