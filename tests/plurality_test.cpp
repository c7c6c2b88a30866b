#include <pathwright/plurality.hpp>

#include <gtest/gtest.h>

#include <list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace pathwright;

TEST(plurality, consensus)
{
    EXPECT_EQ(plurality(std::vector<int>{1, 1, 1, 1}), std::make_pair(1, 4));
}

TEST(plurality, near_consensus)
{
    EXPECT_EQ(plurality(std::vector<int>{1, 1, 2, 1}), std::make_pair(1, 3));
}

TEST(plurality, conflict_first_wins)
{
    EXPECT_EQ(plurality(std::vector<int>{1, 1, 2, 2, 3}), std::make_pair(1, 2));
    EXPECT_EQ(plurality(std::vector<int>{3, 2, 2, 1, 1}), std::make_pair(2, 2));
}

TEST(plurality, later_majority_beats_earlier_value)
{
    EXPECT_EQ(plurality(std::vector<int>{1, 2, 2}), std::make_pair(2, 2));
}

TEST(plurality, single_value)
{
    EXPECT_EQ(plurality(std::vector<std::string>{"only"}),
            std::make_pair(std::string("only"), 1));
}

TEST(plurality, works_on_any_input_range)
{
    const std::list<std::string> labels{"b", "a", "a", "b"};
    const auto result = plurality(labels.begin(), labels.end());
    EXPECT_EQ(result.first, "b");
    EXPECT_EQ(result.second, 2);
}

TEST(plurality, empty_sequence_throws_invalid_argument)
{
    EXPECT_THROW(plurality(std::vector<int>{}), std::invalid_argument);
    try {
        plurality(std::vector<int>{});
        FAIL() << "expected std::invalid_argument";
    } catch(const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("must be non-empty"), std::string::npos);
    }
}
