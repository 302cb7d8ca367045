#include "../include/ranker.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<std::string> words(const SelectedSubset& subset)
{
    std::vector<std::string> out;
    for (const auto& e : subset.entries) out.push_back(e.word);
    return out;
}

} // namespace

TEST(Ranker, TopTwoAlphabetized) {
    FrequencyTable table = {{"the", 3}, {"cat", 2}, {"dog", 1}};
    SelectedSubset subset = Ranker::select(table, 2);

    EXPECT_EQ(words(subset), (std::vector<std::string>{"cat", "the"}));
    EXPECT_EQ(subset.entries[0].count, 2);
    EXPECT_EQ(subset.entries[1].count, 3);
    EXPECT_EQ(subset.minCount, 2);
    EXPECT_EQ(subset.maxCount, 3);
}

TEST(Ranker, SelectionSizeIsClamped) {
    FrequencyTable table = {{"a", 5}, {"b", 4}, {"c", 3}, {"d", 2}};
    for (int n = 0; n <= 7; ++n) {
        SelectedSubset subset = Ranker::select(table, n);
        EXPECT_EQ(subset.size(), std::min<std::size_t>(n, table.size())) << "n=" << n;
    }
}

TEST(Ranker, MinMaxComeFromSubsetOnly) {
    FrequencyTable table = {{"a", 10}, {"b", 7}, {"c", 5}, {"d", 1}};
    SelectedSubset subset = Ranker::select(table, 3);
    EXPECT_EQ(subset.maxCount, 10);
    EXPECT_EQ(subset.minCount, 5);
}

TEST(Ranker, SingleEntryHasEqualMinMax) {
    FrequencyTable table = {{"alpha", 3}, {"beta", 1}};
    SelectedSubset subset = Ranker::select(table, 1);
    ASSERT_EQ(subset.size(), 1u);
    EXPECT_EQ(subset.entries[0].word, "alpha");
    EXPECT_EQ(subset.minCount, 3);
    EXPECT_EQ(subset.maxCount, 3);
}

TEST(Ranker, TiesAtCutoffPreferEarlierWords) {
    FrequencyTable table = {{"cherry", 2}, {"banana", 2}, {"apple", 2}, {"date", 5}};
    SelectedSubset subset = Ranker::select(table, 2);
    EXPECT_EQ(words(subset), (std::vector<std::string>{"apple", "date"}));
    EXPECT_EQ(subset.minCount, 2);
    EXPECT_EQ(subset.maxCount, 5);

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(words(Ranker::select(table, 3)),
                  (std::vector<std::string>{"apple", "banana", "date"}));
    }
}

TEST(Ranker, AlphabeticalOrderIgnoresCase) {
    FrequencyTable table = {{"Banana", 1}, {"apple", 1}, {"Cherry", 1}};
    SelectedSubset subset = Ranker::select(table, 3);
    EXPECT_EQ(words(subset), (std::vector<std::string>{"apple", "Banana", "Cherry"}));
}

TEST(Ranker, CompareIgnoreCase) {
    EXPECT_EQ(Ranker::compareIgnoreCase("Word", "word"), 0);
    EXPECT_LT(Ranker::compareIgnoreCase("apple", "Banana"), 0);
    EXPECT_GT(Ranker::compareIgnoreCase("cat", "Ca"), 0);
    EXPECT_LT(Ranker::compareIgnoreCase("", "a"), 0);
}

TEST(Ranker, ZeroCountIsEmpty) {
    FrequencyTable table = {{"a", 1}};
    SelectedSubset subset = Ranker::select(table, 0);
    EXPECT_TRUE(subset.empty());
    EXPECT_EQ(subset.minCount, 0);
    EXPECT_EQ(subset.maxCount, 0);
}

TEST(Ranker, EmptyTable) {
    SelectedSubset subset = Ranker::select(FrequencyTable(), 5);
    EXPECT_TRUE(subset.empty());
}

TEST(Ranker, NegativeCountThrows) {
    FrequencyTable table = {{"a", 1}};
    EXPECT_THROW(Ranker::select(table, -1), InvalidCountError);
    EXPECT_THROW(Ranker::select(table, -1), std::invalid_argument);

    try {
        Ranker::select(table, -4);
        FAIL() << "expected InvalidCountError";
    } catch (const InvalidCountError& e) {
        EXPECT_EQ(e.count(), -4);
    }
}
