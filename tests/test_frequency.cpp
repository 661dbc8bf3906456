#include "fptree/frequency.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace {

const std::vector<Transaction> kTextbook = {
    {1, 3, 4},
    {2, 3, 5},
    {1, 2, 3, 5},
    {2, 5},
};

std::vector<Item> itemsOf(const FrequencyTable& table) {
    std::vector<Item> items;
    for (const auto& entry : table.entries()) {
        items.push_back(entry.item);
    }
    return items;
}

} // namespace

TEST(FrequencyTable, KeepsOnlyItemsMeetingThreshold) {
    FrequencyTable table(kTextbook, 2);

    EXPECT_EQ(table.size(), 4u);
    EXPECT_TRUE(table.contains(1));
    EXPECT_FALSE(table.contains(4));
    EXPECT_EQ(table.count(1), 2);
    EXPECT_EQ(table.count(2), 3);
    EXPECT_EQ(table.count(3), 3);
    EXPECT_EQ(table.count(5), 3);
    EXPECT_EQ(table.count(4), 0);
}

TEST(FrequencyTable, EqualCountsKeepFirstSeenOrder) {
    FrequencyTable table(kTextbook, 2);

    // 3、2、5 计数都为3，按扫描中首次出现的先后排列
    EXPECT_EQ(itemsOf(table), (std::vector<Item>{3, 2, 5, 1}));
    EXPECT_EQ(table.rank(3), 0u);
    EXPECT_EQ(table.rank(1), 3u);
    EXPECT_EQ(table.miningOrder(), (std::vector<Item>{1, 5, 2, 3}));
}

TEST(FrequencyTable, TiesFollowFirstAppearanceAcrossTransactions) {
    std::vector<Transaction> transactions = {{7, 8}, {8, 7}, {9}};
    FrequencyTable table(transactions, 1);

    EXPECT_EQ(itemsOf(table), (std::vector<Item>{7, 8, 9}));
    EXPECT_EQ(table.sortCanonical({9, 8, 7}), (std::vector<Item>{7, 8, 9}));
}

TEST(FrequencyTable, SortCanonicalDropsInfrequentItems) {
    FrequencyTable table(kTextbook, 2);
    EXPECT_EQ(table.sortCanonical({4, 1, 5, 3}), (std::vector<Item>{3, 5, 1}));
    EXPECT_TRUE(table.sortCanonical({4, 6}).empty());
}

TEST(FrequencyTable, WeightedTransactionsAccumulateCounts) {
    std::vector<WeightedTransaction> base = {
        {{2, 3}, 2},
        {{2}, 1},
        {{4}, 1},
    };
    FrequencyTable table(base, 2);

    EXPECT_EQ(table.count(2), 3);
    EXPECT_EQ(table.count(3), 2);
    EXPECT_FALSE(table.contains(4));
}

TEST(FrequencyTable, EmptyInputGivesEmptyTable) {
    FrequencyTable table(std::vector<Transaction>{}, 1);
    EXPECT_TRUE(table.empty());
    EXPECT_TRUE(table.miningOrder().empty());
}

TEST(FrequencyTable, RankOfAbsentItemThrows) {
    FrequencyTable table(kTextbook, 2);
    EXPECT_THROW(table.rank(4), std::out_of_range);
}

TEST(FrequencyTable, RejectsNonPositiveThreshold) {
    EXPECT_THROW(FrequencyTable(kTextbook, 0), std::invalid_argument);
    EXPECT_THROW(FrequencyTable(kTextbook, -3), std::invalid_argument);
}
