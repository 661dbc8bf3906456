#include "rules/rules.hpp"
#include "fptree/growth.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

// Han & Kamber 的例子，最小支持计数为2
const PatternMap kPatterns = {
    {{1}, 6}, {{2}, 7}, {{3}, 6}, {{4}, 2}, {{5}, 2},
    {{1, 2}, 4}, {{1, 3}, 4}, {{1, 5}, 2}, {{2, 3}, 4}, {{2, 4}, 2}, {{2, 5}, 2},
    {{1, 2, 3}, 2}, {{1, 2, 5}, 2},
};

const Rule* findRule(const RuleMap& rules, const Itemset& antecedent, const Itemset& consequent) {
    auto found = rules.find(antecedent);
    if (found == rules.end()) {
        return nullptr;
    }
    for (const auto& rule : found->second) {
        if (rule.consequent == consequent) {
            return &rule;
        }
    }
    return nullptr;
}

} // namespace

TEST(AssociationRules, KeepsRulesAboveConfidence) {
    RuleMap rules = generateAssociationRules(kPatterns, 0.7);

    const Rule* rule = findRule(rules, {1, 5}, {2});
    ASSERT_NE(rule, nullptr);
    EXPECT_DOUBLE_EQ(rule->confidence, 1.0);
    EXPECT_EQ(rule->support, 2);

    rule = findRule(rules, {2, 5}, {1});
    ASSERT_NE(rule, nullptr);
    EXPECT_DOUBLE_EQ(rule->confidence, 1.0);

    rule = findRule(rules, {4}, {2});
    ASSERT_NE(rule, nullptr);
    EXPECT_DOUBLE_EQ(rule->confidence, 1.0);

    // 同一个前件可以积累多条规则
    ASSERT_EQ(rules.at({5}).size(), 3u);
    for (const Itemset& consequent : {Itemset{1}, Itemset{2}, Itemset{1, 2}}) {
        rule = findRule(rules, {5}, consequent);
        ASSERT_NE(rule, nullptr);
        EXPECT_DOUBLE_EQ(rule->confidence, 1.0);
    }

    // 2 => 1 的置信度为 4/7，低于阈值
    EXPECT_EQ(findRule(rules, {2}, {1}), nullptr);
}

TEST(AssociationRules, ConfidenceIsExactRatio) {
    const double threshold = 0.3;
    RuleMap rules = generateAssociationRules(kPatterns, threshold);
    ASSERT_FALSE(rules.empty());

    for (const auto& [antecedent, consequents] : rules) {
        for (const auto& rule : consequents) {
            Itemset full = antecedent;
            full.insert(full.end(), rule.consequent.begin(), rule.consequent.end());
            full = makeItemset(full);

            // 前件与后件不相交
            EXPECT_EQ(full.size(), antecedent.size() + rule.consequent.size());

            double expected = static_cast<double>(kPatterns.at(full)) / static_cast<double>(kPatterns.at(antecedent));
            EXPECT_EQ(rule.confidence, expected);
            EXPECT_EQ(rule.support, kPatterns.at(full));
            EXPECT_GE(rule.confidence, threshold);
            EXPECT_LE(rule.confidence, 1.0);
        }
    }
}

TEST(AssociationRules, LowThresholdEnumeratesEverySplit) {
    PatternMap patterns = findFrequentPatterns({{1, 3, 4}, {2, 3, 5}, {1, 2, 3, 5}, {2, 5}}, 2);
    RuleMap rules = generateAssociationRules(patterns, 0.1);

    // 每个 k 项集贡献 2^k - 2 条规则
    std::size_t expected = 0;
    for (const auto& [itemset, support] : patterns) {
        expected += (std::size_t{1} << itemset.size()) - 2;
    }

    std::size_t total = 0;
    for (const auto& [antecedent, consequents] : rules) {
        total += consequents.size();
    }
    EXPECT_EQ(total, expected);

    const Rule* rule = findRule(rules, {3}, {2, 5});
    ASSERT_NE(rule, nullptr);
    EXPECT_DOUBLE_EQ(rule->confidence, 2.0 / 3.0);
}

TEST(AssociationRules, EmptyPatternsGiveNoRules) {
    EXPECT_TRUE(generateAssociationRules(PatternMap{}, 0.5).empty());
    EXPECT_TRUE(generateAssociationRules(findFrequentPatterns({}, 1), 0.0).empty());
}

TEST(AssociationRules, ThresholdAboveOneGivesNoRules) {
    EXPECT_TRUE(generateAssociationRules(kPatterns, 1.01).empty());
    EXPECT_TRUE(generateAssociationRules(kPatterns, 5.0).empty());
}

TEST(AssociationRules, MissingAntecedentIsSkipped) {
    PatternMap patterns = {{{1, 2}, 2}, {{1}, 4}};
    RuleMap rules = generateAssociationRules(patterns, 0.0);

    ASSERT_EQ(rules.size(), 1u);
    const Rule* rule = findRule(rules, {1}, {2});
    ASSERT_NE(rule, nullptr);
    EXPECT_DOUBLE_EQ(rule->confidence, 0.5);
    EXPECT_EQ(rules.count({2}), 0u);
}

TEST(AssociationRules, RejectsInvalidThreshold) {
    EXPECT_THROW(generateAssociationRules(kPatterns, -0.1), std::invalid_argument);
    EXPECT_THROW(generateAssociationRules(kPatterns, std::numeric_limits<double>::quiet_NaN()),
                 std::invalid_argument);
}
