#ifndef RULES_HPP
#define RULES_HPP

#include <unordered_map>
#include <vector>
#include "fptree/itemset.hpp"

/**
 * 关联规则 antecedent => consequent
 * confidence = support(antecedent ∪ consequent) / support(antecedent)
 */
struct Rule {
    Itemset consequent;
    double confidence;
    Support support;   // antecedent ∪ consequent 的支持计数
};

// 前件 -> 该前件下满足置信度的所有规则
using RuleMap = std::unordered_map<Itemset, std::vector<Rule>, ItemsetHash>;

/**
 * 由频繁项集生成关联规则
 * 对每个项集枚举所有非空真子集作为前件，前件不在 patterns 中时跳过
 * @param patterns 频繁项集 -> 支持计数
 * @param confidence_threshold 最小置信度，大于1时结果为空
 * @throws std::invalid_argument 置信度为负数或NaN
 */
RuleMap generateAssociationRules(const PatternMap& patterns, double confidence_threshold);

#endif // RULES_HPP
