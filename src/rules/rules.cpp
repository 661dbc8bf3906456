#include "rules.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <string>

using std::vector;

RuleMap generateAssociationRules(const PatternMap& patterns, double confidence_threshold) {
    if (std::isnan(confidence_threshold) || confidence_threshold < 0.0) {
        throw std::invalid_argument("最小置信度必须是非负数，实际为: " + std::to_string(confidence_threshold));
    }

    RuleMap rules;

    // 置信度不会超过1
    if (confidence_threshold > 1.0) {
        return rules;
    }

    for (const auto& pattern : patterns) {
        const Itemset itemset = makeItemset(pattern.first);
        const Support upper_support = pattern.second;

        // 单项集没有非空真子集
        for (std::size_t k = 1; k < itemset.size(); k++) {
            forEachCombination(itemset, k, [&](const vector<Item>& subset) {
                Itemset antecedent = makeItemset(subset);

                auto lower = patterns.find(antecedent);
                if (lower == patterns.end() || lower->second <= 0) {
                    return;
                }

                double confidence = static_cast<double>(upper_support) / static_cast<double>(lower->second);
                if (confidence < confidence_threshold) {
                    return;
                }

                Itemset consequent;
                std::set_difference(itemset.begin(), itemset.end(),
                                    antecedent.begin(), antecedent.end(),
                                    std::back_inserter(consequent));
                rules[antecedent].push_back(Rule{consequent, confidence, upper_support});
            });
        }
    }

    return rules;
}
