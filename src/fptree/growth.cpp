#include "growth.hpp"
#include "threadsignal.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using std::cout;
using std::endl;
using std::vector;
using std::future;

namespace {

// 节点数不超过该值时在详细输出中展示整棵树
constexpr std::size_t kShowTreeLimit = 64;

Itemset withItem(const Itemset& suffix, Item item) {
    Itemset extended = suffix;
    extended.push_back(item);
    return makeItemset(std::move(extended));
}

Itemset rootSuffix(const FPTree& tree) {
    if (auto root = tree.rootItem()) {
        return {*root};
    }
    return {};
}

// 单路径：频繁项的每个非空组合都是频繁模式，支持计数取组合中最小的计数
void emitSinglePath(const FPTree& tree, const Itemset& suffix, PatternMap& patterns) {
    const auto& frequency = tree.frequency();

    vector<Item> items;
    items.reserve(frequency.size());
    for (const auto& entry : frequency.entries()) {
        items.push_back(entry.item);
    }

    for (std::size_t k = 1; k <= items.size(); k++) {
        forEachCombination(items, k, [&](const vector<Item>& subset) {
            Support support = frequency.count(subset.front());
            for (Item item : subset) {
                support = std::min(support, frequency.count(item));
            }

            Itemset key = subset;
            key.insert(key.end(), suffix.begin(), suffix.end());
            mergePattern(patterns, makeItemset(std::move(key)), support);
        });
    }
}

} // namespace

FPGrowth::FPGrowth(const MinerOptions& options) : options_(options) {
    if (options_.min_support < 1) {
        throw std::invalid_argument("最小支持计数必须 >= 1，实际为: " + std::to_string(options_.min_support));
    }
}

PatternMap FPGrowth::mine(const vector<Transaction>& transactions) const {
    if (options_.verbose) {
        cout << "\n========== FP-Tree 算法 ==========" << endl;
        cout << "事务数量: " << transactions.size()
             << " (最小支持计数: " << options_.min_support << ")" << endl;
        cout << "\n步骤1: 计算频繁1项集并构建FP-Tree..." << endl;
    }

    auto begintime = std::chrono::high_resolution_clock::now();
    FPTree tree(transactions, options_.min_support);
    auto endtime = std::chrono::high_resolution_clock::now();

    if (options_.verbose) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endtime - begintime);
        cout << "找到 " << tree.frequency().size() << " 个频繁1项集" << endl;
        cout << "FP-Tree构建完成，共 " << tree.nodeCount() << " 个节点，耗时: "
             << duration.count() << "ms" << endl;
        if (tree.nodeCount() <= kShowTreeLimit) {
            tree.showTree(cout);
        }
        cout << "\n步骤2: 挖掘频繁项集..." << endl;
    }

    PatternMap patterns = mine(tree);

    if (options_.verbose) {
        cout << "\nFP-Tree算法完成！共找到 " << patterns.size() << " 个频繁项集" << endl;
    }
    return patterns;
}

PatternMap FPGrowth::mine(const FPTree& tree) const {
    if (resolveThreadCount(options_.thread_count) > 1 && !tree.hasSinglePath()) {
        return mineParallel(tree);
    }

    PatternMap patterns;
    vector<Frame> stack;
    expand(tree, rootSuffix(tree), stack, patterns);
    drain(stack, patterns);
    return patterns;
}

std::unique_ptr<FPTree> FPGrowth::buildConditionalTree(const FPTree& tree, Item item) const {
    return std::make_unique<FPTree>(tree.conditionalPatternBase(item), tree.minSupport(),
                                    item, tree.frequency().count(item));
}

void FPGrowth::expand(const FPTree& tree, const Itemset& suffix,
                      vector<Frame>& stack, PatternMap& patterns) const {
    // 条件树的后缀本身就是一个频繁模式，计数为根节点计数
    if (!suffix.empty()) {
        mergePattern(patterns, suffix, tree.rootCount());
    }

    if (tree.hasSinglePath()) {
        emitSinglePath(tree, suffix, patterns);
        return;
    }

    // 逆序压栈，出栈时支持度最低的项最先处理
    auto order = tree.frequency().miningOrder();
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        stack.push_back(Frame{buildConditionalTree(tree, *it), withItem(suffix, *it)});
    }
}

void FPGrowth::drain(vector<Frame>& stack, PatternMap& patterns) const {
    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();
        expand(*frame.tree, frame.suffix, stack, patterns);
    }
}

PatternMap FPGrowth::mineParallel(const FPTree& tree) const {
    auto& tpool = getThreadPool(options_.thread_count);

    const Itemset suffix = rootSuffix(tree);
    PatternMap patterns;
    if (!suffix.empty()) {
        mergePattern(patterns, suffix, tree.rootCount());
    }

    // 每个项的条件树互不依赖，提交到线程池并发挖掘
    auto order = tree.frequency().miningOrder();
    vector<future<PatternMap>> futures;
    futures.reserve(order.size());
    for (Item item : order) {
        futures.push_back(tpool.submit_task([this, &tree, &suffix, item]() {
            PatternMap local;
            vector<Frame> stack;
            stack.push_back(Frame{buildConditionalTree(tree, item), withItem(suffix, item)});
            drain(stack, local);
            return local;
        }));
    }

    // 等待所有任务完成后再取结果，任务仍持有 tree 的引用
    for (auto& task : futures) {
        task.wait();
    }

    // 按挖掘顺序合并，结果与串行一致
    for (auto& task : futures) {
        for (const auto& [itemset, support] : task.get()) {
            mergePattern(patterns, itemset, support);
        }
    }

    if (options_.verbose) {
        cout << "并发挖掘 " << order.size() << " 棵条件FP-Tree完成" << endl;
    }
    return patterns;
}

PatternMap findFrequentPatterns(const vector<Transaction>& transactions, Support support_threshold) {
    MinerOptions options;
    options.min_support = support_threshold;
    return findFrequentPatterns(transactions, options);
}

PatternMap findFrequentPatterns(const vector<Transaction>& transactions, const MinerOptions& options) {
    return FPGrowth(options).mine(transactions);
}

void mergePattern(PatternMap& patterns, const Itemset& itemset, Support support) {
    auto found = patterns.find(itemset);
    if (found != patterns.end()) {
        found->second += support;
    } else {
        patterns.emplace(itemset, support);
    }
}

vector<PatternLevel> groupByLevel(const PatternMap& patterns) {
    vector<PatternLevel> levels;
    for (const auto& [itemset, support] : patterns) {
        if (itemset.empty()) {
            continue;
        }
        if (itemset.size() > levels.size()) {
            levels.resize(itemset.size());
        }
        levels[itemset.size() - 1].emplace_back(itemset, support);
    }

    for (auto& level : levels) {
        std::sort(level.begin(), level.end());
    }
    return levels;
}
