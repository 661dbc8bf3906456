#ifndef GROWTH_HPP
#define GROWTH_HPP

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>
#include "fptree/fp.hpp"
#include "fptree/itemset.hpp"

/**
 * 挖掘参数
 */
struct MinerOptions {
    Support min_support = 1;     // 最小支持计数（绝对数量）
    std::size_t thread_count = 1; // 顶层并发数，1为串行，0为硬件并发数
    bool verbose = false;         // 是否输出挖掘过程
};

/**
 * FP-Growth 挖掘器
 * 单路径树直接枚举组合，否则按支持度从低到高逐项构建条件FP-Tree
 * 递归用显式栈完成，每一帧保存（条件树，累计后缀）
 */
class FPGrowth {
public:
    explicit FPGrowth(const MinerOptions& options);

    /**
     * 构建FP-Tree并挖掘全部频繁项集
     */
    PatternMap mine(const std::vector<Transaction>& transactions) const;

    /**
     * 挖掘一棵已经构建好的树（使用建树时的最小支持计数）
     * 对同一棵树可以重复调用，结果相同
     */
    PatternMap mine(const FPTree& tree) const;

    const MinerOptions& options() const noexcept {
        return options_;
    }

private:
    MinerOptions options_;

    struct Frame {
        std::unique_ptr<FPTree> tree;
        Itemset suffix;   // 已包含 tree 根节点的项
    };

    /**
     * 为 item 构建条件FP-Tree，根节点计数为 item 在 tree 中的支持计数
     */
    std::unique_ptr<FPTree> buildConditionalTree(const FPTree& tree, Item item) const;

    // 处理一帧：记录模式，并把需要继续挖掘的条件树压栈
    void expand(const FPTree& tree, const Itemset& suffix,
                std::vector<Frame>& stack, PatternMap& patterns) const;

    // 依次弹出并处理栈中的帧，直到栈为空
    void drain(std::vector<Frame>& stack, PatternMap& patterns) const;

    // 顶层逐项挖掘提交到线程池，结果按挖掘顺序合并
    PatternMap mineParallel(const FPTree& tree) const;
};

/**
 * 挖掘频繁项集
 * @param transactions 事务集合
 * @param support_threshold 最小支持计数，必须 >= 1
 * @return 项集 -> 支持计数
 */
PatternMap findFrequentPatterns(const std::vector<Transaction>& transactions, Support support_threshold);

PatternMap findFrequentPatterns(const std::vector<Transaction>& transactions, const MinerOptions& options);

/**
 * 向结果中合并一个模式，已存在时累加支持计数
 */
void mergePattern(PatternMap& patterns, const Itemset& itemset, Support support);

// 按项集大小分层，层内按字典序排序；levels[k] 为 k+1 项集
using PatternLevel = std::vector<std::pair<Itemset, Support>>;
std::vector<PatternLevel> groupByLevel(const PatternMap& patterns);

#endif // GROWTH_HPP
