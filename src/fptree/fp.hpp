#ifndef FP_HPP
#define FP_HPP

#include <cstddef>
#include <iosfwd>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>
#include "fptree/frequency.hpp"
#include "fptree/itemset.hpp"

/**
 * FP-Tree
 * 按规范顺序（支持度降序）压缩存储所有事务的前缀树
 * 节点保存在树自身的节点池中，父子关系和同项链表都用下标表示
 */
class FPTree {
public:
    using NodeIndex = std::size_t;
    static constexpr NodeIndex kNoNode = std::numeric_limits<NodeIndex>::max();
    static constexpr NodeIndex kRoot = 0;

    struct FPNode {
        std::optional<Item> item;          // 项的值，顶层树的根节点为空
        Support count;                     // 支持计数
        NodeIndex parent;                  // 父节点，根节点为 kNoNode
        std::vector<NodeIndex> children;   // 子节点，同一个项最多出现一次
        NodeIndex next;                    // 同项链表中的下一个节点
    };

    /**
     * 构建顶层FP-Tree（根节点不带项）
     * @param transactions 事务集合
     * @param min_support 最小支持计数
     */
    FPTree(const std::vector<Transaction>& transactions, Support min_support);

    /**
     * 构建条件FP-Tree
     * @param pattern_base 条件模式基（带权前缀路径）
     * @param min_support 最小支持计数
     * @param root_item 后缀项
     * @param root_count 后缀项在上一层树中的支持计数
     */
    FPTree(const std::vector<WeightedTransaction>& pattern_base, Support min_support,
           Item root_item, Support root_count);

    const FrequencyTable& frequency() const noexcept {
        return frequency_;
    }

    Support minSupport() const noexcept {
        return min_support_;
    }

    const FPNode& node(NodeIndex index) const {
        return nodes_.at(index);
    }

    std::optional<Item> rootItem() const {
        return nodes_[kRoot].item;
    }

    Support rootCount() const {
        return nodes_[kRoot].count;
    }

    // 包括根节点在内的节点数
    std::size_t nodeCount() const noexcept {
        return nodes_.size();
    }

    // 没有任何频繁项
    bool empty() const noexcept {
        return frequency_.empty();
    }

    /**
     * 头表：项在树中第一次出现的节点
     * @return 节点下标，不存在时为 kNoNode
     */
    NodeIndex headOf(Item item) const;

    /**
     * 沿同项链表收集项的所有出现节点（按插入顺序）
     */
    std::vector<NodeIndex> occurrences(Item item) const;

    /**
     * 判断从根节点起每个节点是否最多只有一个子节点
     */
    bool hasSinglePath() const;

    /**
     * 生成项的条件模式基
     * 每个出现节点沿父节点向上收集路径（不含根节点），权重为该节点的计数
     */
    std::vector<WeightedTransaction> conditionalPatternBase(Item item) const;

    /**
     * 显示FP-Tree结构（按层展示）
     */
    void showTree(std::ostream& os) const;

private:
    struct HeaderEntry {
        NodeIndex head;
        NodeIndex tail;
    };

    FrequencyTable frequency_;
    Support min_support_;

    std::vector<FPNode> nodes_;                          // 节点池，下标0为根节点
    std::unordered_map<Item, HeaderEntry> header_table_; // 头表：项 -> 同项链表

    void initRoot(std::optional<Item> item, Support count);

    /**
     * 插入一条已按规范顺序排序的事务
     */
    void insert(const std::vector<Item>& sorted_items, Support weight);

    NodeIndex findChild(NodeIndex parent, Item item) const;
};

#endif // FP_HPP
