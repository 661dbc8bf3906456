#ifndef ITEMSET_HPP
#define ITEMSET_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

// 项：事务中的原子元素
using Item = int;

// 支持计数，使用有符号类型以便拒绝非正的阈值
using Support = long long;

// 事务：调用方给出的项序列
using Transaction = std::vector<Item>;

// 项集：升序且无重复的项序列
using Itemset = std::vector<Item>;

/**
 * 带权事务：条件模式基中的一条前缀路径
 * count 表示该路径代表的事务条数
 */
struct WeightedTransaction {
    std::vector<Item> items;
    Support count;
};

struct ItemsetHash {
    std::size_t operator()(const Itemset& set) const {
        std::size_t hash = set.size();  // 先加入size，避免不同长度的项集碰撞
        for (Item item : set) {
            hash ^= std::hash<Item>{}(item) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
        }
        return hash;
    }
};

// 频繁模式：项集 -> 支持计数
using PatternMap = std::unordered_map<Itemset, Support, ItemsetHash>;

/**
 * 规范化为项集：排序并去重
 */
inline Itemset makeItemset(std::vector<Item> items) {
    std::sort(items.begin(), items.end());
    items.erase(std::unique(items.begin(), items.end()), items.end());
    return items;
}

/**
 * 枚举 pool 中所有大小为 k 的组合（按下标字典序），每个组合回调一次
 * 组合中元素的相对顺序与 pool 中一致
 */
template <typename Fn>
void forEachCombination(const std::vector<Item>& pool, std::size_t k, Fn&& fn) {
    const std::size_t n = pool.size();
    if (k == 0 || k > n) {
        return;
    }

    std::vector<std::size_t> index(k);
    for (std::size_t i = 0; i < k; i++) {
        index[i] = i;
    }

    std::vector<Item> combination(k);
    while (true) {
        for (std::size_t i = 0; i < k; i++) {
            combination[i] = pool[index[i]];
        }
        fn(static_cast<const std::vector<Item>&>(combination));

        // 找到最右侧还能右移的下标
        std::size_t pos = k;
        while (pos > 0 && index[pos - 1] == n - k + pos - 1) {
            pos--;
        }
        if (pos == 0) {
            return;
        }
        index[pos - 1]++;
        for (std::size_t i = pos; i < k; i++) {
            index[i] = index[i - 1] + 1;
        }
    }
}

#endif // ITEMSET_HPP
