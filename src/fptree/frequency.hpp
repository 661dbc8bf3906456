#ifndef FREQUENCY_HPP
#define FREQUENCY_HPP

#include <cstddef>
#include <unordered_map>
#include <vector>
#include "fptree/itemset.hpp"

/**
 * 频繁1项集表
 * 一次扫描统计每个项的出现次数，只保留计数不低于最小支持计数的项
 * 条目按规范顺序保存：计数降序，计数相同时按扫描中首次出现的先后
 */
class FrequencyTable {
public:
    struct Entry {
        Item item;
        Support count;
    };

    FrequencyTable() = default;

    /**
     * 统计普通事务（每条权重为1）
     * @param transactions 事务集合
     * @param min_support 最小支持计数，必须 >= 1
     */
    FrequencyTable(const std::vector<Transaction>& transactions, Support min_support);

    /**
     * 统计带权事务（条件模式基）
     */
    FrequencyTable(const std::vector<WeightedTransaction>& transactions, Support min_support);

    bool contains(Item item) const {
        return rank_.find(item) != rank_.end();
    }

    // 不在表中的项返回0
    Support count(Item item) const;

    /**
     * 获取项在规范顺序中的位置
     * @throws std::out_of_range 项不在表中
     */
    std::size_t rank(Item item) const;

    const std::vector<Entry>& entries() const noexcept {
        return entries_;
    }

    /**
     * 挖掘顺序：支持度从低到高（规范顺序的逆序）
     */
    std::vector<Item> miningOrder() const;

    /**
     * 过滤掉非频繁项并按规范顺序排序
     */
    std::vector<Item> sortCanonical(const std::vector<Item>& items) const;

    std::size_t size() const noexcept {
        return entries_.size();
    }

    bool empty() const noexcept {
        return entries_.empty();
    }

private:
    void finalize(std::vector<Entry>& seen, Support min_support);

    std::vector<Entry> entries_;
    std::unordered_map<Item, std::size_t> rank_;   // 项 -> entries_ 下标
};

#endif // FREQUENCY_HPP
