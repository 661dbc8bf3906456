#include "frequency.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

using std::vector;
using std::unordered_map;

namespace {

// 按首次出现顺序累加计数
template <typename Range, typename ItemsOf, typename WeightOf>
vector<FrequencyTable::Entry> countItems(const Range& transactions, ItemsOf items_of, WeightOf weight_of) {
    vector<FrequencyTable::Entry> seen;
    unordered_map<Item, std::size_t> position;

    for (const auto& transaction : transactions) {
        const Support weight = weight_of(transaction);
        for (Item item : items_of(transaction)) {
            auto found = position.find(item);
            if (found == position.end()) {
                position.emplace(item, seen.size());
                seen.push_back({item, weight});
            } else {
                seen[found->second].count += weight;
            }
        }
    }

    return seen;
}

void checkMinSupport(Support min_support) {
    if (min_support < 1) {
        throw std::invalid_argument("最小支持计数必须 >= 1，实际为: " + std::to_string(min_support));
    }
}

} // namespace

FrequencyTable::FrequencyTable(const vector<Transaction>& transactions, Support min_support) {
    checkMinSupport(min_support);

    auto seen = countItems(transactions,
        [](const Transaction& t) -> const vector<Item>& { return t; },
        [](const Transaction&) -> Support { return 1; });

    finalize(seen, min_support);
}

FrequencyTable::FrequencyTable(const vector<WeightedTransaction>& transactions, Support min_support) {
    checkMinSupport(min_support);

    auto seen = countItems(transactions,
        [](const WeightedTransaction& t) -> const vector<Item>& { return t.items; },
        [](const WeightedTransaction& t) -> Support { return t.count; });

    finalize(seen, min_support);
}

void FrequencyTable::finalize(vector<Entry>& seen, Support min_support) {
    // 筛选频繁项，保持首次出现顺序
    entries_.clear();
    for (const auto& entry : seen) {
        if (entry.count >= min_support) {
            entries_.push_back(entry);
        }
    }

    // 按支持度降序排序，稳定排序保证计数相同的项按首次出现先后排列
    std::stable_sort(entries_.begin(), entries_.end(),
        [](const Entry& a, const Entry& b) {
            return a.count > b.count;
        });

    rank_.clear();
    rank_.reserve(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); i++) {
        rank_.emplace(entries_[i].item, i);
    }
}

Support FrequencyTable::count(Item item) const {
    auto found = rank_.find(item);
    if (found == rank_.end()) {
        return 0;
    }
    return entries_[found->second].count;
}

std::size_t FrequencyTable::rank(Item item) const {
    auto found = rank_.find(item);
    if (found == rank_.end()) {
        throw std::out_of_range("项不在频繁1项集表中: " + std::to_string(item));
    }
    return found->second;
}

vector<Item> FrequencyTable::miningOrder() const {
    vector<Item> order;
    order.reserve(entries_.size());
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        order.push_back(it->item);
    }
    return order;
}

vector<Item> FrequencyTable::sortCanonical(const vector<Item>& items) const {
    vector<Item> sorted;
    sorted.reserve(items.size());
    for (Item item : items) {
        if (contains(item)) {
            sorted.push_back(item);
        }
    }

    std::sort(sorted.begin(), sorted.end(), [this](Item a, Item b) {
        return rank_.at(a) < rank_.at(b);
    });

    return sorted;
}
