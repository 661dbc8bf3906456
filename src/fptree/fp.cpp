#include "fp.hpp"
#include <cstddef>
#include <ostream>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using std::endl;
using std::vector;
using std::pair;

FPTree::FPTree(const vector<Transaction>& transactions, Support min_support)
    : frequency_(transactions, min_support), min_support_(min_support) {
    // 顶层树的根节点不带项
    initRoot(std::nullopt, 0);

    for (const auto& transaction : transactions) {
        auto sorted_items = frequency_.sortCanonical(transaction);
        if (!sorted_items.empty()) {
            insert(sorted_items, 1);
        }
    }
}

FPTree::FPTree(const vector<WeightedTransaction>& pattern_base, Support min_support,
               Item root_item, Support root_count)
    : frequency_(pattern_base, min_support), min_support_(min_support) {
    if (root_count < 1) {
        throw std::invalid_argument("条件FP-Tree的后缀计数必须 >= 1，实际为: " + std::to_string(root_count));
    }
    initRoot(root_item, root_count);

    for (const auto& path : pattern_base) {
        auto sorted_items = frequency_.sortCanonical(path.items);
        if (!sorted_items.empty()) {
            insert(sorted_items, path.count);
        }
    }
}

void FPTree::initRoot(std::optional<Item> item, Support count) {
    nodes_.clear();
    nodes_.push_back(FPNode{item, count, kNoNode, {}, kNoNode});
}

FPTree::NodeIndex FPTree::findChild(NodeIndex parent, Item item) const {
    for (NodeIndex child : nodes_[parent].children) {
        if (nodes_[child].item == item) {
            return child;
        }
    }
    return kNoNode;
}

void FPTree::insert(const vector<Item>& sorted_items, Support weight) {
    NodeIndex current = kRoot;

    for (Item item : sorted_items) {
        NodeIndex child = findChild(current, item);
        if (child != kNoNode) {
            // 节点已存在，增加计数
            nodes_[child].count += weight;
            current = child;
            continue;
        }

        // 创建新节点（push_back 之后不能再持有旧节点的引用）
        NodeIndex new_node = nodes_.size();
        nodes_.push_back(FPNode{item, weight, current, {}, kNoNode});
        nodes_[current].children.push_back(new_node);

        // 挂到头表的同项链表末尾
        auto header = header_table_.find(item);
        if (header == header_table_.end()) {
            header_table_.emplace(item, HeaderEntry{new_node, new_node});
        } else {
            nodes_[header->second.tail].next = new_node;
            header->second.tail = new_node;
        }

        current = new_node;
    }
}

FPTree::NodeIndex FPTree::headOf(Item item) const {
    auto header = header_table_.find(item);
    if (header == header_table_.end()) {
        return kNoNode;
    }
    return header->second.head;
}

vector<FPTree::NodeIndex> FPTree::occurrences(Item item) const {
    vector<NodeIndex> result;
    for (NodeIndex index = headOf(item); index != kNoNode; index = nodes_[index].next) {
        result.push_back(index);
    }
    return result;
}

bool FPTree::hasSinglePath() const {
    NodeIndex current = kRoot;
    while (!nodes_[current].children.empty()) {
        if (nodes_[current].children.size() > 1) {
            return false;
        }
        current = nodes_[current].children.front();
    }
    return true;
}

vector<WeightedTransaction> FPTree::conditionalPatternBase(Item item) const {
    vector<WeightedTransaction> pattern_base;

    for (NodeIndex occurrence : occurrences(item)) {
        WeightedTransaction path{{}, nodes_[occurrence].count};

        // 向上回溯到根节点（不含根节点）
        NodeIndex parent = nodes_[occurrence].parent;
        while (parent != kNoNode && parent != kRoot) {
            path.items.push_back(*nodes_[parent].item);
            parent = nodes_[parent].parent;
        }

        // 空路径不贡献任何计数
        if (!path.items.empty()) {
            pattern_base.push_back(std::move(path));
        }
    }

    return pattern_base;
}

void FPTree::showTree(std::ostream& os) const {
    os << "\n========== FP-Tree 结构展示 ==========" << endl;

    std::queue<pair<NodeIndex, int>> q; // (node, level)
    q.push({kRoot, 0});

    int current_level = -1;

    while (!q.empty()) {
        auto [index, level] = q.front();
        q.pop();
        const FPNode& node = nodes_[index];

        // 如果是新的一层，打印层标题
        if (level != current_level) {
            if (current_level != -1) {
                os << endl;
            }
            current_level = level;
            if (level == 0) {
                os << "Level " << level << " (根节点): ";
            } else {
                os << "Level " << level << ": ";
            }
        }

        if (!node.item) {
            os << "[ROOT]";
        } else if (index == kRoot) {
            os << "[ROOT " << *node.item << ":" << node.count << "]";
        } else {
            os << "[" << *node.item << ":" << node.count << "]";
        }

        for (NodeIndex child : node.children) {
            q.push({child, level + 1});
        }

        // 如果这一层还有节点，添加分隔符
        if (!q.empty() && q.front().second == level) {
            os << "  ";
        }
    }

    os << "\n\n==========================================" << endl;
}
