#pragma once

#include "Category.hpp"

/**
 * @brief 分类树节点（子节点以下标引用同一数组中的节点）
 */
struct CategoryTreeNode {
    Category category;
    int directItemCount = 0;   // 直接关联的项目数
    int itemCount = 0;         // 含全部后代的项目数
    std::vector<size_t> children;
};

/**
 * @brief 分类森林
 *
 * - 父节点不在集合中（被过滤或悬空）的节点提升为根
 * - 同级按 (sortOrder, id) 排序
 * - 计数与 JSON 输出都按后序自底向上生成，不使用递归（深链不会耗尽栈）
 * - 数据损坏形成的环不会被根到达：打断环上一条边并提升为根，同时告警
 */
class CategoryTree {
public:
    static CategoryTree build(std::vector<Category> categories,
                              const std::unordered_map<std::string, int>& itemCounts) {
        CategoryTree tree;
        tree.nodes_.reserve(categories.size());
        for (auto& category : categories) {
            CategoryTreeNode node;
            auto it = itemCounts.find(category.id);
            node.directItemCount = it == itemCounts.end() ? 0 : it->second;
            node.category = std::move(category);
            tree.index_.emplace(node.category.id, tree.nodes_.size());
            tree.nodes_.push_back(std::move(node));
        }

        for (size_t i = 0; i < tree.nodes_.size(); ++i) {
            const auto& parentId = tree.nodes_[i].category.parentId;
            auto parent = parentId ? tree.index_.find(*parentId) : tree.index_.end();
            if (parent == tree.index_.end() || parent->second == i) {
                tree.roots_.push_back(i);
            } else {
                tree.nodes_[parent->second].children.push_back(i);
            }
        }

        tree.sortSiblings();
        tree.breakCycles();
        tree.accumulateCounts();
        return tree;
    }

    const std::vector<size_t>& roots() const { return roots_; }
    const CategoryTreeNode& node(size_t index) const { return nodes_[index]; }
    size_t size() const { return nodes_.size(); }

    const CategoryTreeNode* find(const std::string& id) const {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &nodes_[it->second];
    }

    Json::Value toJson() const {
        std::vector<Json::Value> built(nodes_.size());
        auto order = preorder();
        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            const auto& node = nodes_[*it];
            Json::Value json = node.category.toJson();
            json["childCount"] = static_cast<int>(node.children.size());
            json["directItemCount"] = node.directItemCount;
            json["itemCount"] = node.itemCount;
            json["children"] = Json::Value(Json::arrayValue);
            for (size_t child : node.children) {
                json["children"].append(std::move(built[child]));
            }
            built[*it] = std::move(json);
        }

        Json::Value result(Json::arrayValue);
        for (size_t root : roots_) {
            result.append(std::move(built[root]));
        }
        return result;
    }

private:
    std::vector<CategoryTreeNode> nodes_;
    std::vector<size_t> roots_;
    std::unordered_map<std::string, size_t> index_;

    bool lessThan(size_t a, size_t b) const {
        return SiblingOrder{}(nodes_[a].category, nodes_[b].category);
    }

    void sortSiblings() {
        auto cmp = [this](size_t a, size_t b) { return lessThan(a, b); };
        std::sort(roots_.begin(), roots_.end(), cmp);
        for (auto& node : nodes_) {
            std::sort(node.children.begin(), node.children.end(), cmp);
        }
    }

    /** 从 start 出发标记可达节点 */
    void markReachable(size_t start, std::vector<bool>& visited) const {
        std::vector<size_t> stack{start};
        while (!stack.empty()) {
            size_t current = stack.back();
            stack.pop_back();
            if (visited[current]) continue;
            visited[current] = true;
            for (size_t child : nodes_[current].children) {
                stack.push_back(child);
            }
        }
    }

    void breakCycles() {
        std::vector<bool> visited(nodes_.size(), false);
        for (size_t root : roots_) {
            markReachable(root, visited);
        }

        std::vector<size_t> unreachable;
        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (!visited[i]) unreachable.push_back(i);
        }
        if (unreachable.empty()) return;

        std::sort(unreachable.begin(), unreachable.end(),
                  [this](size_t a, size_t b) { return lessThan(a, b); });
        for (size_t i : unreachable) {
            if (visited[i]) continue;
            const auto& category = nodes_[i].category;
            LOG_WARN << "CategoryTree: cycle detected at category " << category.id
                     << " (parent " << category.parentId.value_or("") << "), promoting to root";

            auto& siblings = nodes_[index_.at(*category.parentId)].children;
            siblings.erase(std::remove(siblings.begin(), siblings.end(), i), siblings.end());
            roots_.push_back(i);
            markReachable(i, visited);
        }
        std::sort(roots_.begin(), roots_.end(), [this](size_t a, size_t b) { return lessThan(a, b); });
    }

    /** 从各根出发的先序序列；逆序处理即为后序，子节点总在父节点之前完成 */
    std::vector<size_t> preorder() const {
        std::vector<size_t> order;
        order.reserve(nodes_.size());
        std::vector<size_t> stack(roots_.rbegin(), roots_.rend());
        while (!stack.empty()) {
            size_t current = stack.back();
            stack.pop_back();
            order.push_back(current);
            const auto& children = nodes_[current].children;
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                stack.push_back(*it);
            }
        }
        return order;
    }

    void accumulateCounts() {
        auto order = preorder();
        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            auto& node = nodes_[*it];
            node.itemCount = node.directItemCount;
            for (size_t child : node.children) {
                node.itemCount += nodes_[child].itemCount;
            }
        }
    }
};
