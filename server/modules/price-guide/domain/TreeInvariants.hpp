#pragma once

#include "Category.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief 分类树不变量（纯函数，不访问存储，不挂起）
 *
 * 调用方在事务内读取所需节点后，通过 lookup 回调提供给这里的检查
 */
class TreeInvariants {
public:
    /** 按 ID 查找节点，找不到返回 nullptr */
    using Lookup = std::function<const Category*(const std::string&)>;

    /**
     * @brief 将 categoryId 挂到 candidateParentId 下是否会形成环
     *
     * 沿候选父节点的祖先链向上走：遇到 categoryId 即成环；
     * 超过 maxDepth 步仍未到根按成环处理（数据可能已损坏）；
     * 悬空引用结束遍历（父节点存在性由调用方单独检查）。
     */
    static bool wouldCreateCycle(const std::string& categoryId,
                                 const std::optional<std::string>& candidateParentId,
                                 const Lookup& lookup,
                                 int maxDepth = Constants::CATEGORY_MAX_DEPTH) {
        if (!candidateParentId) return false;

        std::string current = *candidateParentId;
        for (int steps = 0; steps <= maxDepth; ++steps) {
            if (current == categoryId) return true;
            const Category* node = lookup(current);
            if (!node || !node->parentId) return false;
            current = *node->parentId;
        }
        LOG_WARN << "Ancestor walk from " << *candidateParentId << " exceeded " << maxDepth
                 << " steps, treating as cycle";
        return true;
    }

    static int computeDepth(const Category* parent) {
        return parent ? parent->depth + 1 : 0;
    }

    /**
     * @brief 同级是否已有同名的活跃分类（区分大小写）
     * @param excludeId 排除自身（更新、移动时）
     */
    static bool isDuplicateSibling(const std::string& name,
                                   const std::vector<Category>& siblings,
                                   const std::string& excludeId = "") {
        return std::any_of(siblings.begin(), siblings.end(), [&](const Category& sibling) {
            return sibling.isActive && sibling.id != excludeId && sibling.name == name;
        });
    }

    static bool canSetCategoryType(int depth) {
        return depth == 0;
    }

    /**
     * @brief 从 startId 到根的路径（根在前）
     * @return 路径过长或遇到悬空引用时返回空
     */
    static std::optional<std::vector<const Category*>> pathToRoot(const std::string& startId,
                                                                  const Lookup& lookup,
                                                                  int maxDepth = Constants::CATEGORY_MAX_DEPTH) {
        std::vector<const Category*> path;
        std::string current = startId;
        for (int steps = 0; steps <= maxDepth; ++steps) {
            const Category* node = lookup(current);
            if (!node) return std::nullopt;
            path.push_back(node);
            if (!node->parentId) {
                std::reverse(path.begin(), path.end());
                return path;
            }
            current = *node->parentId;
        }
        return std::nullopt;
    }

    /**
     * @brief 以 ID 建立查找表的 lookup（节点需在 lookup 生命周期内有效）
     */
    static Lookup indexLookup(const std::vector<Category>& nodes) {
        auto index = std::make_shared<std::unordered_map<std::string, const Category*>>();
        for (const auto& node : nodes) {
            index->emplace(node.id, &node);
        }
        return [index](const std::string& id) -> const Category* {
            auto it = index->find(id);
            return it == index->end() ? nullptr : it->second;
        };
    }
};
