#pragma once

/**
 * @brief 分类展示类型（仅根分类有意义）
 */
enum class CategoryType {
    Default,
    Detail,
    DeepDrillDown
};

namespace CategoryTypes {

inline const char* toString(CategoryType type) {
    switch (type) {
        case CategoryType::Detail: return "detail";
        case CategoryType::DeepDrillDown: return "deep_drill_down";
        case CategoryType::Default: break;
    }
    return "default";
}

inline std::optional<CategoryType> parse(const std::string& value) {
    if (value == "default") return CategoryType::Default;
    if (value == "detail") return CategoryType::Detail;
    if (value == "deep_drill_down") return CategoryType::DeepDrillDown;
    return std::nullopt;
}

}  // namespace CategoryTypes

/**
 * @brief 价格指南分类记录
 *
 * 父子关系只通过 parentId 表达，不持有其他节点的引用
 */
struct Category {
    std::string id;
    std::string companyId;
    std::string name;
    std::optional<std::string> parentId;  // 空表示根分类
    int depth = 0;
    std::string sortOrder;                // 分数排序键（OrderKey）
    CategoryType categoryType = CategoryType::Default;
    bool isActive = true;
    int version = 1;
    std::string lastModifiedBy;
    std::string createdAt;
    std::string updatedAt;

    bool isRoot() const { return !parentId.has_value(); }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id;
        json["name"] = name;
        json["parentId"] = parentId ? Json::Value(*parentId) : Json::Value::null;
        json["depth"] = depth;
        json["sortOrder"] = sortOrder;
        json["categoryType"] = CategoryTypes::toString(categoryType);
        json["isActive"] = isActive;
        json["version"] = version;
        json["lastModifiedBy"] = lastModifiedBy;
        json["createdAt"] = createdAt;
        json["updatedAt"] = updatedAt;
        return json;
    }
};

/**
 * @brief 同级排序：(sortOrder, id) 字节序升序，严格全序
 */
struct SiblingOrder {
    bool operator()(const Category& a, const Category& b) const {
        if (a.sortOrder != b.sortOrder) return a.sortOrder < b.sortOrder;
        return a.id < b.id;
    }
};

/**
 * @brief 分类列表过滤条件
 *
 * parentId 与 rootsOnly 互斥；都未设置时返回全部分类
 */
struct CategoryFilter {
    std::optional<bool> isActive;
    std::optional<std::string> parentId;
    bool rootsOnly = false;
};

/**
 * @brief 分类及其直接计数（Get / List / Children 的投影）
 */
struct CategoryView {
    Category category;
    int childCount = 0;
    int itemCount = 0;

    Json::Value toJson() const {
        Json::Value json = category.toJson();
        json["childCount"] = childCount;
        json["itemCount"] = itemCount;
        return json;
    }
};
