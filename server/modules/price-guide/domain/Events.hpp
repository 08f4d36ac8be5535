#pragma once

#include "Category.hpp"
#include "common/domain/DomainEvent.hpp"

// ==================== 分类相关事件 ====================

struct CategoryCreated : DomainEvent {
    Category category;

    CategoryCreated(const std::string& actor, Category c)
        : DomainEvent("CategoryCreated", c.id, "Category", actor, c.companyId)
        , category(std::move(c)) {}

    Json::Value payload() const override {
        Json::Value json;
        json["after"] = category.toJson();
        return json;
    }
};

/**
 * @brief 分类更新，changes 形如 { field: { before, after } }
 */
struct CategoryUpdated : DomainEvent {
    Json::Value changes;
    int version;

    CategoryUpdated(const std::string& actor, const Category& c, Json::Value diff)
        : DomainEvent("CategoryUpdated", c.id, "Category", actor, c.companyId)
        , changes(std::move(diff)), version(c.version) {}

    Json::Value payload() const override {
        Json::Value json;
        json["changes"] = changes;
        json["version"] = version;
        return json;
    }
};

struct CategoryMoved : DomainEvent {
    std::optional<std::string> fromParentId;
    std::optional<std::string> toParentId;
    int fromDepth;
    int toDepth;
    std::string sortOrder;
    int descendantsUpdated;
    std::vector<std::string> unassignedOfficeIds;   // 根分类被挂到父节点下时移除的办公室分配

    CategoryMoved(const std::string& actor, const Category& before, const Category& after, int descendants,
                  std::vector<std::string> unassigned = {})
        : DomainEvent("CategoryMoved", after.id, "Category", actor, after.companyId)
        , fromParentId(before.parentId), toParentId(after.parentId)
        , fromDepth(before.depth), toDepth(after.depth)
        , sortOrder(after.sortOrder), descendantsUpdated(descendants)
        , unassignedOfficeIds(std::move(unassigned)) {}

    Json::Value payload() const override {
        Json::Value json;
        json["before"]["parentId"] = fromParentId ? Json::Value(*fromParentId) : Json::Value::null;
        json["before"]["depth"] = fromDepth;
        json["after"]["parentId"] = toParentId ? Json::Value(*toParentId) : Json::Value::null;
        json["after"]["depth"] = toDepth;
        json["after"]["sortOrder"] = sortOrder;
        json["descendantsUpdated"] = descendantsUpdated;
        json["unassignedOfficeIds"] = Json::Value(Json::arrayValue);
        for (const auto& officeId : unassignedOfficeIds) {
            json["unassignedOfficeIds"].append(officeId);
        }
        return json;
    }
};

struct CategoryDeleted : DomainEvent {
    std::string name;
    bool force;
    int deletedCategories;
    int deletedItems;

    CategoryDeleted(const std::string& actor, const Category& c, bool f, int categories, int items)
        : DomainEvent("CategoryDeleted", c.id, "Category", actor, c.companyId)
        , name(c.name), force(f), deletedCategories(categories), deletedItems(items) {}

    Json::Value payload() const override {
        Json::Value json;
        json["name"] = name;
        json["force"] = force;
        json["deletedCategories"] = deletedCategories;
        json["deletedItems"] = deletedItems;
        return json;
    }
};

/**
 * @brief 批量排序，聚合 ID 为空（跨多个分类）
 */
struct CategoriesReordered : DomainEvent {
    std::vector<std::string> updatedIds;
    std::vector<std::string> skippedIds;

    CategoriesReordered(const std::string& actor, const std::string& company,
                        std::vector<std::string> updated, std::vector<std::string> skipped)
        : DomainEvent("CategoriesReordered", "", "Category", actor, company)
        , updatedIds(std::move(updated)), skippedIds(std::move(skipped)) {}

    Json::Value payload() const override {
        Json::Value json;
        json["updatedIds"] = Json::Value(Json::arrayValue);
        for (const auto& id : updatedIds) json["updatedIds"].append(id);
        json["skippedIds"] = Json::Value(Json::arrayValue);
        for (const auto& id : skippedIds) json["skippedIds"].append(id);
        return json;
    }
};

// ==================== 办公室分配事件 ====================

struct CategoryOfficesAssigned : DomainEvent {
    std::vector<std::string> officeIds;   // 本次新增的办公室

    CategoryOfficesAssigned(const std::string& actor, const std::string& company,
                            const std::string& categoryId, std::vector<std::string> offices)
        : DomainEvent("CategoryOfficesAssigned", categoryId, "Category", actor, company)
        , officeIds(std::move(offices)) {}

    Json::Value payload() const override {
        Json::Value json;
        json["officeIds"] = Json::Value(Json::arrayValue);
        for (const auto& id : officeIds) json["officeIds"].append(id);
        return json;
    }
};

struct CategoryOfficeUnassigned : DomainEvent {
    std::string officeId;

    CategoryOfficeUnassigned(const std::string& actor, const std::string& company,
                             const std::string& categoryId, std::string office)
        : DomainEvent("CategoryOfficeUnassigned", categoryId, "Category", actor, company)
        , officeId(std::move(office)) {}

    Json::Value payload() const override {
        Json::Value json;
        json["officeId"] = officeId;
        return json;
    }
};
