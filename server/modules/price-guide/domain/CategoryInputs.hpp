#pragma once

#include "Category.hpp"
#include "OrderKey.hpp"
#include "common/utils/ValidatorHelper.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief 已校验的操作输入
 *
 * fromJson 完成字段类型、长度、枚举和排序键格式校验，
 * 失败抛出 ValidationException（details.field 指明字段）
 */

inline std::optional<CategoryType> parseCategoryTypeField(const Json::Value& json) {
    if (!json.isMember("categoryType") || json["categoryType"].isNull()) return std::nullopt;
    auto type = json["categoryType"].isString()
        ? CategoryTypes::parse(json["categoryType"].asString())
        : std::nullopt;
    if (!type) {
        throw ValidatorHelper::fieldError("categoryType", "分类类型只能是 default、detail 或 deep_drill_down");
    }
    return type;
}

struct CreateCategoryInput {
    std::string name;
    std::optional<std::string> parentId;
    std::optional<CategoryType> categoryType;
    std::optional<bool> isActive;

    static CreateCategoryInput fromJson(const Json::Value& json) {
        CreateCategoryInput input;
        input.name = ValidatorHelper::requireTrimmedString(json, "name", "分类名称",
                                                          Constants::CATEGORY_NAME_MAX_LENGTH);
        input.parentId = ValidatorHelper::optionalId(json, "parentId");
        input.categoryType = parseCategoryTypeField(json);
        input.isActive = ValidatorHelper::optionalBool(json, "isActive");
        return input;
    }
};

struct UpdateCategoryInput {
    int expectedVersion = 0;
    std::optional<std::string> name;
    std::optional<CategoryType> categoryType;
    std::optional<bool> isActive;

    static UpdateCategoryInput fromJson(const Json::Value& json) {
        UpdateCategoryInput input;
        input.expectedVersion = ValidatorHelper::requireInt(json, "version", "版本号");
        input.name = ValidatorHelper::optionalTrimmedString(json, "name", "分类名称",
                                                           Constants::CATEGORY_NAME_MAX_LENGTH);
        input.categoryType = parseCategoryTypeField(json);
        input.isActive = ValidatorHelper::optionalBool(json, "isActive");
        return input;
    }
};

struct MoveCategoryInput {
    std::optional<std::string> newParentId;   // 空表示移动为根分类
    std::optional<std::string> sortOrder;     // 空表示追加到新同级末尾
    std::optional<int> expectedVersion;

    static MoveCategoryInput fromJson(const Json::Value& json) {
        MoveCategoryInput input;
        input.newParentId = ValidatorHelper::optionalId(json, "newParentId");
        if (json.isMember("sortOrder") && !json["sortOrder"].isNull()) {
            if (!json["sortOrder"].isString() || !OrderKey::isValid(json["sortOrder"].asString())) {
                throw ValidatorHelper::fieldError("sortOrder", "排序键无效");
            }
            input.sortOrder = json["sortOrder"].asString();
        }
        input.expectedVersion = ValidatorHelper::optionalInt(json, "version", "版本号");
        return input;
    }
};

struct ReorderEntry {
    std::string id;
    std::string sortOrder;
};

struct ReorderInput {
    std::vector<ReorderEntry> items;

    static ReorderInput fromJson(const Json::Value& json) {
        if (!json.isMember("items") || !json["items"].isArray() || json["items"].empty()) {
            throw ValidatorHelper::fieldError("items", "排序列表不能为空");
        }
        if (json["items"].size() > Constants::REORDER_MAX_ITEMS) {
            throw ValidatorHelper::fieldError("items", "排序列表不能超过" +
                std::to_string(Constants::REORDER_MAX_ITEMS) + "条");
        }
        ReorderInput input;
        for (Json::ArrayIndex i = 0; i < json["items"].size(); ++i) {
            const auto& item = json["items"][i];
            std::string field = "items[" + std::to_string(i) + "]";
            if (!item.isObject() || !item["id"].isString() || item["id"].asString().empty()) {
                throw ValidatorHelper::fieldError(field + ".id", "分类 ID 不能为空");
            }
            if (!item["sortOrder"].isString() || !OrderKey::isValid(item["sortOrder"].asString())) {
                throw ValidatorHelper::fieldError(field + ".sortOrder", "排序键无效");
            }
            input.items.push_back({item["id"].asString(), item["sortOrder"].asString()});
        }
        return input;
    }
};
