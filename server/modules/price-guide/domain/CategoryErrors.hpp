#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/ErrorCodes.hpp"

/**
 * @brief 分类树业务异常
 *
 * 统一返回 AppException，details 携带定位冲突所需的上下文
 */
namespace CategoryError {
    using enum drogon::HttpStatusCode;

    inline Json::Value nullableId(const std::optional<std::string>& id) {
        return id ? Json::Value(*id) : Json::Value::null;
    }

    inline AppException NotFound(const std::string& id) {
        Json::Value details;
        details["ids"].append(id);
        return AppException(ErrorCodes::NOT_FOUND, "分类不存在", k404NotFound, details);
    }

    inline AppException ParentNotFound(const std::string& parentId) {
        Json::Value details;
        details["parentId"] = parentId;
        return AppException(ErrorCodes::PARENT_NOT_FOUND, "父分类不存在", k400BadRequest, details);
    }

    inline AppException DuplicateName(const std::string& name, const std::optional<std::string>& parentId) {
        Json::Value details;
        details["name"] = name;
        details["parentId"] = nullableId(parentId);
        return AppException(ErrorCodes::DUPLICATE_NAME, "同级已存在名为 \"" + name + "\" 的分类",
                            k409Conflict, details);
    }

    inline AppException SelfParent(const std::string& id) {
        Json::Value details;
        details["id"] = id;
        return AppException(ErrorCodes::SELF_PARENT, "不能将分类设为自己的父分类", k400BadRequest, details);
    }

    inline AppException CircularReference(const std::string& id, const std::string& parentId) {
        Json::Value details;
        details["id"] = id;
        details["parentId"] = parentId;
        return AppException(ErrorCodes::CIRCULAR_REFERENCE, "不能将分类移动到其子孙分类下",
                            k400BadRequest, details);
    }

    inline AppException NotRootCategory(const std::string& categoryId, int depth) {
        Json::Value details;
        details["categoryId"] = categoryId;
        details["depth"] = depth;
        return AppException(ErrorCodes::NOT_ROOT_CATEGORY, "只有根分类可以分配办公室",
                            k400BadRequest, details);
    }

    inline AppException HasDependents(int childCount, int itemCount) {
        Json::Value details;
        details["childCount"] = childCount;
        details["itemCount"] = itemCount;
        return AppException(ErrorCodes::HAS_DEPENDENTS,
                            "分类下存在 " + std::to_string(childCount) + " 个子分类和 " +
                            std::to_string(itemCount) + " 个项目，请使用强制删除",
                            k409Conflict, details);
    }

    inline AppException ConcurrentModification(int currentVersion, const std::string& lastModifiedBy) {
        Json::Value details;
        details["currentVersion"] = currentVersion;
        details["lastModifiedBy"] = lastModifiedBy;
        return AppException(ErrorCodes::CONCURRENT_MODIFICATION, "分类已被他人修改，请刷新后重试",
                            k409Conflict, details);
    }

    inline AppException DataIntegrity(const std::string& id) {
        Json::Value details;
        details["id"] = id;
        return AppException(ErrorCodes::DATA_INTEGRITY, "分类树数据异常（循环或悬空引用）",
                            k500InternalServerError, details);
    }

    inline NotFoundException OfficesNotFound(const std::vector<std::string>& missingOfficeIds) {
        Json::Value details;
        details["missingOfficeIds"] = Json::Value(Json::arrayValue);
        for (const auto& id : missingOfficeIds) {
            details["missingOfficeIds"].append(id);
        }
        return NotFoundException("办公室不存在", details);
    }

    inline NotFoundException AssignmentNotFound(const std::string& categoryId, const std::string& officeId) {
        Json::Value details;
        details["categoryId"] = categoryId;
        details["officeId"] = officeId;
        return NotFoundException("办公室分配不存在", details);
    }
}
