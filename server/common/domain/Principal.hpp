#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief 调用方身份
 *
 * 由认证过滤器根据 JWT 声明构造；服务层只依赖 permissionGranted 判定，
 * 不关心权限来源。
 */
struct Principal {
    std::string userId;
    std::string companyId;
    std::function<bool(const std::string&)> permissionGranted;

    bool hasPermission(const std::string& action) const {
        return permissionGranted && permissionGranted(action);
    }

    /**
     * @brief 无权限时抛出 ForbiddenException
     */
    void require(const std::string& action) const {
        if (!hasPermission(action)) {
            LOG_WARN << "Permission denied: user=" << userId << " company=" << companyId
                     << " action=" << action;
            throw ForbiddenException("无权限执行此操作: " + action);
        }
    }

    /**
     * @brief 基于权限码集合构造
     *
     * 支持 "*" 全局通配和 "price_guide:*" 资源级通配
     */
    static Principal withPermissions(std::string userId, std::string companyId,
                                     const std::vector<std::string>& permissions) {
        auto granted = std::make_shared<std::set<std::string>>(permissions.begin(), permissions.end());
        Principal principal;
        principal.userId = std::move(userId);
        principal.companyId = std::move(companyId);
        principal.permissionGranted = [granted](const std::string& action) {
            if (granted->count(Constants::PERM_WILDCARD) || granted->count(action)) {
                return true;
            }
            auto colon = action.find(':');
            return colon != std::string::npos && granted->count(action.substr(0, colon) + ":*") > 0;
        };
        return principal;
    }
};
