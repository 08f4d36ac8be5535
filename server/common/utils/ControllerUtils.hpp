#pragma once

#include "common/domain/Principal.hpp"
#include "common/utils/ValidatorHelper.hpp"

/**
 * @brief Controller 工具函数
 *
 * 提供 Controller 常用的辅助函数
 */
namespace ControllerUtils {

/**
 * @brief 从请求属性构造当前调用方（AuthFilter 写入）
 * @param req HTTP 请求
 */
inline Principal getPrincipal(const drogon::HttpRequestPtr& req) {
    auto attrs = req->attributes();
    return Principal::withPermissions(
        attrs->get<std::string>("userId"),
        attrs->get<std::string>("companyId"),
        attrs->get<std::vector<std::string>>("permissions"));
}

/**
 * @brief 从请求中获取 JSON 请求体，缺失或格式错误时抛出校验异常
 * @param req HTTP 请求
 */
inline const Json::Value& requireJson(const drogon::HttpRequestPtr& req) {
    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        throw ValidatorHelper::fieldError("", "请求体必须是 JSON 对象");
    }
    return *json;
}

}  // namespace ControllerUtils
