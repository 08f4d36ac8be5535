#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 统一响应格式工具类
 *
 * 成功: { code: 0, message, data? }
 * 失败: { code, message, data?(details) }
 */
class Response {
public:
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpResponse = drogon::HttpResponse;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static HttpResponsePtr ok(const Json::Value &data = Json::Value::null,
                               const std::string &message = "Success") {
        return build(k200OK, message, data);
    }

    static HttpResponsePtr created(const Json::Value &data = Json::Value::null,
                                    const std::string &message = "创建成功") {
        return build(k201Created, message, data);
    }

    static HttpResponsePtr updated(const Json::Value &data = Json::Value::null,
                                    const std::string &message = "更新成功") {
        return build(k200OK, message, data);
    }

    static HttpResponsePtr deleted(const Json::Value &data = Json::Value::null,
                                    const std::string &message = "删除成功") {
        return build(k200OK, message, data);
    }

    static HttpResponsePtr error(int code,
                                   const std::string &message,
                                   HttpStatusCode status = k400BadRequest) {
        Json::Value json;
        json["code"] = code;
        json["message"] = message;

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(status);
        return resp;
    }

    static HttpResponsePtr unauthorized(const std::string &message = "未授权访问") {
        return error(ErrorCodes::UNAUTHORIZED, message, k401Unauthorized);
    }

    static HttpResponsePtr badRequest(const std::string &message = "请求参数错误") {
        return error(ErrorCodes::BAD_REQUEST, message, k400BadRequest);
    }

private:
    static HttpResponsePtr build(HttpStatusCode status, const std::string &message,
                                 const Json::Value &data) {
        Json::Value json;
        json["code"] = ErrorCodes::SUCCESS;
        json["message"] = message;
        if (!data.isNull()) {
            json["data"] = data;
        }

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(status);
        return resp;
    }
};
