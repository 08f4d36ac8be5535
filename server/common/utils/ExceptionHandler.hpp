#pragma once

#include "AppException.hpp"
#include "ErrorCodes.hpp"

/**
 * @brief 全局异常处理器
 *
 * AppException 转换为对应 HTTP 状态码的 JSON 响应，details 放在 data 字段；
 * 未映射的 ORM 异常按数据库错误处理，其他异常统一返回 500
 */
class AppExceptionHandler {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpResponse = drogon::HttpResponse;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static Json::Value toJson(const std::exception& e, HttpStatusCode& status) {
        Json::Value json;
        status = k500InternalServerError;

        if (const auto* appEx = dynamic_cast<const AppException*>(&e)) {
            json["code"] = appEx->getCode();
            json["message"] = appEx->getMessage();
            if (!appEx->getDetails().isNull()) {
                json["data"] = appEx->getDetails();
            }
            status = appEx->getStatus();
            if (status >= k500InternalServerError) {
                LOG_ERROR << "Request failed [" << appEx->getCode() << "]: " << appEx->getMessage();
            }
        } else if (dynamic_cast<const drogon::orm::DrogonDbException*>(&e)) {
            LOG_ERROR << "Unhandled database exception: " << e.what();
            json["code"] = ErrorCodes::DATABASE_ERROR;
            json["message"] = "数据库错误";
        } else {
            LOG_ERROR << "Unhandled exception: " << e.what();
            json["code"] = ErrorCodes::INTERNAL_ERROR;
            json["message"] = "服务器内部错误";
        }

        json["status"] = static_cast<int>(status);
        return json;
    }

    static void setup() {
        drogon::app().setExceptionHandler([](const std::exception& e,
                                       const HttpRequestPtr& /*req*/,
                                       std::function<void (const HttpResponsePtr &)> &&callback) {
            HttpStatusCode status = k500InternalServerError;
            Json::Value json = toJson(e, status);
            auto resp = HttpResponse::newHttpJsonResponse(json);
            resp->setStatusCode(status);
            callback(resp);
        });
    }
};
