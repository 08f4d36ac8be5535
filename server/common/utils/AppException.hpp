#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 应用异常基类
 *
 * details 携带结构化上下文（冲突版本、缺失 ID 等），由全局异常处理器
 * 原样放入响应的 data 字段
 */
class AppException : public std::exception {
public:
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

private:
    int code_;
    std::string message_;
    HttpStatusCode status_;
    Json::Value details_;

public:
    AppException(int code, std::string message, HttpStatusCode status = k400BadRequest,
                 Json::Value details = Json::Value::null)
        : code_(code), message_(std::move(message)), status_(status), details_(std::move(details)) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
    HttpStatusCode getStatus() const { return status_; }
    const Json::Value& getDetails() const { return details_; }
};

/**
 * 错误码定义见 ErrorCodes.hpp：
 * 1xxx - 通用错误
 * 2xxx - 认证相关错误
 * 3xxx - 价格指南分类错误
 * 5xxx - 服务器错误
 */

/**
 * @brief 通用异常 - 资源不存在
 */
class NotFoundException : public AppException {
public:
    explicit NotFoundException(const std::string& message = "资源不存在",
                               Json::Value details = Json::Value::null)
        : AppException(ErrorCodes::NOT_FOUND, message, k404NotFound, std::move(details)) {}
};

/**
 * @brief 通用异常 - 验证失败
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "验证失败",
                                 Json::Value details = Json::Value::null)
        : AppException(ErrorCodes::BAD_REQUEST, message, k400BadRequest, std::move(details)) {}
};

/**
 * @brief 通用异常 - 禁止访问
 */
class ForbiddenException : public AppException {
public:
    explicit ForbiddenException(const std::string& message = "禁止访问")
        : AppException(ErrorCodes::FORBIDDEN, message, k403Forbidden) {}
};

/**
 * @brief 存储层瞬时故障（连接断开、死锁、串行化冲突）
 *
 * 只读操作可安全重试，写操作直接向上抛出
 */
class TransientStoreException : public AppException {
public:
    explicit TransientStoreException(const std::string& message = "存储暂时不可用，请稍后重试")
        : AppException(ErrorCodes::STORE_UNAVAILABLE, message, k503ServiceUnavailable) {}
};

/**
 * @brief 认证相关异常
 */
namespace AuthException {
    using enum drogon::HttpStatusCode;

    inline AppException TokenInvalid() {
        return AppException(ErrorCodes::UNAUTHORIZED, "令牌无效或已过期", k401Unauthorized);
    }

    inline AppException TokenExpired() {
        return AppException(ErrorCodes::TOKEN_EXPIRED, "令牌已过期", k401Unauthorized);
    }

    inline AppException MissingClaim(const std::string& claim) {
        return AppException(ErrorCodes::UNAUTHORIZED, "令牌缺少声明: " + claim, k401Unauthorized);
    }
}
