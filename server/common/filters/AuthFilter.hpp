#pragma once

#include "common/utils/JwtUtils.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/StringUtils.hpp"

/**
 * @brief JWT 认证过滤器
 *
 * 校验 Bearer 令牌，并把 userId / companyId / permissions 写入请求属性，
 * 供 ControllerUtils::getPrincipal 构造调用方身份
 */
class AuthFilter : public drogon::HttpFilter<AuthFilter> {
private:
    std::shared_ptr<JwtUtils> jwtUtils_;

public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using FilterCallback = drogon::FilterCallback;
    using FilterChainCallback = drogon::FilterChainCallback;

    AuthFilter() {
        auto config = drogon::app().getCustomConfig();
        std::string secret = config["jwt"]["secret"].asString();
        int expiresIn = config["jwt"]["access_token_expires_in"].asInt();
        jwtUtils_ = std::make_shared<JwtUtils>(secret, expiresIn);
    }

    void doFilter(const HttpRequestPtr& req,
                   FilterCallback&& fcb,
                   FilterChainCallback&& fccb) override {
        auto authHeader = req->getHeader("Authorization");

        if (authHeader.empty()) {
            fcb(Response::unauthorized("缺少认证令牌"));
            return;
        }

        if (!StringUtils::startsWith(authHeader, "Bearer ")) {
            fcb(Response::unauthorized("令牌格式错误"));
            return;
        }

        try {
            TokenClaims claims = jwtUtils_->verifyClaims(authHeader.substr(7));

            auto attrs = req->attributes();
            attrs->insert("userId", claims.userId);
            attrs->insert("companyId", claims.companyId);
            attrs->insert("permissions", claims.permissions);
        } catch (const AppException& e) {
            LOG_DEBUG << "Token rejected: " << e.getMessage();
            fcb(Response::error(e.getCode(), e.getMessage(), e.getStatus()));
            return;
        }

        fccb();
    }
};
