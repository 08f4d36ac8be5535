#pragma once

#include "AppException.hpp"
#include "StringUtils.hpp"

/**
 * @brief 参数校验和解析工具类
 *
 * 提供安全的参数解析和统一的 JSON 校验功能。
 * 校验失败时抛出 ValidationException，details 中携带出错字段名。
 */
class ValidatorHelper {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;

    // ==================== 安全参数解析 ====================

    /**
     * @brief 安全解析整数参数，失败时返回空
     * @param value 字符串值
     * @return 解析后的整数，失败返回 std::nullopt
     */
    static std::optional<int> tryParseInt(const std::string& value) {
        if (value.empty()) return std::nullopt;
        int result = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            return std::nullopt;
        }
        return result;
    }

    /**
     * @brief 解析布尔查询参数（true/false/1/0），缺省返回空
     */
    static std::optional<bool> getBoolParam(const HttpRequestPtr& req, const std::string& name) {
        const auto& value = req->getParameter(name);
        if (value.empty()) return std::nullopt;
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw fieldError(name, name + " 只能是 true 或 false");
    }

    // ==================== 批量校验（返回错误消息） ====================

    /**
     * @brief 校验结果
     */
    struct ValidationResult {
        bool valid = true;
        std::string errorMessage;
        std::string field;

        operator bool() const { return valid; }

        static ValidationResult ok() {
            return {true, "", ""};
        }

        static ValidationResult fail(const std::string& message, const std::string& field = "") {
            return {false, message, field};
        }

        /**
         * @brief 如果校验失败则抛出 ValidationException
         */
        void throwIfInvalid() const {
            if (!valid) {
                throw fieldError(field, errorMessage);
            }
        }
    };

    /**
     * @brief 校验字符串长度（去除首尾空白后按字符计）
     */
    static ValidationResult checkLength(const std::string& value, const std::string& field,
                                        const std::string& fieldName,
                                        size_t minLength, size_t maxLength) {
        size_t len = StringUtils::utf8Length(value);
        if (len < minLength) {
            return ValidationResult::fail(fieldName + "不能为空", field);
        }
        if (len > maxLength) {
            return ValidationResult::fail(fieldName + "长度不能超过" + std::to_string(maxLength) + "个字符", field);
        }
        return ValidationResult::ok();
    }

    // ==================== JSON 字段读取 ====================

    /**
     * @brief 读取必填字符串字段，去除首尾空白并校验长度
     */
    static std::string requireTrimmedString(const Json::Value& json, const std::string& field,
                                            const std::string& fieldName, size_t maxLength) {
        if (!json.isMember(field) || !json[field].isString()) {
            throw fieldError(field, fieldName + "不能为空");
        }
        std::string value = StringUtils::trim(json[field].asString());
        checkLength(value, field, fieldName, 1, maxLength).throwIfInvalid();
        return value;
    }

    /**
     * @brief 读取可选字符串字段（存在时校验同 requireTrimmedString）
     */
    static std::optional<std::string> optionalTrimmedString(const Json::Value& json, const std::string& field,
                                                            const std::string& fieldName, size_t maxLength) {
        if (!json.isMember(field) || json[field].isNull()) return std::nullopt;
        return requireTrimmedString(json, field, fieldName, maxLength);
    }

    /**
     * @brief 读取可为 null 的 ID 字段：缺省或 null 都返回空
     */
    static std::optional<std::string> optionalId(const Json::Value& json, const std::string& field) {
        if (!json.isMember(field) || json[field].isNull()) return std::nullopt;
        if (!json[field].isString() || json[field].asString().empty()) {
            throw fieldError(field, field + " 必须是非空字符串或 null");
        }
        return json[field].asString();
    }

    static std::optional<bool> optionalBool(const Json::Value& json, const std::string& field) {
        if (!json.isMember(field) || json[field].isNull()) return std::nullopt;
        if (!json[field].isBool()) {
            throw fieldError(field, field + " 必须是布尔值");
        }
        return json[field].asBool();
    }

    static int requireInt(const Json::Value& json, const std::string& field, const std::string& fieldName) {
        if (!json.isMember(field) || !json[field].isInt()) {
            throw fieldError(field, fieldName + "必须是整数");
        }
        return json[field].asInt();
    }

    static std::optional<int> optionalInt(const Json::Value& json, const std::string& field,
                                          const std::string& fieldName) {
        if (!json.isMember(field) || json[field].isNull()) return std::nullopt;
        return requireInt(json, field, fieldName);
    }

    /**
     * @brief 读取非空字符串数组
     */
    static std::vector<std::string> requireStringArray(const Json::Value& json, const std::string& field,
                                                       const std::string& fieldName, size_t maxItems) {
        if (!json.isMember(field) || !json[field].isArray() || json[field].empty()) {
            throw fieldError(field, fieldName + "不能为空");
        }
        if (json[field].size() > maxItems) {
            throw fieldError(field, fieldName + "数量不能超过" + std::to_string(maxItems));
        }
        std::vector<std::string> values;
        values.reserve(json[field].size());
        for (const auto& item : json[field]) {
            if (!item.isString() || item.asString().empty()) {
                throw fieldError(field, fieldName + "必须是非空字符串");
            }
            values.push_back(item.asString());
        }
        return values;
    }

    /**
     * @brief 构造带字段信息的校验异常
     */
    static ValidationException fieldError(const std::string& field, const std::string& message) {
        Json::Value details(Json::objectValue);
        if (!field.empty()) {
            details["field"] = field;
        }
        return ValidationException(message, details);
    }
};
