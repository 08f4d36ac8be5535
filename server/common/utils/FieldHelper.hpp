#pragma once

/**
 * @brief Field 值获取辅助类
 * 兼容 Drogon 新版 API
 */
class FieldHelper {
public:
    static std::string getString(const drogon::orm::Field& field, const std::string& defaultValue = "") {
        if (field.isNull()) {
            return defaultValue;
        }
        return field.as<std::string>();
    }

    static std::optional<std::string> getOptionalString(const drogon::orm::Field& field) {
        if (field.isNull()) {
            return std::nullopt;
        }
        return field.as<std::string>();
    }

    static int getInt(const drogon::orm::Field& field, int defaultValue = 0) {
        if (field.isNull()) {
            return defaultValue;
        }
        return field.as<int>();
    }

    static bool getBool(const drogon::orm::Field& field, bool defaultValue = false) {
        if (field.isNull()) {
            return defaultValue;
        }
        return field.as<bool>();
    }
};
