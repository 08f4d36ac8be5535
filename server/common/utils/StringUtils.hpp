#pragma once

/**
 * @brief 字符串工具类
 */
class StringUtils {
public:
    static std::string trim(const std::string& str) {
        auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char ch) {
            return std::isspace(ch);
        });
        auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char ch) {
            return std::isspace(ch);
        }).base();

        return (start < end) ? std::string(start, end) : std::string();
    }

    static bool startsWith(const std::string& str, const std::string& prefix) {
        return str.size() >= prefix.size() &&
               str.compare(0, prefix.size(), prefix) == 0;
    }

    /**
     * @brief UTF-8 字符数（名称长度按字符而非字节限制）
     */
    static size_t utf8Length(const std::string& str) {
        size_t count = 0;
        for (unsigned char c : str) {
            if ((c & 0xC0) != 0x80) ++count;
        }
        return count;
    }

    /**
     * @brief 规范 UUID 文本格式校验（8-4-4-4-12 十六进制）
     */
    static bool isUuid(const std::string& str) {
        if (str.size() != 36) return false;
        for (size_t i = 0; i < str.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (str[i] != '-') return false;
            } else if (!std::isxdigit(static_cast<unsigned char>(str[i]))) {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief 生成规范格式的小写 UUID（兼容不同版本 getUuid 的输出格式）
     */
    static std::string newUuid() {
        std::string hex;
        for (char c : drogon::utils::getUuid()) {
            if (c != '-') hex.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        if (hex.size() != 32) return hex;
        return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
               hex.substr(16, 4) + "-" + hex.substr(20);
    }

    static std::string join(const std::vector<std::string>& parts, const std::string& sep) {
        std::string result;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) result += sep;
            result += parts[i];
        }
        return result;
    }
};
