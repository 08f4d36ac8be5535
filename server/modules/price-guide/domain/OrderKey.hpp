#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief 分数排序键（base-62 fractional indexing）
 *
 * 键由整数部分和可选小数部分组成：
 * - 整数部分首字符编码长度：'a'..'z' 为非负区间（长度 2..27），'A'..'Z' 为负区间（长度 27..2）
 * - 小数部分为 base-62 数字串，不允许以 '0' 结尾
 *
 * 任意两个不同的键之间总能生成新键，插入不需要重写兄弟节点。
 * 比较为字节序，与数据库 VARCHAR 的 C 排序规则一致。
 */
class OrderKey {
public:
    static constexpr std::string_view DIGITS =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

    /**
     * @brief 生成位于 before 与 after 之间的键
     * @param before 下界（不含），空表示无下界
     * @param after 上界（不含），空表示无上界
     * @throws ValidationException 键格式无效或 before >= after
     */
    static std::string between(const std::optional<std::string>& before,
                               const std::optional<std::string>& after) {
        if (before) validate(*before);
        if (after) validate(*after);
        if (before && after && *before >= *after) {
            throw ValidationException("排序键顺序无效: " + *before + " >= " + *after, fieldDetails());
        }

        if (!before) {
            if (!after) {
                return std::string("a") + DIGITS.front();
            }
            std::string ib = integerPart(*after);
            std::string fb = after->substr(ib.size());
            if (ib == smallestInteger()) {
                return ib + midpoint("", fb);
            }
            if (ib < *after) {
                return ib;
            }
            auto decremented = decrementInteger(ib);
            if (!decremented) {
                throw ValidationException("排序键已到下限，无法继续前插", fieldDetails());
            }
            // 最小整数本身不是合法键，只能带小数部分
            if (*decremented == smallestInteger()) {
                return *decremented + midpoint("", std::nullopt);
            }
            return *decremented;
        }

        std::string ia = integerPart(*before);
        std::string fa = before->substr(ia.size());

        if (!after) {
            auto incremented = incrementInteger(ia);
            return incremented ? *incremented : ia + midpoint(fa, std::nullopt);
        }

        std::string ib = integerPart(*after);
        std::string fb = after->substr(ib.size());
        if (ia == ib) {
            return ia + midpoint(fa, fb);
        }
        auto incremented = incrementInteger(ia);
        if (!incremented) {
            throw ValidationException("排序键已到上限，无法继续后插", fieldDetails());
        }
        if (*incremented < *after) {
            return *incremented;
        }
        return ia + midpoint(fa, std::nullopt);
    }

    /**
     * @brief 连续生成 count 个位于 after 之后的键（批量追加）
     */
    static std::vector<std::string> sequence(const std::optional<std::string>& after, size_t count) {
        std::vector<std::string> keys;
        keys.reserve(count);
        std::optional<std::string> previous = after;
        for (size_t i = 0; i < count; ++i) {
            previous = between(previous, std::nullopt);
            keys.push_back(*previous);
        }
        return keys;
    }

    static int compare(const std::string& a, const std::string& b) {
        int c = a.compare(b);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }

    static bool isValid(const std::string& key) noexcept {
        if (key.empty() || key.size() > Constants::ORDER_KEY_MAX_LENGTH) return false;
        for (char c : key) {
            if (digitIndex(c) < 0) return false;
        }
        auto length = integerLength(key[0]);
        if (!length || key.size() < *length) return false;
        if (key == smallestInteger()) return false;
        return key.size() == *length || key.back() != DIGITS.front();
    }

private:
    static Json::Value fieldDetails() {
        Json::Value details;
        details["field"] = "sortOrder";
        return details;
    }

    static int digitIndex(char c) noexcept {
        auto pos = DIGITS.find(c);
        return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
    }

    static std::optional<size_t> integerLength(char head) noexcept {
        if (head >= 'a' && head <= 'z') return static_cast<size_t>(head - 'a' + 2);
        if (head >= 'A' && head <= 'Z') return static_cast<size_t>('Z' - head + 2);
        return std::nullopt;
    }

    /** 负区间最小整数 "A000...0"（26 个 0），不可作为键 */
    static const std::string& smallestInteger() {
        static const std::string value = "A" + std::string(26, DIGITS.front());
        return value;
    }

    static void validate(const std::string& key) {
        if (!isValid(key)) {
            throw ValidationException("排序键无效: " + key, fieldDetails());
        }
    }

    static std::string integerPart(const std::string& key) {
        auto length = integerLength(key[0]);
        if (!length || *length > key.size()) {
            throw ValidationException("排序键无效: " + key, fieldDetails());
        }
        return key.substr(0, *length);
    }

    /**
     * @brief 小数部分中点（a < b，均不以 '0' 结尾；b 为空表示上界为 1）
     */
    static std::string midpoint(const std::string& a, const std::optional<std::string>& b) {
        const char zero = DIGITS.front();
        if (b && (b->empty() || a >= *b)) {
            throw ValidationException("排序键区间无效", fieldDetails());
        }
        if ((!a.empty() && a.back() == zero) || (b && b->back() == zero)) {
            throw ValidationException("排序键小数部分不能以 0 结尾", fieldDetails());
        }

        if (b) {
            // 去掉公共前缀（a 不足部分按 '0' 补齐）
            size_t n = 0;
            while (n < b->size() && (n < a.size() ? a[n] : zero) == (*b)[n]) {
                ++n;
            }
            if (n > 0) {
                std::string restA = n < a.size() ? a.substr(n) : std::string();
                return b->substr(0, n) + midpoint(restA, b->substr(n));
            }
        }

        int digitA = a.empty() ? 0 : digitIndex(a[0]);
        int digitB = b ? digitIndex((*b)[0]) : static_cast<int>(DIGITS.size());
        if (digitB - digitA > 1) {
            return std::string(1, DIGITS[(digitA + digitB + 1) / 2]);
        }
        if (b && b->size() > 1) {
            return b->substr(0, 1);
        }
        return std::string(1, DIGITS[digitA]) +
               midpoint(a.empty() ? std::string() : a.substr(1), std::nullopt);
    }

    static std::optional<std::string> incrementInteger(const std::string& x) {
        char head = x[0];
        std::string digits = x.substr(1);
        bool carry = true;
        for (int i = static_cast<int>(digits.size()) - 1; carry && i >= 0; --i) {
            int d = digitIndex(digits[i]) + 1;
            if (d == static_cast<int>(DIGITS.size())) {
                digits[i] = DIGITS.front();
            } else {
                digits[i] = DIGITS[d];
                carry = false;
            }
        }
        if (!carry) {
            return std::string(1, head) + digits;
        }
        if (head == 'Z') return std::string("a") + DIGITS.front();
        if (head == 'z') return std::nullopt;

        char next = static_cast<char>(head + 1);
        if (next > 'a') {
            digits.push_back(DIGITS.front());
        } else {
            digits.pop_back();
        }
        return std::string(1, next) + digits;
    }

    static std::optional<std::string> decrementInteger(const std::string& x) {
        char head = x[0];
        std::string digits = x.substr(1);
        bool borrow = true;
        for (int i = static_cast<int>(digits.size()) - 1; borrow && i >= 0; --i) {
            int d = digitIndex(digits[i]) - 1;
            if (d == -1) {
                digits[i] = DIGITS.back();
            } else {
                digits[i] = DIGITS[d];
                borrow = false;
            }
        }
        if (!borrow) {
            return std::string(1, head) + digits;
        }
        if (head == 'a') return std::string("Z") + DIGITS.back();
        if (head == 'A') return std::nullopt;

        char next = static_cast<char>(head - 1);
        if (next < 'Z') {
            digits.push_back(DIGITS.back());
        } else {
            digits.pop_back();
        }
        return std::string(1, next) + digits;
    }
};
