#pragma once

/**
 * @brief 查询条件构建器
 *
 * 条件以 AND 连接；占位符统一使用 ?，由 toParameterized 转换为 $N
 */
class QueryBuilder {
private:
    std::vector<std::string> conditions_;
    std::vector<std::string> params_;

public:
    /**
     * @param cast 占位符类型转换（如 "::uuid"），PostgreSQL 无法推断参数类型时使用
     */
    QueryBuilder& eq(const std::string& field, const std::string& value, const std::string& cast = "") {
        conditions_.push_back(field + " = ?" + cast);
        params_.push_back(value);
        return *this;
    }

    QueryBuilder& eqIf(const std::optional<std::string>& value, const std::string& field,
                       const std::string& cast = "") {
        if (value) eq(field, *value, cast);
        return *this;
    }

    QueryBuilder& eqBool(const std::string& field, const std::optional<bool>& value) {
        if (value) {
            conditions_.push_back(field + " = ?::boolean");
            params_.emplace_back(*value ? "true" : "false");
        }
        return *this;
    }

    QueryBuilder& isNull(const std::string& field) {
        conditions_.push_back(field + " IS NULL");
        return *this;
    }

    std::string whereClause() const {
        if (conditions_.empty()) {
            return "";
        }
        std::string result = " WHERE ";
        for (size_t i = 0; i < conditions_.size(); ++i) {
            if (i > 0) result += " AND ";
            result += conditions_[i];
        }
        return result;
    }

    const std::vector<std::string>& params() const {
        return params_;
    }
};
