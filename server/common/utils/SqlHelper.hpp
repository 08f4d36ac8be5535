#pragma once

/**
 * @brief SQL 构建辅助工具
 */
namespace SqlHelper {

/**
 * @brief 构建 IN 子句的参数化占位符和参数（如 "?, ?, ?" + ["a", "b", "c"]）
 * @param ids ID 列表
 * @param cast 每个占位符追加的类型转换（如 "::uuid"），可为空
 * @return {占位符字符串, 参数列表}
 */
inline std::pair<std::string, std::vector<std::string>> buildParameterizedIn(
    const std::vector<std::string>& ids, const std::string& cast = "") {
    std::string placeholders;
    std::vector<std::string> params;
    params.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) placeholders += ", ";
        placeholders += "?" + cast;
        params.push_back(ids[i]);
    }
    return {placeholders, params};
}

/**
 * @brief 布尔参数文本（配合 ?::boolean 使用）
 */
inline std::string boolParam(bool value) {
    return value ? "true" : "false";
}

}  // namespace SqlHelper
