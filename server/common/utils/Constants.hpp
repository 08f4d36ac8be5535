#pragma once

/**
 * @brief 全局常量定义
 *
 * 集中管理项目中的魔法数字，提高可维护性和可读性
 */
namespace Constants {

// ==================== 日志相关 ====================

/** 请求体日志截断长度 */
inline constexpr int REQUEST_LOG_MAX_LENGTH = 1000;

// ==================== 认证相关 ====================

/** 用户 ID（令牌 sub 声明）最大长度，与 last_modified_by 列宽一致 */
inline constexpr size_t USER_ID_MAX_LENGTH = 255;

// ==================== 分类树相关 ====================

/** 分类名称最大长度（字符） */
inline constexpr size_t CATEGORY_NAME_MAX_LENGTH = 255;

/** 排序键最大长度（与数据库列宽一致） */
inline constexpr size_t ORDER_KEY_MAX_LENGTH = 50;

/** 祖先链遍历默认上限，超过视为数据损坏 */
inline constexpr int CATEGORY_MAX_DEPTH = 1000;

/** max_tree_depth 配置允许的最大值 */
inline constexpr int CATEGORY_MAX_DEPTH_LIMIT = 10000;

/** 瞬时故障默认重试次数（仅只读操作和 Reorder） */
inline constexpr int STORE_RETRY_ATTEMPTS = 2;

/** 单次 Reorder 请求最大条目数 */
inline constexpr size_t REORDER_MAX_ITEMS = 1000;

/** 单次分配办公室最大数量 */
inline constexpr size_t ASSIGN_MAX_OFFICES = 500;

// ==================== 存储类型 ====================

/** PostgreSQL 存储 */
inline constexpr const char* STORE_POSTGRES = "postgres";

/** 进程内存储（开发/测试） */
inline constexpr const char* STORE_MEMORY = "memory";

// ==================== 权限码 ====================

inline constexpr const char* PERM_PRICE_GUIDE_READ = "price_guide:read";
inline constexpr const char* PERM_PRICE_GUIDE_CREATE = "price_guide:create";
inline constexpr const char* PERM_PRICE_GUIDE_UPDATE = "price_guide:update";
inline constexpr const char* PERM_PRICE_GUIDE_DELETE = "price_guide:delete";

/** 通配权限 */
inline constexpr const char* PERM_WILDCARD = "*";

}  // namespace Constants
