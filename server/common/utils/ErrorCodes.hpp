#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 0: 成功
 * - 1xxx: 客户端错误（请求参数、资源不存在、权限等）
 * - 2xxx: 认证/授权错误
 * - 3xxx: 价格指南分类树业务错误
 * - 5xxx: 服务器内部错误
 */
namespace ErrorCodes {

// ==================== 成功 ====================

/** 操作成功 */
inline constexpr int SUCCESS = 0;

// ==================== 客户端错误 (1xxx) ====================

/** 资源不存在 */
inline constexpr int NOT_FOUND = 1001;

/** 请求参数错误 */
inline constexpr int BAD_REQUEST = 1002;

/** 无权限访问 */
inline constexpr int FORBIDDEN = 1003;

// ==================== 认证错误 (2xxx) ====================

/** Token 已过期 */
inline constexpr int TOKEN_EXPIRED = 2001;

/** 未认证/Token 无效 */
inline constexpr int UNAUTHORIZED = 2004;

// ==================== 分类树错误 (3xxx) ====================

/** 父分类不存在 */
inline constexpr int PARENT_NOT_FOUND = 3001;

/** 同级分类名称重复 */
inline constexpr int DUPLICATE_NAME = 3002;

/** 不能将分类设为自己的父分类 */
inline constexpr int SELF_PARENT = 3003;

/** 移动会形成循环引用 */
inline constexpr int CIRCULAR_REFERENCE = 3004;

/** 仅根分类可分配办公室 */
inline constexpr int NOT_ROOT_CATEGORY = 3005;

/** 存在子分类或关联项目 */
inline constexpr int HAS_DEPENDENTS = 3006;

/** 版本冲突（乐观锁） */
inline constexpr int CONCURRENT_MODIFICATION = 3007;

// ==================== 服务器错误 (5xxx) ====================

/** 服务器内部错误 */
inline constexpr int INTERNAL_ERROR = 5000;

/** 数据库错误 */
inline constexpr int DATABASE_ERROR = 5001;

/** 树结构数据损坏（循环或悬空引用） */
inline constexpr int DATA_INTEGRITY = 5003;

/** 存储暂时不可用 */
inline constexpr int STORE_UNAVAILABLE = 5004;

}  // namespace ErrorCodes
