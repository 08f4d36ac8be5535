#pragma once

#include "common/utils/AppException.hpp"

/**
 * @brief 瞬时存储故障重试
 *
 * 仅用于可安全重放的操作（只读查询、幂等的 Reorder）。
 * 每次尝试都必须开启新事务，由调用方在 fn 内部完成。
 *
 * @param attempts 失败后的额外重试次数（0 表示不重试）
 * @param label 日志标签
 * @param fn 返回 Task<T> 的可调用对象
 */
template<typename T, typename Fn>
drogon::Task<T> retryTransient(int attempts, std::string label, Fn fn) {
    for (int attempt = 0;; ++attempt) {
        try {
            co_return co_await fn();
        } catch (const TransientStoreException& e) {
            if (attempt >= attempts) {
                LOG_ERROR << label << ": transient store failure, giving up after "
                          << (attempt + 1) << " attempt(s): " << e.what();
                throw;
            }
            LOG_WARN << label << ": transient store failure (attempt " << (attempt + 1)
                     << "/" << (attempts + 1) << "), retrying: " << e.what();
        }
    }
}
