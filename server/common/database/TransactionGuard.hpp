#pragma once

#include "DatabaseService.hpp"

/**
 * @brief 事务守卫类（RAII 风格）
 *
 * 特性：
 * - 自动回滚：析构时如果未提交则自动回滚
 * - 异常安全：异常发生时保证事务回滚
 * - 协程支持：所有操作都是协程
 *
 * 使用示例：
 * @code
 * auto guard = co_await TransactionGuard::create(dbService);
 *
 * co_await guard.execSqlCoro("INSERT INTO ...", {...});
 * co_await guard.execSqlCoro("UPDATE ...", {...});
 *
 * co_await guard.commit();
 * @endcode
 */
class TransactionGuard {
public:
    using Transaction = drogon::orm::Transaction;
    using Result = drogon::orm::Result;
    template<typename T = void> using Task = drogon::Task<T>;

private:
    std::shared_ptr<Transaction> transaction_;
    bool committed_{false};
    bool rolledBack_{false};
    size_t statements_{0};

    explicit TransactionGuard(std::shared_ptr<Transaction> trans)
        : transaction_(std::move(trans)) {}

    void ensureOpen() const {
        if (committed_) {
            throw std::runtime_error("Transaction already committed");
        }
        if (rolledBack_) {
            throw std::runtime_error("Transaction already rolled back");
        }
    }

public:
    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    TransactionGuard(TransactionGuard&& other) noexcept
        : transaction_(std::move(other.transaction_))
        , committed_(other.committed_)
        , rolledBack_(other.rolledBack_)
        , statements_(other.statements_) {
        other.committed_ = true;  // 防止移动后的对象回滚
    }

    TransactionGuard& operator=(TransactionGuard&& other) noexcept {
        if (this != &other) {
            transaction_ = std::move(other.transaction_);
            committed_ = other.committed_;
            rolledBack_ = other.rolledBack_;
            statements_ = other.statements_;
            other.committed_ = true;  // 防止移动后的对象回滚
        }
        return *this;
    }

    /**
     * @brief 创建事务守卫
     */
    template<typename DbService>
    static Task<TransactionGuard> create(DbService& dbService) {
        auto trans = co_await dbService.newTransactionCoro();
        co_return TransactionGuard(trans);
    }

    /**
     * @brief 析构时自动回滚未提交的事务
     */
    ~TransactionGuard() {
        if (!committed_ && !rolledBack_ && transaction_) {
            try {
                LOG_DEBUG << "Transaction rolled back in destructor after " << statements_ << " statement(s)";
                transaction_->rollback();
            } catch (const std::exception& e) {
                LOG_ERROR << "Failed to rollback transaction in destructor: " << e.what();
            }
        }
    }

    /**
     * @brief 执行 SQL（带参数绑定）
     * 使用 PostgreSQL 原生 $N 参数化查询，由 libpq 服务端绑定防止 SQL 注入
     */
    Task<Result> execSqlCoro(const std::string& sql, const std::vector<std::string>& params = {}) {
        ensureOpen();
        ++statements_;

        if (params.empty()) {
            co_return co_await transaction_->execSqlCoro(sql);
        }
        auto binder = *transaction_ << toParameterized(sql, params.size());
        for (const auto& p : params) {
            binder << p;
        }
        co_return co_await drogon::orm::internal::SqlAwaiter(std::move(binder));
    }

    /**
     * @brief 提交事务并等待确认
     *
     * 通过 setCommitCallback 挂起协程，等待 PostgreSQL 确认 COMMIT 后才继续，
     * 确保数据库写入真正完成后再发布领域事件。
     */
    Task<void> commit() {
        ensureOpen();

        // 1. 注册 setCommitCallback 作为恢复点
        // 2. tx_.reset() 析构 Transaction → 发送 COMMIT 命令
        // 3. PostgreSQL 响应触发回调，handle.resume() 恢复协程
        struct CommitAwaiter : drogon::CallbackAwaiter<bool> {
            std::shared_ptr<Transaction> tx_;
            explicit CommitAwaiter(std::shared_ptr<Transaction> tx)
                : tx_(std::move(tx)) {}

            void await_suspend(std::coroutine_handle<> handle) {
                tx_->setCommitCallback([this, handle](bool success) {
                    setValue(success);
                    handle.resume();
                });
                tx_.reset();  // 析构 → 发送 COMMIT 命令
            }
        };

        bool success = co_await CommitAwaiter{std::move(transaction_)};
        committed_ = true;

        if (!success) {
            throw std::runtime_error("Transaction commit failed");
        }

        LOG_TRACE << "Transaction committed (" << statements_ << " statement(s))";
    }

    /**
     * @brief 显式回滚事务
     */
    void rollback() {
        if (committed_) {
            throw std::runtime_error("Cannot rollback: transaction already committed");
        }
        if (rolledBack_) {
            return;
        }

        transaction_->rollback();
        rolledBack_ = true;
        LOG_DEBUG << "Transaction rolled back";
    }

    bool isCommitted() const { return committed_; }
};
