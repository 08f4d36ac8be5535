#pragma once

#include "DatabaseService.hpp"

/**
 * @brief 价格指南表结构初始化（启动时执行，幂等）
 *
 * office / measure_sheet_item 由办公室服务和目录服务维护，
 * 这里仅在缺失时创建最小结构，保证单独部署时可用。
 */
class DatabaseInitializer {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    template<typename T = void> using Task = drogon::Task<T>;

    static Task<> initialize() {
        DatabaseService dbService;
        auto db = dbService.getClient();

        LOG_INFO << "Checking database initialization...";

        // 抑制 IF NOT EXISTS 产生的 NOTICE（"relation already exists, skipping"）
        co_await db->execSqlCoro("SET client_min_messages = WARNING");

        co_await createEnumTypes(db);
        co_await createCollaboratorTables(db);
        co_await createCategoryTables(db);

        LOG_INFO << "Database initialization completed";
    }

private:
    static Task<> createEnumTypes(const DbClientPtr& db) {
        co_await db->execSqlCoro(R"(
            DO $$ BEGIN
                CREATE TYPE price_guide_category_type AS ENUM ('default', 'detail', 'deep_drill_down');
            EXCEPTION
                WHEN duplicate_object THEN null;
            END $$
        )");

        LOG_INFO << "Enum types created/verified";
    }

    static Task<> createCollaboratorTables(const DbClientPtr& db) {
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS office (
                id UUID PRIMARY KEY,
                company_id UUID NOT NULL,
                name VARCHAR(255) NOT NULL DEFAULT '',
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_office_company ON office (company_id))");

        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS measure_sheet_item (
                id UUID PRIMARY KEY,
                company_id UUID NOT NULL,
                category_id UUID NOT NULL,
                name VARCHAR(255) NOT NULL DEFAULT '',
                created_at TIMESTAMPTZ DEFAULT CURRENT_TIMESTAMP
            )
        )");
        // 按分类计数（Tree 分组统计、删除前依赖检查）
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_msi_company_category ON measure_sheet_item (company_id, category_id))");
    }

    static Task<> createCategoryTables(const DbClientPtr& db) {
        // parent_id 外键为 NO ACTION：级联删除由存储层在同一语句中完成
        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS price_guide_category (
                id UUID PRIMARY KEY,
                company_id UUID NOT NULL,
                name VARCHAR(255) NOT NULL,
                parent_id UUID NULL REFERENCES price_guide_category(id),
                depth INT NOT NULL DEFAULT 0,
                sort_order VARCHAR(50) NOT NULL DEFAULT 'a0',
                category_type price_guide_category_type NOT NULL DEFAULT 'default',
                is_active BOOLEAN NOT NULL DEFAULT TRUE,
                version INT NOT NULL DEFAULT 1,
                last_modified_by VARCHAR(255),
                created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
                CONSTRAINT chk_pgc_depth CHECK (depth >= 0),
                CONSTRAINT chk_pgc_not_self CHECK (parent_id IS NULL OR parent_id <> id)
            )
        )");
        // 同级有序读取（findChildren / Tree）
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_pgc_company_parent_order ON price_guide_category (company_id, parent_id, sort_order, id))");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_pgc_parent ON price_guide_category (parent_id))");
        // 同级活跃名称唯一（根分类的 parent_id 为 NULL，用零 UUID 归并）
        co_await db->execSqlCoro(R"(
            CREATE UNIQUE INDEX IF NOT EXISTS uq_pgc_active_sibling_name
            ON price_guide_category (company_id, COALESCE(parent_id, '00000000-0000-0000-0000-000000000000'::uuid), name)
            WHERE is_active
        )");

        co_await db->execSqlCoro(R"(
            CREATE TABLE IF NOT EXISTS price_guide_category_office (
                category_id UUID NOT NULL REFERENCES price_guide_category(id) ON DELETE CASCADE,
                office_id UUID NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
                PRIMARY KEY (category_id, office_id)
            )
        )");
        co_await db->execSqlCoro(R"(CREATE INDEX IF NOT EXISTS idx_pgco_office ON price_guide_category_office (office_id))");

        LOG_INFO << "Price guide tables created/verified";
    }
};
