#pragma once

#include "CategoryStore.hpp"
#include "modules/price-guide/domain/CategoryErrors.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/database/TransactionGuard.hpp"
#include "common/database/QueryBuilder.hpp"
#include "common/utils/FieldHelper.hpp"
#include "common/utils/SqlHelper.hpp"
#include "common/utils/StringUtils.hpp"

/**
 * @brief PostgreSQL 分类存储事务
 *
 * 每个实例持有一个 TransactionGuard；ID 列为 UUID，非 UUID 格式的 ID
 * 直接视为不存在，避免类型转换错误变成 500。
 */
class PgCategoryStore : public CategoryStore {
public:
    using Result = drogon::orm::Result;
    using Row = drogon::orm::Row;

    PgCategoryStore(TransactionGuard tx, std::string companyId)
        : tx_(std::move(tx)), companyId_(std::move(companyId)) {}

    const std::string& companyId() const override { return companyId_; }

    Task<std::optional<Category>> findById(const std::string& id) override {
        if (!StringUtils::isUuid(id)) co_return std::nullopt;
        auto result = co_await exec(
            selectColumns() + " WHERE id = ?::uuid AND company_id = ?::uuid",
            {id, companyId_});
        if (result.empty()) co_return std::nullopt;
        co_return fromRow(result[0]);
    }

    Task<std::vector<Category>> findChildren(const std::optional<std::string>& parentId) override {
        if (parentId && !StringUtils::isUuid(*parentId)) co_return std::vector<Category>{};
        auto result = co_await exec(
            selectColumns() + " WHERE company_id = ?::uuid"
            " AND parent_id IS NOT DISTINCT FROM NULLIF(?, '')::uuid"
            " ORDER BY sort_order COLLATE \"C\", id",
            {companyId_, parentId.value_or("")});
        co_return fromResult(result);
    }

    Task<std::optional<Category>> findSiblingByName(const std::optional<std::string>& parentId,
                                                    const std::string& name) override {
        if (parentId && !StringUtils::isUuid(*parentId)) co_return std::nullopt;
        auto result = co_await exec(
            selectColumns() + " WHERE company_id = ?::uuid"
            " AND parent_id IS NOT DISTINCT FROM NULLIF(?, '')::uuid AND name = ?"
            " ORDER BY is_active DESC LIMIT 1",
            {companyId_, parentId.value_or(""), name});
        if (result.empty()) co_return std::nullopt;
        co_return fromRow(result[0]);
    }

    Task<std::vector<Category>> findAncestors(const std::string& id, int limit) override {
        // 逐级加共享锁：并发的 Move 若互为祖先，至少一方会等待或因死锁被回滚
        std::vector<Category> chain;
        std::optional<std::string> current = id;
        while (current && static_cast<int>(chain.size()) < limit) {
            if (!StringUtils::isUuid(*current)) break;
            auto result = co_await exec(
                selectColumns() + " WHERE id = ?::uuid AND company_id = ?::uuid FOR SHARE",
                {*current, companyId_});
            if (result.empty()) break;
            chain.push_back(fromRow(result[0]));
            current = chain.back().parentId;
        }
        co_return chain;
    }

    Task<std::vector<Category>> findAll(const CategoryFilter& filter) override {
        QueryBuilder qb;
        qb.eq("company_id", companyId_, "::uuid");
        qb.eqBool("is_active", filter.isActive);
        if (filter.rootsOnly) {
            qb.isNull("parent_id");
        } else if (filter.parentId) {
            if (!StringUtils::isUuid(*filter.parentId)) co_return std::vector<Category>{};
            qb.eq("parent_id", *filter.parentId, "::uuid");
        }
        auto result = co_await exec(
            selectColumns() + qb.whereClause() + " ORDER BY depth, sort_order COLLATE \"C\", id",
            qb.params());
        co_return fromResult(result);
    }

    Task<int> countChildren(const std::string& id) override {
        auto result = co_await exec(
            "SELECT COUNT(*) AS count FROM price_guide_category"
            " WHERE company_id = ?::uuid AND parent_id = ?::uuid",
            {companyId_, id});
        co_return FieldHelper::getInt(result[0]["count"]);
    }

    Task<int> countItems(const std::string& id) override {
        auto result = co_await exec(
            "SELECT COUNT(*) AS count FROM measure_sheet_item"
            " WHERE company_id = ?::uuid AND category_id = ?::uuid",
            {companyId_, id});
        co_return FieldHelper::getInt(result[0]["count"]);
    }

    Task<std::unordered_map<std::string, int>> countItemsByCategory() override {
        auto result = co_await exec(
            "SELECT category_id::text AS id, COUNT(*)::int AS count FROM measure_sheet_item"
            " WHERE company_id = ?::uuid GROUP BY category_id",
            {companyId_});
        co_return toCountMap(result);
    }

    Task<std::unordered_map<std::string, int>> countChildrenByCategory() override {
        auto result = co_await exec(
            "SELECT parent_id::text AS id, COUNT(*)::int AS count FROM price_guide_category"
            " WHERE company_id = ?::uuid AND parent_id IS NOT NULL GROUP BY parent_id",
            {companyId_});
        co_return toCountMap(result);
    }

    Task<void> insert(Category& category) override {
        if (category.id.empty()) {
            category.id = StringUtils::newUuid();
        }
        category.companyId = companyId_;
        auto result = co_await exec(
            "INSERT INTO price_guide_category"
            " (id, company_id, name, parent_id, depth, sort_order, category_type, is_active, version, last_modified_by)"
            " VALUES (?::uuid, ?::uuid, ?, NULLIF(?, '')::uuid, ?::int, ?, ?::price_guide_category_type,"
            " ?::boolean, 1, NULLIF(?, ''))"
            " RETURNING version, " + timestampColumns(),
            {category.id, companyId_, category.name, category.parentId.value_or(""),
             std::to_string(category.depth), category.sortOrder,
             CategoryTypes::toString(category.categoryType),
             SqlHelper::boolParam(category.isActive), category.lastModifiedBy},
            &category);
        applyReturning(category, result[0]);
    }

    Task<void> save(Category& category, int expectedVersion) override {
        auto result = co_await exec(
            "UPDATE price_guide_category SET"
            " name = ?, parent_id = NULLIF(?, '')::uuid, depth = ?::int, sort_order = ?,"
            " category_type = ?::price_guide_category_type, is_active = ?::boolean,"
            " last_modified_by = NULLIF(?, ''), version = version + 1, updated_at = CURRENT_TIMESTAMP"
            " WHERE id = ?::uuid AND company_id = ?::uuid AND version = ?::int"
            " RETURNING version, " + timestampColumns(),
            {category.name, category.parentId.value_or(""), std::to_string(category.depth),
             category.sortOrder, CategoryTypes::toString(category.categoryType),
             SqlHelper::boolParam(category.isActive), category.lastModifiedBy,
             category.id, companyId_, std::to_string(expectedVersion)},
            &category);

        if (result.empty()) {
            auto current = co_await findById(category.id);
            if (!current) {
                throw CategoryError::NotFound(category.id);
            }
            throw CategoryError::ConcurrentModification(current->version, current->lastModifiedBy);
        }
        category.companyId = companyId_;
        applyReturning(category, result[0]);
    }

    Task<void> saveMany(std::vector<Category>& categories) override {
        for (auto& category : categories) {
            co_await save(category, category.version);
        }
    }

    Task<DeleteOutcome> deleteCascade(const std::string& id) override {
        DeleteOutcome outcome;
        const std::string subtree =
            "WITH RECURSIVE subtree AS ("
            "  SELECT id, 0 AS lvl FROM price_guide_category WHERE id = ?::uuid AND company_id = ?::uuid"
            "  UNION"
            "  SELECT c.id, s.lvl + 1 FROM price_guide_category c"
            "  JOIN subtree s ON c.parent_id = s.id WHERE s.lvl < ?::int"
            ") ";
        std::string limit = std::to_string(Constants::CATEGORY_MAX_DEPTH_LIMIT);

        auto items = co_await exec(
            subtree + "DELETE FROM measure_sheet_item WHERE company_id = ?::uuid"
            " AND category_id IN (SELECT id FROM subtree)",
            {id, companyId_, limit, companyId_});
        outcome.deletedItems = static_cast<int>(items.affectedRows());

        co_await exec(
            subtree + "DELETE FROM price_guide_category_office WHERE category_id IN (SELECT id FROM subtree)",
            {id, companyId_, limit});

        auto categories = co_await exec(
            subtree + "DELETE FROM price_guide_category WHERE id IN (SELECT id FROM subtree)",
            {id, companyId_, limit});
        outcome.deletedCategories = static_cast<int>(categories.affectedRows());
        co_return outcome;
    }

    Task<int> updateDepthsRecursive(const std::string& rootId, int newRootDepth) override {
        auto result = co_await exec(
            "WITH RECURSIVE subtree AS ("
            "  SELECT id, 0 AS lvl FROM price_guide_category WHERE id = ?::uuid AND company_id = ?::uuid"
            "  UNION ALL"
            "  SELECT c.id, s.lvl + 1 FROM price_guide_category c"
            "  JOIN subtree s ON c.parent_id = s.id WHERE s.lvl < ?::int"
            ") "
            "UPDATE price_guide_category p SET depth = ?::int + s.lvl"
            " FROM subtree s WHERE p.id = s.id AND s.lvl > 0",
            {rootId, companyId_, std::to_string(Constants::CATEGORY_MAX_DEPTH_LIMIT),
             std::to_string(newRootDepth)});
        co_return static_cast<int>(result.affectedRows());
    }

    Task<int> subtreeHeight(const std::string& rootId) override {
        if (!StringUtils::isUuid(rootId)) co_return 0;
        auto result = co_await exec(
            "WITH RECURSIVE subtree AS ("
            "  SELECT id, 0 AS lvl FROM price_guide_category WHERE id = ?::uuid AND company_id = ?::uuid"
            "  UNION ALL"
            "  SELECT c.id, s.lvl + 1 FROM price_guide_category c"
            "  JOIN subtree s ON c.parent_id = s.id WHERE s.lvl < ?::int"
            ") "
            "SELECT COALESCE(MAX(lvl), 0)::int AS height FROM subtree",
            {rootId, companyId_, std::to_string(Constants::CATEGORY_MAX_DEPTH_LIMIT)});
        if (result.empty()) co_return 0;
        co_return FieldHelper::getInt(result[0]["height"]);
    }

    Task<std::vector<std::string>> findOffices(const std::vector<std::string>& officeIds) override {
        std::vector<std::string> valid;
        for (const auto& id : officeIds) {
            if (StringUtils::isUuid(id)) valid.push_back(id);
        }
        std::vector<std::string> found;
        if (valid.empty()) co_return found;

        auto [placeholders, params] = SqlHelper::buildParameterizedIn(valid, "::uuid");
        params.insert(params.begin(), companyId_);
        auto result = co_await exec(
            "SELECT id::text AS id FROM office WHERE company_id = ?::uuid AND id IN (" + placeholders + ")",
            params);
        for (const auto& row : result) {
            found.push_back(FieldHelper::getString(row["id"]));
        }
        co_return found;
    }

    Task<std::vector<std::string>> findOfficeAssignments(const std::string& categoryId) override {
        std::vector<std::string> officeIds;
        if (!StringUtils::isUuid(categoryId)) co_return officeIds;
        auto result = co_await exec(
            "SELECT o.office_id::text AS office_id FROM price_guide_category_office o"
            " JOIN price_guide_category c ON c.id = o.category_id"
            " WHERE o.category_id = ?::uuid AND c.company_id = ?::uuid ORDER BY o.created_at, o.office_id",
            {categoryId, companyId_});
        for (const auto& row : result) {
            officeIds.push_back(FieldHelper::getString(row["office_id"]));
        }
        co_return officeIds;
    }

    Task<void> insertOfficeAssignment(const std::string& categoryId, const std::string& officeId) override {
        co_await exec(
            "INSERT INTO price_guide_category_office (category_id, office_id)"
            " VALUES (?::uuid, ?::uuid) ON CONFLICT DO NOTHING",
            {categoryId, officeId});
    }

    Task<bool> deleteOfficeAssignment(const std::string& categoryId, const std::string& officeId) override {
        if (!StringUtils::isUuid(categoryId) || !StringUtils::isUuid(officeId)) co_return false;
        auto result = co_await exec(
            "DELETE FROM price_guide_category_office o USING price_guide_category c"
            " WHERE o.category_id = c.id AND c.company_id = ?::uuid"
            " AND o.category_id = ?::uuid AND o.office_id = ?::uuid",
            {companyId_, categoryId, officeId});
        co_return result.affectedRows() > 0;
    }

    Task<std::vector<std::string>> deleteOfficeAssignments(const std::string& categoryId) override {
        std::vector<std::string> removed;
        if (!StringUtils::isUuid(categoryId)) co_return removed;
        auto result = co_await exec(
            "DELETE FROM price_guide_category_office o USING price_guide_category c"
            " WHERE o.category_id = c.id AND c.company_id = ?::uuid AND o.category_id = ?::uuid"
            " RETURNING o.office_id::text AS office_id",
            {companyId_, categoryId});
        for (const auto& row : result) {
            removed.push_back(FieldHelper::getString(row["office_id"]));
        }
        std::sort(removed.begin(), removed.end());
        co_return removed;
    }

    Task<void> commit() override {
        try {
            co_await tx_.commit();
        } catch (const std::runtime_error& e) {
            LOG_ERROR << "PgCategoryStore: commit failed: " << e.what();
            throw TransientStoreException("事务提交失败，请重试");
        }
    }

private:
    TransactionGuard tx_;
    std::string companyId_;

    static const std::string& timestampColumns() {
        static const std::string columns =
            "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"') AS created_at,"
            " to_char(updated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"') AS updated_at";
        return columns;
    }

    static const std::string& selectColumns() {
        static const std::string columns =
            "SELECT id::text AS id, company_id::text AS company_id, name, parent_id::text AS parent_id,"
            " depth, sort_order, category_type::text AS category_type, is_active, version,"
            " last_modified_by, " + timestampColumns() + " FROM price_guide_category";
        return columns;
    }

    /**
     * @brief 执行 SQL，并把驱动异常映射为领域异常
     * @param subject 写入的分类（唯一约束冲突时用于构造 DuplicateName）
     */
    Task<Result> exec(const std::string& sql, const std::vector<std::string>& params,
                      const Category* subject = nullptr) {
        try {
            co_return co_await tx_.execSqlCoro(sql, params);
        } catch (const drogon::orm::UniqueViolation& e) {
            LOG_DEBUG << "PgCategoryStore: unique violation: " << e.base().what();
            if (subject) {
                throw CategoryError::DuplicateName(subject->name, subject->parentId);
            }
            throw CategoryError::DuplicateName("", std::nullopt);
        } catch (const drogon::orm::TransactionRollback& e) {
            // 包括 SerializationFailure / DeadlockDetected
            LOG_WARN << "PgCategoryStore: transaction rolled back by server: " << e.base().what();
            throw TransientStoreException();
        } catch (const drogon::orm::BrokenConnection& e) {
            LOG_ERROR << "PgCategoryStore: connection lost: " << e.base().what();
            throw TransientStoreException();
        } catch (const drogon::orm::Failure& e) {
            LOG_ERROR << "PgCategoryStore: SQL failed: " << e.base().what();
            throw;
        }
    }

    static Category fromRow(const Row& row) {
        Category c;
        c.id = FieldHelper::getString(row["id"]);
        c.companyId = FieldHelper::getString(row["company_id"]);
        c.name = FieldHelper::getString(row["name"]);
        c.parentId = FieldHelper::getOptionalString(row["parent_id"]);
        c.depth = FieldHelper::getInt(row["depth"]);
        c.sortOrder = FieldHelper::getString(row["sort_order"]);
        c.categoryType = CategoryTypes::parse(FieldHelper::getString(row["category_type"]))
                             .value_or(CategoryType::Default);
        c.isActive = FieldHelper::getBool(row["is_active"], true);
        c.version = FieldHelper::getInt(row["version"], 1);
        c.lastModifiedBy = FieldHelper::getString(row["last_modified_by"]);
        c.createdAt = FieldHelper::getString(row["created_at"]);
        c.updatedAt = FieldHelper::getString(row["updated_at"]);
        return c;
    }

    static std::vector<Category> fromResult(const Result& result) {
        std::vector<Category> categories;
        categories.reserve(result.size());
        for (const auto& row : result) {
            categories.push_back(fromRow(row));
        }
        return categories;
    }

    static std::unordered_map<std::string, int> toCountMap(const Result& result) {
        std::unordered_map<std::string, int> counts;
        for (const auto& row : result) {
            counts[FieldHelper::getString(row["id"])] = FieldHelper::getInt(row["count"]);
        }
        return counts;
    }

    static void applyReturning(Category& category, const Row& row) {
        category.version = FieldHelper::getInt(row["version"], 1);
        category.createdAt = FieldHelper::getString(row["created_at"]);
        category.updatedAt = FieldHelper::getString(row["updated_at"]);
    }
};

/**
 * @brief PostgreSQL 存储工厂
 */
class PgCategoryStoreProvider : public CategoryStoreProvider {
public:
    Task<std::unique_ptr<CategoryStore>> begin(const std::string& companyId) override {
        std::optional<TransactionGuard> tx;
        try {
            tx.emplace(co_await TransactionGuard::create(dbService_));
        } catch (const drogon::orm::DrogonDbException& e) {
            LOG_ERROR << "PgCategoryStore: cannot open transaction: " << e.base().what();
            throw TransientStoreException();
        }
        co_return std::make_unique<PgCategoryStore>(std::move(*tx), companyId);
    }

private:
    DatabaseService dbService_;
};
