#pragma once

#include "CategoryStore.hpp"
#include "modules/price-guide/domain/CategoryErrors.hpp"
#include "common/utils/StringUtils.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 进程内分类数据库（store = memory 时使用，也是测试夹具）
 *
 * 事务以快照隔离实现：begin 时复制已提交状态，commit 时校验事务读过和写过的
 * 分类自快照后未被其他事务修改（否则抛出 TransientStoreException），
 * 并重新检查同级活跃名称唯一，然后整体应用。
 */
class MemoryCategoryDatabase {
public:
    struct Item {
        std::string companyId;
        std::string categoryId;
    };

    struct State {
        std::map<std::string, Category> categories;
        std::map<std::string, uint64_t> revisions;      // 分类 ID → 最近一次提交序号（删除后保留）
        std::map<std::string, Item> items;              // 项目 ID → 归属
        std::map<std::string, std::string> offices;     // 办公室 ID → 租户
        std::set<std::pair<std::string, std::string>> assignments;  // (分类 ID, 办公室 ID)
    };

    std::string addOffice(const std::string& companyId, std::string id = "") {
        if (id.empty()) id = StringUtils::newUuid();
        std::lock_guard lock(mutex_);
        state_.offices[id] = companyId;
        return id;
    }

    std::string addItem(const std::string& companyId, const std::string& categoryId) {
        std::string id = StringUtils::newUuid();
        std::lock_guard lock(mutex_);
        state_.items[id] = Item{companyId, categoryId};
        return id;
    }

    /**
     * @brief 直接写入分类记录，不做任何校验（导入历史数据、构造损坏数据）
     */
    void putCategory(const Category& category) {
        std::lock_guard lock(mutex_);
        state_.categories[category.id] = category;
        state_.revisions[category.id] = ++clock_;
    }

    std::optional<Category> getCategory(const std::string& id) const {
        std::lock_guard lock(mutex_);
        auto it = state_.categories.find(id);
        if (it == state_.categories.end()) return std::nullopt;
        return it->second;
    }

    size_t categoryCount() const {
        std::lock_guard lock(mutex_);
        return state_.categories.size();
    }

    size_t itemCount() const {
        std::lock_guard lock(mutex_);
        return state_.items.size();
    }

    size_t assignmentCount() const {
        std::lock_guard lock(mutex_);
        return state_.assignments.size();
    }

    /**
     * @brief 之后的 count 次 begin 抛出瞬时故障（验证重试策略）
     */
    void injectTransientFailures(int count) {
        pendingFailures_.store(count);
    }

private:
    friend class MemoryCategoryStore;
    friend class MemoryCategoryStoreProvider;

    struct Changes {
        std::map<std::string, uint64_t> observed;
        std::set<std::string> written;
        std::set<std::string> erased;
        std::set<std::string> erasedItems;
        std::set<std::pair<std::string, std::string>> addedAssignments;
        std::set<std::pair<std::string, std::string>> removedAssignments;
    };

    mutable std::mutex mutex_;
    State state_;
    uint64_t clock_ = 0;
    std::atomic<int> pendingFailures_{0};

    State snapshot() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

    bool consumeFailure() {
        int pending = pendingFailures_.load();
        while (pending > 0) {
            if (pendingFailures_.compare_exchange_weak(pending, pending - 1)) return true;
        }
        return false;
    }

    void apply(const State& working, const Changes& changes) {
        std::lock_guard lock(mutex_);

        for (const auto& [id, revision] : changes.observed) {
            auto it = state_.revisions.find(id);
            uint64_t live = it == state_.revisions.end() ? 0 : it->second;
            if (live != revision) {
                LOG_WARN << "MemoryCategoryStore: write conflict on category " << id;
                throw TransientStoreException("分类数据已被并发修改，请重试");
            }
        }

        // 重新校验写入行的同级活跃名称唯一（等价于数据库部分唯一索引）
        for (const auto& id : changes.written) {
            const auto& row = working.categories.at(id);
            if (!row.isActive) continue;
            for (const auto& [otherId, other] : state_.categories) {
                if (otherId == id || changes.erased.count(otherId) || changes.written.count(otherId)) continue;
                if (other.isActive && other.companyId == row.companyId &&
                    other.parentId == row.parentId && other.name == row.name) {
                    throw CategoryError::DuplicateName(row.name, row.parentId);
                }
            }
        }

        for (const auto& id : changes.written) {
            state_.categories[id] = working.categories.at(id);
            state_.revisions[id] = ++clock_;
        }
        for (const auto& id : changes.erased) {
            state_.categories.erase(id);
            state_.revisions[id] = ++clock_;
        }
        for (const auto& id : changes.erasedItems) {
            state_.items.erase(id);
        }
        for (const auto& pair : changes.removedAssignments) {
            state_.assignments.erase(pair);
        }
        for (const auto& pair : changes.addedAssignments) {
            // 分类可能已被并发删除
            if (state_.categories.count(pair.first)) {
                state_.assignments.insert(pair);
            }
        }
    }
};

/**
 * @brief 内存分类存储事务
 */
class MemoryCategoryStore : public CategoryStore {
public:
    MemoryCategoryStore(std::shared_ptr<MemoryCategoryDatabase> db, std::string companyId)
        : db_(std::move(db)), companyId_(std::move(companyId)), working_(db_->snapshot()) {}

    ~MemoryCategoryStore() override {
        if (!committed_ && dirty()) {
            LOG_DEBUG << "MemoryCategoryStore: discarding uncommitted changes";
        }
    }

    const std::string& companyId() const override { return companyId_; }

    Task<std::optional<Category>> findById(const std::string& id) override {
        const Category* row = lookup(id);
        if (!row) co_return std::nullopt;
        co_return *row;
    }

    Task<std::vector<Category>> findChildren(const std::optional<std::string>& parentId) override {
        std::vector<Category> children;
        for (const auto& [id, row] : working_.categories) {
            if (row.companyId == companyId_ && row.parentId == parentId) {
                observe(id);
                children.push_back(row);
            }
        }
        std::sort(children.begin(), children.end(), SiblingOrder{});
        co_return children;
    }

    Task<std::optional<Category>> findSiblingByName(const std::optional<std::string>& parentId,
                                                    const std::string& name) override {
        for (const auto& [id, row] : working_.categories) {
            if (row.companyId == companyId_ && row.parentId == parentId && row.name == name) {
                observe(id);
                co_return row;
            }
        }
        co_return std::nullopt;
    }

    Task<std::vector<Category>> findAncestors(const std::string& id, int limit) override {
        std::vector<Category> chain;
        std::optional<std::string> current = id;
        while (current && static_cast<int>(chain.size()) < limit) {
            const Category* row = lookup(*current);
            if (!row) break;
            chain.push_back(*row);
            current = row->parentId;
        }
        co_return chain;
    }

    Task<std::vector<Category>> findAll(const CategoryFilter& filter) override {
        std::vector<Category> result;
        for (const auto& [id, row] : working_.categories) {
            if (row.companyId != companyId_) continue;
            if (filter.isActive && row.isActive != *filter.isActive) continue;
            if (filter.rootsOnly && !row.isRoot()) continue;
            if (filter.parentId && row.parentId != filter.parentId) continue;
            result.push_back(row);
        }
        std::sort(result.begin(), result.end(), [](const Category& a, const Category& b) {
            if (a.depth != b.depth) return a.depth < b.depth;
            return SiblingOrder{}(a, b);
        });
        co_return result;
    }

    Task<int> countChildren(const std::string& id) override {
        int count = 0;
        for (const auto& [childId, row] : working_.categories) {
            if (row.companyId == companyId_ && row.parentId == id) ++count;
        }
        co_return count;
    }

    Task<int> subtreeHeight(const std::string& rootId) override {
        int height = 0;
        if (!lookup(rootId)) co_return height;
        auto childrenIndex = buildChildrenIndex();
        std::set<std::string> visited{rootId};
        std::queue<std::pair<std::string, int>> queue;
        queue.emplace(rootId, 0);
        while (!queue.empty()) {
            auto [id, level] = queue.front();
            queue.pop();
            observe(id);
            height = std::max(height, level);
            auto it = childrenIndex.find(id);
            if (it == childrenIndex.end()) continue;
            for (const auto& childId : it->second) {
                if (visited.insert(childId).second) {
                    queue.emplace(childId, level + 1);
                }
            }
        }
        co_return height;
    }

    Task<int> countItems(const std::string& id) override {
        int count = 0;
        for (const auto& [itemId, item] : working_.items) {
            if (item.companyId == companyId_ && item.categoryId == id) ++count;
        }
        co_return count;
    }

    Task<std::unordered_map<std::string, int>> countItemsByCategory() override {
        std::unordered_map<std::string, int> counts;
        for (const auto& [itemId, item] : working_.items) {
            if (item.companyId == companyId_) ++counts[item.categoryId];
        }
        co_return counts;
    }

    Task<std::unordered_map<std::string, int>> countChildrenByCategory() override {
        std::unordered_map<std::string, int> counts;
        for (const auto& [id, row] : working_.categories) {
            if (row.companyId == companyId_ && row.parentId) ++counts[*row.parentId];
        }
        co_return counts;
    }

    Task<void> insert(Category& category) override {
        if (category.id.empty()) {
            category.id = StringUtils::newUuid();
        }
        if (working_.categories.count(category.id)) {
            throw ValidationException("分类 ID 已存在: " + category.id);
        }
        category.companyId = companyId_;
        category.version = 1;
        category.createdAt = TimestampHelper::now();
        category.updatedAt = category.createdAt;
        ensureUniqueName(category);

        observe(category.id);
        working_.categories[category.id] = category;
        changes_.written.insert(category.id);
        co_return;
    }

    Task<void> save(Category& category, int expectedVersion) override {
        Category* row = mutableLookup(category.id);
        if (!row) {
            throw CategoryError::NotFound(category.id);
        }
        if (row->version != expectedVersion) {
            throw CategoryError::ConcurrentModification(row->version, row->lastModifiedBy);
        }
        category.companyId = companyId_;
        category.createdAt = row->createdAt;
        category.version = expectedVersion + 1;
        category.updatedAt = TimestampHelper::now();
        ensureUniqueName(category);

        *row = category;
        changes_.written.insert(category.id);
        co_return;
    }

    Task<void> saveMany(std::vector<Category>& categories) override {
        for (auto& category : categories) {
            co_await save(category, category.version);
        }
    }

    Task<DeleteOutcome> deleteCascade(const std::string& id) override {
        DeleteOutcome outcome;
        if (!lookup(id)) co_return outcome;

        auto subtree = collectSubtree(id);
        for (const auto& [itemId, item] : working_.items) {
            if (item.companyId == companyId_ && subtree.count(item.categoryId)) {
                changes_.erasedItems.insert(itemId);
            }
        }
        for (const auto& itemId : changes_.erasedItems) {
            if (working_.items.erase(itemId)) ++outcome.deletedItems;
        }
        for (auto it = working_.assignments.begin(); it != working_.assignments.end();) {
            if (subtree.count(it->first)) {
                changes_.removedAssignments.insert(*it);
                it = working_.assignments.erase(it);
            } else {
                ++it;
            }
        }
        for (const auto& categoryId : subtree) {
            observe(categoryId);
            working_.categories.erase(categoryId);
            changes_.written.erase(categoryId);
            changes_.erased.insert(categoryId);
            ++outcome.deletedCategories;
        }
        co_return outcome;
    }

    Task<int> updateDepthsRecursive(const std::string& rootId, int newRootDepth) override {
        int updated = 0;
        auto childrenIndex = buildChildrenIndex();
        std::set<std::string> visited{rootId};
        std::queue<std::pair<std::string, int>> queue;
        queue.emplace(rootId, newRootDepth);

        while (!queue.empty()) {
            auto [id, depth] = queue.front();
            queue.pop();

            Category* row = mutableLookup(id);
            if (!row) continue;
            if (id != rootId) ++updated;
            if (row->depth != depth) {
                row->depth = depth;
                changes_.written.insert(id);
            }

            auto it = childrenIndex.find(id);
            if (it == childrenIndex.end()) continue;
            for (const auto& childId : it->second) {
                if (visited.insert(childId).second) {
                    queue.emplace(childId, depth + 1);
                }
            }
        }
        co_return updated;
    }

    Task<std::vector<std::string>> findOffices(const std::vector<std::string>& officeIds) override {
        std::vector<std::string> found;
        for (const auto& id : officeIds) {
            auto it = working_.offices.find(id);
            if (it != working_.offices.end() && it->second == companyId_) {
                found.push_back(id);
            }
        }
        co_return found;
    }

    Task<std::vector<std::string>> findOfficeAssignments(const std::string& categoryId) override {
        std::vector<std::string> officeIds;
        if (!lookup(categoryId)) co_return officeIds;
        for (const auto& [assignedCategory, officeId] : working_.assignments) {
            if (assignedCategory == categoryId) officeIds.push_back(officeId);
        }
        co_return officeIds;
    }

    Task<void> insertOfficeAssignment(const std::string& categoryId, const std::string& officeId) override {
        auto pair = std::make_pair(categoryId, officeId);
        if (working_.assignments.insert(pair).second) {
            changes_.removedAssignments.erase(pair);
            changes_.addedAssignments.insert(pair);
        }
        co_return;
    }

    Task<bool> deleteOfficeAssignment(const std::string& categoryId, const std::string& officeId) override {
        auto pair = std::make_pair(categoryId, officeId);
        if (!lookup(categoryId) || working_.assignments.erase(pair) == 0) {
            co_return false;
        }
        changes_.addedAssignments.erase(pair);
        changes_.removedAssignments.insert(pair);
        co_return true;
    }

    Task<std::vector<std::string>> deleteOfficeAssignments(const std::string& categoryId) override {
        std::vector<std::string> removed;
        if (!lookup(categoryId)) co_return removed;
        for (auto it = working_.assignments.begin(); it != working_.assignments.end();) {
            if (it->first == categoryId) {
                removed.push_back(it->second);
                changes_.addedAssignments.erase(*it);
                changes_.removedAssignments.insert(*it);
                it = working_.assignments.erase(it);
            } else {
                ++it;
            }
        }
        co_return removed;
    }

    Task<void> commit() override {
        if (committed_) {
            throw std::runtime_error("Transaction already committed");
        }
        db_->apply(working_, changes_);
        committed_ = true;
        co_return;
    }

private:
    std::shared_ptr<MemoryCategoryDatabase> db_;
    std::string companyId_;
    MemoryCategoryDatabase::State working_;
    MemoryCategoryDatabase::Changes changes_;
    bool committed_ = false;

    bool dirty() const {
        return !changes_.written.empty() || !changes_.erased.empty() ||
               !changes_.addedAssignments.empty() || !changes_.removedAssignments.empty();
    }

    /** 记录读取时的提交序号，commit 时校验 */
    void observe(const std::string& id) {
        auto it = working_.revisions.find(id);
        changes_.observed.emplace(id, it == working_.revisions.end() ? 0 : it->second);
    }

    const Category* lookup(const std::string& id) {
        return mutableLookup(id);
    }

    Category* mutableLookup(const std::string& id) {
        auto it = working_.categories.find(id);
        if (it == working_.categories.end() || it->second.companyId != companyId_) {
            return nullptr;
        }
        observe(id);
        return &it->second;
    }

    void ensureUniqueName(const Category& category) const {
        if (!category.isActive) return;
        for (const auto& [id, row] : working_.categories) {
            if (id != category.id && row.isActive && row.companyId == companyId_ &&
                row.parentId == category.parentId && row.name == category.name) {
                throw CategoryError::DuplicateName(category.name, category.parentId);
            }
        }
    }

    std::unordered_map<std::string, std::vector<std::string>> buildChildrenIndex() const {
        std::unordered_map<std::string, std::vector<std::string>> index;
        for (const auto& [id, row] : working_.categories) {
            if (row.companyId == companyId_ && row.parentId) {
                index[*row.parentId].push_back(id);
            }
        }
        return index;
    }

    std::set<std::string> collectSubtree(const std::string& rootId) const {
        auto childrenIndex = buildChildrenIndex();
        std::set<std::string> subtree{rootId};
        std::vector<std::string> stack{rootId};
        while (!stack.empty()) {
            std::string current = stack.back();
            stack.pop_back();
            auto it = childrenIndex.find(current);
            if (it == childrenIndex.end()) continue;
            for (const auto& childId : it->second) {
                if (subtree.insert(childId).second) {
                    stack.push_back(childId);
                }
            }
        }
        return subtree;
    }
};

/**
 * @brief 内存存储工厂
 */
class MemoryCategoryStoreProvider : public CategoryStoreProvider {
public:
    explicit MemoryCategoryStoreProvider(std::shared_ptr<MemoryCategoryDatabase> db)
        : db_(std::move(db)) {}

    Task<std::unique_ptr<CategoryStore>> begin(const std::string& companyId) override {
        if (db_->consumeFailure()) {
            throw TransientStoreException("内存存储模拟故障");
        }
        co_return std::make_unique<MemoryCategoryStore>(db_, companyId);
    }

    const std::shared_ptr<MemoryCategoryDatabase>& database() const { return db_; }

private:
    std::shared_ptr<MemoryCategoryDatabase> db_;
};
