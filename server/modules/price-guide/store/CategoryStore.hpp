#pragma once

#include "modules/price-guide/domain/Category.hpp"

/**
 * @brief 级联删除结果
 */
struct DeleteOutcome {
    int deletedCategories = 0;   // 含自身
    int deletedItems = 0;
};

/**
 * @brief 分类存储（单个事务）
 *
 * 由 CategoryStoreProvider::begin 获得，所有读写都在同一事务内、
 * 按创建时的租户过滤。未调用 commit 即析构时回滚。
 *
 * 瞬时故障抛出 TransientStoreException；save 版本不匹配抛出
 * ConcurrentModification；违反同级活跃名称唯一抛出 DuplicateName。
 */
class CategoryStore {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    virtual ~CategoryStore() = default;

    virtual const std::string& companyId() const = 0;

    // ==================== 读取 ====================

    virtual Task<std::optional<Category>> findById(const std::string& id) = 0;

    /** 直接子分类（parentId 为空取根分类），按 (sortOrder, id) 排序 */
    virtual Task<std::vector<Category>> findChildren(const std::optional<std::string>& parentId) = 0;

    virtual Task<std::optional<Category>> findSiblingByName(const std::optional<std::string>& parentId,
                                                            const std::string& name) = 0;

    /**
     * @brief 祖先链：从 id 自身开始逐级向上，最多 limit 个节点
     *
     * 链上节点在事务内加共享锁（PostgreSQL），并发移动无法同时基于过期的链提交
     */
    virtual Task<std::vector<Category>> findAncestors(const std::string& id, int limit) = 0;

    virtual Task<std::vector<Category>> findAll(const CategoryFilter& filter) = 0;

    virtual Task<int> countChildren(const std::string& id) = 0;

    /** 子树高度：最深后代比 rootId 低的层数（叶子为 0） */
    virtual Task<int> subtreeHeight(const std::string& rootId) = 0;
    virtual Task<int> countItems(const std::string& id) = 0;

    /** 按分类分组的直接项目数（一次读取） */
    virtual Task<std::unordered_map<std::string, int>> countItemsByCategory() = 0;

    /** 按父分类分组的直接子分类数（一次读取） */
    virtual Task<std::unordered_map<std::string, int>> countChildrenByCategory() = 0;

    // ==================== 写入 ====================

    /** 插入新分类；id 为空时生成，填充 version/createdAt/updatedAt */
    virtual Task<void> insert(Category& category) = 0;

    /** 比较并交换：仅当当前版本等于 expectedVersion 时写入，成功后 version 加一 */
    virtual Task<void> save(Category& category, int expectedVersion) = 0;

    /** 批量 save，每条以其自身 version 作为期望版本 */
    virtual Task<void> saveMany(std::vector<Category>& categories) = 0;

    /** 删除子树及其项目关联、办公室分配 */
    virtual Task<DeleteOutcome> deleteCascade(const std::string& id) = 0;

    /**
     * @brief 从 rootId 开始广度优先重算后代深度（不修改版本）
     * @return 更新的后代数量（不含 rootId 自身）
     */
    virtual Task<int> updateDepthsRecursive(const std::string& rootId, int newRootDepth) = 0;

    // ==================== 办公室 ====================

    /** 返回 officeIds 中属于本租户的办公室 ID */
    virtual Task<std::vector<std::string>> findOffices(const std::vector<std::string>& officeIds) = 0;
    virtual Task<std::vector<std::string>> findOfficeAssignments(const std::string& categoryId) = 0;
    virtual Task<void> insertOfficeAssignment(const std::string& categoryId, const std::string& officeId) = 0;

    /** @return 是否删除了记录 */
    virtual Task<bool> deleteOfficeAssignment(const std::string& categoryId, const std::string& officeId) = 0;

    /** 删除分类的全部办公室分配，返回被移除的办公室 ID */
    virtual Task<std::vector<std::string>> deleteOfficeAssignments(const std::string& categoryId) = 0;

    virtual Task<void> commit() = 0;
};

/**
 * @brief 存储事务工厂
 */
class CategoryStoreProvider {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    virtual ~CategoryStoreProvider() = default;

    virtual Task<std::unique_ptr<CategoryStore>> begin(const std::string& companyId) = 0;
};

/**
 * @brief 进程级存储工厂注册（启动时按配置设置）
 */
class CategoryStoreRegistry {
public:
    static CategoryStoreRegistry& instance() {
        static CategoryStoreRegistry registry;
        return registry;
    }

    void setProvider(std::shared_ptr<CategoryStoreProvider> provider) {
        std::lock_guard lock(mutex_);
        provider_ = std::move(provider);
    }

    std::shared_ptr<CategoryStoreProvider> provider() const {
        std::lock_guard lock(mutex_);
        if (!provider_) {
            throw std::runtime_error("Category store provider not configured");
        }
        return provider_;
    }

private:
    CategoryStoreRegistry() = default;
    mutable std::mutex mutex_;
    std::shared_ptr<CategoryStoreProvider> provider_;
};
