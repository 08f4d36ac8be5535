#pragma once

#include "domain/Category.hpp"
#include "domain/CategoryErrors.hpp"
#include "domain/CategoryInputs.hpp"
#include "domain/CategoryTree.hpp"
#include "domain/Events.hpp"
#include "domain/OrderKey.hpp"
#include "domain/TreeInvariants.hpp"
#include "store/CategoryStore.hpp"
#include "common/database/RetryPolicy.hpp"
#include "common/domain/EventBus.hpp"
#include "common/domain/Principal.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief 删除结果
 */
struct DeleteCategoryResult {
    int deletedChildren = 0;   // 被级联删除的后代分类数（不含自身）
    int deletedItems = 0;

    Json::Value toJson() const {
        Json::Value json;
        json["deletedChildren"] = deletedChildren;
        json["deletedItems"] = deletedItems;
        return json;
    }
};

/**
 * @brief 批量排序结果（不存在的 ID 被跳过并原样返回）
 */
struct ReorderResult {
    int updatedCount = 0;
    std::vector<std::string> skippedIds;

    Json::Value toJson() const {
        Json::Value json;
        json["updatedCount"] = updatedCount;
        json["skippedIds"] = Json::Value(Json::arrayValue);
        for (const auto& id : skippedIds) json["skippedIds"].append(id);
        return json;
    }
};

struct BreadcrumbEntry {
    std::string id;
    std::string name;
};

inline Json::Value breadcrumbToJson(const std::vector<BreadcrumbEntry>& path) {
    Json::Value json(Json::arrayValue);
    for (const auto& entry : path) {
        Json::Value item;
        item["id"] = entry.id;
        item["name"] = entry.name;
        json.append(item);
    }
    return json;
}

/**
 * @brief 价格指南分类服务
 *
 * 每个操作开启一个存储事务：事务内读取 → 不变量检查 → 写入 → 提交 → 发布事件。
 * 只读操作和 Reorder 在瞬时故障时重试；其余写操作不重试，直接失败。
 */
class CategoryService {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    CategoryService()
        : CategoryService(CategoryStoreRegistry::instance().provider(), ConfigManager::getPriceGuideOptions()) {}

    CategoryService(std::shared_ptr<CategoryStoreProvider> provider, PriceGuideOptions options)
        : provider_(std::move(provider)), options_(std::move(options)) {}

    // ==================== 查询 ====================

    /**
     * @brief 分类详情（含直接子分类数和项目数）
     */
    Task<CategoryView> get(const Principal& actor, const std::string& id) {
        actor.require(Constants::PERM_PRICE_GUIDE_READ);
        co_return co_await retryTransient<CategoryView>(options_.retryAttempts, "CategoryService::get",
            [&]() -> Task<CategoryView> {
                auto store = co_await provider_->begin(actor.companyId);
                CategoryView view;
                view.category = co_await requireCategory(*store, id);
                view.childCount = co_await store->countChildren(id);
                view.itemCount = co_await store->countItems(id);
                co_await store->commit();
                co_return view;
            });
    }

    /**
     * @brief 平铺列表，按深度、同级顺序排序
     */
    Task<std::vector<CategoryView>> list(const Principal& actor, const CategoryFilter& filter) {
        actor.require(Constants::PERM_PRICE_GUIDE_READ);
        co_return co_await retryTransient<std::vector<CategoryView>>(options_.retryAttempts, "CategoryService::list",
            [&]() -> Task<std::vector<CategoryView>> {
                auto store = co_await provider_->begin(actor.companyId);
                auto categories = co_await store->findAll(filter);
                auto childCounts = co_await store->countChildrenByCategory();
                auto itemCounts = co_await store->countItemsByCategory();
                co_await store->commit();
                co_return project(std::move(categories), childCounts, itemCounts);
            });
    }

    /**
     * @brief 直接子分类
     */
    Task<std::vector<CategoryView>> children(const Principal& actor, const std::string& id) {
        actor.require(Constants::PERM_PRICE_GUIDE_READ);
        co_return co_await retryTransient<std::vector<CategoryView>>(options_.retryAttempts, "CategoryService::children",
            [&]() -> Task<std::vector<CategoryView>> {
                auto store = co_await provider_->begin(actor.companyId);
                co_await requireCategory(*store, id);
                auto categories = co_await store->findChildren(id);
                auto childCounts = co_await store->countChildrenByCategory();
                auto itemCounts = co_await store->countItemsByCategory();
                co_await store->commit();
                co_return project(std::move(categories), childCounts, itemCounts);
            });
    }

    /**
     * @brief 分类森林（isActive 过滤后父节点缺失的分类提升为根）
     */
    Task<CategoryTree> tree(const Principal& actor, std::optional<bool> isActive = std::nullopt) {
        actor.require(Constants::PERM_PRICE_GUIDE_READ);
        co_return co_await retryTransient<CategoryTree>(options_.retryAttempts, "CategoryService::tree",
            [&]() -> Task<CategoryTree> {
                auto store = co_await provider_->begin(actor.companyId);
                CategoryFilter filter;
                filter.isActive = isActive;
                auto categories = co_await store->findAll(filter);
                auto itemCounts = co_await store->countItemsByCategory();
                co_await store->commit();
                co_return CategoryTree::build(std::move(categories), itemCounts);
            });
    }

    /**
     * @brief 面包屑：根到 id 的路径
     */
    Task<std::vector<BreadcrumbEntry>> breadcrumb(const Principal& actor, const std::string& id) {
        actor.require(Constants::PERM_PRICE_GUIDE_READ);
        co_return co_await retryTransient<std::vector<BreadcrumbEntry>>(options_.retryAttempts, "CategoryService::breadcrumb",
            [&]() -> Task<std::vector<BreadcrumbEntry>> {
                auto store = co_await provider_->begin(actor.companyId);
                auto chain = co_await store->findAncestors(id, options_.maxTreeDepth + 1);
                co_await store->commit();
                if (chain.empty()) {
                    throw CategoryError::NotFound(id);
                }

                auto path = TreeInvariants::pathToRoot(id, TreeInvariants::indexLookup(chain), options_.maxTreeDepth);
                if (!path) {
                    LOG_ERROR << "Breadcrumb: broken ancestor chain for category " << id
                              << " (company " << actor.companyId << ")";
                    throw CategoryError::DataIntegrity(id);
                }

                std::vector<BreadcrumbEntry> entries;
                entries.reserve(path->size());
                for (const Category* node : *path) {
                    entries.push_back({node->id, node->name});
                }
                co_return entries;
            });
    }

    // ==================== 写操作 ====================

    /**
     * @brief 创建分类，排在当前同级末尾
     */
    Task<Category> create(const Principal& actor, const CreateCategoryInput& input) {
        actor.require(Constants::PERM_PRICE_GUIDE_CREATE);
        auto store = co_await provider_->begin(actor.companyId);

        std::optional<Category> parent;
        if (input.parentId) {
            parent = co_await store->findById(*input.parentId);
            if (!parent) {
                throw CategoryError::ParentNotFound(*input.parentId);
            }
        }

        bool active = input.isActive.value_or(true);
        auto siblings = co_await store->findChildren(input.parentId);
        if (active && TreeInvariants::isDuplicateSibling(input.name, siblings)) {
            throw CategoryError::DuplicateName(input.name, input.parentId);
        }

        Category category;
        category.name = input.name;
        category.parentId = input.parentId;
        category.depth = TreeInvariants::computeDepth(parent ? &*parent : nullptr);
        if (category.depth > options_.maxTreeDepth) {
            throw ValidatorHelper::fieldError("parentId", "分类层级不能超过" + std::to_string(options_.maxTreeDepth));
        }
        category.sortOrder = OrderKey::between(lastSortOrder(siblings), std::nullopt);
        category.categoryType = TreeInvariants::canSetCategoryType(category.depth)
            ? input.categoryType.value_or(CategoryType::Default)
            : CategoryType::Default;
        category.isActive = active;
        category.lastModifiedBy = actor.userId;

        co_await store->insert(category);
        co_await store->commit();

        LOG_INFO << "Category created: " << category.id << " \"" << category.name << "\""
                 << " parent=" << category.parentId.value_or("-") << " by " << actor.userId;
        co_await EventBus::instance().publish(CategoryCreated(actor.userId, category));
        co_return category;
    }

    /**
     * @brief 更新名称、类型、启用状态（乐观锁）
     */
    Task<Category> update(const Principal& actor, const std::string& id, const UpdateCategoryInput& input) {
        actor.require(Constants::PERM_PRICE_GUIDE_UPDATE);
        auto store = co_await provider_->begin(actor.companyId);

        auto current = co_await requireCategory(*store, id);
        if (current.version != input.expectedVersion) {
            throw CategoryError::ConcurrentModification(current.version, current.lastModifiedBy);
        }

        Category updated = current;
        Json::Value changes(Json::objectValue);

        if (input.name && *input.name != current.name) {
            updated.name = *input.name;
            changes["name"] = diff(current.name, updated.name);
        }
        if (input.isActive && *input.isActive != current.isActive) {
            updated.isActive = *input.isActive;
            changes["isActive"] = diff(current.isActive, updated.isActive);
        }
        if (input.categoryType) {
            if (TreeInvariants::canSetCategoryType(current.depth)) {
                if (*input.categoryType != current.categoryType) {
                    updated.categoryType = *input.categoryType;
                    changes["categoryType"] = diff(CategoryTypes::toString(current.categoryType),
                                                   CategoryTypes::toString(updated.categoryType));
                }
            } else {
                LOG_DEBUG << "Ignoring categoryType change for non-root category " << id;
            }
        }

        // 改名或重新启用都需要与活跃同级比对
        bool renamed = changes.isMember("name");
        bool reactivated = updated.isActive && !current.isActive;
        if (updated.isActive && (renamed || reactivated)) {
            auto siblings = co_await store->findChildren(current.parentId);
            if (TreeInvariants::isDuplicateSibling(updated.name, siblings, id)) {
                throw CategoryError::DuplicateName(updated.name, current.parentId);
            }
        }

        updated.lastModifiedBy = actor.userId;
        co_await store->save(updated, input.expectedVersion);
        co_await store->commit();

        LOG_INFO << "Category updated: " << id << " v" << updated.version << " by " << actor.userId;
        co_await EventBus::instance().publish(CategoryUpdated(actor.userId, updated, changes));
        co_return updated;
    }

    /**
     * @brief 移动分类到新父节点下（或提升为根），后代深度在同一事务内级联更新
     */
    Task<Category> move(const Principal& actor, const std::string& id, const MoveCategoryInput& input) {
        actor.require(Constants::PERM_PRICE_GUIDE_UPDATE);
        if (input.newParentId && *input.newParentId == id) {
            throw CategoryError::SelfParent(id);
        }
        if (input.sortOrder && !OrderKey::isValid(*input.sortOrder)) {
            throw ValidatorHelper::fieldError("sortOrder", "排序键无效");
        }

        auto store = co_await provider_->begin(actor.companyId);
        auto category = co_await requireCategory(*store, id);
        if (input.expectedVersion && *input.expectedVersion != category.version) {
            throw CategoryError::ConcurrentModification(category.version, category.lastModifiedBy);
        }

        std::optional<Category> parent;
        if (input.newParentId) {
            // 祖先链在事务内读取（并加锁），环检测基于最新已提交数据
            auto chain = co_await store->findAncestors(*input.newParentId, options_.maxTreeDepth + 1);
            if (chain.empty()) {
                throw CategoryError::ParentNotFound(*input.newParentId);
            }
            if (TreeInvariants::wouldCreateCycle(id, input.newParentId, TreeInvariants::indexLookup(chain),
                                                 options_.maxTreeDepth)) {
                throw CategoryError::CircularReference(id, *input.newParentId);
            }
            parent = chain.front();
        }

        auto siblings = co_await store->findChildren(input.newParentId);
        if (category.isActive && TreeInvariants::isDuplicateSibling(category.name, siblings, id)) {
            throw CategoryError::DuplicateName(category.name, input.newParentId);
        }

        Category moved = category;
        moved.parentId = input.newParentId;
        moved.depth = TreeInvariants::computeDepth(parent ? &*parent : nullptr);
        // 整棵子树随之下移，最深的后代也不能超过上限
        int height = co_await store->subtreeHeight(id);
        if (moved.depth + height > options_.maxTreeDepth) {
            throw ValidatorHelper::fieldError("newParentId", "分类层级不能超过" + std::to_string(options_.maxTreeDepth));
        }
        if (input.sortOrder) {
            moved.sortOrder = *input.sortOrder;
        } else {
            std::vector<Category> others;
            std::copy_if(siblings.begin(), siblings.end(), std::back_inserter(others),
                         [&](const Category& s) { return s.id != id; });
            moved.sortOrder = OrderKey::between(lastSortOrder(others), std::nullopt);
        }
        if (!TreeInvariants::canSetCategoryType(moved.depth)) {
            moved.categoryType = CategoryType::Default;
        }
        moved.lastModifiedBy = actor.userId;

        bool parentChanged = category.parentId != moved.parentId;
        std::vector<std::string> unassignedOffices;
        if (category.isRoot() && moved.parentId) {
            // 办公室只能分配给根分类
            unassignedOffices = co_await store->deleteOfficeAssignments(id);
        }
        co_await store->save(moved, category.version);
        int descendants = 0;
        if (parentChanged) {
            descendants = co_await store->updateDepthsRecursive(id, moved.depth);
        }
        co_await store->commit();

        LOG_INFO << "Category moved: " << id << " " << category.parentId.value_or("<root>")
                 << " -> " << moved.parentId.value_or("<root>") << " depth " << category.depth
                 << " -> " << moved.depth << " (" << descendants << " descendant(s)) by " << actor.userId;
        if (!unassignedOffices.empty()) {
            LOG_INFO << "Category " << id << " is no longer a root, removed " << unassignedOffices.size()
                     << " office assignment(s)";
        }
        co_await EventBus::instance().publish(
            CategoryMoved(actor.userId, category, moved, descendants, unassignedOffices));
        co_return moved;
    }

    /**
     * @brief 批量设置排序键
     *
     * 不存在（或不属于本租户）的 ID 跳过并在结果中返回；同一 ID 出现多次以最后一次为准。
     * 重复执行同一批次结果一致，因此允许瞬时故障重试。
     */
    Task<ReorderResult> reorder(const Principal& actor, const ReorderInput& input) {
        actor.require(Constants::PERM_PRICE_GUIDE_UPDATE);
        for (size_t i = 0; i < input.items.size(); ++i) {
            if (!OrderKey::isValid(input.items[i].sortOrder)) {
                throw ValidatorHelper::fieldError("items[" + std::to_string(i) + "].sortOrder", "排序键无效");
            }
        }

        std::vector<std::string> updatedIds;
        auto result = co_await retryTransient<ReorderResult>(options_.retryAttempts, "CategoryService::reorder",
            [&]() -> Task<ReorderResult> {
                auto store = co_await provider_->begin(actor.companyId);
                ReorderResult outcome;
                std::vector<Category> changed;
                std::unordered_map<std::string, size_t> positions;

                for (const auto& entry : input.items) {
                    auto pos = positions.find(entry.id);
                    if (pos != positions.end()) {
                        changed[pos->second].sortOrder = entry.sortOrder;
                        continue;
                    }
                    auto category = co_await store->findById(entry.id);
                    if (!category) {
                        outcome.skippedIds.push_back(entry.id);
                        continue;
                    }
                    category->sortOrder = entry.sortOrder;
                    category->lastModifiedBy = actor.userId;
                    positions.emplace(entry.id, changed.size());
                    changed.push_back(std::move(*category));
                }

                co_await store->saveMany(changed);
                co_await store->commit();

                updatedIds.clear();
                for (const auto& category : changed) updatedIds.push_back(category.id);
                outcome.updatedCount = static_cast<int>(changed.size());
                co_return outcome;
            });

        if (!result.skippedIds.empty()) {
            LOG_INFO << "Reorder skipped " << result.skippedIds.size() << " missing category id(s)";
        }
        LOG_INFO << "Categories reordered: " << result.updatedCount << " by " << actor.userId;
        co_await EventBus::instance().publish(
            CategoriesReordered(actor.userId, actor.companyId, updatedIds, result.skippedIds));
        co_return result;
    }

    /**
     * @brief 删除分类；有子分类或项目时必须 force，强制删除级联整棵子树
     */
    Task<DeleteCategoryResult> remove(const Principal& actor, const std::string& id, bool force) {
        actor.require(Constants::PERM_PRICE_GUIDE_DELETE);
        auto store = co_await provider_->begin(actor.companyId);

        auto category = co_await requireCategory(*store, id);
        int childCount = co_await store->countChildren(id);
        int itemCount = co_await store->countItems(id);
        if ((childCount > 0 || itemCount > 0) && !force) {
            throw CategoryError::HasDependents(childCount, itemCount);
        }

        auto outcome = co_await store->deleteCascade(id);
        co_await store->commit();

        DeleteCategoryResult result;
        result.deletedChildren = std::max(0, outcome.deletedCategories - 1);
        result.deletedItems = outcome.deletedItems;

        LOG_INFO << "Category deleted: " << id << " \"" << category.name << "\""
                 << (force ? " (force)" : "") << " children=" << result.deletedChildren
                 << " items=" << result.deletedItems << " by " << actor.userId;
        co_await EventBus::instance().publish(
            CategoryDeleted(actor.userId, category, force, outcome.deletedCategories, outcome.deletedItems));
        co_return result;
    }

private:
    std::shared_ptr<CategoryStoreProvider> provider_;
    PriceGuideOptions options_;

    static Task<Category> requireCategory(CategoryStore& store, const std::string& id) {
        auto category = co_await store.findById(id);
        if (!category) {
            throw CategoryError::NotFound(id);
        }
        co_return *category;
    }

    /** 同级中最大的排序键（同级已按 (sortOrder, id) 排序） */
    static std::optional<std::string> lastSortOrder(const std::vector<Category>& siblings) {
        if (siblings.empty()) return std::nullopt;
        return std::max_element(siblings.begin(), siblings.end(), SiblingOrder{})->sortOrder;
    }

    template<typename V>
    static Json::Value diff(const V& before, const V& after) {
        Json::Value json;
        json["before"] = before;
        json["after"] = after;
        return json;
    }

    static std::vector<CategoryView> project(std::vector<Category> categories,
                                             const std::unordered_map<std::string, int>& childCounts,
                                             const std::unordered_map<std::string, int>& itemCounts) {
        std::vector<CategoryView> views;
        views.reserve(categories.size());
        for (auto& category : categories) {
            CategoryView view;
            auto child = childCounts.find(category.id);
            auto item = itemCounts.find(category.id);
            view.childCount = child == childCounts.end() ? 0 : child->second;
            view.itemCount = item == itemCounts.end() ? 0 : item->second;
            view.category = std::move(category);
            views.push_back(std::move(view));
        }
        return views;
    }
};
