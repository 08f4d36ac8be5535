#pragma once

#include "domain/CategoryErrors.hpp"
#include "domain/Events.hpp"
#include "store/CategoryStore.hpp"
#include "common/database/RetryPolicy.hpp"
#include "common/domain/EventBus.hpp"
#include "common/domain/Principal.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief 根分类的办公室可见性分配
 *
 * 只有根分类可以分配办公室；子分类继承根分类的可见性
 */
class OfficeAssignmentService {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    OfficeAssignmentService()
        : OfficeAssignmentService(CategoryStoreRegistry::instance().provider(), ConfigManager::getPriceGuideOptions()) {}

    OfficeAssignmentService(std::shared_ptr<CategoryStoreProvider> provider, PriceGuideOptions options)
        : provider_(std::move(provider)), options_(std::move(options)) {}

    /**
     * @brief 分配办公室（已存在的分配跳过）
     * @return 本次新建的分配数
     */
    Task<int> assign(const Principal& actor, const std::string& categoryId, std::vector<std::string> officeIds) {
        actor.require(Constants::PERM_PRICE_GUIDE_UPDATE);
        dedupe(officeIds);
        if (officeIds.empty()) {
            throw ValidationException("办公室列表不能为空");
        }
        if (officeIds.size() > static_cast<size_t>(Constants::ASSIGN_MAX_OFFICES)) {
            throw ValidationException("办公室列表不能超过" + std::to_string(Constants::ASSIGN_MAX_OFFICES) + "个");
        }

        auto store = co_await provider_->begin(actor.companyId);
        auto category = co_await store->findById(categoryId);
        if (!category) {
            throw CategoryError::NotFound(categoryId);
        }
        if (!category->isRoot()) {
            throw CategoryError::NotRootCategory(categoryId, category->depth);
        }

        auto found = co_await store->findOffices(officeIds);
        std::set<std::string> foundSet(found.begin(), found.end());
        std::vector<std::string> missing;
        for (const auto& id : officeIds) {
            if (!foundSet.count(id)) missing.push_back(id);
        }
        if (!missing.empty()) {
            throw CategoryError::OfficesNotFound(missing);
        }

        auto existing = co_await store->findOfficeAssignments(categoryId);
        std::set<std::string> assigned(existing.begin(), existing.end());
        std::vector<std::string> created;
        for (const auto& officeId : officeIds) {
            if (assigned.count(officeId)) continue;
            co_await store->insertOfficeAssignment(categoryId, officeId);
            created.push_back(officeId);
        }
        co_await store->commit();

        LOG_INFO << "Offices assigned to category " << categoryId << ": " << created.size()
                 << " new, " << (officeIds.size() - created.size()) << " existing, by " << actor.userId;
        int count = static_cast<int>(created.size());
        if (count > 0) {
            co_await EventBus::instance().publish(
                CategoryOfficesAssigned(actor.userId, actor.companyId, categoryId, std::move(created)));
        }
        co_return count;
    }

    /**
     * @brief 取消分配，分配不存在时返回 NotFound
     */
    Task<void> unassign(const Principal& actor, const std::string& categoryId, const std::string& officeId) {
        actor.require(Constants::PERM_PRICE_GUIDE_UPDATE);
        auto store = co_await provider_->begin(actor.companyId);
        if (!co_await store->findById(categoryId)) {
            throw CategoryError::NotFound(categoryId);
        }
        if (!co_await store->deleteOfficeAssignment(categoryId, officeId)) {
            throw CategoryError::AssignmentNotFound(categoryId, officeId);
        }
        co_await store->commit();

        LOG_INFO << "Office " << officeId << " unassigned from category " << categoryId << " by " << actor.userId;
        co_await EventBus::instance().publish(
            CategoryOfficeUnassigned(actor.userId, actor.companyId, categoryId, officeId));
    }

    /**
     * @brief 分类已分配的办公室 ID
     */
    Task<std::vector<std::string>> list(const Principal& actor, const std::string& categoryId) {
        actor.require(Constants::PERM_PRICE_GUIDE_READ);
        co_return co_await retryTransient<std::vector<std::string>>(options_.retryAttempts, "OfficeAssignmentService::list",
            [&]() -> Task<std::vector<std::string>> {
                auto store = co_await provider_->begin(actor.companyId);
                if (!co_await store->findById(categoryId)) {
                    throw CategoryError::NotFound(categoryId);
                }
                auto offices = co_await store->findOfficeAssignments(categoryId);
                co_await store->commit();
                std::sort(offices.begin(), offices.end());
                co_return offices;
            });
    }

private:
    std::shared_ptr<CategoryStoreProvider> provider_;
    PriceGuideOptions options_;

    /** 保序去重 */
    static void dedupe(std::vector<std::string>& ids) {
        std::set<std::string> seen;
        std::vector<std::string> unique;
        for (auto& id : ids) {
            if (seen.insert(id).second) unique.push_back(std::move(id));
        }
        ids = std::move(unique);
    }
};
