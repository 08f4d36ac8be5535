#pragma once

#include "Events.hpp"
#include "common/domain/EventBus.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 分类审计事件处理器
 *
 * 事件在事务提交后发布，这里只写审计日志，失败不影响业务结果。
 */
class AuditEventHandlers {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    /**
     * @brief 注册所有审计处理器（应用启动时调用）
     */
    static void registerAll() {
        auto& bus = EventBus::instance();
        bus.subscribe<CategoryCreated>(audit<CategoryCreated>());
        bus.subscribe<CategoryUpdated>(audit<CategoryUpdated>());
        bus.subscribe<CategoryMoved>(audit<CategoryMoved>());
        bus.subscribe<CategoryDeleted>(audit<CategoryDeleted>());
        bus.subscribe<CategoriesReordered>(audit<CategoriesReordered>());
        bus.subscribe<CategoryOfficesAssigned>(audit<CategoryOfficesAssigned>());
        bus.subscribe<CategoryOfficeUnassigned>(audit<CategoryOfficeUnassigned>());
        LOG_INFO << "AuditEventHandlers: 7 handlers registered";
    }

    /**
     * @brief 审计记录（单行 JSON）
     */
    static std::string format(const DomainEvent& event) {
        Json::Value record;
        record["event"] = event.type;
        record["aggregateType"] = event.aggregateType;
        record["aggregateId"] = event.aggregateId;
        record["actorId"] = event.actorId;
        record["companyId"] = event.companyId;
        record["occurredAt"] = TimestampHelper::format(event.occurredAt);
        record["payload"] = event.payload();

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        return Json::writeString(writer, record);
    }

private:
    template<typename E>
    static std::function<Task<void>(const E&)> audit() {
        return [](const E& event) -> Task<void> {
            LOG_INFO << "AUDIT " << format(event);
            co_return;
        };
    }
};
