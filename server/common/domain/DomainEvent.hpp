#pragma once

/**
 * @brief 领域事件基类
 *
 * 领域事件代表领域中发生的重要业务事件，在事务提交后发布。
 * 用于解耦业务操作与副作用（审计日志等）。
 *
 * 具体事件定义在各模块的 domain/Events.hpp 中。
 */
struct DomainEvent {
    std::string type;                    // 事件类型标识
    std::string aggregateId;             // 聚合根 ID
    std::string aggregateType;           // 聚合根类型
    std::string actorId;                 // 操作人
    std::string companyId;               // 租户
    std::chrono::system_clock::time_point occurredAt;  // 发生时间

    DomainEvent() : occurredAt(std::chrono::system_clock::now()) {}

    DomainEvent(std::string eventType, std::string aggId, std::string aggType,
                std::string actor, std::string company)
        : type(std::move(eventType))
        , aggregateId(std::move(aggId))
        , aggregateType(std::move(aggType))
        , actorId(std::move(actor))
        , companyId(std::move(company))
        , occurredAt(std::chrono::system_clock::now()) {}

    virtual ~DomainEvent() = default;

    // 允许拷贝和移动（事件对象需要在订阅者间传递）
    DomainEvent(const DomainEvent&) = default;
    DomainEvent& operator=(const DomainEvent&) = default;
    DomainEvent(DomainEvent&&) = default;
    DomainEvent& operator=(DomainEvent&&) = default;

    /**
     * @brief 事件负载（审计输出用），子类补充自身字段
     */
    virtual Json::Value payload() const {
        return Json::Value(Json::objectValue);
    }
};
