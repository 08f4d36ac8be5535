#pragma once

#include "Category.Service.hpp"
#include "OfficeAssignment.Service.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ControllerUtils.hpp"
#include "common/utils/ValidatorHelper.hpp"

/**
 * @brief 价格指南分类控制器
 *
 * 固定路径（tree、reorder）必须在 {id} 路由之前注册
 */
class CategoryController : public drogon::HttpController<CategoryController> {
private:
    CategoryService service_;
    OfficeAssignmentService offices_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(CategoryController::list, "/api/price-guide/categories", Get, "AuthFilter");
    ADD_METHOD_TO(CategoryController::tree, "/api/price-guide/categories/tree", Get, "AuthFilter");
    ADD_METHOD_TO(CategoryController::reorder, "/api/price-guide/categories/reorder", Patch, "AuthFilter");
    ADD_METHOD_TO(CategoryController::create, "/api/price-guide/categories", Post, "AuthFilter");
    ADD_METHOD_TO(CategoryController::detail, "/api/price-guide/categories/{id}", Get, "AuthFilter");
    ADD_METHOD_TO(CategoryController::children, "/api/price-guide/categories/{id}/children", Get, "AuthFilter");
    ADD_METHOD_TO(CategoryController::breadcrumb, "/api/price-guide/categories/{id}/breadcrumb", Get, "AuthFilter");
    ADD_METHOD_TO(CategoryController::update, "/api/price-guide/categories/{id}", Patch, "AuthFilter");
    ADD_METHOD_TO(CategoryController::move, "/api/price-guide/categories/{id}/move", Patch, "AuthFilter");
    ADD_METHOD_TO(CategoryController::remove, "/api/price-guide/categories/{id}", Delete, "AuthFilter");
    ADD_METHOD_TO(CategoryController::listOffices, "/api/price-guide/categories/{id}/offices", Get, "AuthFilter");
    ADD_METHOD_TO(CategoryController::assignOffices, "/api/price-guide/categories/{id}/offices", Post, "AuthFilter");
    ADD_METHOD_TO(CategoryController::unassignOffice, "/api/price-guide/categories/{id}/offices/{officeId}", Delete, "AuthFilter");
    METHOD_LIST_END

    Task<HttpResponsePtr> list(HttpRequestPtr req) {
        CategoryFilter filter;
        filter.isActive = ValidatorHelper::getBoolParam(req, "isActive");
        filter.rootsOnly = ValidatorHelper::getBoolParam(req, "rootsOnly").value_or(false);
        const auto& parentId = req->getParameter("parentId");
        if (!parentId.empty()) {
            if (filter.rootsOnly) {
                throw ValidatorHelper::fieldError("parentId", "parentId 与 rootsOnly 不能同时使用");
            }
            filter.parentId = parentId;
        }

        auto views = co_await service_.list(ControllerUtils::getPrincipal(req), filter);
        co_return Response::ok(viewsToJson(views));
    }

    Task<HttpResponsePtr> tree(HttpRequestPtr req) {
        auto isActive = ValidatorHelper::getBoolParam(req, "isActive");
        auto forest = co_await service_.tree(ControllerUtils::getPrincipal(req), isActive);
        co_return Response::ok(forest.toJson());
    }

    Task<HttpResponsePtr> detail(HttpRequestPtr req, std::string id) {
        auto view = co_await service_.get(ControllerUtils::getPrincipal(req), id);
        co_return Response::ok(view.toJson());
    }

    Task<HttpResponsePtr> children(HttpRequestPtr req, std::string id) {
        auto views = co_await service_.children(ControllerUtils::getPrincipal(req), id);
        co_return Response::ok(viewsToJson(views));
    }

    Task<HttpResponsePtr> breadcrumb(HttpRequestPtr req, std::string id) {
        auto path = co_await service_.breadcrumb(ControllerUtils::getPrincipal(req), id);
        co_return Response::ok(breadcrumbToJson(path));
    }

    Task<HttpResponsePtr> create(HttpRequestPtr req) {
        auto input = CreateCategoryInput::fromJson(ControllerUtils::requireJson(req));
        auto category = co_await service_.create(ControllerUtils::getPrincipal(req), input);
        co_return Response::created(category.toJson());
    }

    Task<HttpResponsePtr> update(HttpRequestPtr req, std::string id) {
        auto input = UpdateCategoryInput::fromJson(ControllerUtils::requireJson(req));
        auto category = co_await service_.update(ControllerUtils::getPrincipal(req), id, input);
        co_return Response::updated(category.toJson());
    }

    Task<HttpResponsePtr> move(HttpRequestPtr req, std::string id) {
        auto input = MoveCategoryInput::fromJson(ControllerUtils::requireJson(req));
        auto category = co_await service_.move(ControllerUtils::getPrincipal(req), id, input);
        co_return Response::updated(category.toJson(), "移动成功");
    }

    Task<HttpResponsePtr> reorder(HttpRequestPtr req) {
        auto input = ReorderInput::fromJson(ControllerUtils::requireJson(req));
        auto result = co_await service_.reorder(ControllerUtils::getPrincipal(req), input);
        co_return Response::updated(result.toJson(), "排序成功");
    }

    Task<HttpResponsePtr> remove(HttpRequestPtr req, std::string id) {
        bool force = ValidatorHelper::getBoolParam(req, "force").value_or(false);
        auto result = co_await service_.remove(ControllerUtils::getPrincipal(req), id, force);
        co_return Response::deleted(result.toJson());
    }

    Task<HttpResponsePtr> listOffices(HttpRequestPtr req, std::string id) {
        auto officeIds = co_await offices_.list(ControllerUtils::getPrincipal(req), id);
        Json::Value data(Json::arrayValue);
        for (const auto& officeId : officeIds) data.append(officeId);
        co_return Response::ok(data);
    }

    Task<HttpResponsePtr> assignOffices(HttpRequestPtr req, std::string id) {
        auto officeIds = ValidatorHelper::requireStringArray(ControllerUtils::requireJson(req), "officeIds",
                                                             "办公室", Constants::ASSIGN_MAX_OFFICES);
        int count = co_await offices_.assign(ControllerUtils::getPrincipal(req), id, std::move(officeIds));
        Json::Value data;
        data["assignedCount"] = count;
        co_return Response::created(data, "分配成功");
    }

    Task<HttpResponsePtr> unassignOffice(HttpRequestPtr req, std::string id, std::string officeId) {
        co_await offices_.unassign(ControllerUtils::getPrincipal(req), id, officeId);
        co_return Response::deleted(Json::Value::null, "取消分配成功");
    }

private:
    static Json::Value viewsToJson(const std::vector<CategoryView>& views) {
        Json::Value items(Json::arrayValue);
        for (const auto& view : views) items.append(view.toJson());
        return items;
    }
};
