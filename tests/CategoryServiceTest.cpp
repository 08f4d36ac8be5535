#include "TestHelper.hpp"

#include "modules/price-guide/domain/AuditEventHandlers.hpp"

namespace {

const std::string UNKNOWN_ID = "00000000-0000-4000-8000-000000000000";

/**
 * @brief 校验整棵树：无环、深度一致、同级活跃名称唯一
 */
void verifyTreeInvariants(PriceGuideFixture& f) {
    auto views = sync(f.service.list(f.admin, CategoryFilter{}));
    std::map<std::string, Category> byId;
    for (const auto& view : views) byId[view.category.id] = view.category;

    std::set<std::tuple<std::string, std::string>> activeNames;
    for (const auto& [id, category] : byId) {
        if (category.parentId) {
            auto parent = byId.find(*category.parentId);
            REQUIRE(parent != byId.end());
            REQUIRE(category.depth == parent->second.depth + 1);
        } else {
            REQUIRE(category.depth == 0);
        }

        // 向上最多走 size 步必须到根
        std::optional<std::string> current = category.parentId;
        size_t steps = 0;
        while (current) {
            REQUIRE(*current != id);
            REQUIRE(++steps <= byId.size());
            current = byId.at(*current).parentId;
        }

        if (category.isActive) {
            auto key = std::make_tuple(category.parentId.value_or(""), category.name);
            REQUIRE(activeNames.insert(key).second);
        }
    }
}

}  // namespace

// ==================== Create ====================

TEST_CASE("Create places categories by depth and order", "[service][create]") {
    PriceGuideFixture f;

    auto windows = f.create("Windows");
    CHECK(windows.depth == 0);
    CHECK(windows.version == 1);
    CHECK(windows.isRoot());
    CHECK(windows.sortOrder == "a0");
    CHECK(windows.companyId == "company-1");
    CHECK(windows.lastModifiedBy == "user-admin");
    CHECK(StringUtils::isUuid(windows.id));

    auto doors = f.create("Doors");
    CHECK(doors.sortOrder == "a1");

    auto vinyl = f.create("Vinyl", windows.id);
    CHECK(vinyl.depth == 1);
    CHECK(vinyl.parentId == windows.id);
    CHECK(vinyl.sortOrder == "a0");

    auto doubleHung = f.create("Double-Hung", vinyl.id);
    CHECK(doubleHung.depth == 2);

    CHECK(f.childNames(std::nullopt) == std::vector<std::string>{"Windows", "Doors"});
    CHECK(f.events.types() == std::vector<std::string>(4, "CategoryCreated"));
}

TEST_CASE("Create honours categoryType only on roots", "[service][create]") {
    PriceGuideFixture f;
    auto root = f.create("Siding", std::nullopt, CategoryType::Detail);
    CHECK(root.categoryType == CategoryType::Detail);

    auto child = f.create("Vinyl", root.id, CategoryType::DeepDrillDown);
    CHECK(child.categoryType == CategoryType::Default);
}

TEST_CASE("Create rejects invalid parents and duplicates", "[service][create]") {
    PriceGuideFixture f;
    auto windows = f.create("Windows");
    f.create("Vinyl", windows.id);

    SECTION("unknown parent") {
        auto error = expectAppError(ErrorCodes::PARENT_NOT_FOUND, [&] { f.create("X", UNKNOWN_ID); });
        CHECK(error.getDetails()["parentId"].asString() == UNKNOWN_ID);
    }

    SECTION("parent in another company") {
        auto other = Principal::withPermissions("user-2", "company-2", {"*"});
        CreateCategoryInput input;
        input.name = "X";
        input.parentId = windows.id;
        expectAppError(ErrorCodes::PARENT_NOT_FOUND, [&] { sync(f.service.create(other, input)); });
    }

    SECTION("duplicate active sibling") {
        auto error = expectAppError(ErrorCodes::DUPLICATE_NAME, [&] { f.create("Vinyl", windows.id); });
        CHECK(error.getStatus() == drogon::k409Conflict);
        CHECK(error.getDetails()["name"].asString() == "Vinyl");
        CHECK(error.getDetails()["parentId"].asString() == windows.id);
        CHECK(f.childNames(windows.id) == std::vector<std::string>{"Vinyl"});
    }

    SECTION("names are case-sensitive and scoped by parent") {
        CHECK_NOTHROW(f.create("vinyl", windows.id));
        CHECK_NOTHROW(f.create("Vinyl"));
    }

    SECTION("inactive siblings do not collide") {
        CHECK_NOTHROW(f.createInactive("Vinyl", windows.id));
        auto error = catchAppError([&] { f.createInactive("Vinyl", windows.id); });
        CHECK_FALSE(error.has_value());
    }
}

TEST_CASE("Create enforces the configured depth limit", "[service][create][edge]") {
    PriceGuideFixture f;
    PriceGuideOptions options;
    options.maxTreeDepth = 2;
    CategoryService service(f.provider, options);

    CreateCategoryInput input;
    input.name = "L0";
    auto l0 = sync(service.create(f.admin, input));
    input.name = "L1";
    input.parentId = l0.id;
    auto l1 = sync(service.create(f.admin, input));
    input.name = "L2";
    input.parentId = l1.id;
    auto l2 = sync(service.create(f.admin, input));
    CHECK(l2.depth == 2);

    input.name = "L3";
    input.parentId = l2.id;
    auto error = expectAppError(ErrorCodes::BAD_REQUEST, [&] { sync(service.create(f.admin, input)); });
    CHECK(error.getDetails()["field"].asString() == "parentId");
}

TEST_CASE("Move enforces the depth limit on the whole subtree", "[service][move][edge]") {
    PriceGuideFixture f;
    PriceGuideOptions options;
    options.maxTreeDepth = 3;
    CategoryService service(f.provider, options);

    auto e = f.create("E");
    auto g = f.create("G", f.create("F", e.id).id);
    auto a = f.create("A");
    auto b = f.create("B", a.id);
    auto c = f.create("C", b.id);
    auto d = f.create("D", c.id);
    REQUIRE(d.depth == 3);

    auto moveUnder = [&](const Category& category, const std::string& parentId) {
        MoveCategoryInput input;
        input.newParentId = parentId;
        return sync(service.move(f.admin, category.id, input));
    };

    auto error = expectAppError(ErrorCodes::BAD_REQUEST, [&] { moveUnder(a, g.id); });
    CHECK(error.getDetails()["field"].asString() == "newParentId");
    expectAppError(ErrorCodes::BAD_REQUEST, [&] { moveUnder(c, g.id); });

    CHECK_FALSE(f.fetch(a.id).parentId.has_value());
    CHECK(f.fetch(a.id).depth == 0);
    CHECK(f.fetch(b.id).depth == 1);
    CHECK(f.fetch(c.id).depth == 2);
    CHECK(f.fetch(d.id).depth == 3);
    CHECK(f.fetch(a.id).version == a.version);

    // 子树最深处恰好到达上限时允许
    auto moved = moveUnder(c, e.id);
    CHECK(moved.depth == 1);
    CHECK(f.fetch(d.id).depth == 2);
    CHECK(moveUnder(d, g.id).depth == 3);

    auto crumbs = sync(service.breadcrumb(f.admin, d.id));
    REQUIRE(crumbs.size() == 4);
    CHECK(crumbs.front().id == e.id);
    CHECK(crumbs.back().id == d.id);
}

// ==================== Update ====================

TEST_CASE("Update checks the expected version", "[service][update]") {
    PriceGuideFixture f;
    auto windows = f.create("Windows");

    auto renamed = f.rename(windows, "Windows & Doors");
    CHECK(renamed.version == 2);
    CHECK(renamed.name == "Windows & Doors");

    auto error = expectAppError(ErrorCodes::CONCURRENT_MODIFICATION, [&] { f.rename(windows, "Stale"); });
    CHECK(error.getStatus() == drogon::k409Conflict);
    CHECK(error.getDetails()["currentVersion"].asInt() == 2);
    CHECK(error.getDetails()["lastModifiedBy"].asString() == "user-admin");
    CHECK(f.fetch(windows.id).name == "Windows & Doors");
}

TEST_CASE("Update rejects sibling name collisions", "[service][update]") {
    PriceGuideFixture f;
    auto windows = f.create("Windows");
    auto vinyl = f.create("Vinyl", windows.id);
    auto wood = f.create("Wood", windows.id);

    expectAppError(ErrorCodes::DUPLICATE_NAME, [&] { f.rename(wood, "Vinyl"); });

    SECTION("renaming to the current name is allowed") {
        CHECK_NOTHROW(f.rename(vinyl, "Vinyl"));
    }

    SECTION("re-activating into a collision is rejected") {
        auto hidden = f.createInactive("Vinyl", windows.id);
        UpdateCategoryInput input;
        input.expectedVersion = hidden.version;
        input.isActive = true;
        expectAppError(ErrorCodes::DUPLICATE_NAME, [&] { sync(f.service.update(f.admin, hidden.id, input)); });

        f.rename(vinyl, "Vinyl (old)");
        auto activated = sync(f.service.update(f.admin, hidden.id, input));
        CHECK(activated.isActive);
    }
}

TEST_CASE("Update ignores categoryType on non-root categories", "[service][update]") {
    PriceGuideFixture f;
    auto root = f.create("Roofing");
    auto child = f.create("Shingles", root.id);

    UpdateCategoryInput input;
    input.expectedVersion = child.version;
    input.categoryType = CategoryType::Detail;
    auto updated = sync(f.service.update(f.admin, child.id, input));
    CHECK(updated.categoryType == CategoryType::Default);
    CHECK(updated.version == child.version + 1);

    input.expectedVersion = root.version;
    auto updatedRoot = sync(f.service.update(f.admin, root.id, input));
    CHECK(updatedRoot.categoryType == CategoryType::Detail);

    auto payload = f.events.payloads().back();
    CHECK(payload["changes"]["categoryType"]["before"].asString() == "default");
    CHECK(payload["changes"]["categoryType"]["after"].asString() == "detail");
}

TEST_CASE("Update of a missing category", "[service][update]") {
    PriceGuideFixture f;
    UpdateCategoryInput input;
    input.expectedVersion = 1;
    input.name = "X";
    auto error = expectAppError(ErrorCodes::NOT_FOUND, [&] { sync(f.service.update(f.admin, UNKNOWN_ID, input)); });
    CHECK(error.getDetails()["ids"][0].asString() == UNKNOWN_ID);
}

// ==================== Move ====================

TEST_CASE("Move rejects structural violations", "[service][move]") {
    PriceGuideFixture f;
    auto windows = f.create("Windows");
    auto vinyl = f.create("Vinyl", windows.id);
    auto doubleHung = f.create("Double-Hung", vinyl.id);
    auto doors = f.create("Doors");
    f.create("Vinyl", doors.id);

    expectAppError(ErrorCodes::SELF_PARENT, [&] { f.moveTo(vinyl.id, vinyl.id); });
    expectAppError(ErrorCodes::CIRCULAR_REFERENCE, [&] { f.moveTo(windows.id, doubleHung.id); });
    expectAppError(ErrorCodes::CIRCULAR_REFERENCE, [&] { f.moveTo(vinyl.id, doubleHung.id); });
    expectAppError(ErrorCodes::PARENT_NOT_FOUND, [&] { f.moveTo(vinyl.id, UNKNOWN_ID); });
    expectAppError(ErrorCodes::DUPLICATE_NAME, [&] { f.moveTo(vinyl.id, doors.id); });
    expectAppError(ErrorCodes::NOT_FOUND, [&] { f.moveTo(UNKNOWN_ID, doors.id); });
    expectAppError(ErrorCodes::BAD_REQUEST, [&] { f.moveTo(vinyl.id, std::nullopt, std::string("a00")); });

    CHECK(f.fetch(vinyl.id).parentId == windows.id);
    CHECK(f.fetch(windows.id).version == 1);
    CHECK(f.events.types().size() == 5);
}

TEST_CASE("Move cascades depths to every descendant", "[service][move]") {
    PriceGuideFixture f;
    auto a = f.create("A");
    auto b = f.create("B", a.id);
    auto c = f.create("C", b.id);
    auto d = f.create("D", c.id);
    auto other = f.create("Other");
    auto deep = f.create("Deep", other.id);

    auto moved = f.moveTo(b.id, deep.id);
    CHECK(moved.depth == 2);
    CHECK(moved.version == b.version + 1);
    CHECK(f.fetch(c.id).depth == 3);
    CHECK(f.fetch(d.id).depth == 4);
    CHECK(f.fetch(c.id).version == c.version);
    verifyTreeInvariants(f);

    auto payload = f.events.payloads().back();
    CHECK(payload["descendantsUpdated"].asInt() == 2);
    CHECK(payload["before"]["parentId"].asString() == a.id);
    CHECK(payload["after"]["depth"].asInt() == 2);

    auto promoted = f.moveTo(c.id, std::nullopt);
    CHECK(promoted.depth == 0);
    CHECK(promoted.isRoot());
    CHECK(f.fetch(d.id).depth == 1);
    verifyTreeInvariants(f);
}

TEST_CASE("Move places the category among its new siblings", "[service][move]") {
    PriceGuideFixture f;
    auto root = f.create("Root");
    auto first = f.create("First", root.id);
    auto second = f.create("Second", root.id);
    auto loose = f.create("Loose");

    SECTION("appended last by default") {
        auto moved = f.moveTo(loose.id, root.id);
        CHECK(OrderKey::compare(second.sortOrder, moved.sortOrder) < 0);
        CHECK(f.childNames(root.id) == std::vector<std::string>{"First", "Second", "Loose"});
    }

    SECTION("explicit key between neighbours") {
        auto key = OrderKey::between(first.sortOrder, second.sortOrder);
        auto moved = f.moveTo(loose.id, root.id, key);
        CHECK(moved.sortOrder == key);
        CHECK(f.childNames(root.id) == std::vector<std::string>{"First", "Loose", "Second"});
    }

    SECTION("reordering within the same parent") {
        auto moved = f.moveTo(first.id, root.id);
        CHECK(moved.depth == 1);
        CHECK(f.childNames(root.id) == std::vector<std::string>{"Second", "First"});
    }
}

TEST_CASE("Move demotes a root's categoryType", "[service][move]") {
    PriceGuideFixture f;
    auto detail = f.create("Detail Root", std::nullopt, CategoryType::Detail);
    auto target = f.create("Target");
    auto moved = f.moveTo(detail.id, target.id);
    CHECK(moved.categoryType == CategoryType::Default);
}

TEST_CASE("Move with a stale version", "[service][move]") {
    PriceGuideFixture f;
    auto a = f.create("A");
    auto b = f.create("B");
    f.rename(a, "A2");

    MoveCategoryInput input;
    input.newParentId = b.id;
    input.expectedVersion = a.version;
    auto error = expectAppError(ErrorCodes::CONCURRENT_MODIFICATION, [&] { sync(f.service.move(f.admin, a.id, input)); });
    CHECK(error.getDetails()["currentVersion"].asInt() == 2);
}

// ==================== Reorder ====================

TEST_CASE("Reorder applies keys and skips missing ids", "[service][reorder]") {
    PriceGuideFixture f;
    auto root = f.create("Root");
    auto x = f.create("X", root.id);
    auto y = f.create("Y", root.id);
    auto z = f.create("Z", root.id);

    ReorderInput input;
    input.items = {{z.id, "a0"}, {UNKNOWN_ID, "a1"}, {y.id, "a1"}, {x.id, "a2"}};
    auto result = sync(f.service.reorder(f.admin, input));
    CHECK(result.updatedCount == 3);
    CHECK(result.skippedIds == std::vector<std::string>{UNKNOWN_ID});
    auto order = f.childNames(root.id);
    CHECK(order == std::vector<std::string>{"Z", "Y", "X"});
    CHECK(f.fetch(z.id).version == 2);

    // 同一批次重复执行，顺序不变
    auto again = sync(f.service.reorder(f.admin, input));
    CHECK(again.updatedCount == 3);
    CHECK(f.childNames(root.id) == order);

    CHECK(f.events.types().back() == "CategoriesReordered");
    CHECK(f.events.payloads().back()["skippedIds"][0].asString() == UNKNOWN_ID);
}

TEST_CASE("Reorder keeps the last key for repeated ids", "[service][reorder]") {
    PriceGuideFixture f;
    auto a = f.create("A");
    f.create("B");

    ReorderInput input;
    input.items = {{a.id, "a5"}, {a.id, "b00"}};
    auto result = sync(f.service.reorder(f.admin, input));
    CHECK(result.updatedCount == 1);
    CHECK(f.fetch(a.id).sortOrder == "b00");
    CHECK(f.childNames(std::nullopt) == std::vector<std::string>{"B", "A"});
}

TEST_CASE("Reorder validates keys before touching the store", "[service][reorder]") {
    PriceGuideFixture f;
    auto a = f.create("A");
    ReorderInput input;
    input.items = {{a.id, "a1"}, {a.id, "bad key"}};
    auto error = expectAppError(ErrorCodes::BAD_REQUEST, [&] { sync(f.service.reorder(f.admin, input)); });
    CHECK(error.getDetails()["field"].asString() == "items[1].sortOrder");
    CHECK(f.fetch(a.id).sortOrder == "a0");
}

// ==================== Delete ====================

TEST_CASE("Delete without dependents", "[service][delete]") {
    PriceGuideFixture f;
    auto leaf = f.create("Leaf");
    auto result = sync(f.service.remove(f.admin, leaf.id, false));
    CHECK(result.deletedChildren == 0);
    CHECK(result.deletedItems == 0);
    CHECK(f.db->categoryCount() == 0);
    expectAppError(ErrorCodes::NOT_FOUND, [&] { f.fetch(leaf.id); });
    expectAppError(ErrorCodes::NOT_FOUND, [&] { sync(f.service.remove(f.admin, leaf.id, true)); });
}

TEST_CASE("Delete with dependents requires force", "[service][delete]") {
    PriceGuideFixture f;
    auto root = f.create("Root");
    auto child = f.create("Child", root.id);
    auto grandchild = f.create("Grandchild", child.id);
    f.create("Sibling");
    f.addItems(root.id, 1);
    f.addItems(grandchild.id, 2);

    auto error = expectAppError(ErrorCodes::HAS_DEPENDENTS, [&] { sync(f.service.remove(f.admin, root.id, false)); });
    CHECK(error.getStatus() == drogon::k409Conflict);
    CHECK(error.getDetails()["childCount"].asInt() == 1);
    CHECK(error.getDetails()["itemCount"].asInt() == 1);
    CHECK(f.db->categoryCount() == 4);
    CHECK(f.db->itemCount() == 3);

    auto result = sync(f.service.remove(f.admin, root.id, true));
    CHECK(result.deletedChildren == 2);
    CHECK(result.deletedItems == 3);
    CHECK(f.db->categoryCount() == 1);
    CHECK(f.db->itemCount() == 0);

    auto payload = f.events.payloads().back();
    CHECK(payload["force"].asBool());
    CHECK(payload["deletedCategories"].asInt() == 3);
}

// ==================== Queries ====================

TEST_CASE("Breadcrumb walks from the root", "[service][breadcrumb]") {
    PriceGuideFixture f;
    auto a = f.create("A");
    auto b = f.create("B", a.id);
    auto c = f.create("C", b.id);

    auto path = sync(f.service.breadcrumb(f.admin, c.id));
    REQUIRE(path.size() == 3);
    CHECK(path[0].name == "A");
    CHECK(path[1].id == b.id);
    CHECK(path[2].name == "C");

    auto rootPath = sync(f.service.breadcrumb(f.admin, a.id));
    REQUIRE(rootPath.size() == 1);
    CHECK(breadcrumbToJson(rootPath)[0]["name"].asString() == "A");

    expectAppError(ErrorCodes::NOT_FOUND, [&] { sync(f.service.breadcrumb(f.admin, UNKNOWN_ID)); });
}

TEST_CASE("Breadcrumb reports corrupt ancestry", "[service][breadcrumb][edge]") {
    PriceGuideFixture f;
    Category p;
    p.id = "11111111-1111-4111-8111-111111111111";
    p.companyId = "company-1";
    p.name = "P";
    p.sortOrder = "a0";
    Category q = p;
    q.id = "22222222-2222-4222-8222-222222222222";
    q.name = "Q";
    p.parentId = q.id;
    q.parentId = p.id;
    f.db->putCategory(p);
    f.db->putCategory(q);

    auto error = expectAppError(ErrorCodes::DATA_INTEGRITY, [&] { sync(f.service.breadcrumb(f.admin, p.id)); });
    CHECK(error.getStatus() == drogon::k500InternalServerError);

    Category orphan = p;
    orphan.id = "33333333-3333-4333-8333-333333333333";
    orphan.parentId = UNKNOWN_ID;
    f.db->putCategory(orphan);
    expectAppError(ErrorCodes::DATA_INTEGRITY, [&] { sync(f.service.breadcrumb(f.admin, orphan.id)); });
}

TEST_CASE("Tree filters by isActive and promotes orphans", "[service][tree]") {
    PriceGuideFixture f;
    auto root = f.create("Root");
    auto hidden = f.createInactive("Hidden", root.id);
    auto visible = f.create("Visible", hidden.id);
    f.addItems(visible.id, 4);
    f.addItems(root.id, 1);

    auto all = sync(f.service.tree(f.admin));
    REQUIRE(all.roots().size() == 1);
    CHECK(all.find(root.id)->itemCount == 5);

    auto active = sync(f.service.tree(f.admin, true));
    REQUIRE(active.roots().size() == 2);
    CHECK(active.find(hidden.id) == nullptr);
    CHECK(active.find(root.id)->itemCount == 1);
    CHECK(active.find(visible.id)->itemCount == 4);

    auto inactive = sync(f.service.tree(f.admin, false));
    REQUIRE(inactive.size() == 1);
    CHECK(inactive.node(inactive.roots().front()).category.id == hidden.id);
}

TEST_CASE("Get, List and Children project counts", "[service][query]") {
    PriceGuideFixture f;
    auto root = f.create("Root");
    f.create("A", root.id);
    auto b = f.create("B", root.id);
    f.createInactive("C", root.id);
    f.addItems(root.id, 2);
    f.addItems(b.id, 7);

    auto view = sync(f.service.get(f.admin, root.id));
    CHECK(view.childCount == 3);
    CHECK(view.itemCount == 2);
    CHECK(view.toJson()["childCount"].asInt() == 3);

    auto children = sync(f.service.children(f.admin, root.id));
    REQUIRE(children.size() == 3);
    CHECK(children[1].category.name == "B");
    CHECK(children[1].itemCount == 7);

    CategoryFilter activeOnly;
    activeOnly.isActive = true;
    CHECK(sync(f.service.list(f.admin, activeOnly)).size() == 3);

    CategoryFilter roots;
    roots.rootsOnly = true;
    auto rootViews = sync(f.service.list(f.admin, roots));
    REQUIRE(rootViews.size() == 1);
    CHECK(rootViews[0].childCount == 3);

    expectAppError(ErrorCodes::NOT_FOUND, [&] { sync(f.service.children(f.admin, UNKNOWN_ID)); });
}

// ==================== Access ====================

TEST_CASE("Operations require price guide permissions", "[service][auth]") {
    PriceGuideFixture f;
    auto root = f.create("Root");
    auto reader = Principal::withPermissions("user-reader", "company-1", {"price_guide:read"});
    auto editor = Principal::withPermissions("user-editor", "company-1", {"price_guide:*"});

    CHECK(sync(f.service.get(reader, root.id)).category.name == "Root");

    CreateCategoryInput input;
    input.name = "Nope";
    auto error = expectAppError(ErrorCodes::FORBIDDEN, [&] { sync(f.service.create(reader, input)); });
    CHECK(error.getStatus() == drogon::k403Forbidden);
    expectAppError(ErrorCodes::FORBIDDEN, [&] { sync(f.service.remove(reader, root.id, true)); });

    CHECK_NOTHROW(sync(f.service.create(editor, input)));
}

TEST_CASE("Companies never see each other's categories", "[service][tenant]") {
    PriceGuideFixture f;
    auto root = f.create("Root");
    auto other = Principal::withPermissions("user-2", "company-2", {"*"});

    expectAppError(ErrorCodes::NOT_FOUND, [&] { sync(f.service.get(other, root.id)); });
    CHECK(sync(f.service.tree(other)).size() == 0);

    CreateCategoryInput input;
    input.name = "Root";
    auto mine = sync(f.service.create(other, input));
    CHECK(mine.sortOrder == "a0");
    CHECK(mine.companyId == "company-2");
}

// ==================== Retry ====================

TEST_CASE("Reads retry transient store failures", "[service][retry]") {
    PriceGuideFixture f;
    auto root = f.create("Root");

    f.db->injectTransientFailures(f.options.retryAttempts);
    CHECK(sync(f.service.get(f.admin, root.id)).category.id == root.id);

    f.db->injectTransientFailures(f.options.retryAttempts + 1);
    auto error = expectAppError(ErrorCodes::STORE_UNAVAILABLE, [&] { sync(f.service.tree(f.admin)); });
    CHECK(error.getStatus() == drogon::k503ServiceUnavailable);

    f.db->injectTransientFailures(1);
    ReorderInput input;
    input.items = {{root.id, "a5"}};
    CHECK(sync(f.service.reorder(f.admin, input)).updatedCount == 1);
}

TEST_CASE("Writes are not retried", "[service][retry]") {
    PriceGuideFixture f;
    f.db->injectTransientFailures(1);
    expectAppError(ErrorCodes::STORE_UNAVAILABLE, [&] { f.create("Root"); });
    CHECK(f.db->categoryCount() == 0);
    CHECK(f.events.types().empty());

    CHECK_NOTHROW(f.create("Root"));
}

// ==================== Properties ====================

TEST_CASE("Random create and move sequences keep the tree valid", "[service][property]") {
    PriceGuideFixture f;
    std::mt19937 rng(20240611);
    std::vector<std::string> ids;
    const std::vector<std::string> names{"Alpha", "Beta", "Gamma", "Delta"};

    for (int step = 0; step < 300; ++step) {
        bool doMove = ids.size() > 3 && rng() % 2 == 0;
        auto pick = [&]() { return ids[rng() % ids.size()]; };

        auto error = catchAppError([&] {
            if (doMove) {
                std::optional<std::string> parent;
                if (rng() % 5 != 0) parent = pick();
                f.moveTo(pick(), parent);
            } else {
                std::optional<std::string> parent;
                if (!ids.empty() && rng() % 4 != 0) parent = pick();
                ids.push_back(f.create(names[rng() % names.size()], parent).id);
            }
        });
        if (error) {
            int code = error->getCode();
            REQUIRE((code == ErrorCodes::DUPLICATE_NAME || code == ErrorCodes::CIRCULAR_REFERENCE ||
                     code == ErrorCodes::SELF_PARENT));
        }
        verifyTreeInvariants(f);
    }
    CHECK(ids.size() > 20);
}

// ==================== Events ====================

TEST_CASE("Audit records carry actor and payload", "[service][events]") {
    PriceGuideFixture f;
    auto root = f.create("Root");
    CategoryCreated event("user-admin", root);

    Json::Value record;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream in(AuditEventHandlers::format(event));
    REQUIRE(Json::parseFromStream(builder, in, &record, &errors));
    CHECK(record["event"].asString() == "CategoryCreated");
    CHECK(record["actorId"].asString() == "user-admin");
    CHECK(record["companyId"].asString() == "company-1");
    CHECK(record["aggregateId"].asString() == root.id);
    CHECK(record["payload"]["after"]["name"].asString() == "Root");
    CHECK(record["occurredAt"].asString().back() == 'Z');
}
