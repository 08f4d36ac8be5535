#include "TestHelper.hpp"

TEST_CASE("Offices are assigned idempotently to root categories", "[offices]") {
    PriceGuideFixture f;
    auto root = f.create("Windows");
    auto north = f.db->addOffice("company-1", "office-north");
    auto south = f.db->addOffice("company-1", "office-south");

    CHECK(sync(f.offices.assign(f.admin, root.id, {north})) == 1);
    CHECK(sync(f.offices.assign(f.admin, root.id, {north, south})) == 1);
    CHECK(sync(f.offices.assign(f.admin, root.id, {south, north})) == 0);
    CHECK(sync(f.offices.list(f.admin, root.id)) == std::vector<std::string>{north, south});
    CHECK(f.db->assignmentCount() == 2);

    // 没有新增时不发布事件
    auto types = f.events.types();
    CHECK(std::count(types.begin(), types.end(), "CategoryOfficesAssigned") == 2);
}

TEST_CASE("Duplicate office ids in one request count once", "[offices]") {
    PriceGuideFixture f;
    auto root = f.create("Windows");
    auto office = f.db->addOffice("company-1");
    CHECK(sync(f.offices.assign(f.admin, root.id, {office, office, office})) == 1);
}

TEST_CASE("Office assignment rejects invalid targets", "[offices]") {
    PriceGuideFixture f;
    auto root = f.create("Windows");
    auto child = f.create("Vinyl", root.id);
    auto office = f.db->addOffice("company-1");
    auto foreign = f.db->addOffice("company-2");

    SECTION("non-root category") {
        auto error = expectAppError(ErrorCodes::NOT_ROOT_CATEGORY,
                                    [&] { sync(f.offices.assign(f.admin, child.id, {office})); });
        CHECK(error.getDetails()["categoryId"].asString() == child.id);
        CHECK(error.getDetails()["depth"].asInt() == 1);
    }

    SECTION("offices outside the company") {
        auto error = expectAppError(ErrorCodes::NOT_FOUND,
                                    [&] { sync(f.offices.assign(f.admin, root.id, {office, foreign, "nowhere"})); });
        const auto& missing = error.getDetails()["missingOfficeIds"];
        REQUIRE(missing.size() == 2);
        CHECK(missing[0].asString() == foreign);
        CHECK(missing[1].asString() == "nowhere");
        CHECK(f.db->assignmentCount() == 0);
    }

    SECTION("missing category") {
        expectAppError(ErrorCodes::NOT_FOUND,
                       [&] { sync(f.offices.assign(f.admin, "00000000-0000-4000-8000-000000000000", {office})); });
    }

    SECTION("empty office list") {
        expectAppError(ErrorCodes::BAD_REQUEST, [&] { sync(f.offices.assign(f.admin, root.id, {})); });
    }

    SECTION("missing permission") {
        auto reader = Principal::withPermissions("user-reader", "company-1", {"price_guide:read"});
        expectAppError(ErrorCodes::FORBIDDEN, [&] { sync(f.offices.assign(reader, root.id, {office})); });
        CHECK(sync(f.offices.list(reader, root.id)).empty());
    }
}

TEST_CASE("Unassigning offices", "[offices]") {
    PriceGuideFixture f;
    auto root = f.create("Windows");
    auto office = f.db->addOffice("company-1");
    sync(f.offices.assign(f.admin, root.id, {office}));

    sync(f.offices.unassign(f.admin, root.id, office));
    CHECK(f.db->assignmentCount() == 0);
    CHECK(f.events.types().back() == "CategoryOfficeUnassigned");

    auto error = expectAppError(ErrorCodes::NOT_FOUND, [&] { sync(f.offices.unassign(f.admin, root.id, office)); });
    CHECK(error.getDetails()["officeId"].asString() == office);
}

TEST_CASE("Force delete drops office assignments of the subtree", "[offices][delete]") {
    PriceGuideFixture f;
    auto root = f.create("Windows");
    f.create("Vinyl", root.id);
    auto office = f.db->addOffice("company-1");
    sync(f.offices.assign(f.admin, root.id, {office}));

    sync(f.service.remove(f.admin, root.id, true));
    CHECK(f.db->assignmentCount() == 0);
}

TEST_CASE("Moving a root under a parent releases its offices", "[offices][move]") {
    PriceGuideFixture f;
    auto windows = f.create("Windows");
    auto doors = f.create("Doors");
    auto office = f.db->addOffice("company-1", "office-east");
    REQUIRE(sync(f.offices.assign(f.admin, windows.id, {office})) == 1);

    SECTION("staying at the root level keeps assignments") {
        f.moveTo(windows.id, std::nullopt);
        CHECK(sync(f.offices.list(f.admin, windows.id)) == std::vector<std::string>{office});
    }

    SECTION("demotion removes assignments in the same move") {
        f.events.clear();
        auto moved = f.moveTo(windows.id, doors.id);
        CHECK(moved.depth == 1);
        CHECK(sync(f.offices.list(f.admin, windows.id)).empty());
        CHECK(f.db->assignmentCount() == 0);

        auto payloads = f.events.payloads();
        REQUIRE(payloads.size() == 1);
        REQUIRE(payloads[0]["unassignedOfficeIds"].size() == 1);
        CHECK(payloads[0]["unassignedOfficeIds"][0].asString() == office);

        f.moveTo(windows.id, std::nullopt);
        CHECK(sync(f.offices.list(f.admin, windows.id)).empty());
        CHECK(sync(f.offices.assign(f.admin, windows.id, {office})) == 1);
    }
}
