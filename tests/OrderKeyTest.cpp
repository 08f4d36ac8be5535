#include "TestHelper.hpp"

#include "modules/price-guide/domain/OrderKey.hpp"

using Key = std::optional<std::string>;

TEST_CASE("OrderKey::between generates keys at the open ends", "[orderkey]") {
    CHECK(OrderKey::between(std::nullopt, std::nullopt) == "a0");
    CHECK(OrderKey::between(Key("a0"), std::nullopt) == "a1");
    CHECK(OrderKey::between(Key("a1"), std::nullopt) == "a2");
    CHECK(OrderKey::between(std::nullopt, Key("a0")) == "Zz");
    CHECK(OrderKey::between(std::nullopt, Key("Zz")) == "Zy");
    CHECK(OrderKey::between(Key("az"), std::nullopt) == "b00");
}

TEST_CASE("OrderKey::between splits the fractional part", "[orderkey]") {
    CHECK(OrderKey::between(Key("a0"), Key("a1")) == "a0V");
    CHECK(OrderKey::between(Key("a1"), Key("a2")) == "a1V");
    CHECK(OrderKey::between(Key("a0V"), Key("a1")) == "a0l");
    CHECK(OrderKey::between(Key("a0"), Key("a0V")) == "a0G");
    CHECK(OrderKey::between(Key("Zz"), Key("a0")) == "ZzV");
    CHECK(OrderKey::between(Key("Zz"), Key("a1")) == "a0");
    CHECK(OrderKey::between(std::nullopt, Key("a0V")) == "a0");
}

TEST_CASE("OrderKey::between at the edges of the integer range", "[orderkey][edge]") {
    const std::string largest(27, 'z');
    CHECK(OrderKey::between(Key(std::string(26, 'z') + "y"), std::nullopt) == largest);
    CHECK(OrderKey::between(Key(largest), std::nullopt) == largest + "V");

    const std::string smallest = "A" + std::string(26, '0');
    CHECK(OrderKey::between(std::nullopt, Key(smallest + "1")) == smallest + "0V");

    // 最小整数本身不是合法键，前插结果带小数部分
    auto key = OrderKey::between(std::nullopt, Key("A" + std::string(25, '0') + "1"));
    CHECK(key == smallest + "V");
    CHECK(OrderKey::isValid(key));
}

TEST_CASE("OrderKey rejects invalid keys", "[orderkey][validation]") {
    CHECK_FALSE(OrderKey::isValid(""));
    CHECK_FALSE(OrderKey::isValid("0"));
    CHECK_FALSE(OrderKey::isValid("a"));
    CHECK_FALSE(OrderKey::isValid("a00"));
    CHECK_FALSE(OrderKey::isValid("a0-"));
    CHECK_FALSE(OrderKey::isValid("A" + std::string(26, '0')));
    CHECK_FALSE(OrderKey::isValid("a0" + std::string(60, 'V')));
    CHECK(OrderKey::isValid("a0"));
    CHECK(OrderKey::isValid("Zz"));
    CHECK(OrderKey::isValid("a0V"));

    auto error = expectAppError(ErrorCodes::BAD_REQUEST, [] { OrderKey::between(Key("a00"), std::nullopt); });
    CHECK(error.getDetails()["field"].asString() == "sortOrder");

    expectAppError(ErrorCodes::BAD_REQUEST, [] { OrderKey::between(Key("a1"), Key("a0")); });
    expectAppError(ErrorCodes::BAD_REQUEST, [] { OrderKey::between(Key("a1"), Key("a1")); });
    expectAppError(ErrorCodes::BAD_REQUEST, [] { OrderKey::between(std::nullopt, Key("0")); });
}

TEST_CASE("OrderKey survives repeated insertions between the same neighbours", "[orderkey][property]") {
    SECTION("always towards the lower bound") {
        std::string low = "a0", high = "a1";
        for (int i = 0; i < 50; ++i) {
            auto key = OrderKey::between(low, high);
            REQUIRE(OrderKey::compare(low, key) < 0);
            REQUIRE(OrderKey::compare(key, high) < 0);
            high = key;
        }
        CHECK(high.size() <= Constants::ORDER_KEY_MAX_LENGTH);
    }

    SECTION("always towards the upper bound") {
        std::string low = "a0", high = "a1";
        for (int i = 0; i < 50; ++i) {
            auto key = OrderKey::between(low, high);
            REQUIRE(OrderKey::compare(low, key) < 0);
            REQUIRE(OrderKey::compare(key, high) < 0);
            low = key;
        }
        CHECK(low.size() <= Constants::ORDER_KEY_MAX_LENGTH);
    }

    SECTION("alternating") {
        std::string low = "a0", high = "a1";
        for (int i = 0; i < 50; ++i) {
            auto key = OrderKey::between(low, high);
            REQUIRE(OrderKey::compare(low, key) < 0);
            REQUIRE(OrderKey::compare(key, high) < 0);
            REQUIRE(OrderKey::isValid(key));
            (i % 2 ? low : high) = key;
        }
    }
}

TEST_CASE("OrderKey::sequence appends strictly increasing keys", "[orderkey]") {
    auto keys = OrderKey::sequence(std::nullopt, 5);
    CHECK(keys == std::vector<std::string>{"a0", "a1", "a2", "a3", "a4"});

    auto more = OrderKey::sequence(Key("az"), 3);
    REQUIRE(more.size() == 3);
    CHECK(std::is_sorted(more.begin(), more.end()));
    CHECK(more.front() > "az");
}

TEST_CASE("OrderKey::compare is byte-wise", "[orderkey]") {
    CHECK(OrderKey::compare("Zz", "a0") == -1);
    CHECK(OrderKey::compare("a0", "a0") == 0);
    CHECK(OrderKey::compare("a0V", "a0") == 1);
    CHECK(OrderKey::compare("a1", "a0V") == 1);
}
