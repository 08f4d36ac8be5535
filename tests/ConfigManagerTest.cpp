#include <catch2/catch.hpp>

#include "common/utils/ConfigManager.hpp"

namespace {

Json::Value section(const std::string& key, const Json::Value& value) {
    Json::Value json(Json::objectValue);
    json[key] = value;
    return json;
}

}  // namespace

TEST_CASE("price_guide section defaults", "[config]") {
    PriceGuideOptions options;
    options.store = Constants::STORE_MEMORY;
    options.maxTreeDepth = 7;

    auto errors = ConfigManager::parsePriceGuide(Json::Value::null, options);
    CHECK(errors.empty());
    CHECK(options.store == Constants::STORE_POSTGRES);
    CHECK(options.maxTreeDepth == Constants::CATEGORY_MAX_DEPTH);
    CHECK(options.retryAttempts == Constants::STORE_RETRY_ATTEMPTS);
    CHECK_FALSE(options.useMemoryStore());

    CHECK(ConfigManager::parsePriceGuide(Json::Value(Json::objectValue), options).empty());
    CHECK(options.maxTreeDepth == Constants::CATEGORY_MAX_DEPTH);
}

TEST_CASE("price_guide section accepts valid values", "[config]") {
    Json::Value json(Json::objectValue);
    json["store"] = "memory";
    json["max_tree_depth"] = 12;
    json["retry_attempts"] = 0;

    PriceGuideOptions options;
    auto errors = ConfigManager::parsePriceGuide(json, options);
    CHECK(errors.empty());
    CHECK(options.useMemoryStore());
    CHECK(options.maxTreeDepth == 12);
    CHECK(options.retryAttempts == 0);
}

TEST_CASE("price_guide section rejects invalid values", "[config]") {
    PriceGuideOptions options;

    SECTION("unknown store") {
        CHECK(ConfigManager::parsePriceGuide(section("store", "redis"), options).size() == 1);
        CHECK(ConfigManager::parsePriceGuide(section("store", 1), options).size() == 1);
        CHECK(options.store == Constants::STORE_POSTGRES);
    }

    SECTION("depth out of range") {
        CHECK(ConfigManager::parsePriceGuide(section("max_tree_depth", 0), options).size() == 1);
        CHECK(ConfigManager::parsePriceGuide(
                  section("max_tree_depth", Constants::CATEGORY_MAX_DEPTH_LIMIT + 1), options).size() == 1);
        CHECK(ConfigManager::parsePriceGuide(section("max_tree_depth", "deep"), options).size() == 1);
        CHECK(options.maxTreeDepth == Constants::CATEGORY_MAX_DEPTH);
    }

    SECTION("retry attempts out of range") {
        CHECK(ConfigManager::parsePriceGuide(section("retry_attempts", -1), options).size() == 1);
        CHECK(ConfigManager::parsePriceGuide(section("retry_attempts", 11), options).size() == 1);
    }

    SECTION("errors accumulate") {
        Json::Value json(Json::objectValue);
        json["store"] = "sqlite";
        json["max_tree_depth"] = -3;
        json["retry_attempts"] = 99;
        CHECK(ConfigManager::parsePriceGuide(json, options).size() == 3);
    }

    SECTION("section must be an object") {
        CHECK(ConfigManager::parsePriceGuide(Json::Value("memory"), options).size() == 1);
    }
}
