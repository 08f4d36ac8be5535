#include <catch2/catch.hpp>

#include "common/utils/JwtUtils.hpp"
#include "common/domain/Principal.hpp"

namespace {

const std::string SECRET = "unit-test-secret-with-enough-length-0123456789";

TokenClaims sampleClaims() {
    TokenClaims claims;
    claims.userId = "user-1";
    claims.companyId = "company-1";
    claims.permissions = {"price_guide:read", "price_guide:update"};
    return claims;
}

int errorCode(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const AppException& e) {
        return e.getCode();
    }
    return ErrorCodes::SUCCESS;
}

}  // namespace

TEST_CASE("JWT issue and verify", "[jwt]") {
    JwtUtils jwt(SECRET, 3600);
    auto token = jwt.issue(sampleClaims());

    auto claims = jwt.verifyClaims(token);
    CHECK(claims.userId == "user-1");
    CHECK(claims.companyId == "company-1");
    CHECK(claims.permissions == std::vector<std::string>{"price_guide:read", "price_guide:update"});

    auto payload = jwt.verify(token);
    CHECK(payload["exp"].asInt64() - payload["iat"].asInt64() == 3600);
}

TEST_CASE("JWT rejects forged or stale tokens", "[jwt]") {
    JwtUtils jwt(SECRET, 3600);
    auto token = jwt.issue(sampleClaims());

    SECTION("tampered signature") {
        std::string forged = token;
        forged.back() = forged.back() == 'A' ? 'B' : 'A';
        CHECK(errorCode([&] { jwt.verify(forged); }) == ErrorCodes::UNAUTHORIZED);
    }

    SECTION("different secret") {
        JwtUtils other("another-secret-another-secret-another-secret", 3600);
        CHECK(errorCode([&] { other.verify(token); }) == ErrorCodes::UNAUTHORIZED);
    }

    SECTION("malformed") {
        CHECK(errorCode([&] { jwt.verify("not-a-token"); }) == ErrorCodes::UNAUTHORIZED);
        CHECK(errorCode([&] { jwt.verify(""); }) == ErrorCodes::UNAUTHORIZED);
    }

    SECTION("expired") {
        JwtUtils expired(SECRET, -60);
        auto old = expired.issue(sampleClaims());
        CHECK(errorCode([&] { jwt.verify(old); }) == ErrorCodes::TOKEN_EXPIRED);
    }
}

TEST_CASE("JWT claims require tenant and subject", "[jwt]") {
    JwtUtils jwt(SECRET, 3600);

    Json::Value noCompany;
    noCompany["sub"] = "user-1";
    auto token = jwt.sign(noCompany);
    CHECK(errorCode([&] { jwt.verifyClaims(token); }) == ErrorCodes::UNAUTHORIZED);

    Json::Value longSubject;
    longSubject["sub"] = std::string(Constants::USER_ID_MAX_LENGTH + 1, 'u');
    longSubject["companyId"] = "company-1";
    CHECK(errorCode([&] { jwt.verifyClaims(jwt.sign(longSubject)); }) == ErrorCodes::UNAUTHORIZED);

    longSubject["sub"] = std::string(Constants::USER_ID_MAX_LENGTH, 'u');
    CHECK(jwt.verifyClaims(jwt.sign(longSubject)).userId.size() == Constants::USER_ID_MAX_LENGTH);

    Json::Value noSubject;
    noSubject["companyId"] = "company-1";
    CHECK(errorCode([&] { jwt.verifyClaims(jwt.sign(noSubject)); }) == ErrorCodes::UNAUTHORIZED);
}

TEST_CASE("Principal permission wildcards", "[jwt][principal]") {
    auto reader = Principal::withPermissions("u", "c", {Constants::PERM_PRICE_GUIDE_READ});
    CHECK(reader.hasPermission(Constants::PERM_PRICE_GUIDE_READ));
    CHECK_FALSE(reader.hasPermission(Constants::PERM_PRICE_GUIDE_DELETE));

    auto resourceAdmin = Principal::withPermissions("u", "c", {"price_guide:*"});
    CHECK(resourceAdmin.hasPermission(Constants::PERM_PRICE_GUIDE_DELETE));
    CHECK_FALSE(resourceAdmin.hasPermission("office:update"));

    auto superuser = Principal::withPermissions("u", "c", {Constants::PERM_WILDCARD});
    CHECK(superuser.hasPermission("anything:at_all"));

    Principal anonymous;
    CHECK_FALSE(anonymous.hasPermission(Constants::PERM_PRICE_GUIDE_READ));
    CHECK_THROWS_AS(anonymous.require(Constants::PERM_PRICE_GUIDE_READ), ForbiddenException);
}
