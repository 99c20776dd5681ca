#include <catch2/catch_test_macros.hpp>

#include "cors_middleware.hpp"
#include "router.hpp"
#include "test_utils.hpp"

namespace switchyard {
namespace test {

namespace {

Dispatcher corsDispatcher(const CorsConfig& config, bool& handler_ran) {
    Router router;
    router.use(CorsMiddleware(config));
    router.get("/data", [&handler_ran](Context& ctx) {
        handler_ran = true;
        ctx.writeText(200, "data");
    });
    router.options("/data", [&handler_ran](Context& ctx) {
        handler_ran = true;
        ctx.writeText(200, "options handler");
    });
    return router.build();
}

CorsConfig originsOnly(std::vector<std::string> origins) {
    CorsConfig config = CorsConfig::defaults();
    config.allowed_origins = std::move(origins);
    return config;
}

} // namespace

TEST_CASE("CorsMiddleware: explicit allow-list", "[cors]") {
    bool handler_ran = false;
    auto dispatcher = corsDispatcher(originsOnly({"https://a.com"}), handler_ran);

    SECTION("Listed origin is echoed") {
        crow::response res;
        dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/data", {{"Origin", "https://a.com"}}), res);

        REQUIRE(res.get_header_value("Access-Control-Allow-Origin") == "https://a.com");
        REQUIRE(res.get_header_value("Access-Control-Allow-Methods") == "GET, POST, PUT, DELETE, PATCH, OPTIONS");
        REQUIRE(res.get_header_value("Access-Control-Allow-Headers") == "Content-Type, Authorization");
        REQUIRE(res.get_header_value("Access-Control-Allow-Credentials") == "true");
        REQUIRE(res.body == "data");
        REQUIRE(handler_ran);
    }

    SECTION("Unlisted origin gets no allow-origin header") {
        crow::response res;
        dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/data", {{"Origin", "https://b.com"}}), res);

        REQUIRE(res.get_header_value("Access-Control-Allow-Origin").empty());
        REQUIRE(res.body == "data");
    }

    SECTION("Missing origin gets no allow-origin header") {
        crow::response res;
        dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/data"), res);

        REQUIRE(res.get_header_value("Access-Control-Allow-Origin").empty());
    }
}

TEST_CASE("CorsMiddleware: wildcard", "[cors]") {
    bool handler_ran = false;
    auto dispatcher = corsDispatcher(CorsConfig::defaults(), handler_ran);

    SECTION("Origin is echoed") {
        crow::response res;
        dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/data", {{"Origin", "https://c.com"}}), res);
        REQUIRE(res.get_header_value("Access-Control-Allow-Origin") == "https://c.com");
    }

    SECTION("No origin yields '*'") {
        crow::response res;
        dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/data"), res);
        REQUIRE(res.get_header_value("Access-Control-Allow-Origin") == "*");
    }
}

TEST_CASE("CorsMiddleware: preflight short-circuits", "[cors]") {
    bool handler_ran = false;
    auto dispatcher = corsDispatcher(originsOnly({"https://a.com"}), handler_ran);

    crow::response res;
    dispatcher.handle(makeRequest(crow::HTTPMethod::Options, "/data", {{"Origin", "https://a.com"}}), res);

    REQUIRE(res.code == 204);
    REQUIRE(res.body.empty());
    REQUIRE(res.get_header_value("Access-Control-Allow-Origin") == "https://a.com");
    REQUIRE_FALSE(handler_ran);
}

TEST_CASE("CorsMiddleware answers preflight for paths served under other methods", "[cors]") {
    Router router;
    router.use(CorsMiddleware(originsOnly({"https://a.com"})));
    router.get("/reports", [](Context& ctx) {
        ctx.writeText(200, "reports");
    });
    auto dispatcher = router.build();

    crow::response res;
    dispatcher.handle(makeRequest(crow::HTTPMethod::Options, "/reports", {{"Origin", "https://a.com"}}), res);

    REQUIRE(res.code == 204);
    REQUIRE(res.get_header_value("Access-Control-Allow-Origin") == "https://a.com");
    REQUIRE(res.get_header_value("Allow").empty());
}

TEST_CASE("CorsConfig::fromEnvironment", "[cors]") {
    SECTION("Defaults when nothing is set") {
        ScopedEnv origins("CORS_ALLOWED_ORIGINS", std::nullopt);
        ScopedEnv fallback("ALLOWED_ORIGINS", std::nullopt);
        ScopedEnv methods("CORS_ALLOWED_METHODS", std::nullopt);
        ScopedEnv headers("CORS_ALLOWED_HEADERS", std::nullopt);

        auto config = CorsConfig::fromEnvironment();
        REQUIRE(config.allowed_origins == std::vector<std::string>{"*"});
        REQUIRE(config.allowed_methods == std::vector<std::string>{"GET", "POST", "PUT", "DELETE", "PATCH", "OPTIONS"});
        REQUIRE(config.allowed_headers == std::vector<std::string>{"Content-Type", "Authorization"});
    }

    SECTION("Lists are trimmed and empty entries dropped") {
        ScopedEnv origins("CORS_ALLOWED_ORIGINS", std::string(" https://a.com, ,https://b.com ,"));
        ScopedEnv methods("CORS_ALLOWED_METHODS", std::string("get, post"));
        ScopedEnv headers("CORS_ALLOWED_HEADERS", std::string("X-Api-Key , Content-Type"));

        auto config = CorsConfig::fromEnvironment();
        REQUIRE(config.allowed_origins == std::vector<std::string>{"https://a.com", "https://b.com"});
        REQUIRE(config.allowed_methods == std::vector<std::string>{"GET", "POST"});
        REQUIRE(config.allowed_headers == std::vector<std::string>{"X-Api-Key", "Content-Type"});
    }

    SECTION("ALLOWED_ORIGINS is the fallback") {
        ScopedEnv origins("CORS_ALLOWED_ORIGINS", std::nullopt);
        ScopedEnv fallback("ALLOWED_ORIGINS", std::string("https://fallback.com"));

        auto config = CorsConfig::fromEnvironment();
        REQUIRE(config.allowed_origins == std::vector<std::string>{"https://fallback.com"});
    }

    SECTION("CORS_ALLOWED_ORIGINS takes precedence") {
        ScopedEnv origins("CORS_ALLOWED_ORIGINS", std::string("https://primary.com"));
        ScopedEnv fallback("ALLOWED_ORIGINS", std::string("https://fallback.com"));

        auto config = CorsConfig::fromEnvironment();
        REQUIRE(config.allowed_origins == std::vector<std::string>{"https://primary.com"});
    }
}

} // namespace test
} // namespace switchyard
