#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include "recovery_middleware.hpp"
#include "router.hpp"
#include "test_utils.hpp"

namespace switchyard {
namespace test {

TEST_CASE("RecoveryMiddleware turns a fault into one 500 response", "[recovery]") {
    Router router;
    router.use(RecoveryMiddleware());
    router.get("/panic", [](Context&) {
        throw std::runtime_error("something went wrong");
    });
    router.get("/ok", [](Context& ctx) {
        ctx.writeText(200, "fine");
    });
    router.get("/odd", [](Context&) {
        throw 42;
    });
    router.get("/late", [](Context& ctx) {
        ctx.writeText(202, "accepted");
        throw std::runtime_error("after the response");
    });
    auto dispatcher = router.build();

    SECTION("Fault payload") {
        crow::response res;
        REQUIRE_NOTHROW(dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/panic"), res));

        REQUIRE(res.code == 500);
        auto body = parseBody(res);
        REQUIRE(std::string(body["error"].s()) == "Internal Server Error");
        REQUIRE(std::string(body["message"].s()) == "Internal server error");
        REQUIRE(std::string(body["details"]["panic_message"].s()) == "something went wrong");
        REQUIRE(body["details"].has("stack_trace"));
        REQUIRE(body["details"].has("note"));
        REQUIRE(body.has("trace"));
    }

    SECTION("Next request is served normally") {
        crow::response first;
        dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/panic"), first);
        REQUIRE(first.code == 500);

        crow::response second;
        dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/ok"), second);
        REQUIRE(second.code == 200);
        REQUIRE(second.body == "fine");
    }

    SECTION("Non-standard exceptions are caught") {
        crow::response res;
        REQUIRE_NOTHROW(dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/odd"), res));

        REQUIRE(res.code == 500);
        auto body = parseBody(res);
        REQUIRE(std::string(body["details"]["panic_message"].s()) == "unknown exception");
    }

    SECTION("Response written before the fault is kept") {
        crow::response res;
        REQUIRE_NOTHROW(dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/late"), res));

        REQUIRE(res.code == 202);
        REQUIRE(res.body == "accepted");
    }
}

TEST_CASE("RecoveryMiddleware compact payload", "[recovery]") {
    Router router;
    router.use(RecoveryMiddleware());
    router.get("/panic", [](Context&) {
        throw std::runtime_error("hidden");
    });

    DiagnosticsOptions options;
    options.detailed = false;
    auto dispatcher = router.build(options);

    crow::response res;
    dispatcher.handle(makeRequest(crow::HTTPMethod::Get, "/panic"), res);

    REQUIRE(res.code == 500);
    auto body = parseBody(res);
    REQUIRE_FALSE(body.has("details"));
    REQUIRE_FALSE(body.has("trace"));
    REQUIRE(res.body.find("hidden") == std::string::npos);
}

TEST_CASE("RecoveryMiddleware::captureStackTrace", "[recovery]") {
    auto trace = RecoveryMiddleware::captureStackTrace();
    REQUIRE_FALSE(trace.empty());
}

} // namespace test
} // namespace switchyard
