#include "api_server.hpp"
#include "auth_middleware.hpp"
#include "cors_middleware.hpp"
#include "logger_middleware.hpp"
#include "recovery_middleware.hpp"
#include "request_counter.hpp"

namespace switchyard {

ApiServer::ApiServer(ServerConfig config, RouteSetup setup)
    : config_(std::move(config))
{
    Router router;
    auto listing = std::make_shared<std::vector<RouteInfo>>();

    registerDefaults(router, config_, listing);
    if (setup) {
        setup(router);
    }

    // Filled before build; read-only afterwards
    *listing = router.routes();

    DiagnosticsOptions options;
    options.detailed = config_.detailed_errors;
    dispatcher_ = std::make_shared<const Dispatcher>(router.build(options));

    setupTransport();
    CROW_LOG_INFO << "ApiServer initialized with " << listing->size() << " routes";
}

void ApiServer::registerDefaults(Router& router, const ServerConfig& config,
                                 std::shared_ptr<std::vector<RouteInfo>> listing) {
    RequestCounter counter;

    router.use(RecoveryMiddleware());
    router.use(LoggerMiddleware());
    router.use(CorsMiddleware(config.effectiveCors()));
    router.use(counter.middleware());

    router.get("/health", [](Context& ctx) {
        crow::json::wvalue body;
        body["status"] = "ok";
        ctx.writeJSON(200, body);
    });

    router.get("/routes", [listing](Context& ctx) {
        std::vector<crow::json::wvalue> entries;
        for (const auto& route : *listing) {
            crow::json::wvalue entry;
            entry["method"] = route.method;
            entry["path"] = route.path;
            entries.push_back(std::move(entry));
        }
        crow::json::wvalue body;
        body["routes"] = std::move(entries);
        ctx.writeJSON(200, body);
    });

    if (!config.auth.enabled()) {
        CROW_LOG_INFO << "No auth configured, /api routes disabled";
        return;
    }

    std::shared_ptr<const TokenValidator> validator;
    if (!config.auth.jwt_secret.empty()) {
        validator = std::make_shared<JwtTokenValidator>(config.auth.jwt_secret, config.auth.jwt_issuer);
    } else {
        validator = std::make_shared<StaticTokenValidator>(config.auth.tokens);
    }

    auto& api = router.group("/api");
    api.use(AuthMiddleware(validator));
    api.get("/me", [](Context& ctx) {
        crow::json::wvalue body;
        body["user"] = "profile data";
        ctx.writeJSON(200, body);
    });
}

void PreflightBridge::setDispatcher(std::shared_ptr<const Dispatcher> dispatcher) {
    this->dispatcher = std::move(dispatcher);
}

void PreflightBridge::before_handle(crow::request& /*req*/, crow::response& /*res*/, context& /*ctx*/) {
}

void PreflightBridge::after_handle(crow::request& req, crow::response& res, context& /*ctx*/) {
    if (req.method != crow::HTTPMethod::Options || !dispatcher) {
        return;
    }

    // Drop Crow's automatic 204/404 and its Allow header
    res.code = 200;
    res.body.clear();
    res.headers.clear();
    dispatcher->handle(req, res);
}

void ApiServer::setupTransport() {
    auto dispatcher = dispatcher_;
    app_.get_middleware<PreflightBridge>().setDispatcher(dispatcher);

    CROW_CATCHALL_ROUTE(app_)
        ([dispatcher](const crow::request& req, crow::response& res) {
            dispatcher->handle(req, res);
            res.end();
        });
}

void ApiServer::run() {
    CROW_LOG_INFO << "Server starting on " << config_.bind_address << ":" << config_.port << "...";

    app_.bindaddr(config_.bind_address)
        .port(static_cast<uint16_t>(config_.port))
        .server_name("switchyard");

    if (config_.threads > 0) {
        app_.concurrency(static_cast<uint16_t>(config_.threads));
    } else {
        app_.multithreaded();
    }

    app_.run();
}

void ApiServer::stop() {
    app_.stop();
}

} // namespace switchyard
