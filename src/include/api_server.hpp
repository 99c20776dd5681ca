#pragma once

#include <crow.h>
#include <functional>
#include <memory>

#include "dispatcher.hpp"
#include "router.hpp"
#include "server_config.hpp"

namespace switchyard {

using RouteSetup = std::function<void(Router&)>;

/**
 * Crow answers OPTIONS requests on its own and never reaches the catch-all
 * route. This middleware replaces that answer with the Dispatcher's, so
 * preflight requests go through the router's global middleware.
 */
class PreflightBridge {
public:
    struct context {};

    void setDispatcher(std::shared_ptr<const Dispatcher> dispatcher);

    void before_handle(crow::request& req, crow::response& res, context& ctx);
    void after_handle(crow::request& req, crow::response& res, context& ctx);

private:
    std::shared_ptr<const Dispatcher> dispatcher;
};

using SwitchyardApp = crow::App<PreflightBridge>;

/**
 * Hosts a Dispatcher on Crow. Every request reaching the Crow app goes
 * through a single catch-all route into the Dispatcher.
 *
 * Global middleware: recovery, logger, CORS, request counter. Service
 * routes: GET /health, GET /routes and, when auth is configured, GET /api/me.
 */
class ApiServer
{
public:
    explicit ApiServer(ServerConfig config, RouteSetup setup = RouteSetup());

    void run();
    void stop();

    const Dispatcher& dispatcher() const { return *dispatcher_; }

    // Registers global middleware and service routes on a router
    static void registerDefaults(Router& router, const ServerConfig& config,
                                 std::shared_ptr<std::vector<RouteInfo>> listing);

private:
    void setupTransport();

    ServerConfig config_;
    std::shared_ptr<const Dispatcher> dispatcher_;
    SwitchyardApp app_;
};

} // namespace switchyard
