#pragma once

#include <memory>
#include <string>
#include <vector>

#include "diagnostics.hpp"
#include "dispatcher.hpp"
#include "middleware_chain.hpp"
#include "route_table.hpp"

namespace switchyard {

class Router;

/**
 * Path-prefix scope with its own middleware. Group middleware runs after the
 * global middleware and is bound to a route when the route is registered, so
 * only middleware added before a registration applies to it.
 */
class RouteGroup {
public:
    RouteGroup(Router& router, std::string prefix);

    RouteGroup(const RouteGroup&) = delete;
    RouteGroup& operator=(const RouteGroup&) = delete;

    RouteGroup& use(Middleware middleware);
    RouteGroup& handle(const std::string& method, const std::string& suffix, Handler handler);

    RouteGroup& get(const std::string& suffix, Handler handler) { return handle("GET", suffix, std::move(handler)); }
    RouteGroup& post(const std::string& suffix, Handler handler) { return handle("POST", suffix, std::move(handler)); }
    RouteGroup& put(const std::string& suffix, Handler handler) { return handle("PUT", suffix, std::move(handler)); }
    RouteGroup& patch(const std::string& suffix, Handler handler) { return handle("PATCH", suffix, std::move(handler)); }
    RouteGroup& del(const std::string& suffix, Handler handler) { return handle("DELETE", suffix, std::move(handler)); }
    RouteGroup& options(const std::string& suffix, Handler handler) { return handle("OPTIONS", suffix, std::move(handler)); }

    const std::string& prefix() const { return prefix_; }

private:
    Router& router_;
    std::string prefix_;
    std::vector<Middleware> middleware_;
};

/**
 * Registration surface used during setup. build() hands the finished route
 * table to a Dispatcher and seals the router; registering afterwards throws.
 */
class Router {
public:
    Router();
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Global middleware, applied to every route in registration order
    Router& use(Middleware middleware);

    Router& handle(const std::string& method, const std::string& templatePath, Handler handler);

    Router& get(const std::string& path, Handler handler) { return handle("GET", path, std::move(handler)); }
    Router& post(const std::string& path, Handler handler) { return handle("POST", path, std::move(handler)); }
    Router& put(const std::string& path, Handler handler) { return handle("PUT", path, std::move(handler)); }
    Router& patch(const std::string& path, Handler handler) { return handle("PATCH", path, std::move(handler)); }
    Router& del(const std::string& path, Handler handler) { return handle("DELETE", path, std::move(handler)); }
    Router& options(const std::string& path, Handler handler) { return handle("OPTIONS", path, std::move(handler)); }

    RouteGroup& group(const std::string& prefix);

    // Route listing of the table being built
    std::vector<RouteInfo> routes() const;

    Dispatcher build(DiagnosticsOptions options = DiagnosticsOptions{});

    bool sealed() const { return !table_; }

private:
    friend class RouteGroup;

    void addRoute(const std::string& method, const std::string& templatePath, MiddlewareChain chain);
    void ensureOpen(const std::string& operation) const;

    std::unique_ptr<RouteTable> table_;
    std::vector<Middleware> middleware_;
    std::vector<std::unique_ptr<RouteGroup>> groups_;
};

} // namespace switchyard
