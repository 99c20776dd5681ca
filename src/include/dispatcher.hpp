#pragma once

#include <crow/http_request.h>
#include <crow/http_response.h>
#include <memory>
#include <vector>

#include "diagnostics.hpp"
#include "middleware_chain.hpp"
#include "route_table.hpp"

namespace switchyard {

/**
 * Entry point invoked by the transport for every request.
 *
 * Resolves the route, runs its middleware chain on a fresh Context and turns
 * routing misses into 404 / 405 diagnostics. Faults raised by handlers are
 * not caught here; the recovery middleware is the only fault boundary.
 *
 * Misses skip the global middleware, except an OPTIONS request to a path
 * served under other methods: that one runs the global middleware in front
 * of the 405 so a CORS middleware can answer the preflight.
 */
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<const RouteTable> routes, DiagnosticsEngine diagnostics,
               std::vector<Middleware> preflight = {});

    void handle(const crow::request& req, crow::response& res) const;

    const RouteTable& routes() const { return *routes_; }
    const DiagnosticsEngine& diagnostics() const { return diagnostics_; }

private:
    void handleNotFound(Context& ctx) const;
    void handleMethodNotAllowed(Context& ctx, const std::vector<std::string>& allowed) const;

    std::shared_ptr<const RouteTable> routes_;
    DiagnosticsEngine diagnostics_;
    std::vector<Middleware> preflight_;
};

} // namespace switchyard
