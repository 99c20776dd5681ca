#include "dispatcher.hpp"
#include "context.hpp"
#include "request_utils.hpp"

#include <crow/logging.h>
#include <stdexcept>

namespace switchyard {

Dispatcher::Dispatcher(std::shared_ptr<const RouteTable> routes, DiagnosticsEngine diagnostics,
                       std::vector<Middleware> preflight)
    : routes_(std::move(routes)), diagnostics_(diagnostics), preflight_(std::move(preflight))
{
    if (!routes_) {
        throw std::invalid_argument("Dispatcher requires a route table");
    }
}

void Dispatcher::handle(const crow::request& req, crow::response& res) const {
    Context ctx(req, res, diagnostics_);

    RouteMatch match = routes_->resolve(ctx.method(), ctx.path());
    switch (match.status) {
        case MatchStatus::Found:
            CROW_LOG_DEBUG << "Dispatching " << ctx.method() << " " << ctx.path()
                           << " to " << match.route->templatePath();
            ctx.setParams(std::move(match.params));
            match.route->chain.run(ctx);
            break;
        case MatchStatus::MethodNotAllowed:
            if (req.method == crow::HTTPMethod::Options && !preflight_.empty()) {
                const auto& allowed = match.allowed_methods;
                MiddlewareChain preflight(preflight_, [this, &allowed](Context& preflight_ctx) {
                    handleMethodNotAllowed(preflight_ctx, allowed);
                });
                preflight.run(ctx);
                break;
            }
            handleMethodNotAllowed(ctx, match.allowed_methods);
            break;
        case MatchStatus::NotFound:
            handleNotFound(ctx);
            break;
    }
}

void Dispatcher::handleNotFound(Context& ctx) const {
    diagnostics_.logRouteNotFound(ctx.request());

    auto available = routes_->knownPaths();
    auto suggestions = DiagnosticsEngine::suggestRoutes(ctx.path(), available);

    crow::json::wvalue details;
    details["suggestions"] = suggestions;
    details["available_routes"] = available;
    details["tip"] = "Check the URL and the HTTP method";

    ctx.writeError(Error::RouteNotFound("Route not found"), std::move(details));
}

void Dispatcher::handleMethodNotAllowed(Context& ctx, const std::vector<std::string>& allowed) const {
    diagnostics_.logMethodNotAllowed(ctx.request(), allowed);

    crow::json::wvalue details;
    details["allowed_methods"] = allowed;
    details["suggestion"] = "Try again with " + allowed.front();

    ctx.setHeader("Allow", joinList(allowed));
    ctx.writeError(Error::MethodNotAllowed("HTTP method not allowed for this route"), std::move(details));
}

} // namespace switchyard
