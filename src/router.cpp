#include "router.hpp"

#include <crow/logging.h>
#include <stdexcept>

namespace switchyard {

RouteGroup::RouteGroup(Router& router, std::string prefix)
    : router_(router), prefix_(std::move(prefix))
{
}

RouteGroup& RouteGroup::use(Middleware middleware) {
    router_.ensureOpen("add group middleware");
    if (!middleware) {
        throw std::invalid_argument("Cannot add an empty middleware to group " + prefix_);
    }
    middleware_.push_back(std::move(middleware));
    return *this;
}

RouteGroup& RouteGroup::handle(const std::string& method, const std::string& suffix, Handler handler) {
    router_.addRoute(method, prefix_ + suffix, MiddlewareChain(middleware_, std::move(handler)));
    return *this;
}

Router::Router()
    : table_(std::make_unique<RouteTable>())
{
}

Router::~Router() = default;

Router& Router::use(Middleware middleware) {
    ensureOpen("add middleware");
    if (!middleware) {
        throw std::invalid_argument("Cannot add an empty middleware");
    }
    middleware_.push_back(std::move(middleware));
    return *this;
}

Router& Router::handle(const std::string& method, const std::string& templatePath, Handler handler) {
    addRoute(method, templatePath, MiddlewareChain({}, std::move(handler)));
    return *this;
}

RouteGroup& Router::group(const std::string& prefix) {
    ensureOpen("create group");
    groups_.push_back(std::make_unique<RouteGroup>(*this, prefix));
    return *groups_.back();
}

std::vector<RouteInfo> Router::routes() const {
    if (!table_) {
        return {};
    }
    return table_->routes();
}

Dispatcher Router::build(DiagnosticsOptions options) {
    ensureOpen("build");

    table_->wrapAll(middleware_);
    std::shared_ptr<const RouteTable> routes(std::move(table_));

    CROW_LOG_INFO << "Router built with " << routes->size() << " routes and "
                  << middleware_.size() << " global middleware";
    return Dispatcher(std::move(routes), DiagnosticsEngine(options), middleware_);
}

void Router::addRoute(const std::string& method, const std::string& templatePath, MiddlewareChain chain) {
    ensureOpen("register " + method + " " + templatePath);
    if (method.empty()) {
        throw std::invalid_argument("HTTP method must not be empty for route " + templatePath);
    }
    table_->add(method, templatePath, std::move(chain));
}

void Router::ensureOpen(const std::string& operation) const {
    if (!table_) {
        throw std::logic_error("Router is sealed, cannot " + operation);
    }
}

} // namespace switchyard
