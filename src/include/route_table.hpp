#pragma once

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "middleware_chain.hpp"
#include "route_pattern.hpp"

namespace switchyard {

struct Route {
    std::string method;
    RoutePattern pattern;
    MiddlewareChain chain;

    const std::string& templatePath() const { return pattern.templatePath(); }
};

enum class MatchStatus {
    Found,
    MethodNotAllowed,
    NotFound
};

struct RouteMatch {
    MatchStatus status = MatchStatus::NotFound;
    const Route* route = nullptr;
    Params params;
    // Sorted methods serving the path, set for MethodNotAllowed
    std::vector<std::string> allowed_methods;
};

struct RouteInfo {
    std::string method;
    std::string path;
};

/**
 * Routes per HTTP method. Static templates are kept in a hash index for O(1)
 * lookup, parameterized templates in registration order.
 *
 * The table is filled during setup and only read while serving.
 */
class RouteTable {
public:
    // Adds a route; an existing (method, template) pair is replaced in place
    void add(const std::string& method, const std::string& templatePath, MiddlewareChain chain);

    RouteMatch resolve(const std::string& method, const std::string& path) const;

    // Distinct templates in registration order
    std::vector<std::string> knownPaths() const;

    // All routes sorted by method, then template
    std::vector<RouteInfo> routes() const;

    size_t size() const { return routes_.size(); }

    // Prepend middleware to the chain of every route
    void wrapAll(const std::vector<Middleware>& outer);

private:
    struct MethodRoutes {
        std::unordered_map<std::string, size_t> static_routes;
        std::vector<size_t> dynamic_routes;
    };

    const Route* matchMethod(const MethodRoutes& entries, const std::string& path, Params& params) const;

    std::vector<Route> routes_;
    std::map<std::string, MethodRoutes> by_method_;
    // Static path -> methods registered for it
    std::unordered_map<std::string, std::vector<std::string>> static_path_methods_;
};

} // namespace switchyard
