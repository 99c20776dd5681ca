#include "route_table.hpp"
#include "request_utils.hpp"

#include <algorithm>
#include <crow/logging.h>
#include <set>
#include <unordered_set>

namespace switchyard {

void RouteTable::add(const std::string& method, const std::string& templatePath, MiddlewareChain chain) {
    std::string verb = toUpper(method);
    RoutePattern pattern = RoutePattern::compile(templatePath);
    auto& entries = by_method_[verb];

    auto replace = [&](size_t index) {
        CROW_LOG_DEBUG << "Replacing handler for " << verb << " " << templatePath;
        routes_[index].chain = std::move(chain);
    };

    if (pattern.isStatic()) {
        auto it = entries.static_routes.find(templatePath);
        if (it != entries.static_routes.end()) {
            replace(it->second);
            return;
        }
        entries.static_routes[templatePath] = routes_.size();
        static_path_methods_[templatePath].push_back(verb);
    } else {
        for (size_t index : entries.dynamic_routes) {
            if (routes_[index].templatePath() == templatePath) {
                replace(index);
                return;
            }
        }
        entries.dynamic_routes.push_back(routes_.size());
    }

    routes_.push_back(Route{verb, std::move(pattern), std::move(chain)});
    CROW_LOG_DEBUG << "Registered route " << verb << " " << templatePath;
}

const Route* RouteTable::matchMethod(const MethodRoutes& entries, const std::string& path, Params& params) const {
    auto it = entries.static_routes.find(path);
    if (it != entries.static_routes.end()) {
        return &routes_[it->second];
    }

    for (size_t index : entries.dynamic_routes) {
        Params captured;
        if (routes_[index].pattern.match(path, captured)) {
            params = std::move(captured);
            return &routes_[index];
        }
    }
    return nullptr;
}

RouteMatch RouteTable::resolve(const std::string& method, const std::string& path) const {
    RouteMatch result;
    std::string verb = toUpper(method);

    auto own = by_method_.find(verb);
    if (own != by_method_.end()) {
        result.route = matchMethod(own->second, path, result.params);
        if (result.route) {
            result.status = MatchStatus::Found;
            return result;
        }
    }

    std::set<std::string> allowed;
    auto static_it = static_path_methods_.find(path);
    if (static_it != static_path_methods_.end()) {
        allowed.insert(static_it->second.begin(), static_it->second.end());
    }

    for (const auto& [other, entries] : by_method_) {
        if (other == verb || allowed.count(other)) {
            continue;
        }
        Params ignored;
        if (matchMethod(entries, path, ignored)) {
            allowed.insert(other);
        }
    }

    if (!allowed.empty()) {
        result.status = MatchStatus::MethodNotAllowed;
        result.allowed_methods.assign(allowed.begin(), allowed.end());
        return result;
    }

    result.status = MatchStatus::NotFound;
    return result;
}

std::vector<std::string> RouteTable::knownPaths() const {
    std::vector<std::string> paths;
    std::unordered_set<std::string> seen;
    for (const auto& route : routes_) {
        if (seen.insert(route.templatePath()).second) {
            paths.push_back(route.templatePath());
        }
    }
    return paths;
}

std::vector<RouteInfo> RouteTable::routes() const {
    std::vector<RouteInfo> listing;
    listing.reserve(routes_.size());
    for (const auto& route : routes_) {
        listing.push_back(RouteInfo{route.method, route.templatePath()});
    }

    std::sort(listing.begin(), listing.end(), [](const RouteInfo& a, const RouteInfo& b) {
        if (a.method != b.method) {
            return a.method < b.method;
        }
        return a.path < b.path;
    });
    return listing;
}

void RouteTable::wrapAll(const std::vector<Middleware>& outer) {
    if (outer.empty()) {
        return;
    }
    for (auto& route : routes_) {
        route.chain = route.chain.withPrefix(outer);
    }
}

} // namespace switchyard
