#include "router.h"
#include "../core/logger.h"
#include <algorithm>

namespace hellosvc {
namespace http {

Router::Router() : route_count_(0) {}

Router::~Router() = default;

Router::Router(Router&&) noexcept = default;
Router& Router::operator=(Router&&) noexcept = default;

int Router::add_route(
    const std::string& method,
    const std::string& path,
    RouteHandler handler
) noexcept {
    if (method.empty()) {
        LOG_ERROR("Router", "method cannot be empty for path: %s", path.c_str());
        return 1;
    }

    if (path.empty() || path[0] != '/') {
        LOG_ERROR("Router", "path must start with '/': %s", path.c_str());
        return 1;
    }

    if (!handler) {
        LOG_ERROR("Router", "handler cannot be null for path: %s", path.c_str());
        return 1;
    }

    auto& table = tables_[method];
    if (table.find(path) != table.end()) {
        LOG_ERROR("Router", "duplicate route: %s %s", method.c_str(), path.c_str());
        return 1;
    }

    table.emplace(path, std::move(handler));
    route_count_++;

    LOG_DEBUG("Router", "Registered: %s %s", method.c_str(), path.c_str());
    return 0;
}

const RouteHandler* Router::match(
    const std::string& method,
    const std::string& path
) const noexcept {
    auto table = tables_.find(method);
    if (table == tables_.end()) {
        return nullptr;
    }

    auto route = table->second.find(path);
    if (route == table->second.end()) {
        return nullptr;
    }
    return &route->second;
}

size_t Router::route_count(const std::string& method) const noexcept {
    auto it = tables_.find(method);
    if (it == tables_.end()) {
        return 0;
    }
    return it->second.size();
}

size_t Router::total_routes() const noexcept {
    return route_count_;
}

std::vector<Router::RouteInfo> Router::get_routes() const {
    std::vector<RouteInfo> routes;
    routes.reserve(route_count_);

    for (const auto& [method, table] : tables_) {
        for (const auto& entry : table) {
            routes.push_back({method, entry.first});
        }
    }

    std::sort(routes.begin(), routes.end(), [](const RouteInfo& a, const RouteInfo& b) {
        return a.path == b.path ? a.method < b.method : a.path < b.path;
    });
    return routes;
}

} // namespace http
} // namespace hellosvc
