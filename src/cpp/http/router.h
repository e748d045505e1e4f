#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hellosvc {
namespace http {

class Request;
class Response;

/**
 * Exact-match HTTP router.
 *
 * - One table per method, keyed by the exact path
 * - Case-sensitive; no parameters, wildcards or trailing-slash folding
 * - The query string is not part of the match (callers pass the path only)
 * - Immutable after startup, so concurrent reads need no locking
 */

/**
 * Route handler function type.
 *
 * Fills in the response. May throw; the error handler turns exceptions
 * into a 500.
 */
using RouteHandler = std::function<void(const Request&, Response&)>;

class Router {
public:
    Router();
    ~Router();

    // Non-copyable, movable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;
    Router(Router&&) noexcept;
    Router& operator=(Router&&) noexcept;

    /**
     * Add a route to the router.
     *
     * @param method HTTP method token (GET, POST, etc.)
     * @param path Exact path, must start with '/'
     * @param handler Handler function
     * @return 0 on success, 1 on invalid path/handler or duplicate route
     */
    int add_route(
        const std::string& method,
        const std::string& path,
        RouteHandler handler
    ) noexcept;

    /**
     * Find the handler for (method, path).
     *
     * @return Handler, or nullptr if no route matches
     */
    const RouteHandler* match(
        const std::string& method,
        const std::string& path
    ) const noexcept;

    /**
     * Get route count for a method.
     */
    size_t route_count(const std::string& method) const noexcept;

    /**
     * Get total route count.
     */
    size_t total_routes() const noexcept;

    /**
     * Get all registered routes (for startup logging and tests).
     */
    struct RouteInfo {
        std::string method;
        std::string path;
    };
    std::vector<RouteInfo> get_routes() const;

private:
    // method -> (path -> handler)
    std::unordered_map<std::string, std::unordered_map<std::string, RouteHandler>> tables_;

    size_t route_count_;
};

} // namespace http
} // namespace hellosvc
