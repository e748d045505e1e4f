/**
 * @file app.h
 * @brief Application object: routes, request pipeline and server lifecycle
 *
 * Example:
 * @code
 * core::Config config;           // or core::load_config(...)
 * http::App app(config);
 *
 * app.get("/hello", [](const http::Request&, http::Response& res) {
 *     res.text("Hello world");
 * });
 *
 * return app.run();              // 0 after stop, 1 on startup failure
 * @endcode
 */

#pragma once

#include "middleware.h"
#include "request.h"
#include "response.h"
#include "router.h"
#include "server.h"
#include "../core/config.h"
#include "../core/result.h"

#include <cstdint>
#include <memory>
#include <string>

namespace hellosvc {
namespace http {

class App {
public:
    explicit App(const core::Config& config);
    ~App();

    // Non-copyable, non-movable (the server callback captures this)
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /**
     * Register a GET route. Registration failures are logged; use
     * add_route() to observe them.
     */
    App& get(const std::string& path, RouteHandler handler);

    /**
     * @return 0 on success, non-zero if the router rejected the route
     */
    int add_route(const std::string& method, const std::string& path, RouteHandler handler);

    /**
     * Run the request pipeline:
     *   request logger -> [error handler: router -> handler]
     *
     * Always returns exactly one response (handler result, 404 or 500).
     */
    Response handle(const Request& request);

    /**
     * Create the server and bind HOST:PORT. Failures are logged with
     * remediation hints.
     */
    core::result<void> bind();

    /**
     * Serve until stop() or should_stop(). Requires a successful bind().
     *
     * @return 0 on clean stop, non-zero on event loop failure
     */
    int serve(const HttpServer::StopPredicate& should_stop = {});

    /**
     * bind() + startup banner + serve().
     *
     * @return Process exit code: 0 after a requested stop, 1 on failure
     */
    int run(const HttpServer::StopPredicate& should_stop = {});

    /**
     * Stop serving. Thread-safe.
     */
    void stop();

    /**
     * Port actually bound (0 before bind()).
     */
    uint16_t bound_port() const;

    const core::Config& config() const noexcept { return config_; }
    Router& router() noexcept { return router_; }
    const Router& router() const noexcept { return router_; }
    const RequestLogger& request_logger() const noexcept { return request_logger_; }
    const ErrorHandler& error_handler() const noexcept { return error_handler_; }

    // nullptr before bind()
    const HttpServer* server() const noexcept { return server_.get(); }

private:
    Response route(const Request& request);

    void report_bind_failure(core::error_code code, int err) const;

    core::Config config_;
    Router router_;
    RequestLogger request_logger_;
    ErrorHandler error_handler_;
    std::unique_ptr<HttpServer> server_;
};

} // namespace http
} // namespace hellosvc
