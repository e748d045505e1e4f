#include "app.h"
#include "../core/logger.h"
#include "../net/tcp_listener.h"

#include <cstring>

namespace hellosvc {
namespace http {

using core::error_code;

App::App(const core::Config& config)
    : config_(config)
    , request_logger_(config_)
{
}

App::~App() = default;

App& App::get(const std::string& path, RouteHandler handler) {
    add_route("GET", path, std::move(handler));
    return *this;
}

int App::add_route(const std::string& method, const std::string& path, RouteHandler handler) {
    int result = router_.add_route(method, path, std::move(handler));
    if (result != 0) {
        LOG_ERROR("App", "add_route returned %d for %s %s", result, method.c_str(), path.c_str());
    }
    return result;
}

Response App::handle(const Request& request) {
    request_logger_.log(request);

    return error_handler_.run(request, [this, &request]() {
        return route(request);
    });
}

Response App::route(const Request& request) {
    const RouteHandler* handler = router_.match(request.get_method_str(), request.get_path());
    if (!handler) {
        LOG_DEBUG("Router", "%s: %s %s", core::error_name(error_code::route_not_found),
                  request.get_method_str().c_str(), request.get_target().c_str());
        return Response::error(Response::Status::NOT_FOUND, request.get_target());
    }

    Response response;
    (*handler)(request, response);
    return response;
}

core::result<void> App::bind() {
    HttpServer::Config server_config;
    server_config.host = config_.host;
    server_config.port = config_.port;
    server_config.max_body_bytes = config_.max_body_bytes;
    server_config.request_timeout_ms = config_.request_timeout_ms;

    server_ = std::make_unique<HttpServer>(server_config, [this](const Request& request) {
        return handle(request);
    });

    auto result = server_->bind();
    if (result.is_err()) {
        report_bind_failure(result.error(), server_->last_errno());
    }
    return result;
}

int App::serve(const HttpServer::StopPredicate& should_stop) {
    if (!server_) {
        LOG_ERROR("App", "serve() called before a successful bind()");
        return -1;
    }
    return server_->run(should_stop);
}

int App::run(const HttpServer::StopPredicate& should_stop) {
    if (bind().is_err()) {
        LOG_ERROR("Server", "Application terminating due to server startup failure");
        return 1;
    }

    LOG_INFO("Server", "%s listening on http://%s:%u", config_.app_name.c_str(),
             config_.host.c_str(), static_cast<unsigned>(bound_port()));
    LOG_INFO("Server", "Environment: %s", core::environment_name(config_.environment));
    for (const auto& route : router_.get_routes()) {
        LOG_INFO("Server", "Route: %s %s", route.method.c_str(), route.path.c_str());
    }

    int result = serve(should_stop);
    if (result != 0) {
        int err = server_->last_errno();
        LOG_ERROR("Server", "Event loop failed: %s (%s)", strerror(err), net::errno_name(err));
        return 1;
    }

    LOG_INFO("Server", "Shutdown complete");
    return 0;
}

void App::stop() {
    if (server_) {
        server_->stop();
    }
}

uint16_t App::bound_port() const {
    return server_ ? server_->bound_port() : 0;
}

void App::report_bind_failure(error_code code, int err) const {
    unsigned port = config_.port;

    if (code == error_code::address_in_use) {
        LOG_ERROR("Server", "Server startup failed: Port %u is already in use (EADDRINUSE)", port);
        LOG_ERROR("Server", "Resolution suggestions:");
        LOG_ERROR("Server", "  - Stop the process using port %u: lsof -ti:%u | xargs kill", port, port);
        LOG_ERROR("Server", "  - Use a different port: PORT=%u hello_server", port == 65535 ? 3001 : port + 1);
        LOG_ERROR("Server", "  - Check for other running instances of this application");
        return;
    }

    LOG_ERROR("Server", "Server startup failed on %s:%u: %s", config_.host.c_str(), port,
              err ? strerror(err) : core::error_name(code));
    LOG_ERROR("Server", "Error code: %s (%d), kind: %s", net::errno_name(err), err,
              core::error_name(code));
    if (code == error_code::permission_denied) {
        LOG_ERROR("Server", "Ports below 1024 need elevated privileges; choose a higher PORT");
    } else {
        LOG_ERROR("Server", "Please check HOST and PORT and the system network configuration");
    }
}

} // namespace http
} // namespace hellosvc
