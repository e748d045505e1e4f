/**
 * hellosvc server
 *
 * Serves GET /hello -> "Hello world". Everything else gets a JSON 404.
 *
 * Build:
 *   cmake --build build --target hello_server
 *
 * Run:
 *   PORT=3000 ./build/hello_server
 *
 * Test:
 *   curl http://localhost:3000/hello
 *   curl -i http://localhost:3000/missing
 *
 * Configuration comes from the environment, then from ./.env for anything
 * left unset (see core/config.h for the variable list).
 *
 * Exit codes: 0 after SIGINT/SIGTERM, 1 on configuration or startup failure.
 */

#include "../src/cpp/core/config.h"
#include "../src/cpp/core/logger.h"
#include "../src/cpp/http/app.h"
#include "../src/cpp/http/hello_routes.h"
#include "../src/cpp/http/middleware.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string>
#include <unistd.h>
#include <unordered_map>

using namespace hellosvc;

static std::atomic<bool> g_running{true};
static std::atomic<int> g_signal{0};

void signal_handler(int sig) {
    g_signal = sig;
    g_running = false;
}

[[noreturn]] void terminate_handler() {
    std::string type = "unknown";
    const char* message = "terminate called without an active exception";

    if (std::exception_ptr current = std::current_exception()) {
        type = http::ErrorHandler::describe_current_exception();
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            LOG_ERROR("Error", "Uncaught exception: type=%s message=%s", type.c_str(), e.what());
            _exit(1);
        } catch (...) {
            message = "non-standard exception";
        }
    }

    LOG_ERROR("Error", "Uncaught exception: type=%s message=%s", type.c_str(), message);
    _exit(1);
}

static void configure_logger(const core::Config& config) {
    auto& logger = core::Logger::instance();
    logger.set_level(config.log_level);
    logger.set_format(config.environment == core::Environment::PRODUCTION
                          ? core::LogFormat::PRODUCTION
                          : core::LogFormat::DEVELOPMENT);
    logger.set_tag_enabled("Request", config.enable_logging);
}

int main() {
    std::set_terminate(terminate_handler);

    // Before any startup work, so an early Ctrl-C still exits 0
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    std::unordered_map<std::string, std::string> dotenv;
    auto env_file = core::load_env_file(".env", dotenv);
    if (env_file.is_err()) {
        LOG_ERROR("Config", ".env exists but could not be read: %s", core::error_name(env_file.error()));
        return 1;
    }

    core::ConfigDiagnostics diag;
    auto loaded = core::load_config(core::layered_env(core::process_env(), std::move(dotenv)), diag);
    for (const auto& warning : diag.warnings) {
        LOG_WARN("Config", "%s", warning.c_str());
    }
    if (loaded.is_err()) {
        LOG_ERROR("Config", "Invalid configuration: %s", diag.error.c_str());
        return 1;
    }

    const core::Config& config = loaded.value();
    configure_logger(config);
    if (env_file.value() > 0) {
        LOG_DEBUG("Config", "Read %zu variables from .env", env_file.value());
    }

    if (!g_running.load()) {
        LOG_INFO("Server", "Received %s during startup, exiting",
                 g_signal == SIGINT ? "SIGINT" : "SIGTERM");
        return 0;
    }

    try {
        http::App app(config);
        if (http::register_hello_routes(app.router()) != 0) {
            LOG_ERROR("Server", "Route registration failed");
            return 1;
        }

        int code = app.run([]() { return !g_running.load(); });
        if (g_signal != 0) {
            LOG_INFO("Server", "Received %s, shut down gracefully",
                     g_signal == SIGINT ? "SIGINT" : "SIGTERM");
        }
        return code;
    } catch (const std::exception& e) {
        LOG_ERROR("Error", "Fatal: type=%s message=%s",
                  http::ErrorHandler::describe_exception(e).c_str(), e.what());
        return 1;
    }
}
