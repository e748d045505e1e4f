#pragma once

#include "logger.h"
#include "result.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hellosvc {
namespace core {

enum class Environment : uint8_t {
    DEVELOPMENT,
    PRODUCTION,
    TEST
};

const char* environment_name(Environment env) noexcept;

/**
 * Service configuration.
 *
 * Loaded once at startup and passed by const reference into every component
 * that needs it. Never mutated after load_config() returns.
 */
struct Config {
    std::string app_name = "hellosvc";
    std::string host = "localhost";
    uint16_t port = 3000;
    Environment environment = Environment::DEVELOPMENT;
    LogLevel log_level = LogLevel::INFO;
    bool enable_logging = true;               // Per-request log lines
    size_t max_body_bytes = 10 * 1024 * 1024; // 413 above this
    uint32_t request_timeout_ms = 30000;      // 0 = no timeout
    size_t log_body_limit = 1024;             // Logged body truncation
};

/**
 * Environment variable lookup. Returns nullopt for unset variables.
 */
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

/**
 * Lookup backed by getenv().
 */
EnvLookup process_env();

/**
 * Lookup backed by a fixed map (tests).
 */
EnvLookup map_env(std::unordered_map<std::string, std::string> values);

/**
 * Process environment first, then values read from a .env file.
 */
EnvLookup layered_env(EnvLookup primary, std::unordered_map<std::string, std::string> fallback);

/**
 * Parse a dotenv file into a map.
 *
 * Accepts KEY=VALUE lines, `export ` prefixes, # comments, blank lines and
 * single or double quoted values. Lines without '=' are skipped.
 * A missing file is not an error (empty map).
 *
 * @return Number of variables read, or invalid_state if the file exists but
 *         cannot be read
 */
result<size_t> load_env_file(const std::string& path,
                             std::unordered_map<std::string, std::string>& out);

/**
 * Diagnostics collected while loading. Warnings are non-fatal; error is set
 * whenever load_config() fails.
 */
struct ConfigDiagnostics {
    std::vector<std::string> warnings;
    std::string error;
};

/**
 * Build a Config from the environment.
 *
 * Variables: PORT, HOST, APP_ENV (falls back to NODE_ENV), LOG_LEVEL,
 * APP_NAME, ENABLE_LOGGING, MAX_BODY_BYTES, REQUEST_TIMEOUT_MS,
 * LOG_BODY_LIMIT.
 *
 * @return Config, or config_error with diag.error describing the bad value
 */
result<Config> load_config(const EnvLookup& env, ConfigDiagnostics& diag);

} // namespace core
} // namespace hellosvc
