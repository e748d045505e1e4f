#include "config.h"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string_view>
#include <unistd.h>

namespace hellosvc {
namespace core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

template<typename T>
bool parse_unsigned(std::string_view text, T& out) noexcept {
    text = trim(text);
    if (text.empty()) {
        return false;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return false;
    }
    if (value > std::numeric_limits<T>::max()) {
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

bool parse_environment(std::string_view text, Environment& out) {
    std::string lowered = to_lower(trim(text));
    if (lowered == "development") { out = Environment::DEVELOPMENT; return true; }
    if (lowered == "production")  { out = Environment::PRODUCTION;  return true; }
    if (lowered == "test")        { out = Environment::TEST;        return true; }
    return false;
}

bool is_false_flag(std::string_view text) {
    std::string lowered = to_lower(trim(text));
    return lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off";
}

// Reads an unsigned setting; an unparsable value keeps the default and warns.
template<typename T>
void read_unsigned(const EnvLookup& env, const char* name, T& field, ConfigDiagnostics& diag) {
    auto raw = env(name);
    if (!raw || trim(*raw).empty()) {
        return;
    }
    T parsed{};
    if (!parse_unsigned(*raw, parsed)) {
        diag.warnings.push_back(std::string(name) + "='" + *raw +
                                "' is not a valid number, using default " +
                                std::to_string(field));
        return;
    }
    field = parsed;
}

} // namespace

const char* environment_name(Environment env) noexcept {
    switch (env) {
        case Environment::DEVELOPMENT: return "development";
        case Environment::PRODUCTION:  return "production";
        case Environment::TEST:        return "test";
    }
    return "development";
}

EnvLookup process_env() {
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

EnvLookup map_env(std::unordered_map<std::string, std::string> values) {
    return [values = std::move(values)](const char* name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

EnvLookup layered_env(EnvLookup primary, std::unordered_map<std::string, std::string> fallback) {
    return [primary = std::move(primary), fallback = std::move(fallback)](
               const char* name) -> std::optional<std::string> {
        if (auto value = primary(name)) {
            return value;
        }
        auto it = fallback.find(name);
        if (it == fallback.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

result<size_t> load_env_file(const std::string& path,
                             std::unordered_map<std::string, std::string>& out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        // Distinguish "no file" from "unreadable file"
        if (::access(path.c_str(), F_OK) == 0) {
            return err<size_t>(error_code::invalid_state);
        }
        return ok<size_t>(0);
    }

    size_t count = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string_view view = trim(line);
        if (view.empty() || view.front() == '#') {
            continue;
        }
        if (view.substr(0, 7) == "export ") {
            view = trim(view.substr(7));
        }

        size_t eq = view.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            continue;
        }

        std::string key(trim(view.substr(0, eq)));
        std::string_view value = trim(view.substr(eq + 1));

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment
            size_t hash = value.find(" #");
            if (hash != std::string_view::npos) {
                value = trim(value.substr(0, hash));
            }
        }

        out[key] = std::string(value);
        ++count;
    }

    if (in.bad()) {
        return err<size_t>(error_code::invalid_state);
    }
    return ok(count);
}

result<Config> load_config(const EnvLookup& env, ConfigDiagnostics& diag) {
    Config config;

    if (auto raw = env("PORT"); raw && !trim(*raw).empty()) {
        uint16_t port = 0;
        if (parse_unsigned(*raw, port)) {
            config.port = port;
        } else {
            diag.warnings.push_back("PORT='" + *raw + "' is not a valid port, using default " +
                                    std::to_string(config.port));
        }
    }
    if (config.port < 1024) {
        diag.warnings.push_back("Port " + std::to_string(config.port) +
                                " is outside recommended range (1024-65535)");
    }

    if (auto raw = env("HOST"); raw && !trim(*raw).empty()) {
        config.host = std::string(trim(*raw));
    }

    auto env_name = env("APP_ENV");
    if (!env_name || trim(*env_name).empty()) {
        env_name = env("NODE_ENV");
    }
    if (env_name && !trim(*env_name).empty() &&
        !parse_environment(*env_name, config.environment)) {
        diag.error = "Unknown environment '" + *env_name +
                     "' (expected development, production or test)";
        return err<Config>(error_code::config_error);
    }

    if (auto raw = env("LOG_LEVEL"); raw && !trim(*raw).empty()) {
        if (!parse_log_level(trim(*raw), config.log_level)) {
            diag.error = "Unknown LOG_LEVEL '" + *raw + "' (expected error, warn, info or debug)";
            return err<Config>(error_code::config_error);
        }
    }

    if (auto raw = env("APP_NAME")) {
        config.app_name = std::string(trim(*raw));
        if (config.app_name.empty()) {
            diag.error = "APP_NAME configuration is required";
            return err<Config>(error_code::config_error);
        }
    }

    if (auto raw = env("ENABLE_LOGGING")) {
        config.enable_logging = !is_false_flag(*raw);
    }

    read_unsigned(env, "MAX_BODY_BYTES", config.max_body_bytes, diag);
    read_unsigned(env, "REQUEST_TIMEOUT_MS", config.request_timeout_ms, diag);
    read_unsigned(env, "LOG_BODY_LIMIT", config.log_body_limit, diag);

    return ok(std::move(config));
}

} // namespace core
} // namespace hellosvc
