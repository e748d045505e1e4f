#include "middleware.h"
#include "json_writer.h"
#include "../core/logger.h"
#include "../core/time_format.h"

#include <cxxabi.h>
#include <execinfo.h>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <typeinfo>

namespace hellosvc {
namespace http {

// ============================================================================
// RequestLogger
// ============================================================================

RequestLogger::RequestLogger(const core::Config& config)
    : enabled_(config.enable_logging)
    , body_limit_(config.log_body_limit)
{
}

void RequestLogger::log(const Request& request) noexcept {
    if (!enabled_) {
        return;
    }

    std::string body = serialize_body(request);
    LOG_INFO("Request", "HTTP Request - Method: %s Path: %s Body: %s",
             request.get_method_str().c_str(), request.get_target().c_str(), body.c_str());
}

std::string RequestLogger::serialize_body(const Request& request) noexcept {
    try {
        const std::string& body = request.get_body();
        if (body.empty()) {
            return EMPTY_BODY;
        }
        if (request.is_json()) {
            return serialize_json(request);
        }
        return serialize_text(body);
    } catch (const std::exception& e) {
        report_failure(request, e.what());
    } catch (...) {
        report_failure(request, "non-standard exception");
    }
    return UNSERIALIZABLE_BODY;
}

std::string RequestLogger::serialize_json(const Request& request) {
    auto minified = parser_.minify(request.get_body());
    if (minified.is_err()) {
        report_failure(request, parser_.get_last_error().c_str());
        return UNSERIALIZABLE_BODY;
    }
    return std::move(minified).value();
}

std::string RequestLogger::serialize_text(const std::string& body) const {
    size_t shown = body.size() > body_limit_ ? body_limit_ : body.size();

    std::string out;
    out.reserve(shown + 32);
    for (size_t i = 0; i < shown; ++i) {
        auto c = static_cast<unsigned char>(body[i]);
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }

    if (shown < body.size()) {
        out += "...(";
        out += std::to_string(body.size());
        out += " bytes)";
    }
    return out;
}

void RequestLogger::report_failure(const Request& request, const char* reason) noexcept {
    failures_++;
    LOG_ERROR("Request", "Request body serialization failed: %s for path: %s",
              reason, request.get_target().c_str());
}

// ============================================================================
// ErrorHandler
// ============================================================================

std::string demangle(const char* mangled) {
    if (!mangled) {
        return "unknown";
    }

    int status = 0;
    std::unique_ptr<char, void (*)(void*)> name(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && name) {
        return name.get();
    }
    return mangled;
}

std::string capture_stack_trace(int skip) {
    constexpr int MAX_FRAMES = 64;
    void* frames[MAX_FRAMES];
    int depth = backtrace(frames, MAX_FRAMES);

    std::unique_ptr<char*, void (*)(void*)> symbols(backtrace_symbols(frames, depth), std::free);
    if (!symbols) {
        return "unavailable";
    }

    std::string out;
    int shown = 0;
    for (int i = 1 + skip; i < depth; ++i) {
        // "binary(mangled+0x1f) [0x...]"
        std::string frame = symbols.get()[i];
        size_t name_begin = frame.find('(');
        size_t name_end = frame.find('+', name_begin);
        if (name_begin != std::string::npos && name_end != std::string::npos &&
            name_end > name_begin + 1) {
            std::string mangled = frame.substr(name_begin + 1, name_end - name_begin - 1);
            frame.replace(name_begin + 1, mangled.size(), demangle(mangled.c_str()));
        }

        if (shown > 0) {
            out += " | ";
        }
        out += "#" + std::to_string(shown++) + " " + frame;
    }
    return out.empty() ? "unavailable" : out;
}

std::string ErrorHandler::describe_exception(const std::exception& e) {
    return demangle(typeid(e).name());
}

std::string ErrorHandler::describe_current_exception() {
    const std::type_info* type = abi::__cxa_current_exception_type();
    return type ? demangle(type->name()) : "unknown";
}

Response ErrorHandler::handle_exception(const Request& request, core::error_code kind,
                                        const std::string& type, const char* message) noexcept {
    errors_handled_++;

    auto now = std::chrono::system_clock::now();

    JsonWriter headers;
    for (const auto& [name, value] : request.get_headers()) {
        headers.field(name, value);
    }

    LOG_ERROR("Error",
              "Unhandled error: kind=%s type=%s message=%s method=%s path=%s "
              "headers=%s ip=%s user_agent=%s timestamp=%s stack=%s",
              core::error_name(kind), type.c_str(), message ? message : "",
              request.get_method_str().c_str(), request.get_target().c_str(),
              headers.finish().c_str(), request.get_client_ip().c_str(),
              std::string(request.get_user_agent()).c_str(),
              core::format_iso8601(now).c_str(), capture_stack_trace().c_str());

    Response res;
    res.status(Response::Status::INTERNAL_SERVER_ERROR);
    res.json(error_body(status_reason(Response::Status::INTERNAL_SERVER_ERROR), 500,
                        request.get_target(), now));
    return res;
}

} // namespace http
} // namespace hellosvc
