#pragma once

#include "json_parser.h"
#include "request.h"
#include "response.h"
#include "../core/config.h"
#include "../core/result.h"

#include <cstddef>
#include <exception>
#include <string>

/**
 * Pipeline stages that wrap every request.
 *
 * - RequestLogger: one INFO line per request, before routing
 * - ErrorHandler: turns anything thrown by routing or a handler into a 500
 *
 * Stages are plain objects called in order by App::handle(); there is no
 * next() continuation.
 */

namespace hellosvc {
namespace http {

class RequestLogger {
public:
    /**
     * Logged in place of a body that could not be serialized.
     */
    static constexpr const char* UNSERIALIZABLE_BODY = "[Object - Unable to serialize]";

    /**
     * Logged for requests without a body.
     */
    static constexpr const char* EMPTY_BODY = "{}";

    explicit RequestLogger(const core::Config& config);

    /**
     * Log "HTTP Request - Method: <M> Path: <target> Body: <body>" under
     * the Request tag. Never throws.
     */
    void log(const Request& request) noexcept;

    /**
     * Body as it appears in the log line.
     *
     * Empty body: "{}". JSON content type: minified document, or
     * UNSERIALIZABLE_BODY after logging the failure. Anything else: the raw
     * text with control characters escaped, truncated to the configured
     * limit with a "...(<n> bytes)" suffix.
     */
    std::string serialize_body(const Request& request) noexcept;

    size_t failures() const noexcept { return failures_; }

private:
    std::string serialize_json(const Request& request);
    std::string serialize_text(const std::string& body) const;
    void report_failure(const Request& request, const char* reason) noexcept;

    bool enabled_;
    size_t body_limit_;
    JsonParser parser_;
    size_t failures_ = 0;
};

class ErrorHandler {
public:
    /**
     * Run the wrapped stages; convert any exception into a 500.
     *
     * @param stages Routing and handler stages, returning the response
     */
    template<typename Stages>
    Response run(const Request& request, Stages&& stages) noexcept {
        try {
            return stages();
        } catch (const std::exception& e) {
            return handle_exception(request, core::error_code::handler_failure,
                                    describe_exception(e), e.what());
        } catch (...) {
            return handle_exception(request, core::error_code::internal_error,
                                    describe_current_exception(), "non-standard exception");
        }
    }

    /**
     * Log the failure under the Error tag and build the generic 500 body.
     * The client sees no message, type or location.
     */
    Response handle_exception(const Request& request, core::error_code kind,
                              const std::string& type, const char* message) noexcept;

    size_t errors_handled() const noexcept { return errors_handled_; }

    /**
     * Demangled dynamic type of e ("std::runtime_error").
     */
    static std::string describe_exception(const std::exception& e);

    /**
     * Demangled type of the exception currently being handled.
     */
    static std::string describe_current_exception();

private:
    size_t errors_handled_ = 0;
};

/**
 * Demangle an Itanium ABI type name; returns the input if that fails.
 */
std::string demangle(const char* mangled);

/**
 * Symbolized call stack of the calling thread on one line:
 * "#0 frame | #1 frame | ...". Frames inside this function and the
 * first `skip` callers are left out. Executables need -rdynamic
 * (ENABLE_EXPORTS) for function names to appear.
 */
std::string capture_stack_trace(int skip = 0);

} // namespace http
} // namespace hellosvc
