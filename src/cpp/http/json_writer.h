#pragma once

#include "../core/time_format.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace hellosvc {
namespace http {

/**
 * Append-only writer for flat JSON objects.
 *
 * Usage:
 *   JsonWriter w;
 *   w.field("error", "Not Found").field("status", 404);
 *   std::string body = w.finish();  // {"error":"Not Found","status":404}
 */
class JsonWriter {
public:
    JsonWriter();

    JsonWriter& field(std::string_view key, std::string_view value);
    JsonWriter& field(std::string_view key, const char* value);
    JsonWriter& field(std::string_view key, int value);
    JsonWriter& field(std::string_view key, int64_t value);
    JsonWriter& field(std::string_view key, bool value);

    /**
     * Insert an already-serialized JSON value verbatim.
     */
    JsonWriter& raw_field(std::string_view key, std::string_view json);

    /**
     * Close the object and return it. The writer is empty afterwards.
     */
    std::string finish();

private:
    void key(std::string_view name);

    std::string out_;
    bool first_ = true;
};

/**
 * Append s to out with JSON string escaping (quotes not included).
 */
void append_json_escaped(std::string& out, std::string_view s);

std::string json_escape(std::string_view s);

/**
 * Client-facing error body:
 * {"error":"<error>","status":<status>,"timestamp":"<ISO8601>","path":"<path>"}
 */
std::string error_body(std::string_view error, int status, std::string_view path,
                       core::SystemTime when);

inline std::string error_body(std::string_view error, int status, std::string_view path) {
    return error_body(error, status, path, std::chrono::system_clock::now());
}

} // namespace http
} // namespace hellosvc
