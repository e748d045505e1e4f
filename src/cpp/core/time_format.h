#pragma once

#include <chrono>
#include <string>

namespace hellosvc {
namespace core {

using SystemTime = std::chrono::system_clock::time_point;

/**
 * ISO 8601 UTC with millisecond precision: "2026-10-19T08:15:30.123Z".
 */
std::string format_iso8601(SystemTime when);

/**
 * IMF-fixdate for the HTTP Date header: "Mon, 19 Oct 2026 08:15:30 GMT".
 */
std::string format_http_date(SystemTime when);

inline std::string iso8601_now() {
    return format_iso8601(std::chrono::system_clock::now());
}

} // namespace core
} // namespace hellosvc
