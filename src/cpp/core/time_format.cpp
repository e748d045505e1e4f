#include "time_format.h"
#include <cstdio>
#include <ctime>

namespace hellosvc {
namespace core {

std::string format_iso8601(SystemTime when) {
    auto time_t_when = std::chrono::system_clock::to_time_t(when);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()) % 1000;

    struct tm tm_buf;
    gmtime_r(&time_t_when, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<int>(ms.count()));
    return buf;
}

std::string format_http_date(SystemTime when) {
    static constexpr const char* kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                              "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    auto time_t_when = std::chrono::system_clock::to_time_t(when);
    struct tm tm_buf;
    gmtime_r(&time_t_when, &tm_buf);

    char buf[40];
    snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
             kDays[tm_buf.tm_wday], tm_buf.tm_mday, kMonths[tm_buf.tm_mon],
             tm_buf.tm_year + 1900, tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
    return buf;
}

} // namespace core
} // namespace hellosvc
