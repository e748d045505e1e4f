#pragma once

#include "../core/result.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace simdjson {
namespace dom {
class parser;
} // namespace dom
} // namespace simdjson

namespace hellosvc {
namespace http {

/**
 * JSON validation and minification backed by the simdjson DOM parser.
 *
 * One instance reuses its parser buffers across calls; not thread-safe.
 */
class JsonParser {
public:
    JsonParser();
    ~JsonParser();

    JsonParser(const JsonParser&) = delete;
    JsonParser& operator=(const JsonParser&) = delete;

    /**
     * Parse a document and re-serialize it without insignificant whitespace.
     *
     * @return Minified JSON, or parse_error with get_last_error() describing
     *         the simdjson failure. May throw std::bad_alloc.
     */
    core::result<std::string> minify(std::string_view json);

    /**
     * @return true if json is a single well-formed document
     */
    bool validate(std::string_view json);

    const std::string& get_last_error() const noexcept { return last_error_; }

    void clear_error() noexcept { last_error_.clear(); }

    uint64_t total_parses() const noexcept { return total_parses_.load(std::memory_order_relaxed); }
    uint64_t failed_parses() const noexcept { return failed_parses_.load(std::memory_order_relaxed); }

private:
    std::unique_ptr<simdjson::dom::parser> parser_;
    std::string last_error_;

    std::atomic<uint64_t> total_parses_{0};
    std::atomic<uint64_t> failed_parses_{0};

    void update_stats(bool success) noexcept;
};

} // namespace http
} // namespace hellosvc
