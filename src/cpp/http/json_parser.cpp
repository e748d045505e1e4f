#include "json_parser.h"

#include <simdjson.h>

namespace hellosvc {
namespace http {

using core::error_code;

JsonParser::JsonParser()
    : parser_(std::make_unique<simdjson::dom::parser>()) {
}

JsonParser::~JsonParser() = default;

core::result<std::string> JsonParser::minify(std::string_view json) {
    simdjson::padded_string padded(json.data(), json.size());

    simdjson::dom::element doc;
    auto error = parser_->parse(padded).get(doc);
    if (error) {
        last_error_ = simdjson::error_message(error);
        update_stats(false);
        return core::err<std::string>(error_code::parse_error);
    }

    update_stats(true);
    return core::ok(simdjson::minify(doc));
}

bool JsonParser::validate(std::string_view json) {
    simdjson::padded_string padded(json.data(), json.size());

    simdjson::dom::element doc;
    auto error = parser_->parse(padded).get(doc);
    update_stats(!error);
    if (error) {
        last_error_ = simdjson::error_message(error);
        return false;
    }
    return true;
}

void JsonParser::update_stats(bool success) noexcept {
    total_parses_.fetch_add(1, std::memory_order_relaxed);
    if (!success) {
        failed_parses_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace http
} // namespace hellosvc
