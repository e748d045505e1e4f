#include "json_writer.h"

#include <cstdio>

namespace hellosvc {
namespace http {

void append_json_escaped(std::string& out, std::string_view s) {
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += ch;
                }
        }
    }
}

std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    append_json_escaped(out, s);
    return out;
}

JsonWriter::JsonWriter() {
    out_.reserve(128);
    out_ += '{';
}

void JsonWriter::key(std::string_view name) {
    if (!first_) {
        out_ += ',';
    }
    first_ = false;
    out_ += '"';
    append_json_escaped(out_, name);
    out_ += "\":";
}

JsonWriter& JsonWriter::field(std::string_view name, std::string_view value) {
    key(name);
    out_ += '"';
    append_json_escaped(out_, value);
    out_ += '"';
    return *this;
}

JsonWriter& JsonWriter::field(std::string_view name, const char* value) {
    return field(name, std::string_view(value ? value : ""));
}

JsonWriter& JsonWriter::field(std::string_view name, int value) {
    return field(name, static_cast<int64_t>(value));
}

JsonWriter& JsonWriter::field(std::string_view name, int64_t value) {
    key(name);
    out_ += std::to_string(value);
    return *this;
}

JsonWriter& JsonWriter::field(std::string_view name, bool value) {
    key(name);
    out_ += value ? "true" : "false";
    return *this;
}

JsonWriter& JsonWriter::raw_field(std::string_view name, std::string_view json) {
    key(name);
    out_ += json;
    return *this;
}

std::string JsonWriter::finish() {
    out_ += '}';
    std::string result = std::move(out_);
    out_.clear();
    out_ += '{';
    first_ = true;
    return result;
}

std::string error_body(std::string_view error, int status, std::string_view path,
                       core::SystemTime when) {
    JsonWriter w;
    w.field("error", error)
     .field("status", status)
     .field("timestamp", core::format_iso8601(when))
     .field("path", path);
    return w.finish();
}

} // namespace http
} // namespace hellosvc
