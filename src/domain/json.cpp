#include "rg/json.hpp"

#include <cmath>
#include <cstdio>

namespace rg {

std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char uc : s) {
        switch (char c = static_cast<char>(uc)) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (uc < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

void JsonObject::key(std::string_view k) {
    if (!body_.empty()) body_ += ',';
    body_ += '"';
    body_ += json_escape(k);
    body_ += "\":";
}

JsonObject& JsonObject::str(std::string_view k, std::string_view value) {
    key(k);
    body_ += '"';
    body_ += json_escape(value);
    body_ += '"';
    return *this;
}

JsonObject& JsonObject::opt_str(std::string_view k, const std::optional<std::string>& value) {
    return value ? str(k, *value) : null(k);
}

JsonObject& JsonObject::num(std::string_view k, double value, int precision) {
    // JSON has no representation for inf/nan
    if (!std::isfinite(value)) return null(k);
    key(k);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    body_ += buf;
    return *this;
}

JsonObject& JsonObject::integer(std::string_view k, long long value) {
    key(k);
    body_ += std::to_string(value);
    return *this;
}

JsonObject& JsonObject::boolean(std::string_view k, bool value) {
    key(k);
    body_ += value ? "true" : "false";
    return *this;
}

JsonObject& JsonObject::null(std::string_view k) {
    key(k);
    body_ += "null";
    return *this;
}

JsonObject& JsonObject::raw(std::string_view k, std::string_view json) {
    key(k);
    body_ += json;
    return *this;
}

} // namespace rg
