#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rg {

// Escapes a string for embedding between JSON double quotes.
std::string json_escape(std::string_view s);

// Builds one flat JSON object, keys in insertion order.
class JsonObject {
public:
    JsonObject& str(std::string_view key, std::string_view value);
    JsonObject& opt_str(std::string_view key, const std::optional<std::string>& value);
    JsonObject& num(std::string_view key, double value, int precision = 3);
    JsonObject& integer(std::string_view key, long long value);
    JsonObject& boolean(std::string_view key, bool value);
    JsonObject& null(std::string_view key);
    // `json` must already be a serialized JSON value
    JsonObject& raw(std::string_view key, std::string_view json);

    std::string build() const { return "{" + body_ + "}"; }

private:
    void key(std::string_view k);

    std::string body_;
};

} // namespace rg
