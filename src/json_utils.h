#pragma once

#include <string>
#include <json/json.h>

namespace capsulerun {

class JsonUtils {
public:
    // Single-line JSON, used for store records and harness test data
    static std::string write_compact(const Json::Value& value);

    // Indented JSON, used for HTTP response bodies
    static std::string write_pretty(const Json::Value& value);

    // Parse text; returns false and fills errors on malformed input
    static bool parse(const std::string& text, Json::Value& out, std::string* errors = nullptr);

    // Parse or throw std::runtime_error
    static Json::Value parse_or_throw(const std::string& text);

    // Typed accessors that tolerate missing keys and wrong types
    static std::string get_string(const Json::Value& obj, const std::string& key,
                                  const std::string& fallback = "");
    static int64_t get_int64(const Json::Value& obj, const std::string& key, int64_t fallback = 0);
    static bool get_bool(const Json::Value& obj, const std::string& key, bool fallback = false);
};

} // namespace capsulerun
