#include "json_utils.h"
#include <sstream>
#include <stdexcept>

namespace capsulerun {

std::string JsonUtils::write_compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string JsonUtils::write_pretty(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

bool JsonUtils::parse(const std::string& text, Json::Value& out, std::string* errors) {
    Json::CharReaderBuilder builder;
    std::string parse_errors;
    std::istringstream stream(text);

    if (!Json::parseFromStream(builder, stream, &out, &parse_errors)) {
        if (errors) *errors = parse_errors;
        return false;
    }
    return true;
}

Json::Value JsonUtils::parse_or_throw(const std::string& text) {
    Json::Value value;
    std::string errors;
    if (!parse(text, value, &errors)) {
        throw std::runtime_error("Failed to parse JSON: " + errors);
    }
    return value;
}

std::string JsonUtils::get_string(const Json::Value& obj, const std::string& key,
                                  const std::string& fallback) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isString()) {
        return fallback;
    }
    return obj[key].asString();
}

int64_t JsonUtils::get_int64(const Json::Value& obj, const std::string& key, int64_t fallback) {
    if (!obj.isObject() || !obj.isMember(key)) {
        return fallback;
    }
    const Json::Value& value = obj[key];
    if (value.isInt64()) return value.asInt64();
    if (value.isDouble()) return static_cast<int64_t>(value.asDouble());
    return fallback;
}

bool JsonUtils::get_bool(const Json::Value& obj, const std::string& key, bool fallback) {
    if (!obj.isObject() || !obj.isMember(key) || !obj[key].isBool()) {
        return fallback;
    }
    return obj[key].asBool();
}

} // namespace capsulerun
