#include "sandbox_client.h"
#include "json_utils.h"
#include <chrono>
#include <iostream>

namespace capsulerun {

namespace {

constexpr int64_t BYTES_PER_MB = 1000000;
constexpr long RUNTIMES_TIMEOUT_MS = 10000;

int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

// Piston reports some streams as null
std::string string_field(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : "";
}

// Exit codes must fit an int; anything else is a broken reply
bool integral_or_absent(const Json::Value& v) {
    return !v.isNumeric() || v.isInt();
}

} // namespace

SandboxClient::SandboxClient(const SandboxConfig& config, std::shared_ptr<HttpTransport> transport)
    : config_(config), transport_(std::move(transport)) {}

Json::Value SandboxClient::build_request(const LanguageSpec& spec, const std::string& code,
                                         const std::string& stdin_data, const ExecutionLimits& limits,
                                         const SandboxConfig& config) {
    Json::Value body;
    body["language"] = spec.runtime;
    body["version"] = spec.version;

    Json::Value file;
    file["name"] = spec.filename;
    file["content"] = code;
    body["files"].append(file);

    body["stdin"] = stdin_data;
    body["args"] = Json::Value(Json::arrayValue);
    body["compile_timeout"] = config.compile_timeout_ms;
    body["run_timeout"] = limits.time_limit_seconds * 1000;
    body["compile_memory_limit"] = static_cast<Json::Int64>(config.compile_memory_limit_mb * BYTES_PER_MB);
    body["run_memory_limit"] = static_cast<Json::Int64>(limits.memory_limit_mb * BYTES_PER_MB);
    return body;
}

NormalizedResult SandboxClient::transport_failure(const std::string& message, int64_t wall_time_ms) {
    NormalizedResult result;
    result.success = false;
    result.stderr_log = message;
    result.exit_code = 1;
    result.execution_time_ms = wall_time_ms;
    result.transport_error = true;
    return result;
}

NormalizedResult SandboxClient::normalize_response(const Json::Value& body, int64_t wall_time_ms) {
    if (!body.isObject()) {
        return transport_failure("Sandbox returned a non-object response", wall_time_ms);
    }
    if (!body.isMember("run") && body.isMember("message")) {
        return transport_failure("Sandbox error: " + string_field(body, "message"), wall_time_ms);
    }

    const Json::Value& compile = body["compile"];
    const Json::Value& run = body["run"];
    if (!run.isNull() && !run.isObject()) {
        return transport_failure("Sandbox returned a malformed run section", wall_time_ms);
    }
    if ((compile.isObject() && !integral_or_absent(compile["code"])) || !integral_or_absent(run["code"])) {
        return transport_failure("Sandbox returned an out-of-range exit code", wall_time_ms);
    }

    NormalizedResult result;
    result.execution_time_ms = wall_time_ms;

    // A failed compile never produces a run worth reporting
    if (compile.isObject() && compile["code"].isInt() && compile["code"].asInt() != 0) {
        result.stdout_log = string_field(compile, "stdout");
        result.stderr_log = string_field(compile, "stderr");
        if (result.stderr_log.empty()) {
            result.stderr_log = string_field(compile, "output");
        }
        result.exit_code = compile["code"].asInt();
        result.signal = string_field(compile, "signal");
        result.success = false;
        return result;
    }

    result.stdout_log = string_field(run, "stdout");
    if (result.stdout_log.empty()) {
        result.stdout_log = string_field(run, "output");
    }
    result.stderr_log = string_field(run, "stderr");
    result.signal = string_field(run, "signal");
    if (run["memory"].isInt64()) {
        result.memory_used = run["memory"].asInt64();
    }
    if (run["wall_time"].isInt64()) {
        result.backend_time_ms = run["wall_time"].asInt64();
    }

    if (run["code"].isInt()) {
        result.exit_code = run["code"].asInt();
    } else {
        result.exit_code = (!result.signal.empty() || !result.stderr_log.empty()) ? 1 : 0;
    }
    result.success = result.exit_code == 0;
    return result;
}

NormalizedResult SandboxClient::execute(const std::string& language, const std::string& code,
                                        const std::string& stdin_data, const ExecutionLimits& limits) {
    const LanguageSpec* spec = LanguageTable::find(language);
    if (!spec || !spec->executable) {
        return transport_failure("Unsupported language: " + language);
    }

    std::string url = config_.base_url + "/api/v2/execute";
    std::string body = JsonUtils::write_compact(build_request(*spec, code, stdin_data, limits, config_));
    long timeout_ms = static_cast<long>(config_.compile_timeout_ms) +
                      limits.time_limit_seconds * 1000L + SANDBOX_HTTP_SLACK_MS;

    std::cout << "[Sandbox] Executing " << spec->name << " (" << spec->runtime << " "
              << spec->version << ")" << std::endl;
    auto start = std::chrono::steady_clock::now();

    ClientResponse resp;
    try {
        resp = transport_->post_json(url, body, timeout_ms);
    } catch (const std::exception& e) {
        std::cerr << "[Sandbox] Transport error: " << e.what() << std::endl;
        return transport_failure(e.what(), elapsed_ms(start));
    }
    int64_t wall = elapsed_ms(start);

    if (resp.status < 200 || resp.status >= 300) {
        std::cerr << "[Sandbox] HTTP " << resp.status << " from sandbox" << std::endl;
        std::string detail = resp.body.substr(0, 500);
        return transport_failure("Sandbox returned HTTP " + std::to_string(resp.status) +
                                 (detail.empty() ? "" : ": " + detail), wall);
    }

    Json::Value parsed;
    std::string errors;
    if (!JsonUtils::parse(resp.body, parsed, &errors)) {
        std::cerr << "[Sandbox] Unparseable response: " << errors << std::endl;
        return transport_failure("Sandbox returned malformed JSON: " + errors, wall);
    }

    NormalizedResult result;
    try {
        result = normalize_response(parsed, wall);
    } catch (const Json::Exception& e) {
        std::cerr << "[Sandbox] Unexpected response shape: " << e.what() << std::endl;
        return transport_failure(std::string("Sandbox returned an unexpected response: ") + e.what(), wall);
    }
    std::cout << "[Sandbox] Finished in " << wall << "ms (exit=" << result.exit_code << ")" << std::endl;
    return result;
}

std::vector<RuntimeInfo> SandboxClient::list_runtimes() {
    ClientResponse resp = transport_->get(config_.base_url + "/api/v2/runtimes", RUNTIMES_TIMEOUT_MS);
    if (resp.status < 200 || resp.status >= 300) {
        throw std::runtime_error("Sandbox runtimes request returned HTTP " + std::to_string(resp.status));
    }

    Json::Value parsed = JsonUtils::parse_or_throw(resp.body);
    if (!parsed.isArray()) {
        throw std::runtime_error("Sandbox runtimes response is not an array");
    }

    std::vector<RuntimeInfo> runtimes;
    for (const auto& entry : parsed) {
        RuntimeInfo info;
        info.language = JsonUtils::get_string(entry, "language");
        info.version = JsonUtils::get_string(entry, "version");
        for (const auto& alias : entry["aliases"]) {
            if (alias.isString()) info.aliases.push_back(alias.asString());
        }
        runtimes.push_back(std::move(info));
    }
    return runtimes;
}

SandboxHealth SandboxClient::health_check() {
    SandboxHealth health;
    try {
        health.runtimes_count = list_runtimes().size();
        health.healthy = true;
    } catch (const std::exception& e) {
        health.healthy = false;
        health.error = e.what();
    }
    return health;
}

} // namespace capsulerun
