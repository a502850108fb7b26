#pragma once

#include "job.h"
#include "http_client.h"
#include "language_table.h"
#include <memory>
#include <vector>

namespace capsulerun {

struct SandboxConfig {
    std::string base_url = "http://localhost:2000";
    int compile_timeout_ms = DEFAULT_COMPILE_TIMEOUT_MS;
    int compile_memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB;
};

struct RuntimeInfo {
    std::string language;
    std::string version;
    std::vector<std::string> aliases;
};

struct SandboxHealth {
    bool healthy = false;
    size_t runtimes_count = 0;
    std::string error;
};

// Client for a Piston-compatible sandbox. execute() never throws: transport
// problems come back as a failed NormalizedResult with transport_error set.
class SandboxClient {
public:
    SandboxClient(const SandboxConfig& config, std::shared_ptr<HttpTransport> transport);

    NormalizedResult execute(const std::string& language, const std::string& code,
                             const std::string& stdin_data, const ExecutionLimits& limits);

    // Throws std::runtime_error when the sandbox cannot be reached
    std::vector<RuntimeInfo> list_runtimes();

    SandboxHealth health_check();

    // Request body for POST /api/v2/execute
    static Json::Value build_request(const LanguageSpec& spec, const std::string& code,
                                     const std::string& stdin_data, const ExecutionLimits& limits,
                                     const SandboxConfig& config);

    // Converts any sandbox reply shape into the fixed result contract
    static NormalizedResult normalize_response(const Json::Value& body, int64_t wall_time_ms);

    static NormalizedResult transport_failure(const std::string& message, int64_t wall_time_ms = 0);

private:
    SandboxConfig config_;
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace capsulerun
