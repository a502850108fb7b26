#pragma once

#include <string>
#include <vector>
#include <map>
#include <variant>
#include <optional>
#include <cstdint>
#include <json/json.h>
#include "constants.h"
#include "errors.h"

namespace capsulerun {

enum class JobKind {
    EXECUTION,
    GENERATION
};

// queued -> processing -> completed | failed
enum class JobStatus {
    QUEUED,
    PROCESSING,
    COMPLETED,
    FAILED
};

std::string job_kind_to_string(JobKind kind);
std::optional<JobKind> job_kind_from_string(const std::string& name);
std::string job_status_to_string(JobStatus status);
std::optional<JobStatus> job_status_from_string(const std::string& name);

bool is_terminal(JobStatus status);

// Status transitions are one-directional; terminal states never move
bool can_transition(JobStatus from, JobStatus to);

// Sandbox resource limits requested by the caller
struct ExecutionLimits {
    int time_limit_seconds = DEFAULT_TIME_LIMIT_SECONDS;
    int memory_limit_mb = DEFAULT_MEMORY_LIMIT_MB;
};

struct ExecutionPayload {
    std::string language;
    std::string code;
    std::string stdin_data;
    ExecutionLimits limits;
};

struct GenerationPayload {
    std::string prompt;
    std::string language;
    std::string difficulty = "medium";
};

// Fixed-shape result every sandbox response is converted into
struct NormalizedResult {
    bool success = false;
    std::string stdout_log;
    std::string stderr_log;
    int exit_code = 0;
    int64_t execution_time_ms = 0;      // Client-side wall clock
    int64_t backend_time_ms = -1;       // Reported by the sandbox, -1 when absent
    int64_t memory_used = 0;            // Bytes
    std::string signal;
    bool transport_error = false;       // Sandbox unreachable or malformed reply
};

struct GenerationResult {
    Json::Value content;                // Opaque capsule document
    double quality_score = 0.0;
    int64_t generation_time_ms = 0;
    std::map<std::string, int64_t> stage_timings_ms;
    std::string capsule_id;
    bool from_cache = false;
};

// Tagged result union; read kind before touching the payload
struct JobResult {
    JobKind kind = JobKind::EXECUTION;
    std::variant<NormalizedResult, GenerationResult> payload;

    static JobResult execution(NormalizedResult result);
    static JobResult generation(GenerationResult result);

    // Throw std::logic_error when the kind does not match
    const NormalizedResult& as_execution() const;
    const GenerationResult& as_generation() const;
};

struct JobError {
    ErrorKind kind = ErrorKind::INTERNAL;
    std::string message;
};

struct Job {
    std::string id;
    JobKind kind = JobKind::EXECUTION;
    std::string user_id;
    std::variant<ExecutionPayload, GenerationPayload> payload;

    JobStatus status = JobStatus::QUEUED;
    int progress = 0;
    std::string current_step;
    std::vector<std::string> steps;

    int64_t created_at_ms = 0;
    int64_t started_at_ms = 0;
    int64_t completed_at_ms = 0;

    std::optional<JobResult> result;
    std::optional<JobError> error;

    const ExecutionPayload& execution() const;
    const GenerationPayload& generation() const;
};

// Wall clock in milliseconds since the epoch
int64_t current_time_ms();

// Human-traceable id, e.g. "gen_1718000000000_3fa4c2d1"
std::string generate_job_id(const std::string& prefix);
std::string job_id_prefix(JobKind kind);

// Store record encoding
Json::Value normalized_result_to_json(const NormalizedResult& result);
NormalizedResult normalized_result_from_json(const Json::Value& json);
Json::Value generation_result_to_json(const GenerationResult& result);
GenerationResult generation_result_from_json(const Json::Value& json);
Json::Value job_result_to_json(const JobResult& result);
JobResult job_result_from_json(const Json::Value& json);

// Full job record, including the input payload
Json::Value job_to_json(const Job& job);

// Throws std::runtime_error on missing identity fields
Job job_from_json(const Json::Value& json);

} // namespace capsulerun
