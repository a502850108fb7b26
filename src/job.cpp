#include "job.h"
#include "hash_utils.h"
#include "json_utils.h"
#include <chrono>
#include <stdexcept>

namespace capsulerun {

std::string job_kind_to_string(JobKind kind) {
    return kind == JobKind::GENERATION ? "generation" : "execution";
}

std::optional<JobKind> job_kind_from_string(const std::string& name) {
    if (name == "execution") return JobKind::EXECUTION;
    if (name == "generation") return JobKind::GENERATION;
    return std::nullopt;
}

std::string job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::QUEUED:     return "queued";
        case JobStatus::PROCESSING: return "processing";
        case JobStatus::COMPLETED:  return "completed";
        case JobStatus::FAILED:     return "failed";
    }
    return "queued";
}

std::optional<JobStatus> job_status_from_string(const std::string& name) {
    if (name == "queued") return JobStatus::QUEUED;
    if (name == "processing") return JobStatus::PROCESSING;
    if (name == "completed") return JobStatus::COMPLETED;
    if (name == "failed") return JobStatus::FAILED;
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED;
}

bool can_transition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::QUEUED:
            // A queued job may fail without running (cancelled, enqueue failure)
            return to == JobStatus::PROCESSING || to == JobStatus::FAILED;
        case JobStatus::PROCESSING:
            // processing -> processing carries progress updates
            return to == JobStatus::PROCESSING || is_terminal(to);
        case JobStatus::COMPLETED:
        case JobStatus::FAILED:
            return false;
    }
    return false;
}

JobResult JobResult::execution(NormalizedResult result) {
    JobResult r;
    r.kind = JobKind::EXECUTION;
    r.payload = std::move(result);
    return r;
}

JobResult JobResult::generation(GenerationResult result) {
    JobResult r;
    r.kind = JobKind::GENERATION;
    r.payload = std::move(result);
    return r;
}

const NormalizedResult& JobResult::as_execution() const {
    if (kind != JobKind::EXECUTION) {
        throw std::logic_error("Job result is not an execution result");
    }
    return std::get<NormalizedResult>(payload);
}

const GenerationResult& JobResult::as_generation() const {
    if (kind != JobKind::GENERATION) {
        throw std::logic_error("Job result is not a generation result");
    }
    return std::get<GenerationResult>(payload);
}

const ExecutionPayload& Job::execution() const {
    if (kind != JobKind::EXECUTION) {
        throw std::logic_error("Job " + id + " is not an execution job");
    }
    return std::get<ExecutionPayload>(payload);
}

const GenerationPayload& Job::generation() const {
    if (kind != JobKind::GENERATION) {
        throw std::logic_error("Job " + id + " is not a generation job");
    }
    return std::get<GenerationPayload>(payload);
}

int64_t current_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string generate_job_id(const std::string& prefix) {
    return prefix + "_" + std::to_string(current_time_ms()) + "_" + HashUtils::random_hex(4);
}

std::string job_id_prefix(JobKind kind) {
    return kind == JobKind::GENERATION ? "gen" : "exec";
}

Json::Value normalized_result_to_json(const NormalizedResult& result) {
    Json::Value json;
    json["success"] = result.success;
    json["stdout"] = result.stdout_log;
    json["stderr"] = result.stderr_log;
    json["exit_code"] = result.exit_code;
    json["execution_time_ms"] = static_cast<Json::Int64>(result.execution_time_ms);
    json["memory_used"] = static_cast<Json::Int64>(result.memory_used);
    json["signal"] = result.signal.empty() ? Json::Value(Json::nullValue) : Json::Value(result.signal);
    if (result.backend_time_ms >= 0) {
        json["backend_time_ms"] = static_cast<Json::Int64>(result.backend_time_ms);
    }
    if (result.transport_error) {
        json["transport_error"] = true;
    }
    return json;
}

NormalizedResult normalized_result_from_json(const Json::Value& json) {
    NormalizedResult result;
    result.success = JsonUtils::get_bool(json, "success");
    result.stdout_log = JsonUtils::get_string(json, "stdout");
    result.stderr_log = JsonUtils::get_string(json, "stderr");
    result.exit_code = static_cast<int>(JsonUtils::get_int64(json, "exit_code", 0));
    result.execution_time_ms = JsonUtils::get_int64(json, "execution_time_ms");
    result.backend_time_ms = JsonUtils::get_int64(json, "backend_time_ms", -1);
    result.memory_used = JsonUtils::get_int64(json, "memory_used");
    result.signal = JsonUtils::get_string(json, "signal");
    result.transport_error = JsonUtils::get_bool(json, "transport_error");
    return result;
}

Json::Value generation_result_to_json(const GenerationResult& result) {
    Json::Value json;
    json["content"] = result.content;
    json["quality_score"] = result.quality_score;
    json["generation_time_ms"] = static_cast<Json::Int64>(result.generation_time_ms);

    Json::Value stages(Json::objectValue);
    for (const auto& [stage, ms] : result.stage_timings_ms) {
        stages[stage] = static_cast<Json::Int64>(ms);
    }
    json["stage_timings_ms"] = stages;

    if (!result.capsule_id.empty()) {
        json["capsule_id"] = result.capsule_id;
    }
    json["from_cache"] = result.from_cache;
    return json;
}

GenerationResult generation_result_from_json(const Json::Value& json) {
    GenerationResult result;
    result.content = json.isMember("content") ? json["content"] : Json::Value(Json::nullValue);
    if (json.isMember("quality_score") && json["quality_score"].isNumeric()) {
        result.quality_score = json["quality_score"].asDouble();
    }
    result.generation_time_ms = JsonUtils::get_int64(json, "generation_time_ms");

    const Json::Value& stages = json["stage_timings_ms"];
    if (stages.isObject()) {
        for (const auto& name : stages.getMemberNames()) {
            result.stage_timings_ms[name] = JsonUtils::get_int64(stages, name);
        }
    }
    result.capsule_id = JsonUtils::get_string(json, "capsule_id");
    result.from_cache = JsonUtils::get_bool(json, "from_cache");
    return result;
}

Json::Value job_result_to_json(const JobResult& result) {
    Json::Value json;
    json["kind"] = job_kind_to_string(result.kind);
    switch (result.kind) {
        case JobKind::EXECUTION:
            json["execution"] = normalized_result_to_json(result.as_execution());
            break;
        case JobKind::GENERATION:
            json["generation"] = generation_result_to_json(result.as_generation());
            break;
    }
    return json;
}

JobResult job_result_from_json(const Json::Value& json) {
    auto kind = job_kind_from_string(JsonUtils::get_string(json, "kind"));
    if (!kind) {
        throw std::runtime_error("Job result has no valid kind");
    }
    switch (*kind) {
        case JobKind::EXECUTION:
            return JobResult::execution(normalized_result_from_json(json["execution"]));
        case JobKind::GENERATION:
            return JobResult::generation(generation_result_from_json(json["generation"]));
    }
    throw std::runtime_error("Unhandled job result kind");
}

Json::Value job_to_json(const Job& job) {
    Json::Value json;
    json["id"] = job.id;
    json["kind"] = job_kind_to_string(job.kind);
    json["user_id"] = job.user_id;

    Json::Value input;
    if (job.kind == JobKind::EXECUTION) {
        const auto& exec = job.execution();
        input["language"] = exec.language;
        input["code"] = exec.code;
        input["stdin"] = exec.stdin_data;
        input["time_limit_seconds"] = exec.limits.time_limit_seconds;
        input["memory_limit_mb"] = exec.limits.memory_limit_mb;
    } else {
        const auto& gen = job.generation();
        input["prompt"] = gen.prompt;
        input["language"] = gen.language;
        input["difficulty"] = gen.difficulty;
    }
    json["input"] = input;

    json["status"] = job_status_to_string(job.status);
    json["progress"] = job.progress;
    json["current_step"] = job.current_step;

    Json::Value steps(Json::arrayValue);
    for (const auto& step : job.steps) {
        steps.append(step);
    }
    json["steps"] = steps;

    json["created_at_ms"] = static_cast<Json::Int64>(job.created_at_ms);
    json["started_at_ms"] = static_cast<Json::Int64>(job.started_at_ms);
    json["completed_at_ms"] = static_cast<Json::Int64>(job.completed_at_ms);

    if (job.result) {
        json["result"] = job_result_to_json(*job.result);
    }
    if (job.error) {
        Json::Value error;
        error["kind"] = error_kind_to_string(job.error->kind);
        error["message"] = job.error->message;
        json["error"] = error;
    }
    return json;
}

Job job_from_json(const Json::Value& json) {
    if (!json.isObject()) {
        throw std::runtime_error("Job record is not an object");
    }

    Job job;
    job.id = JsonUtils::get_string(json, "id");
    if (job.id.empty()) {
        throw std::runtime_error("Job record has no id");
    }

    auto kind = job_kind_from_string(JsonUtils::get_string(json, "kind"));
    if (!kind) {
        throw std::runtime_error("Job record " + job.id + " has no valid kind");
    }
    job.kind = *kind;
    job.user_id = JsonUtils::get_string(json, "user_id");

    const Json::Value& input = json["input"];
    if (job.kind == JobKind::EXECUTION) {
        ExecutionPayload exec;
        exec.language = JsonUtils::get_string(input, "language");
        exec.code = JsonUtils::get_string(input, "code");
        exec.stdin_data = JsonUtils::get_string(input, "stdin");
        exec.limits.time_limit_seconds = static_cast<int>(
            JsonUtils::get_int64(input, "time_limit_seconds", DEFAULT_TIME_LIMIT_SECONDS));
        exec.limits.memory_limit_mb = static_cast<int>(
            JsonUtils::get_int64(input, "memory_limit_mb", DEFAULT_MEMORY_LIMIT_MB));
        job.payload = exec;
    } else {
        GenerationPayload gen;
        gen.prompt = JsonUtils::get_string(input, "prompt");
        gen.language = JsonUtils::get_string(input, "language");
        gen.difficulty = JsonUtils::get_string(input, "difficulty", "medium");
        job.payload = gen;
    }

    auto status = job_status_from_string(JsonUtils::get_string(json, "status"));
    if (!status) {
        throw std::runtime_error("Job record " + job.id + " has no valid status");
    }
    job.status = *status;
    job.progress = static_cast<int>(JsonUtils::get_int64(json, "progress"));
    job.current_step = JsonUtils::get_string(json, "current_step");
    for (const auto& step : json["steps"]) {
        job.steps.push_back(step.asString());
    }

    job.created_at_ms = JsonUtils::get_int64(json, "created_at_ms");
    job.started_at_ms = JsonUtils::get_int64(json, "started_at_ms");
    job.completed_at_ms = JsonUtils::get_int64(json, "completed_at_ms");

    if (json.isMember("result") && json["result"].isObject()) {
        job.result = job_result_from_json(json["result"]);
    }
    if (json.isMember("error") && json["error"].isObject()) {
        JobError error;
        error.kind = error_kind_from_string(JsonUtils::get_string(json["error"], "kind"));
        error.message = JsonUtils::get_string(json["error"], "message");
        job.error = error;
    }
    return job;
}

} // namespace capsulerun
