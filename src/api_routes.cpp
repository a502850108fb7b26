#include "api_routes.h"
#include "json_utils.h"
#include "language_table.h"
#include <algorithm>
#include <iostream>

namespace capsulerun {

namespace {

const std::string GENERATE_PREFIX = "/api/v1/generate/";
const std::string JOBS_PREFIX = "/api/v1/jobs/";

HttpResponse json_response(int status, const Json::Value& body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = JsonUtils::write_pretty(body);
    return resp;
}

HttpResponse error_response(int status, const std::string& code, const std::string& message,
                            bool retryable = false) {
    Json::Value body;
    body["success"] = false;
    body["error"]["code"] = code;
    body["error"]["message"] = message;
    body["error"]["retryable"] = retryable;
    return json_response(status, body);
}

HttpResponse rejection_response(const AdmissionResult& r) {
    return error_response(r.http_status, admission_code_to_string(r.error_code), r.message, r.retryable);
}

// Parses the body as a JSON object; on failure fills resp with a 400
bool parse_body(const HttpRequest& req, Json::Value& body, HttpResponse& resp) {
    std::string errors;
    if (!JsonUtils::parse(req.body, body, &errors) || !body.isObject()) {
        resp = error_response(400, "VALIDATION_ERROR", "Request body must be a JSON object");
        return false;
    }
    return true;
}

// X-User-Plan is optional; unknown values are rejected
bool read_plan(const HttpRequest& req, Plan& plan, HttpResponse& resp) {
    std::string name = req.header("X-User-Plan");
    if (name.empty()) {
        plan = Plan::FREE;
        return true;
    }
    auto parsed = plan_from_string(name);
    if (!parsed) {
        resp = error_response(400, "VALIDATION_ERROR", "Unknown plan: " + name);
        return false;
    }
    plan = *parsed;
    return true;
}

bool optional_int(const Json::Value& body, const char* key, int& out, std::string& error) {
    if (!body.isMember(key) || body[key].isNull()) {
        return true;
    }
    if (!body[key].isInt()) {
        error = std::string(key) + " must be an integer";
        return false;
    }
    out = body[key].asInt();
    return true;
}

bool optional_string(const Json::Value& body, const char* key, std::string& out, std::string& error) {
    if (!body.isMember(key) || body[key].isNull()) {
        return true;
    }
    if (!body[key].isString()) {
        error = std::string(key) + " must be a string";
        return false;
    }
    out = body[key].asString();
    return true;
}

Json::Value generation_result_view(const GenerationResult& result) {
    Json::Value view;
    view["content"] = result.content;
    view["qualityScore"] = result.quality_score;
    view["generationTimeMs"] = static_cast<Json::Int64>(result.generation_time_ms);
    Json::Value stages(Json::objectValue);
    for (const auto& [name, ms] : result.stage_timings_ms) {
        stages[name] = static_cast<Json::Int64>(ms);
    }
    view["stageTimings"] = stages;
    if (!result.capsule_id.empty()) {
        view["capsuleId"] = result.capsule_id;
    }
    view["fromCache"] = result.from_cache;
    return view;
}

} // namespace

Json::Value execution_result_view(const NormalizedResult& result) {
    Json::Value view;
    view["success"] = result.success;
    view["stdout"] = result.stdout_log;
    view["stderr"] = result.stderr_log;
    view["exitCode"] = result.exit_code;
    view["executionTime"] = static_cast<Json::Int64>(result.execution_time_ms);
    view["memoryUsed"] = static_cast<Json::Int64>(result.memory_used);
    view["signal"] = result.signal.empty() ? Json::Value(Json::nullValue) : Json::Value(result.signal);
    return view;
}

Json::Value job_status_view(const Job& job) {
    Json::Value view;
    view["success"] = true;
    view["jobId"] = job.id;
    view["kind"] = job_kind_to_string(job.kind);
    view["status"] = job_status_to_string(job.status);
    view["progress"] = job.progress;
    view["currentStep"] = job.current_step;

    Json::Value steps(Json::arrayValue);
    for (const auto& step : job.steps) {
        steps.append(step);
    }
    view["steps"] = steps;

    view["createdAt"] = static_cast<Json::Int64>(job.created_at_ms);
    if (job.started_at_ms > 0) view["startedAt"] = static_cast<Json::Int64>(job.started_at_ms);
    if (job.completed_at_ms > 0) view["completedAt"] = static_cast<Json::Int64>(job.completed_at_ms);

    if (job.result) {
        view["result"] = job.result->kind == JobKind::EXECUTION
            ? execution_result_view(job.result->as_execution())
            : generation_result_view(job.result->as_generation());
    }
    if (job.error) {
        view["error"]["kind"] = error_kind_to_string(job.error->kind);
        view["error"]["message"] = job.error->message;
    }
    return view;
}

ApiRoutes::ApiRoutes(std::shared_ptr<KeyValueStore> store,
                     AdmissionController& admission,
                     ProgressStore& progress,
                     ExecutionQueue& queue,
                     CircuitBreaker& circuit,
                     SyncExecutor& sync,
                     TestRunner& tests,
                     int sync_timeout_seconds)
    : store_(std::move(store)), admission_(admission), progress_(progress), queue_(queue),
      circuit_(circuit), sync_(sync), tests_(tests), sync_timeout_seconds_(sync_timeout_seconds) {}

void ApiRoutes::register_routes(HttpServer& server) {
    server.route("POST", "/api/v1/generate", [this](const HttpRequest& r) { return submit_generation(r); });
    server.route("GET", GENERATE_PREFIX, [this](const HttpRequest& r) { return generation_status(r); });
    server.route("POST", "/api/v1/execute", [this](const HttpRequest& r) { return execute_sync(r); });
    server.route("POST", "/api/v1/execute/async", [this](const HttpRequest& r) { return execute_async(r); });
    server.route("GET", JOBS_PREFIX, [this](const HttpRequest& r) { return job_status(r); });
    server.route("POST", "/api/v1/execute/tests", [this](const HttpRequest& r) { return execute_tests(r); });
    server.route("GET", "/api/v1/queue/stats", [this](const HttpRequest& r) { return queue_stats(r); });
    server.route("GET", "/health", [this](const HttpRequest& r) { return health(r); });
}

HttpResponse ApiRoutes::submit_generation(const HttpRequest& req) {
    HttpResponse resp;
    Json::Value body;
    Plan plan;
    if (!parse_body(req, body, resp) || !read_plan(req, plan, resp)) {
        return resp;
    }

    GenerationPayload payload;
    std::string error;
    if (!optional_string(body, "prompt", payload.prompt, error) ||
        !optional_string(body, "language", payload.language, error) ||
        !optional_string(body, "difficulty", payload.difficulty, error)) {
        return error_response(400, "VALIDATION_ERROR", error);
    }

    AdmissionResult r = admission_.admit(
        AdmissionRequest::for_generation(req.header("X-User-Id"), payload, plan));
    if (!r.accepted) {
        return rejection_response(r);
    }

    Json::Value out;
    out["success"] = true;
    out["jobId"] = r.job_id;
    out["statusUrl"] = GENERATE_PREFIX + r.job_id + "/status";
    if (r.deduplicated) {
        out["deduplicated"] = true;
        auto job = progress_.get(r.job_id);
        out["status"] = job ? job_status_to_string(job->status) : "queued";
    } else if (r.from_cache) {
        out["fromCache"] = true;
        out["status"] = "completed";
        if (r.cached_result) {
            out["result"] = generation_result_view(r.cached_result->as_generation());
        }
    } else {
        out["status"] = "queued";
    }
    return json_response(r.http_status, out);
}

HttpResponse ApiRoutes::status_for(const std::string& job_id) {
    if (job_id.empty()) {
        return error_response(404, "NOT_FOUND", "Job not found");
    }
    try {
        auto job = progress_.get(job_id);
        if (!job) {
            return error_response(404, "NOT_FOUND", "Job " + job_id + " not found or expired");
        }
        return json_response(200, job_status_view(*job));
    } catch (const CorruptRecordError& e) {
        std::cerr << "[API] " << e.what() << std::endl;
        return error_response(500, "INTERNAL_ERROR", "Job record is unreadable");
    }
}

HttpResponse ApiRoutes::generation_status(const HttpRequest& req) {
    // /api/v1/generate/{id}/status
    std::string rest = req.path.substr(GENERATE_PREFIX.size());
    const std::string suffix = "/status";
    if (rest.size() <= suffix.size() ||
        rest.compare(rest.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return error_response(404, "NOT_FOUND", "Not found");
    }
    return status_for(rest.substr(0, rest.size() - suffix.size()));
}

HttpResponse ApiRoutes::job_status(const HttpRequest& req) {
    std::string job_id = req.path.substr(JOBS_PREFIX.size());
    if (job_id.find('/') != std::string::npos) {
        return error_response(404, "NOT_FOUND", "Not found");
    }
    return status_for(job_id);
}

AdmissionResult ApiRoutes::admit_execution(const HttpRequest& req, const Json::Value& body,
                                           int& time_limit, std::string& error) {
    ExecutionPayload payload;
    bool ok = optional_string(body, "language", payload.language, error) &&
              optional_string(body, body.isMember("source_code") ? "source_code" : "code",
                              payload.code, error) &&
              optional_string(body, "input", payload.stdin_data, error) &&
              optional_int(body, "time_limit", payload.limits.time_limit_seconds, error) &&
              optional_int(body, "memory_limit", payload.limits.memory_limit_mb, error);
    if (!ok) {
        return AdmissionResult::rejected(AdmissionCode::VALIDATION_ERROR, error, 400, false);
    }

    Plan plan = plan_from_string(req.header("X-User-Plan")).value_or(Plan::FREE);
    time_limit = payload.limits.time_limit_seconds;
    return admission_.admit(AdmissionRequest::for_execution(req.header("X-User-Id"), payload, plan));
}

HttpResponse ApiRoutes::execute_sync(const HttpRequest& req) {
    HttpResponse resp;
    Json::Value body;
    Plan plan;
    if (!parse_body(req, body, resp) || !read_plan(req, plan, resp)) {
        return resp;
    }

    int time_limit = DEFAULT_TIME_LIMIT_SECONDS;
    std::string error;
    AdmissionResult r = admit_execution(req, body, time_limit, error);
    if (!r.accepted) {
        return rejection_response(r);
    }

    // Leave room for queueing on top of the run budget
    int wait_seconds = std::max(sync_timeout_seconds_, time_limit + 10);
    NormalizedResult result = sync_.await_result(r.job_id, wait_seconds);

    Json::Value out = execution_result_view(result);
    out["jobId"] = r.job_id;
    if (r.deduplicated) {
        out["deduplicated"] = true;
    }
    return json_response(200, out);
}

HttpResponse ApiRoutes::execute_async(const HttpRequest& req) {
    HttpResponse resp;
    Json::Value body;
    Plan plan;
    if (!parse_body(req, body, resp) || !read_plan(req, plan, resp)) {
        return resp;
    }

    int time_limit = DEFAULT_TIME_LIMIT_SECONDS;
    std::string error;
    AdmissionResult r = admit_execution(req, body, time_limit, error);
    if (!r.accepted) {
        return rejection_response(r);
    }

    Json::Value out;
    out["success"] = true;
    out["jobId"] = r.job_id;
    out["status"] = "queued";
    out["statusUrl"] = JOBS_PREFIX + r.job_id;
    if (r.deduplicated) {
        out["deduplicated"] = true;
    }
    return json_response(r.http_status, out);
}

HttpResponse ApiRoutes::execute_tests(const HttpRequest& req) {
    HttpResponse resp;
    Json::Value body;
    Plan plan;
    if (!parse_body(req, body, resp) || !read_plan(req, plan, resp)) {
        return resp;
    }

    std::string user_id = req.header("X-User-Id");
    if (user_id.empty()) {
        return error_response(400, "VALIDATION_ERROR", "Missing user id");
    }

    std::string user_code, language, function_name, error;
    if (!optional_string(body, "userCode", user_code, error) ||
        !optional_string(body, "language", language, error) ||
        !optional_string(body, "functionName", function_name, error)) {
        return error_response(400, "VALIDATION_ERROR", error);
    }
    if (user_code.empty() || language.empty() || !body["testCases"].isArray()) {
        return error_response(400, "VALIDATION_ERROR", "userCode, testCases, and language are required");
    }
    const LanguageSpec* spec = LanguageTable::find(language);
    if (!spec || !spec->executable) {
        return error_response(400, "VALIDATION_ERROR", "Unsupported language: " + language);
    }

    std::vector<TestCase> cases;
    try {
        for (const auto& item : body["testCases"]) {
            cases.push_back(test_case_from_json(item));
        }
        TestSummary summary = tests_.run(user_id, user_code, cases, spec->name, function_name, plan);
        Json::Value out = test_summary_to_json(summary);
        out["success"] = true;
        return json_response(200, out);
    } catch (const std::invalid_argument& e) {
        return error_response(400, "VALIDATION_ERROR", e.what());
    }
}

HttpResponse ApiRoutes::queue_stats(const HttpRequest&) {
    Json::Value out;
    out["success"] = true;
    for (JobKind kind : {JobKind::EXECUTION, JobKind::GENERATION}) {
        Json::Value q;
        q["length"] = static_cast<Json::Int64>(queue_.length(kind));
        q["depth"] = static_cast<Json::Int64>(queue_.depth(kind));

        CircuitBreaker::State state = circuit_.state(kind);
        q["circuit"]["open"] = state.open;
        q["circuit"]["secondsRemaining"] = static_cast<Json::Int64>(state.seconds_remaining);
        q["circuit"]["consecutiveFailures"] = static_cast<Json::Int64>(state.consecutive_failures);
        out["queues"][job_kind_to_string(kind)] = q;
    }
    return json_response(200, out);
}

HttpResponse ApiRoutes::health(const HttpRequest&) {
    Json::Value out;
    bool store_ok = false;
    try {
        store_ok = store_->ping();
    } catch (const StoreError& e) {
        std::cerr << "[API] Health check store error: " << e.what() << std::endl;
    }
    out["status"] = store_ok ? "healthy" : "unhealthy";
    out["store"] = store_ok ? "ok" : "unreachable";
    out["timestamp"] = static_cast<Json::Int64>(current_time_ms());
    return json_response(store_ok ? 200 : 503, out);
}

} // namespace capsulerun
