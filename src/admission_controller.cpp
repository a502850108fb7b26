#include "admission_controller.h"
#include "job_hash.h"
#include "json_utils.h"
#include "language_table.h"
#include <iostream>

namespace capsulerun {

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

AdmissionRequest AdmissionRequest::for_execution(const std::string& user_id,
                                                 const ExecutionPayload& payload, Plan plan) {
    AdmissionRequest req;
    req.kind = JobKind::EXECUTION;
    req.user_id = user_id;
    req.plan = plan;
    req.execution = payload;
    return req;
}

AdmissionRequest AdmissionRequest::for_generation(const std::string& user_id,
                                                  const GenerationPayload& payload, Plan plan) {
    AdmissionRequest req;
    req.kind = JobKind::GENERATION;
    req.user_id = user_id;
    req.plan = plan;
    req.generation = payload;
    return req;
}

AdmissionResult AdmissionResult::rejected(AdmissionCode code, const std::string& message,
                                          int http_status, bool retryable) {
    AdmissionResult r;
    r.accepted = false;
    r.error_code = code;
    r.message = message;
    r.http_status = http_status;
    r.retryable = retryable;
    return r;
}

AdmissionController::AdmissionController(std::shared_ptr<KeyValueStore> store,
                                         ProgressStore& progress,
                                         ExecutionQueue& queue,
                                         CircuitBreaker& circuit,
                                         RateLimiter& limiter,
                                         const Config& config)
    : store_(std::move(store)), progress_(progress), queue_(queue),
      circuit_(circuit), limiter_(limiter), config_(config) {}

int AdmissionController::max_concurrency(JobKind kind) const {
    return kind == JobKind::GENERATION ? config_.max_concurrent_generation
                                       : config_.max_concurrent_execution;
}

std::string AdmissionController::validate(AdmissionRequest& request) {
    if (is_blank(request.user_id)) {
        return "Missing user id";
    }

    if (request.kind == JobKind::GENERATION) {
        auto& gen = request.generation;
        if (is_blank(gen.prompt)) {
            return "prompt is required";
        }
        if (gen.prompt.size() > MAX_PROMPT_LENGTH) {
            return "prompt exceeds " + std::to_string(MAX_PROMPT_LENGTH) + " characters";
        }
        const LanguageSpec* spec = LanguageTable::find(gen.language);
        if (!spec || !spec->generatable) {
            return "Unsupported language for generation: '" + gen.language +
                   "'. Supported: " + LanguageTable::generatable_names();
        }
        gen.language = spec->name;
        if (gen.difficulty.empty()) {
            gen.difficulty = "medium";
        }
        if (gen.difficulty != "easy" && gen.difficulty != "medium" && gen.difficulty != "hard") {
            return "difficulty must be one of easy, medium, hard";
        }
        return "";
    }

    auto& exec = request.execution;
    if (is_blank(exec.code)) {
        return "source_code is required";
    }
    if (exec.code.size() > MAX_SOURCE_CODE_BYTES) {
        return "source_code exceeds " + std::to_string(MAX_SOURCE_CODE_BYTES / 1024) + "KB";
    }
    if (exec.stdin_data.size() > MAX_STDIN_BYTES) {
        return "input exceeds " + std::to_string(MAX_STDIN_BYTES / 1024) + "KB";
    }
    const LanguageSpec* spec = LanguageTable::find(exec.language);
    if (!spec || !spec->executable) {
        return "Unsupported language: '" + exec.language +
               "'. Supported: " + LanguageTable::executable_names();
    }
    exec.language = spec->name;
    if (exec.limits.time_limit_seconds < MIN_TIME_LIMIT_SECONDS ||
        exec.limits.time_limit_seconds > MAX_TIME_LIMIT_SECONDS) {
        return "time_limit must be between " + std::to_string(MIN_TIME_LIMIT_SECONDS) +
               " and " + std::to_string(MAX_TIME_LIMIT_SECONDS) + " seconds";
    }
    if (exec.limits.memory_limit_mb < MIN_MEMORY_LIMIT_MB ||
        exec.limits.memory_limit_mb > MAX_MEMORY_LIMIT_MB) {
        return "memory_limit must be between " + std::to_string(MIN_MEMORY_LIMIT_MB) +
               " and " + std::to_string(MAX_MEMORY_LIMIT_MB) + " MB";
    }
    return "";
}

AdmissionResult AdmissionController::admit(const AdmissionRequest& request) {
    try {
        return check_and_enqueue(request);
    } catch (const StoreError& e) {
        std::cerr << "[Admission] Store unavailable: " << e.what() << std::endl;
        return AdmissionResult::rejected(AdmissionCode::INTERNAL_ERROR,
                                         "Job store is unavailable. Please try again.", 500, true);
    }
}

std::string AdmissionController::idempotency_key_for(const AdmissionRequest& request) {
    JobDefinition def;
    def.kind = request.kind;
    def.user_id = request.user_id;
    if (request.kind == JobKind::GENERATION) {
        def.language = request.generation.language;
        def.text = request.generation.prompt;
    } else {
        def.language = request.execution.language;
        def.text = request.execution.code;
        def.stdin_data = request.execution.stdin_data;
    }
    return def.idempotency_key();
}

void AdmissionController::release_idempotency(const Job& job) {
    AdmissionRequest request = job.kind == JobKind::GENERATION
        ? AdmissionRequest::for_generation(job.user_id, job.generation())
        : AdmissionRequest::for_execution(job.user_id, job.execution());
    std::string key = idempotency_key_for(request);
    try {
        // Leave the record alone if it already points at a newer job
        auto current = store_->get(key);
        if (current && *current == job.id) {
            store_->del(key);
            std::cout << "[Admission] Released idempotency record for " << job.id << std::endl;
        }
    } catch (const StoreError& e) {
        std::cerr << "[Admission] Could not release idempotency for " << job.id << ": " << e.what() << std::endl;
    }
}

AdmissionResult AdmissionController::check_and_enqueue(const AdmissionRequest& original) {
    AdmissionRequest request = original;

    // 1. Input validation
    std::string invalid = validate(request);
    if (!invalid.empty()) {
        return AdmissionResult::rejected(AdmissionCode::VALIDATION_ERROR, invalid, 400, false);
    }

    // 2. Circuit breaker
    if (circuit_.is_open(request.kind)) {
        std::string message = request.kind == JobKind::GENERATION
            ? CIRCUIT_OPEN_MESSAGE
            : "Code execution is temporarily unavailable. Please try again in a few minutes.";
        return AdmissionResult::rejected(AdmissionCode::CIRCUIT_OPEN, message, 503, true);
    }

    // 3. Idempotency
    std::string idempotency_key = idempotency_key_for(request);

    auto existing = store_->get(idempotency_key);
    if (existing) {
        std::cout << "[Admission] Duplicate request from " << request.user_id
                  << ", returning " << *existing << std::endl;
        AdmissionResult r;
        r.accepted = true;
        r.job_id = *existing;
        r.deduplicated = true;
        r.http_status = 200;
        return r;
    }

    // 4. Daily quota
    auto quota = limiter_.check_quota(request.user_id, request.plan, request.kind);
    if (!quota.can_submit) {
        return AdmissionResult::rejected(AdmissionCode::QUOTA_EXCEEDED, quota.reason, 429, true);
    }

    // 5. Concurrency cap
    int64_t depth = queue_.depth(request.kind);
    if (depth >= max_concurrency(request.kind)) {
        return AdmissionResult::rejected(
            AdmissionCode::QUEUE_FULL,
            "Too many " + job_kind_to_string(request.kind) + " jobs in progress (" +
                std::to_string(depth) + "). Please retry shortly.",
            429, true);
    }

    // 6. Semantic cache
    if (request.kind == JobKind::GENERATION && config_.semantic_cache_enabled) {
        auto cached = try_semantic_cache(request, idempotency_key);
        if (cached) {
            return *cached;
        }
    }

    // 7. Enqueue
    return enqueue(request, idempotency_key);
}

std::optional<AdmissionResult> AdmissionController::try_semantic_cache(
        const AdmissionRequest& request, const std::string& idempotency_key) {
    std::string cache_key = semantic_cache_key(request.generation.language, request.generation.prompt);
    auto raw = store_->get(cache_key);
    if (!raw) {
        return std::nullopt;
    }

    GenerationResult cached;
    try {
        cached = generation_result_from_json(JsonUtils::parse_or_throw(*raw));
    } catch (const std::runtime_error& e) {
        std::cerr << "[Admission] Ignoring unreadable cache entry " << cache_key
                  << ": " << e.what() << std::endl;
        return std::nullopt;
    }
    cached.from_cache = true;

    Job job;
    job.id = generate_job_id("cached");
    job.kind = JobKind::GENERATION;
    job.user_id = request.user_id;
    job.payload = request.generation;
    job.status = JobStatus::COMPLETED;
    job.progress = 100;
    job.current_step = "Done!";
    job.created_at_ms = current_time_ms();
    job.started_at_ms = job.created_at_ms;
    job.completed_at_ms = job.created_at_ms;
    job.result = JobResult::generation(cached);

    if (!progress_.create(job)) {
        std::cerr << "[Admission] Cached job id collision for " << job.id << std::endl;
        return std::nullopt;
    }
    try {
        store_->set_if_absent(idempotency_key, job.id, config_.idempotency_ttl_seconds);
    } catch (const StoreError& e) {
        std::cerr << "[Admission] Could not record idempotency for " << job.id << ": " << e.what() << std::endl;
    }

    std::cout << "[Admission] Semantic cache hit for " << request.user_id << " -> " << job.id << std::endl;
    AdmissionResult r;
    r.accepted = true;
    r.job_id = job.id;
    r.from_cache = true;
    r.cached_result = job.result;
    r.http_status = 200;
    return r;
}

void AdmissionController::refund_quota(const Job& job) {
    try {
        limiter_.refund(job.user_id, job.kind);
    } catch (const StoreError& e) {
        std::cerr << "[Admission] Quota refund failed for " << job.id << ": " << e.what() << std::endl;
    }
}

AdmissionResult AdmissionController::enqueue(const AdmissionRequest& request,
                                             const std::string& idempotency_key) {
    Job job;
    job.id = generate_job_id(job_id_prefix(request.kind));
    job.kind = request.kind;
    job.user_id = request.user_id;
    if (request.kind == JobKind::GENERATION) {
        job.payload = request.generation;
    } else {
        job.payload = request.execution;
    }
    job.status = JobStatus::QUEUED;
    job.current_step = "Queued";
    job.created_at_ms = current_time_ms();

    // Quota is taken with one atomic increment so racing admissions cannot
    // overshoot the limit; it is handed back if the job never reaches the queue
    auto quota = limiter_.reserve(request.user_id, request.plan, request.kind);
    if (!quota.can_submit) {
        return AdmissionResult::rejected(AdmissionCode::QUOTA_EXCEEDED, quota.reason, 429, true);
    }

    try {
        if (!progress_.create(job)) {
            refund_quota(job);
            return AdmissionResult::rejected(AdmissionCode::INTERNAL_ERROR,
                                             "Job id collision, please retry", 500, true);
        }
    } catch (const StoreError& e) {
        std::cerr << "[Admission] Failed to write job " << job.id << ": " << e.what() << std::endl;
        refund_quota(job);
        return AdmissionResult::rejected(AdmissionCode::INTERNAL_ERROR,
                                         "Failed to create job", 500, true);
    }

    try {
        queue_.enqueue(job.kind, job.id);
    } catch (const StoreError& e) {
        std::cerr << "[Admission] Failed to enqueue " << job.id << ": " << e.what() << std::endl;
        try {
            progress_.fail(job.id, ErrorKind::INTERNAL, "Failed to enqueue job");
        } catch (const std::exception& mark_error) {
            std::cerr << "[Admission] Could not mark " << job.id << " failed: "
                      << mark_error.what() << std::endl;
        }
        refund_quota(job);
        return AdmissionResult::rejected(AdmissionCode::INTERNAL_ERROR,
                                         "Failed to enqueue job", 500, true);
    }

    // Past this point the job is durable; bookkeeping failures are tolerated
    try {
        if (!store_->set_if_absent(idempotency_key, job.id, config_.idempotency_ttl_seconds)) {
            std::cerr << "[Admission] Concurrent duplicate of " << job.id << " already recorded" << std::endl;
        }
    } catch (const StoreError& e) {
        std::cerr << "[Admission] Idempotency write failed for " << job.id << ": " << e.what() << std::endl;
    }

    try {
        queue_.increment_depth(job.kind);
    } catch (const StoreError& e) {
        std::cerr << "[Admission] Depth increment failed for " << job.id << ": " << e.what() << std::endl;
    }

    std::cout << "[Admission] Queued " << job.id << " for " << job.user_id << std::endl;
    AdmissionResult r;
    r.accepted = true;
    r.job_id = job.id;
    r.http_status = 202;
    return r;
}

} // namespace capsulerun
