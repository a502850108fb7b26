#pragma once

#include "job.h"
#include "progress_store.h"
#include "execution_queue.h"
#include "circuit_breaker.h"
#include "rate_limiter.h"
#include <optional>

namespace capsulerun {

struct AdmissionRequest {
    JobKind kind = JobKind::EXECUTION;
    std::string user_id;
    Plan plan = Plan::FREE;
    ExecutionPayload execution;         // kind == EXECUTION
    GenerationPayload generation;       // kind == GENERATION

    static AdmissionRequest for_execution(const std::string& user_id, const ExecutionPayload& payload,
                                          Plan plan = Plan::FREE);
    static AdmissionRequest for_generation(const std::string& user_id, const GenerationPayload& payload,
                                           Plan plan = Plan::FREE);
};

struct AdmissionResult {
    bool accepted = false;
    std::string job_id;
    bool deduplicated = false;
    bool from_cache = false;
    std::optional<JobResult> cached_result;

    AdmissionCode error_code = AdmissionCode::NONE;
    std::string message;
    int http_status = 202;
    bool retryable = false;

    static AdmissionResult rejected(AdmissionCode code, const std::string& message,
                                    int http_status, bool retryable);
};

// Synchronous gate in front of the queues. Every check short-circuits and
// nothing here talks to the sandbox. Rejections are returned, never thrown.
class AdmissionController {
public:
    struct Config {
        int max_concurrent_generation;
        int max_concurrent_execution;
        bool semantic_cache_enabled;
        int idempotency_ttl_seconds;

        Config() :
            max_concurrent_generation(MAX_CONCURRENT_GENERATION_JOBS),
            max_concurrent_execution(MAX_CONCURRENT_EXECUTION_JOBS),
            semantic_cache_enabled(true),
            idempotency_ttl_seconds(IDEMPOTENCY_TTL_SECONDS) {}
    };

    AdmissionController(std::shared_ptr<KeyValueStore> store,
                        ProgressStore& progress,
                        ExecutionQueue& queue,
                        CircuitBreaker& circuit,
                        RateLimiter& limiter,
                        const Config& config = Config());

    AdmissionResult admit(const AdmissionRequest& request);

    // Input checks alone; empty string when valid. Canonicalizes the
    // language name and fills the default difficulty.
    static std::string validate(AdmissionRequest& request);

    // Drops the dedup record for the job's request if it still maps to
    // this job, so the same request can be admitted afresh
    void release_idempotency(const Job& job);

    static std::string idempotency_key_for(const AdmissionRequest& request);

    static constexpr const char* CIRCUIT_OPEN_MESSAGE =
        "AI generation is temporarily unavailable. Please try again in a few minutes.";

private:
    std::shared_ptr<KeyValueStore> store_;
    ProgressStore& progress_;
    ExecutionQueue& queue_;
    CircuitBreaker& circuit_;
    RateLimiter& limiter_;
    Config config_;

    AdmissionResult check_and_enqueue(const AdmissionRequest& request);
    std::optional<AdmissionResult> try_semantic_cache(const AdmissionRequest& request,
                                                      const std::string& idempotency_key);
    AdmissionResult enqueue(const AdmissionRequest& request, const std::string& idempotency_key);
    void refund_quota(const Job& job);
    int max_concurrency(JobKind kind) const;
};

} // namespace capsulerun
