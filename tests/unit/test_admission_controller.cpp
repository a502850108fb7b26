#include <gtest/gtest.h>
#include "test_support.h"
#include "job_hash.h"
#include <atomic>
#include <thread>
#include <vector>

using namespace capsulerun;
using namespace capsulerun::testing_support;

namespace {

// Store whose list pushes always fail, as when the queue side of the store
// goes away mid-admission
class PushFailingStore : public MemoryStore {
public:
    int64_t push_tail(const std::string&, const std::string&) override {
        throw StoreError("Connection reset by peer");
    }
};

} // namespace

class AdmissionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        pipeline = std::make_unique<TestPipeline>();
    }

    int64_t quota_used(const std::string& user, JobKind kind) {
        return pipeline->limiter.check_quota(user, Plan::FREE, kind).used;
    }

    std::unique_ptr<TestPipeline> pipeline;
};

// ============================================================================
// Validation
// ============================================================================

TEST_F(AdmissionControllerTest, RejectsMissingPrompt) {
    auto r = pipeline->submit_generation("user-1", "   ");
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.error_code, AdmissionCode::VALIDATION_ERROR);
    EXPECT_EQ(r.http_status, 400);
    EXPECT_FALSE(r.retryable);
}

TEST_F(AdmissionControllerTest, RejectsUnsupportedLanguage) {
    auto gen = pipeline->submit_generation("user-1", "Write FizzBuzz", "cobol");
    EXPECT_EQ(gen.error_code, AdmissionCode::VALIDATION_ERROR);

    // Executable but not generatable
    auto go = pipeline->submit_generation("user-1", "Write FizzBuzz", "go");
    EXPECT_EQ(go.error_code, AdmissionCode::VALIDATION_ERROR);
    EXPECT_TRUE(pipeline->submit_execution("user-1", "package main", "go").accepted);
}

TEST_F(AdmissionControllerTest, RejectsMissingUserAndOversizedInput) {
    EXPECT_EQ(pipeline->submit_execution("", "print(1)").error_code, AdmissionCode::VALIDATION_ERROR);

    std::string huge(MAX_SOURCE_CODE_BYTES + 1, 'x');
    EXPECT_EQ(pipeline->submit_execution("user-1", huge).error_code, AdmissionCode::VALIDATION_ERROR);

    std::string long_prompt(MAX_PROMPT_LENGTH + 1, 'p');
    EXPECT_EQ(pipeline->submit_generation("user-1", long_prompt).error_code, AdmissionCode::VALIDATION_ERROR);
}

TEST_F(AdmissionControllerTest, RejectsOutOfRangeLimits) {
    ExecutionPayload payload;
    payload.language = "python";
    payload.code = "print(1)";
    payload.limits.time_limit_seconds = MAX_TIME_LIMIT_SECONDS + 1;

    auto r = pipeline->admission.admit(AdmissionRequest::for_execution("user-1", payload));
    EXPECT_EQ(r.error_code, AdmissionCode::VALIDATION_ERROR);
}

TEST_F(AdmissionControllerTest, ValidateCanonicalizesLanguage) {
    ExecutionPayload payload;
    payload.language = "Python3";
    payload.code = "print(1)";
    AdmissionRequest request = AdmissionRequest::for_execution("user-1", payload);

    EXPECT_EQ(AdmissionController::validate(request), "");
    EXPECT_EQ(request.execution.language, "python");
}

// ============================================================================
// Acceptance
// ============================================================================

TEST_F(AdmissionControllerTest, AcceptedJobIsQueuedAndCharged) {
    // When: A valid generation request arrives
    auto r = pipeline->submit_generation("user-1", "Write a function that reverses a linked list");

    // Then: 202 with a gen_ id, a queued record, a queue entry, depth and quota
    ASSERT_TRUE(r.accepted);
    EXPECT_EQ(r.http_status, 202);
    EXPECT_EQ(r.job_id.rfind("gen_", 0), 0u);

    auto job = pipeline->progress.get(r.job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::QUEUED);
    EXPECT_EQ(job->current_step, "Queued");

    EXPECT_EQ(pipeline->queue.length(JobKind::GENERATION), 1);
    EXPECT_EQ(pipeline->queue.depth(JobKind::GENERATION), 1);
    EXPECT_EQ(quota_used("user-1", JobKind::GENERATION), 1);
}

TEST_F(AdmissionControllerTest, DuplicateRequestReturnsSameJob) {
    // Given: An accepted request
    auto first = pipeline->submit_execution("user-1", "print(sum([1,2,3]))");
    ASSERT_TRUE(first.accepted);

    // When: The identical request arrives again
    auto second = pipeline->submit_execution("user-1", "print(sum([1,2,3]))");

    // Then: Same id, nothing new queued or charged
    EXPECT_TRUE(second.accepted);
    EXPECT_TRUE(second.deduplicated);
    EXPECT_EQ(second.http_status, 200);
    EXPECT_EQ(second.job_id, first.job_id);
    EXPECT_EQ(pipeline->queue.length(JobKind::EXECUTION), 1);
    EXPECT_EQ(quota_used("user-1", JobKind::EXECUTION), 1);
}

TEST_F(AdmissionControllerTest, DuplicateWindowExpires) {
    auto first = pipeline->submit_execution("user-1", "print(1)");
    JobDefinition def;
    def.kind = JobKind::EXECUTION;
    def.user_id = "user-1";
    def.language = "python";
    def.text = "print(1)";
    EXPECT_EQ(pipeline->store->get(def.idempotency_key()), first.job_id);

    // Dropping the record stands in for the window elapsing
    pipeline->store->del(def.idempotency_key());
    auto second = pipeline->submit_execution("user-1", "print(1)");
    EXPECT_FALSE(second.deduplicated);
    EXPECT_NE(second.job_id, first.job_id);
}

// ============================================================================
// Rejections Leave No Trace
// ============================================================================

TEST_F(AdmissionControllerTest, QuotaExceededOnSixthFreeGeneration) {
    for (int i = 0; i < 5; ++i) {
        auto r = pipeline->submit_generation("user-1", "Exercise number " + std::to_string(i));
        ASSERT_TRUE(r.accepted) << r.message;
        // Free the concurrency slot so only the quota can refuse
        pipeline->queue.decrement_depth(JobKind::GENERATION);
    }

    auto r = pipeline->submit_generation("user-1", "Exercise number 6");
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.error_code, AdmissionCode::QUOTA_EXCEEDED);
    EXPECT_EQ(r.http_status, 429);
    EXPECT_EQ(quota_used("user-1", JobKind::GENERATION), 5);
    EXPECT_EQ(pipeline->queue.length(JobKind::GENERATION), 5);
}

TEST_F(AdmissionControllerTest, RacingAdmissionsCannotExceedQuota) {
    // Given: A free user with one generation left today
    for (int i = 0; i < 4; ++i) {
        pipeline->limiter.charge("user-1", JobKind::GENERATION);
    }

    // When: Several distinct requests race through admission
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t, &accepted]() {
            if (pipeline->submit_generation("user-1", "Racing prompt " + std::to_string(t)).accepted) {
                ++accepted;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    // Then: Only one got through and the counter stops at the limit
    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(quota_used("user-1", JobKind::GENERATION), 5);
    EXPECT_EQ(pipeline->queue.length(JobKind::GENERATION), 1);
}

TEST_F(AdmissionControllerTest, QueueFullAtConcurrencyCap) {
    // Given: Five generation jobs in flight
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(pipeline->submit_generation("user-" + std::to_string(i), "Prompt " + std::to_string(i)).accepted);
    }
    ASSERT_EQ(pipeline->queue.depth(JobKind::GENERATION), 5);

    // When: A sixth distinct request arrives
    auto r = pipeline->submit_generation("user-9", "Prompt 9");

    // Then: Refused as retryable and not charged
    EXPECT_EQ(r.error_code, AdmissionCode::QUEUE_FULL);
    EXPECT_EQ(r.http_status, 429);
    EXPECT_TRUE(r.retryable);
    EXPECT_EQ(quota_used("user-9", JobKind::GENERATION), 0);
    EXPECT_EQ(pipeline->queue.length(JobKind::GENERATION), 5);

    // And: Accepted again once a slot frees up
    pipeline->queue.decrement_depth(JobKind::GENERATION);
    EXPECT_TRUE(pipeline->submit_generation("user-9", "Prompt 9").accepted);
}

TEST_F(AdmissionControllerTest, CircuitOpenWritesNothing) {
    // Given: An open generation circuit
    pipeline->circuit.open(JobKind::GENERATION);

    // When: A request arrives
    auto r = pipeline->submit_generation("user-1", "Write FizzBuzz");

    // Then: 503 with the user-facing message, and no job, queue entry or charge
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.error_code, AdmissionCode::CIRCUIT_OPEN);
    EXPECT_EQ(r.http_status, 503);
    EXPECT_EQ(r.message, AdmissionController::CIRCUIT_OPEN_MESSAGE);
    EXPECT_TRUE(r.job_id.empty());
    EXPECT_EQ(pipeline->queue.length(JobKind::GENERATION), 0);
    EXPECT_EQ(pipeline->queue.depth(JobKind::GENERATION), 0);
    EXPECT_EQ(quota_used("user-1", JobKind::GENERATION), 0);

    // And: No idempotency record was left behind
    GenerationPayload payload;
    payload.prompt = "Write FizzBuzz";
    payload.language = "python";
    AdmissionRequest request = AdmissionRequest::for_generation("user-1", payload);
    ASSERT_TRUE(AdmissionController::validate(request).empty());
    EXPECT_FALSE(pipeline->store->get(AdmissionController::idempotency_key_for(request)).has_value());

    // Execution is unaffected
    EXPECT_TRUE(pipeline->submit_execution("user-1", "print(1)").accepted);

    // And: Once the circuit closes the same request is admitted as new work
    pipeline->circuit.close(JobKind::GENERATION);
    auto retried = pipeline->submit_generation("user-1", "Write FizzBuzz");
    EXPECT_TRUE(retried.accepted);
    EXPECT_FALSE(retried.deduplicated);
    EXPECT_EQ(retried.http_status, 202);
}

// ============================================================================
// Semantic Cache
// ============================================================================

TEST_F(AdmissionControllerTest, CacheHitCompletesWithoutQueueOrCharge) {
    // Given: A cached generation for a prompt
    GenerationResult cached;
    cached.content["title"] = "Reverse a list";
    cached.quality_score = 0.9;
    pipeline->store->set(semantic_cache_key("python", "Reverse a list"),
                         JsonUtils::write_compact(generation_result_to_json(cached)), 3600);

    // When: Another user asks for the same prompt, formatted differently
    auto r = pipeline->submit_generation("user-2", "  reverse A   list ");

    // Then: Answered from cache
    ASSERT_TRUE(r.accepted);
    EXPECT_TRUE(r.from_cache);
    EXPECT_EQ(r.http_status, 200);
    EXPECT_EQ(r.job_id.rfind("cached_", 0), 0u);
    ASSERT_TRUE(r.cached_result.has_value());
    EXPECT_TRUE(r.cached_result->as_generation().from_cache);

    auto job = pipeline->progress.get(r.job_id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::COMPLETED);
    EXPECT_EQ(job->progress, 100);

    EXPECT_EQ(pipeline->queue.length(JobKind::GENERATION), 0);
    EXPECT_EQ(pipeline->queue.depth(JobKind::GENERATION), 0);
    EXPECT_EQ(quota_used("user-2", JobKind::GENERATION), 0);

    // And: Repeating the request returns the same cached job
    auto again = pipeline->submit_generation("user-2", "  reverse A   list ");
    EXPECT_TRUE(again.deduplicated);
    EXPECT_EQ(again.job_id, r.job_id);
}

TEST_F(AdmissionControllerTest, CacheDisabledAlwaysQueues) {
    AdmissionController::Config config;
    config.semantic_cache_enabled = false;
    TestPipeline p(std::make_shared<MemoryStore>(), config);

    GenerationResult cached;
    cached.content["title"] = "x";
    p.store->set(semantic_cache_key("python", "Reverse a list"),
                 JsonUtils::write_compact(generation_result_to_json(cached)));

    auto r = p.submit_generation("user-1", "Reverse a list");
    EXPECT_FALSE(r.from_cache);
    EXPECT_EQ(r.http_status, 202);
}

// ============================================================================
// Store Failures
// ============================================================================

TEST_F(AdmissionControllerTest, PushFailureMarksJobFailedWithoutCharge) {
    // Given: A store that accepts records but cannot push onto queues
    TestPipeline p(std::make_shared<PushFailingStore>());

    // When: A request is admitted
    auto r = p.submit_execution("user-1", "print(1)");

    // Then: 500 INTERNAL_ERROR, nothing charged, no depth held
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.error_code, AdmissionCode::INTERNAL_ERROR);
    EXPECT_EQ(r.http_status, 500);
    EXPECT_EQ(p.limiter.check_quota("user-1", Plan::FREE, JobKind::EXECUTION).used, 0);
    EXPECT_EQ(p.queue.depth(JobKind::EXECUTION), 0);
}

TEST_F(AdmissionControllerTest, UnreachableStoreIsInternalError) {
    pipeline->store->fail_next(1);
    auto r = pipeline->submit_execution("user-1", "print(1)");

    EXPECT_EQ(r.error_code, AdmissionCode::INTERNAL_ERROR);
    EXPECT_EQ(r.http_status, 500);
    EXPECT_TRUE(r.retryable);
}
