#include "sync_executor.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace capsulerun {

SyncExecutor::SyncExecutor(AdmissionController& admission, ProgressStore& progress,
                           const Config& config)
    : admission_(admission), progress_(progress), config_(config) {}

NormalizedResult SyncExecutor::failure_result(const std::string& message, int exit_code) {
    NormalizedResult result;
    result.success = false;
    result.stderr_log = message;
    result.exit_code = exit_code;
    return result;
}

NormalizedResult SyncExecutor::execute_sync(const std::string& user_id,
                                            const std::string& language,
                                            const std::string& code,
                                            const std::string& input,
                                            int timeout_seconds,
                                            const ExecutionLimits& limits,
                                            Plan plan) {
    ExecutionPayload payload;
    payload.language = language;
    payload.code = code;
    payload.stdin_data = input;
    payload.limits = limits;

    AdmissionResult admitted = admission_.admit(AdmissionRequest::for_execution(user_id, payload, plan));
    if (!admitted.accepted) {
        return failure_result(admission_code_to_string(admitted.error_code) + ": " + admitted.message);
    }
    return await_result(admitted.job_id, timeout_seconds);
}

NormalizedResult SyncExecutor::await_result(const std::string& job_id, int timeout_seconds) {
    using clock = std::chrono::steady_clock;
    auto start = clock::now();
    auto deadline = start + std::chrono::seconds(timeout_seconds);
    double interval_ms = config_.poll_initial_ms;

    while (true) {
        std::optional<Job> job;
        try {
            job = progress_.get(job_id);
        } catch (const std::exception& e) {
            std::cerr << "[Sync] Polling " << job_id << " failed: " << e.what() << std::endl;
            return failure_result(std::string("Job status unavailable: ") + e.what());
        }

        if (!job) {
            return failure_result("Job " + job_id + " not found or expired");
        }
        if (job->status == JobStatus::COMPLETED) {
            if (job->result && job->result->kind == JobKind::EXECUTION) {
                return job->result->as_execution();
            }
            return failure_result("Job " + job_id + " completed without an execution result");
        }
        if (job->status == JobStatus::FAILED) {
            return failure_result(job->error ? job->error->message : "Job failed");
        }

        auto now = clock::now();
        if (now >= deadline) {
            try {
                progress_.request_cancel(job_id);
            } catch (const std::exception& e) {
                std::cerr << "[Sync] Could not flag " << job_id << " for cancel: " << e.what() << std::endl;
            }
            // A retry of the same request must get a fresh job, not this cancelled one
            admission_.release_idempotency(*job);
            std::cout << "[Sync] Gave up on " << job_id << " after " << timeout_seconds << "s" << std::endl;
            NormalizedResult timed_out = failure_result(
                "Execution timed out after " + std::to_string(timeout_seconds) + " seconds",
                TIMEOUT_EXIT_CODE);
            timed_out.execution_time_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();
            return timed_out;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto wait = std::min(std::chrono::milliseconds(static_cast<int64_t>(interval_ms)), remaining);
        std::this_thread::sleep_for(wait);
        interval_ms = std::min(interval_ms * config_.poll_growth, static_cast<double>(config_.poll_max_ms));
    }
}

} // namespace capsulerun
