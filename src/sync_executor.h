#pragma once

#include "admission_controller.h"
#include "progress_store.h"

namespace capsulerun {

// Blocking facade over the async pipeline: admit, then poll the progress
// store with growing intervals until the job ends or the caller's budget
// runs out. Never throws.
class SyncExecutor {
public:
    struct Config {
        int poll_initial_ms;
        int poll_max_ms;
        double poll_growth;

        Config() :
            poll_initial_ms(SYNC_POLL_INITIAL_MS),
            poll_max_ms(SYNC_POLL_MAX_MS),
            poll_growth(SYNC_POLL_GROWTH) {}
    };

    SyncExecutor(AdmissionController& admission, ProgressStore& progress,
                 const Config& config = Config());

    NormalizedResult execute_sync(const std::string& user_id,
                                  const std::string& language,
                                  const std::string& code,
                                  const std::string& input,
                                  int timeout_seconds,
                                  const ExecutionLimits& limits = ExecutionLimits(),
                                  Plan plan = Plan::FREE);

    // On timeout sets the job's cancel flag, frees its dedup record and
    // returns exit code 124
    NormalizedResult await_result(const std::string& job_id, int timeout_seconds);

    static NormalizedResult failure_result(const std::string& message, int exit_code = 1);

private:
    AdmissionController& admission_;
    ProgressStore& progress_;
    Config config_;
};

} // namespace capsulerun
