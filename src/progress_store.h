#pragma once

#include "kv_store.h"
#include "job.h"
#include <memory>
#include <optional>

namespace capsulerun {

// Job records keyed by id, each write refreshing the TTL. Status changes go
// through compare-and-set so concurrent writers cannot move a job backwards.
class ProgressStore {
public:
    explicit ProgressStore(std::shared_ptr<KeyValueStore> store,
                           int ttl_seconds = JOB_TTL_SECONDS);

    static std::string job_key(const std::string& job_id);
    static std::string cancel_key(const std::string& job_id);

    // Initial write of a new record; fails if the id already exists
    bool create(const Job& job);

    // nullopt when unknown or expired. Throws CorruptRecordError on bad JSON
    std::optional<Job> get(const std::string& job_id);

    // queued -> processing
    bool mark_processing(const std::string& job_id);

    // processing only; progress never decreases
    bool update_progress(const std::string& job_id, int progress, const std::string& step);

    // Terminal writes; false when the job is missing or already terminal
    bool complete(const std::string& job_id, const JobResult& result);
    bool fail(const std::string& job_id, ErrorKind kind, const std::string& message);

    void request_cancel(const std::string& job_id);
    bool is_cancelled(const std::string& job_id);

private:
    std::shared_ptr<KeyValueStore> store_;
    int ttl_seconds_;

    // Read-modify-CAS loop; mutate returns false to abort
    template <typename Mutator>
    bool update(const std::string& job_id, Mutator mutate);
};

} // namespace capsulerun
