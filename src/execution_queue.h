#pragma once

#include "kv_store.h"
#include "job.h"
#include <memory>
#include <optional>

namespace capsulerun {

// A dequeued job reference: the queue carries ids, the record lives in the
// progress store
struct QueuedJob {
    JobKind kind;
    std::string job_id;
};

// FIFO queues per job kind plus the shared depth counter the concurrency cap
// reads. Depth counts admitted jobs that have not reached a terminal state.
class ExecutionQueue {
public:
    explicit ExecutionQueue(std::shared_ptr<KeyValueStore> store);

    static std::string queue_key(JobKind kind);
    static std::string depth_key(JobKind kind);

    void enqueue(JobKind kind, const std::string& job_id);

    // Execution is polled before generation. nullopt on timeout
    std::optional<QueuedJob> dequeue_blocking(int timeout_seconds);

    int64_t length(JobKind kind);
    int64_t depth(JobKind kind);

    int64_t increment_depth(JobKind kind);

    // Floored at zero
    int64_t decrement_depth(JobKind kind);

private:
    std::shared_ptr<KeyValueStore> store_;
};

} // namespace capsulerun
