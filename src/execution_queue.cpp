#include "execution_queue.h"
#include <algorithm>
#include <iostream>

namespace capsulerun {

ExecutionQueue::ExecutionQueue(std::shared_ptr<KeyValueStore> store)
    : store_(std::move(store)) {}

std::string ExecutionQueue::queue_key(JobKind kind) {
    return "queue:" + job_kind_to_string(kind);
}

std::string ExecutionQueue::depth_key(JobKind kind) {
    return "system:queue:" + job_kind_to_string(kind) + ":depth";
}

void ExecutionQueue::enqueue(JobKind kind, const std::string& job_id) {
    store_->push_tail(queue_key(kind), job_id);
}

std::optional<QueuedJob> ExecutionQueue::dequeue_blocking(int timeout_seconds) {
    static const std::vector<std::string> keys = {
        queue_key(JobKind::EXECUTION),
        queue_key(JobKind::GENERATION)
    };

    auto popped = store_->pop_head_blocking(keys, timeout_seconds);
    if (!popped) {
        return std::nullopt;
    }

    JobKind kind = popped->first == keys[0] ? JobKind::EXECUTION : JobKind::GENERATION;
    return QueuedJob{kind, popped->second};
}

int64_t ExecutionQueue::length(JobKind kind) {
    return store_->list_length(queue_key(kind));
}

int64_t ExecutionQueue::depth(JobKind kind) {
    auto raw = store_->get(depth_key(kind));
    if (!raw) {
        return 0;
    }
    try {
        return std::max<int64_t>(0, std::stoll(*raw));
    } catch (const std::exception&) {
        std::cerr << "[Queue] Non-numeric depth counter for "
                  << job_kind_to_string(kind) << ", treating as 0" << std::endl;
        return 0;
    }
}

int64_t ExecutionQueue::increment_depth(JobKind kind) {
    return store_->incr_by(depth_key(kind), 1, QUEUE_DEPTH_TTL_SECONDS);
}

int64_t ExecutionQueue::decrement_depth(JobKind kind) {
    std::string key = depth_key(kind);
    int64_t value = store_->incr_by(key, -1, QUEUE_DEPTH_TTL_SECONDS);
    if (value < 0) {
        // Drift from an expired counter; pull it back to zero unless someone
        // already moved it
        store_->compare_and_set(key, std::to_string(value), "0", QUEUE_DEPTH_TTL_SECONDS);
        return 0;
    }
    return value;
}

} // namespace capsulerun
