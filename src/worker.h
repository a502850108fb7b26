#pragma once

#include "progress_store.h"
#include "execution_queue.h"
#include "circuit_breaker.h"
#include "sandbox_client.h"
#include "generation_engine.h"
#include "capsule_repository.h"
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace capsulerun {

// Pulls job ids off the queues and drives each job to exactly one terminal
// status. A throwing job is recorded as failed and the loop moves on.
class Worker {
public:
    struct Config {
        int pop_timeout_seconds;
        int backoff_seconds;
        int semantic_cache_ttl_seconds;
        bool semantic_cache_enabled;

        Config() :
            pop_timeout_seconds(WORKER_POP_TIMEOUT_SECONDS),
            backoff_seconds(WORKER_BACKOFF_SECONDS),
            semantic_cache_ttl_seconds(SEMANTIC_CACHE_TTL_SECONDS),
            semantic_cache_enabled(true) {}
    };

    struct Stats {
        uint64_t completed = 0;
        uint64_t failed = 0;
        uint64_t skipped = 0;
        uint64_t store_errors = 0;
    };

    Worker(std::string name,
           std::shared_ptr<KeyValueStore> store,
           ProgressStore& progress,
           ExecutionQueue& queue,
           CircuitBreaker& circuit,
           SandboxClient& sandbox,
           GenerationEngine& engine,
           CapsuleRepository& capsules,
           const Config& config = Config());

    // Blocks until stop() is called. A stop() that lands before run() starts
    // still ends the loop.
    void run();
    void stop();
    bool running() const { return running_; }

    // One dequeue attempt; true when a job was handled
    bool run_once();

    // Handles a job that was already popped
    void process(const QueuedJob& queued);

    Stats stats() const;

private:
    std::string name_;
    std::shared_ptr<KeyValueStore> store_;
    ProgressStore& progress_;
    ExecutionQueue& queue_;
    CircuitBreaker& circuit_;
    SandboxClient& sandbox_;
    GenerationEngine& engine_;
    CapsuleRepository& capsules_;
    Config config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> store_errors_{0};

    void run_execution(const Job& job);
    void run_generation(const Job& job);
    void write_failure(const std::string& job_id, ErrorKind kind, const std::string& message);
    void release_depth(JobKind kind);
    void backoff();
};

} // namespace capsulerun
