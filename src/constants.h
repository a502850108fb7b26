#pragma once

#include <cstddef>  // for size_t

namespace capsulerun {

// Input limits
constexpr size_t MAX_SOURCE_CODE_BYTES = 50 * 1024;               // 50KB of source
constexpr size_t MAX_PROMPT_LENGTH = 4000;                        // Generation prompt chars
constexpr size_t MAX_STDIN_BYTES = 64 * 1024;                     // 64KB of stdin
constexpr size_t MAX_REQUEST_SIZE = 512 * 1024;                   // 512KB max request
constexpr size_t MAX_TEST_CASES = 5;                              // Test cases run per request

// Sandbox limits
constexpr int DEFAULT_TIME_LIMIT_SECONDS = 10;                    // Run timeout
constexpr int MIN_TIME_LIMIT_SECONDS = 1;
constexpr int MAX_TIME_LIMIT_SECONDS = 30;
constexpr int DEFAULT_COMPILE_TIMEOUT_MS = 10 * 1000;             // Compile timeout
constexpr int DEFAULT_MEMORY_LIMIT_MB = 128;                      // Run memory ceiling
constexpr int MIN_MEMORY_LIMIT_MB = 16;
constexpr int MAX_MEMORY_LIMIT_MB = 512;
constexpr int SANDBOX_HTTP_SLACK_MS = 5 * 1000;                   // Transport timeout on top of limits
constexpr int HARNESS_TIME_LIMIT_SECONDS = 3;                     // Per test case

// Store TTLs
constexpr int JOB_TTL_SECONDS = 60 * 60;                          // Job records live 1 hour
constexpr int IDEMPOTENCY_TTL_SECONDS = 10 * 60;                  // Dedup window
constexpr int SEMANTIC_CACHE_TTL_SECONDS = 60 * 60;               // Cached generations
constexpr int QUEUE_DEPTH_TTL_SECONDS = 10 * 60;                  // Depth counter self-heals when idle
constexpr int QUOTA_TTL_SECONDS = 24 * 60 * 60;                   // Daily quota buckets
constexpr int CANCEL_FLAG_TTL_SECONDS = 10 * 60;

// Circuit breaker
constexpr int CIRCUIT_FAILURE_THRESHOLD = 5;                      // Consecutive failures to trip
constexpr int CIRCUIT_OPEN_SECONDS = 5 * 60;                      // Auto-reset after 5 minutes
constexpr int CIRCUIT_FAILURE_WINDOW_SECONDS = 10 * 60;

// Concurrency caps
constexpr int MAX_CONCURRENT_GENERATION_JOBS = 5;
constexpr int MAX_CONCURRENT_EXECUTION_JOBS = 50;

// Worker
constexpr int WORKER_POP_TIMEOUT_SECONDS = 5;                     // Wakes to observe stop requests
constexpr int WORKER_BACKOFF_SECONDS = 5;                         // After store connectivity errors
constexpr int GENERATION_TIMEOUT_MS = 55 * 1000;

// Synchronous facade polling
constexpr int SYNC_POLL_INITIAL_MS = 250;
constexpr int SYNC_POLL_MAX_MS = 2000;
constexpr double SYNC_POLL_GROWTH = 1.5;
constexpr int DEFAULT_SYNC_TIMEOUT_SECONDS = 30;
constexpr int TIMEOUT_EXIT_CODE = 124;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                      // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 8080;                                // Default server port
constexpr int LISTEN_BACKLOG = 64;                                // Socket listen backlog
constexpr int DEFAULT_REDIS_PORT = 6379;

} // namespace capsulerun
