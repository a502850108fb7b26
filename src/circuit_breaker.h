#pragma once

#include "kv_store.h"
#include "job.h"
#include <memory>

namespace capsulerun {

// Shared open/closed switch per job kind. The open flag expires on its own;
// consecutive failures trip it.
class CircuitBreaker {
public:
    struct Config {
        int failure_threshold;
        int open_seconds;
        int failure_window_seconds;

        Config() :
            failure_threshold(CIRCUIT_FAILURE_THRESHOLD),
            open_seconds(CIRCUIT_OPEN_SECONDS),
            failure_window_seconds(CIRCUIT_FAILURE_WINDOW_SECONDS) {}
    };

    struct State {
        bool open = false;
        int64_t seconds_remaining = 0;
        int64_t consecutive_failures = 0;
    };

    explicit CircuitBreaker(std::shared_ptr<KeyValueStore> store, const Config& config = Config());

    static std::string state_key(JobKind kind);
    static std::string failures_key(JobKind kind);

    bool is_open(JobKind kind);
    State state(JobKind kind);

    void open(JobKind kind);
    void close(JobKind kind);

    // Returns true when this failure tripped the breaker
    bool record_failure(JobKind kind);
    void record_success(JobKind kind);

private:
    std::shared_ptr<KeyValueStore> store_;
    Config config_;
};

} // namespace capsulerun
