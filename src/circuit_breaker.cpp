#include "circuit_breaker.h"
#include <algorithm>
#include <iostream>

namespace capsulerun {

CircuitBreaker::CircuitBreaker(std::shared_ptr<KeyValueStore> store, const Config& config)
    : store_(std::move(store)), config_(config) {}

std::string CircuitBreaker::state_key(JobKind kind) {
    return "system:circuit:" + job_kind_to_string(kind);
}

std::string CircuitBreaker::failures_key(JobKind kind) {
    return state_key(kind) + ":failures";
}

bool CircuitBreaker::is_open(JobKind kind) {
    auto value = store_->get(state_key(kind));
    return value && *value == "open";
}

CircuitBreaker::State CircuitBreaker::state(JobKind kind) {
    State s;
    s.open = is_open(kind);
    if (s.open) {
        s.seconds_remaining = std::max<int64_t>(0, store_->ttl(state_key(kind)));
    }
    auto failures = store_->get(failures_key(kind));
    if (failures) {
        try {
            s.consecutive_failures = std::stoll(*failures);
        } catch (const std::exception&) {
            s.consecutive_failures = 0;
        }
    }
    return s;
}

void CircuitBreaker::open(JobKind kind) {
    store_->set(state_key(kind), "open", config_.open_seconds);
    std::cerr << "[Circuit] " << job_kind_to_string(kind) << " circuit OPEN for "
              << config_.open_seconds << "s" << std::endl;
}

void CircuitBreaker::close(JobKind kind) {
    store_->del(state_key(kind));
    store_->del(failures_key(kind));
    std::cout << "[Circuit] " << job_kind_to_string(kind) << " circuit closed" << std::endl;
}

bool CircuitBreaker::record_failure(JobKind kind) {
    int64_t failures = store_->incr_by(failures_key(kind), 1, config_.failure_window_seconds);
    if (failures < config_.failure_threshold) {
        return false;
    }
    // Failures past the threshold reopen a circuit whose open flag expired
    if (!is_open(kind)) {
        open(kind);
        return true;
    }
    return false;
}

void CircuitBreaker::record_success(JobKind kind) {
    store_->del(failures_key(kind));
}

} // namespace capsulerun
