#pragma once

#include "kv_store.h"
#include "sandbox_client.h"
#include "admission_controller.h"
#include "circuit_breaker.h"
#include "worker.h"
#include "sync_executor.h"
#include <functional>
#include <string>
#include <vector>

namespace capsulerun {

// Runtime configuration: constants.h defaults, then environment, then argv
struct ServiceConfig {
    std::string mode = "all";               // api | worker | all
    int port = DEFAULT_PORT;
    int workers = 1;
    int sync_timeout_seconds = DEFAULT_SYNC_TIMEOUT_SECONDS;
    std::string generation_url = "http://localhost:3001/api/generate";

    StoreConfig store;
    SandboxConfig sandbox;
    AdmissionController::Config admission;
    CircuitBreaker::Config circuit;
    Worker::Config worker;
    SyncExecutor::Config sync;

    using EnvLookup = std::function<const char*(const char*)>;

    // Throws std::invalid_argument on malformed numeric values
    static ServiceConfig from_env(const EnvLookup& lookup);
    static ServiceConfig from_env();

    // Returns false when --help was requested. Throws std::invalid_argument
    // on unknown flags or bad values.
    bool apply_args(const std::vector<std::string>& args);

    // Throws std::invalid_argument when the combination cannot work
    void validate() const;

    static std::string usage(const std::string& program);
};

} // namespace capsulerun
