/*
 * CapsuleRun - Queued code execution and AI capsule generation
 * API front end and worker pool sharing one key/value store
 */

#include "config.h"
#include "http_server.h"
#include "api_routes.h"
#include "rate_limiter.h"
#include "worker.h"
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include <csignal>
#include <pthread.h>
#include <unistd.h>

using namespace capsulerun;

int main(int argc, char* argv[]) {
    ServiceConfig config;
    try {
        config = ServiceConfig::from_env();
        if (!config.apply_args(std::vector<std::string>(argv + 1, argv + argc))) {
            std::cout << ServiceConfig::usage(argv[0]);
            return 0;
        }
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        std::cerr << ServiceConfig::usage(argv[0]);
        return 1;
    }

    // Every thread inherits the blocked mask; only the signal thread receives them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::shared_ptr<KeyValueStore> store;
    try {
        store = create_store(config.store);
        if (!store->ping()) {
            throw StoreError("store did not answer PING");
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Store unavailable (" << config.store.backend << "): " << e.what() << std::endl;
        return 1;
    }

    ProgressStore progress(store);
    ExecutionQueue queue(store);
    CircuitBreaker circuit(store, config.circuit);
    RateLimiter limiter(store);
    AdmissionController admission(store, progress, queue, circuit, limiter, config.admission);
    SyncExecutor sync(admission, progress, config.sync);
    TestRunner tests(sync);

    auto transport = std::make_shared<CurlTransport>();
    SandboxClient sandbox(config.sandbox, transport);
    HttpGenerationEngine engine(config.generation_url, transport);
    InMemoryCapsuleRepository capsules;

    bool run_api = config.mode == "api" || config.mode == "all";
    bool run_workers = config.mode == "worker" || config.mode == "all";

    std::cout << "📦 CapsuleRun - Code Execution & Capsule Generation" << std::endl;
    std::cout << "   Admission • Queues • Sandboxed Workers" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Mode: " << config.mode << "  Store: " << config.store.backend << std::endl;
    std::cout << "Sandbox: " << config.sandbox.base_url << std::endl;
    std::cout << "Generation: " << config.generation_url << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    std::vector<std::unique_ptr<Worker>> workers;
    std::vector<std::thread> worker_threads;
    if (run_workers) {
        SandboxHealth health = sandbox.health_check();
        if (health.healthy) {
            std::cout << "[Sandbox] Reachable, " << health.runtimes_count << " runtimes" << std::endl;
        } else {
            std::cerr << "[Sandbox] Unreachable at startup: " << health.error << std::endl;
        }

        for (int i = 0; i < config.workers; i++) {
            workers.push_back(std::make_unique<Worker>(
                "worker-" + std::to_string(i + 1), store, progress, queue, circuit,
                sandbox, engine, capsules, config.worker));
        }
        for (auto& worker : workers) {
            Worker* w = worker.get();
            worker_threads.emplace_back([w]() { w->run(); });
        }
        std::cout << "[Main] Started " << workers.size() << " worker(s)" << std::endl;
    }

    HttpServer server(config.port);
    ApiRoutes routes(store, admission, progress, queue, circuit, sync, tests,
                     config.sync_timeout_seconds);
    routes.register_routes(server);

    std::thread signal_thread([&]() {
        int sig = 0;
        sigwait(&signals, &sig);
        std::cout << "[Main] Received signal " << sig << ", shutting down" << std::endl;
        server.stop();
        for (auto& worker : workers) {
            worker->stop();
        }
    });

    int exit_code = 0;
    if (run_api) {
        std::cout << "Endpoints:" << std::endl;
        std::cout << "  POST /api/v1/generate              - Submit a capsule generation" << std::endl;
        std::cout << "  GET  /api/v1/generate/{id}/status  - Generation progress" << std::endl;
        std::cout << "  POST /api/v1/execute               - Run code and wait for the result" << std::endl;
        std::cout << "  POST /api/v1/execute/async         - Queue code and return a job id" << std::endl;
        std::cout << "  GET  /api/v1/jobs/{id}             - Job status and result" << std::endl;
        std::cout << "  POST /api/v1/execute/tests         - Run code against test cases" << std::endl;
        std::cout << "  GET  /api/v1/queue/stats           - Queue depth and circuit state" << std::endl;
        std::cout << "  GET  /health                       - Store reachability" << std::endl;
        std::cout << std::endl;

        try {
            server.start();
        } catch (const std::runtime_error& e) {
            std::cerr << "❌ " << e.what() << std::endl;
            exit_code = 1;
            // Release the signal thread so shutdown runs
            kill(getpid(), SIGTERM);
        }
    }

    signal_thread.join();
    for (auto& t : worker_threads) {
        t.join();
    }

    for (const auto& worker : workers) {
        Worker::Stats stats = worker->stats();
        std::cout << "[Main] Worker stats: completed=" << stats.completed
                  << " failed=" << stats.failed << " skipped=" << stats.skipped
                  << " store_errors=" << stats.store_errors << std::endl;
    }
    return exit_code;
}
