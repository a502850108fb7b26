#pragma once

/**
 * Shared fakes for tests: a scripted HTTP transport standing in for the
 * sandbox, a scripted generation engine, and a fully wired pipeline on the
 * in-process store.
 */

#include "memory_store.h"
#include "admission_controller.h"
#include "worker.h"
#include "sync_executor.h"
#include "test_runner.h"
#include "json_utils.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace capsulerun {
namespace testing_support {

// Body of a successful Piston reply
inline std::string piston_reply(const std::string& stdout_text, int code = 0,
                                const std::string& stderr_text = "") {
    Json::Value run;
    run["stdout"] = stdout_text;
    run["stderr"] = stderr_text;
    run["output"] = stdout_text + stderr_text;
    run["code"] = code;
    run["signal"] = Json::Value(Json::nullValue);
    run["memory"] = 2048000;
    run["wall_time"] = 12;

    Json::Value body;
    body["language"] = "python";
    body["version"] = "3.10.0";
    body["run"] = run;
    return JsonUtils::write_compact(body);
}

class FakeTransport : public HttpTransport {
public:
    using Handler = std::function<ClientResponse(const std::string& url, const std::string& body)>;

    explicit FakeTransport(Handler handler) : handler_(std::move(handler)) {}

    // Replies 200 with the given stdout to every request
    static std::shared_ptr<FakeTransport> replying(const std::string& stdout_text) {
        return std::make_shared<FakeTransport>([stdout_text](const std::string&, const std::string&) {
            return ClientResponse{200, piston_reply(stdout_text)};
        });
    }

    // Throws on every request, like an unreachable host
    static std::shared_ptr<FakeTransport> unreachable() {
        return std::make_shared<FakeTransport>([](const std::string&, const std::string&) -> ClientResponse {
            throw std::runtime_error("Couldn't connect to server");
        });
    }

    ClientResponse post_json(const std::string& url, const std::string& json_body, long) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_;
            last_url_ = url;
            last_body_ = json_body;
            handler = handler_;
        }
        return handler(url, json_body);
    }

    ClientResponse get(const std::string& url, long timeout_ms) override {
        return post_json(url, "", timeout_ms);
    }

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    int calls() const { return calls_; }

    std::string last_url() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_url_;
    }

    std::string last_body() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_body_;
    }

private:
    std::mutex mutex_;
    Handler handler_;
    std::atomic<int> calls_{0};
    std::string last_url_;
    std::string last_body_;
};

class FakeEngine : public GenerationEngine {
public:
    FakeEngine() {
        outcome_.success = true;
        outcome_.content["title"] = "Two Sum";
        outcome_.content["language"] = "python";
        outcome_.quality_score = 0.87;
        outcome_.stage_timings_ms["planner"] = 1200;
        outcome_.stage_timings_ms["validator"] = 800;
        outcome_.duration_ms = 2000;
    }

    GenerationOutcome generate(const GenerationContext& context) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        last_context_ = context;
        if (throw_message_) {
            throw std::runtime_error(*throw_message_);
        }
        return outcome_;
    }

    void fail_with(const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_ = GenerationOutcome();
        outcome_.success = false;
        outcome_.error = error;
    }

    void throw_with(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        throw_message_ = message;
    }

    int calls() const { return calls_; }

    GenerationContext last_context() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_context_;
    }

private:
    std::mutex mutex_;
    GenerationOutcome outcome_;
    std::optional<std::string> throw_message_;
    std::atomic<int> calls_{0};
    GenerationContext last_context_;
};

inline Worker::Config fast_worker_config() {
    Worker::Config config;
    config.pop_timeout_seconds = 1;
    config.backoff_seconds = 1;
    return config;
}

inline SyncExecutor::Config fast_sync_config() {
    SyncExecutor::Config config;
    config.poll_initial_ms = 10;
    config.poll_max_ms = 50;
    return config;
}

// Every component wired to one in-process store, as a single-node process
// would wire them. The worker is not started; call worker.process() or
// worker.run_once() to drive jobs, or run it on a thread.
struct TestPipeline {
    std::shared_ptr<MemoryStore> store;
    ProgressStore progress;
    ExecutionQueue queue;
    CircuitBreaker circuit;
    RateLimiter limiter;
    AdmissionController admission;
    std::shared_ptr<FakeTransport> transport;
    SandboxClient sandbox;
    FakeEngine engine;
    InMemoryCapsuleRepository capsules;
    Worker worker;
    SyncExecutor sync;
    TestRunner tests;

    explicit TestPipeline(std::shared_ptr<MemoryStore> s = std::make_shared<MemoryStore>(),
                          const AdmissionController::Config& admission_config = AdmissionController::Config(),
                          std::shared_ptr<FakeTransport> t = FakeTransport::replying("ok\n"))
        : store(std::move(s)),
          progress(store),
          queue(store),
          circuit(store),
          limiter(store, RateLimiter::Config(), []() { return std::string("20260101"); }),
          admission(store, progress, queue, circuit, limiter, admission_config),
          transport(std::move(t)),
          sandbox(SandboxConfig(), transport),
          worker("test-worker", store, progress, queue, circuit, sandbox, engine, capsules,
                 fast_worker_config()),
          sync(admission, progress, fast_sync_config()),
          tests(sync) {}

    AdmissionResult submit_execution(const std::string& user, const std::string& code,
                                     const std::string& language = "python",
                                     Plan plan = Plan::FREE) {
        ExecutionPayload payload;
        payload.language = language;
        payload.code = code;
        return admission.admit(AdmissionRequest::for_execution(user, payload, plan));
    }

    AdmissionResult submit_generation(const std::string& user, const std::string& prompt,
                                      const std::string& language = "python",
                                      Plan plan = Plan::FREE) {
        GenerationPayload payload;
        payload.prompt = prompt;
        payload.language = language;
        return admission.admit(AdmissionRequest::for_generation(user, payload, plan));
    }

    // Pops and processes one job; false when both queues are empty
    bool drain_one() {
        auto queued = queue.dequeue_blocking(0);
        if (!queued) return false;
        worker.process(*queued);
        return true;
    }
};

} // namespace testing_support
} // namespace capsulerun
