#include "worker.h"
#include "job_hash.h"
#include "json_utils.h"
#include <iostream>

namespace capsulerun {

Worker::Worker(std::string name,
               std::shared_ptr<KeyValueStore> store,
               ProgressStore& progress,
               ExecutionQueue& queue,
               CircuitBreaker& circuit,
               SandboxClient& sandbox,
               GenerationEngine& engine,
               CapsuleRepository& capsules,
               const Config& config)
    : name_(std::move(name)), store_(std::move(store)), progress_(progress), queue_(queue),
      circuit_(circuit), sandbox_(sandbox), engine_(engine), capsules_(capsules), config_(config) {}

void Worker::run() {
    running_ = true;
    std::cout << "[" << name_ << "] Started, waiting for jobs" << std::endl;
    while (!stop_requested_) {
        run_once();
    }
    running_ = false;
    std::cout << "[" << name_ << "] Stopped" << std::endl;
}

void Worker::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();
}

Worker::Stats Worker::stats() const {
    Stats s;
    s.completed = completed_;
    s.failed = failed_;
    s.skipped = skipped_;
    s.store_errors = store_errors_;
    return s;
}

void Worker::backoff() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::seconds(config_.backoff_seconds),
                      [this]() { return stop_requested_.load(); });
}

bool Worker::run_once() {
    std::optional<QueuedJob> queued;
    try {
        queued = queue_.dequeue_blocking(config_.pop_timeout_seconds);
    } catch (const StoreError& e) {
        ++store_errors_;
        std::cerr << "[" << name_ << "] Queue unavailable: " << e.what()
                  << ", retrying in " << config_.backoff_seconds << "s" << std::endl;
        backoff();
        return false;
    }

    if (!queued) {
        return false;
    }
    process(*queued);
    return true;
}

void Worker::write_failure(const std::string& job_id, ErrorKind kind, const std::string& message) {
    try {
        if (progress_.fail(job_id, kind, message)) {
            ++failed_;
        }
    } catch (const std::exception& e) {
        std::cerr << "[" << name_ << "] Could not record failure of " << job_id
                  << ": " << e.what() << std::endl;
    }
}

void Worker::release_depth(JobKind kind) {
    try {
        queue_.decrement_depth(kind);
    } catch (const StoreError& e) {
        std::cerr << "[" << name_ << "] Depth decrement failed: " << e.what() << std::endl;
    }
}

void Worker::process(const QueuedJob& queued) {
    std::optional<Job> job;
    try {
        job = progress_.get(queued.job_id);
    } catch (const CorruptRecordError& e) {
        std::cerr << "[" << name_ << "] " << e.what() << std::endl;
        ++skipped_;
        release_depth(queued.kind);
        return;
    } catch (const StoreError& e) {
        // The id is already off the queue; nothing left to retry it with
        std::cerr << "[" << name_ << "] Lost job " << queued.job_id << ": " << e.what() << std::endl;
        ++store_errors_;
        release_depth(queued.kind);
        return;
    }

    if (!job) {
        std::cerr << "[" << name_ << "] Job " << queued.job_id << " expired before it ran" << std::endl;
        ++skipped_;
        release_depth(queued.kind);
        return;
    }
    if (is_terminal(job->status)) {
        std::cout << "[" << name_ << "] Job " << job->id << " already "
                  << job_status_to_string(job->status) << ", skipping" << std::endl;
        ++skipped_;
        return;
    }

    try {
        if (progress_.is_cancelled(job->id)) {
            std::cout << "[" << name_ << "] Job " << job->id << " was cancelled" << std::endl;
            write_failure(job->id, ErrorKind::CANCELLED, "Job was cancelled before it started");
            release_depth(job->kind);
            return;
        }

        if (!progress_.mark_processing(job->id)) {
            std::cerr << "[" << name_ << "] Job " << job->id << " is no longer queued" << std::endl;
            ++skipped_;
            return;
        }

        std::cout << "[" << name_ << "] Processing " << job->id << " ("
                  << job_kind_to_string(job->kind) << ")" << std::endl;

        if (job->kind == JobKind::EXECUTION) {
            run_execution(*job);
        } else {
            run_generation(*job);
        }
    } catch (const std::exception& e) {
        std::cerr << "[" << name_ << "] Job " << job->id << " threw: " << e.what() << std::endl;
        write_failure(job->id, ErrorKind::INTERNAL, e.what());
    }

    release_depth(job->kind);
}

void Worker::run_execution(const Job& job) {
    const auto& exec = job.execution();
    NormalizedResult result = sandbox_.execute(exec.language, exec.code, exec.stdin_data, exec.limits);

    if (result.transport_error) {
        write_failure(job.id, ErrorKind::TRANSPORT, result.stderr_log);
        if (circuit_.record_failure(JobKind::EXECUTION)) {
            std::cerr << "[" << name_ << "] Sandbox failures tripped the execution circuit" << std::endl;
        }
        return;
    }

    if (progress_.complete(job.id, JobResult::execution(result))) {
        ++completed_;
    }
    circuit_.record_success(JobKind::EXECUTION);
    std::cout << "[" << name_ << "] Job " << job.id << " completed (exit=" << result.exit_code
              << ", " << result.execution_time_ms << "ms)" << std::endl;
}

void Worker::run_generation(const Job& job) {
    const auto& gen = job.generation();

    progress_.update_progress(job.id, 5, "Queued for AI generation...");
    progress_.update_progress(job.id, 15, "AI agents are working on your exercise...");

    GenerationContext context;
    context.job_id = job.id;
    context.user_id = job.user_id;
    context.prompt = gen.prompt;
    context.language = gen.language;
    context.difficulty = gen.difficulty;

    GenerationOutcome outcome = engine_.generate(context);
    if (!outcome.success) {
        write_failure(job.id, ErrorKind::GENERATION, outcome.error);
        if (circuit_.record_failure(JobKind::GENERATION)) {
            std::cerr << "[" << name_ << "] Generation failures tripped the circuit" << std::endl;
        }
        return;
    }

    progress_.update_progress(job.id, 90, "Finalizing your capsule...");

    Capsule capsule;
    capsule.owner_id = job.user_id;
    capsule.title = capsule_title(outcome.content, gen.prompt);
    capsule.language = gen.language;
    capsule.difficulty = gen.difficulty;
    capsule.content = outcome.content;
    capsule.quality_score = outcome.quality_score;
    capsule.source_job_id = job.id;

    GenerationResult result;
    result.content = outcome.content;
    result.quality_score = outcome.quality_score;
    result.generation_time_ms = outcome.duration_ms;
    result.stage_timings_ms = outcome.stage_timings_ms;
    result.capsule_id = capsules_.create(capsule);

    if (config_.semantic_cache_enabled) {
        try {
            store_->set(semantic_cache_key(gen.language, gen.prompt),
                        JsonUtils::write_compact(generation_result_to_json(result)),
                        config_.semantic_cache_ttl_seconds);
        } catch (const StoreError& e) {
            std::cerr << "[" << name_ << "] Cache fill failed for " << job.id << ": " << e.what() << std::endl;
        }
    }

    if (progress_.complete(job.id, JobResult::generation(result))) {
        ++completed_;
    }
    circuit_.record_success(JobKind::GENERATION);
    std::cout << "[" << name_ << "] Job " << job.id << " generated capsule " << result.capsule_id
              << " (quality=" << result.quality_score << ", " << result.generation_time_ms << "ms)" << std::endl;
}

} // namespace capsulerun
