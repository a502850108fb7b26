#include "progress_store.h"
#include "json_utils.h"
#include <algorithm>
#include <iostream>

namespace capsulerun {

namespace {

// Bounded so a storm of writers cannot spin forever
constexpr int MAX_CAS_ATTEMPTS = 16;

void advance_step(Job& job, const std::string& step) {
    if (step.empty() || step == job.current_step) {
        return;
    }
    if (!job.current_step.empty()) {
        job.steps.push_back(job.current_step);
    }
    job.current_step = step;
}

} // namespace

ProgressStore::ProgressStore(std::shared_ptr<KeyValueStore> store, int ttl_seconds)
    : store_(std::move(store)), ttl_seconds_(ttl_seconds) {}

std::string ProgressStore::job_key(const std::string& job_id) {
    return "job:" + job_id;
}

std::string ProgressStore::cancel_key(const std::string& job_id) {
    return "cancel:" + job_id;
}

bool ProgressStore::create(const Job& job) {
    return store_->set_if_absent(job_key(job.id), JsonUtils::write_compact(job_to_json(job)), ttl_seconds_);
}

std::optional<Job> ProgressStore::get(const std::string& job_id) {
    std::string key = job_key(job_id);
    auto raw = store_->get(key);
    if (!raw) {
        return std::nullopt;
    }

    Json::Value json;
    std::string errors;
    if (!JsonUtils::parse(*raw, json, &errors)) {
        throw CorruptRecordError(key, errors);
    }
    try {
        return job_from_json(json);
    } catch (const std::runtime_error& e) {
        throw CorruptRecordError(key, e.what());
    }
}

template <typename Mutator>
bool ProgressStore::update(const std::string& job_id, Mutator mutate) {
    std::string key = job_key(job_id);
    for (int attempt = 0; attempt < MAX_CAS_ATTEMPTS; ++attempt) {
        auto raw = store_->get(key);
        if (!raw) {
            return false;
        }

        Json::Value json;
        std::string errors;
        if (!JsonUtils::parse(*raw, json, &errors)) {
            throw CorruptRecordError(key, errors);
        }
        Job job;
        try {
            job = job_from_json(json);
        } catch (const std::runtime_error& e) {
            throw CorruptRecordError(key, e.what());
        }
        if (!mutate(job)) {
            return false;
        }

        std::string updated = JsonUtils::write_compact(job_to_json(job));
        if (store_->compare_and_set(key, *raw, updated, ttl_seconds_)) {
            return true;
        }
    }
    std::cerr << "[Progress] Gave up updating " << job_id << " after "
              << MAX_CAS_ATTEMPTS << " conflicting writes" << std::endl;
    return false;
}

bool ProgressStore::mark_processing(const std::string& job_id) {
    return update(job_id, [](Job& job) {
        if (job.status != JobStatus::QUEUED) {
            return false;
        }
        job.status = JobStatus::PROCESSING;
        job.started_at_ms = current_time_ms();
        return true;
    });
}

bool ProgressStore::update_progress(const std::string& job_id, int progress, const std::string& step) {
    return update(job_id, [&](Job& job) {
        if (job.status != JobStatus::PROCESSING) {
            return false;
        }
        job.progress = std::max(job.progress, std::clamp(progress, 0, 100));
        advance_step(job, step);
        return true;
    });
}

bool ProgressStore::complete(const std::string& job_id, const JobResult& result) {
    return update(job_id, [&](Job& job) {
        if (!can_transition(job.status, JobStatus::COMPLETED)) {
            return false;
        }
        job.status = JobStatus::COMPLETED;
        job.progress = 100;
        advance_step(job, "Done!");
        job.completed_at_ms = current_time_ms();
        job.result = result;
        return true;
    });
}

bool ProgressStore::fail(const std::string& job_id, ErrorKind kind, const std::string& message) {
    return update(job_id, [&](Job& job) {
        if (!can_transition(job.status, JobStatus::FAILED)) {
            return false;
        }
        job.status = JobStatus::FAILED;
        job.completed_at_ms = current_time_ms();
        job.error = JobError{kind, message};
        return true;
    });
}

void ProgressStore::request_cancel(const std::string& job_id) {
    store_->set(cancel_key(job_id), "1", CANCEL_FLAG_TTL_SECONDS);
}

bool ProgressStore::is_cancelled(const std::string& job_id) {
    return store_->get(cancel_key(job_id)).has_value();
}

} // namespace capsulerun
