#pragma once

#include "kv_store.h"
#include "job.h"
#include <string>
#include <memory>
#include <optional>
#include <functional>

namespace capsulerun {

enum class Plan {
    FREE,
    CREATOR,
    TEAM,
    ENTERPRISE
};

std::string plan_to_string(Plan plan);
std::optional<Plan> plan_from_string(const std::string& name);

// Per-user daily quota, counted in the shared store so every API instance
// sees the same totals
class RateLimiter {
public:
    static constexpr int64_t UNLIMITED = -1;

    struct Config {
        int64_t generation_free;
        int64_t generation_creator;
        int64_t generation_team;
        int64_t generation_enterprise;
        int64_t execution_free;
        int64_t execution_creator;
        int64_t execution_team;
        int64_t execution_enterprise;

        Config() :
            generation_free(5),
            generation_creator(100),
            generation_team(500),
            generation_enterprise(UNLIMITED),
            execution_free(200),
            execution_creator(2000),
            execution_team(10000),
            execution_enterprise(UNLIMITED) {}

        int64_t limit_for(JobKind kind, Plan plan) const;
    };

    struct QuotaInfo {
        int64_t used = 0;
        int64_t limit = 0;
        int64_t remaining = 0;          // UNLIMITED when the plan has no cap
        bool can_submit = false;
        std::string reason;
    };

    // Returns the UTC day as YYYYMMDD; injectable for tests
    using DayFunc = std::function<std::string()>;

    explicit RateLimiter(std::shared_ptr<KeyValueStore> store, const Config& config = Config());
    RateLimiter(std::shared_ptr<KeyValueStore> store, const Config& config, DayFunc day);

    // Read-only check used before admission
    QuotaInfo check_quota(const std::string& user_id, Plan plan, JobKind kind);

    // Count one job against today's bucket; returns the new total
    int64_t charge(const std::string& user_id, JobKind kind);

    // Atomically takes one unit of today's quota. When the increment lands
    // past the limit it is undone and can_submit comes back false.
    QuotaInfo reserve(const std::string& user_id, Plan plan, JobKind kind);

    // Gives back a unit taken by reserve() for a job that never got queued
    void refund(const std::string& user_id, JobKind kind);

    std::string quota_key(const std::string& user_id, JobKind kind) const;

    static std::string utc_day();

private:
    std::shared_ptr<KeyValueStore> store_;
    Config config_;
    DayFunc day_;
};

} // namespace capsulerun
