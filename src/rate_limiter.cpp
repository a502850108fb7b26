#include "rate_limiter.h"
#include <algorithm>
#include <ctime>
#include <iostream>

namespace capsulerun {

std::string plan_to_string(Plan plan) {
    switch (plan) {
        case Plan::FREE:       return "free";
        case Plan::CREATOR:    return "creator";
        case Plan::TEAM:       return "team";
        case Plan::ENTERPRISE: return "enterprise";
    }
    return "free";
}

std::optional<Plan> plan_from_string(const std::string& name) {
    if (name == "free") return Plan::FREE;
    if (name == "creator") return Plan::CREATOR;
    if (name == "team") return Plan::TEAM;
    if (name == "enterprise") return Plan::ENTERPRISE;
    return std::nullopt;
}

int64_t RateLimiter::Config::limit_for(JobKind kind, Plan plan) const {
    bool gen = kind == JobKind::GENERATION;
    switch (plan) {
        case Plan::FREE:       return gen ? generation_free : execution_free;
        case Plan::CREATOR:    return gen ? generation_creator : execution_creator;
        case Plan::TEAM:       return gen ? generation_team : execution_team;
        case Plan::ENTERPRISE: return gen ? generation_enterprise : execution_enterprise;
    }
    return gen ? generation_free : execution_free;
}

RateLimiter::RateLimiter(std::shared_ptr<KeyValueStore> store, const Config& config)
    : RateLimiter(std::move(store), config, utc_day) {}

RateLimiter::RateLimiter(std::shared_ptr<KeyValueStore> store, const Config& config, DayFunc day)
    : store_(std::move(store)), config_(config), day_(std::move(day)) {}

std::string RateLimiter::utc_day() {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y%m%d", &tm_utc);
    return buf;
}

std::string RateLimiter::quota_key(const std::string& user_id, JobKind kind) const {
    return "quota:" + job_kind_to_string(kind) + ":" + user_id + ":" + day_();
}

namespace {

std::string limit_reached_message(int64_t limit, Plan plan, JobKind kind) {
    return "Daily " + job_kind_to_string(kind) + " limit of " + std::to_string(limit) +
           " reached for the " + plan_to_string(plan) + " plan. Try again tomorrow.";
}

} // namespace

RateLimiter::QuotaInfo RateLimiter::check_quota(const std::string& user_id, Plan plan, JobKind kind) {
    QuotaInfo info;
    info.limit = config_.limit_for(kind, plan);

    auto raw = store_->get(quota_key(user_id, kind));
    if (raw) {
        try {
            info.used = std::stoll(*raw);
        } catch (const std::exception&) {
            std::cerr << "[Quota] Non-numeric counter for " << user_id << ", treating as 0" << std::endl;
            info.used = 0;
        }
    }

    if (info.limit == UNLIMITED) {
        info.remaining = UNLIMITED;
        info.can_submit = true;
        return info;
    }

    info.remaining = std::max<int64_t>(0, info.limit - info.used);
    info.can_submit = info.used < info.limit;
    if (!info.can_submit) {
        info.reason = limit_reached_message(info.limit, plan, kind);
    }
    return info;
}

int64_t RateLimiter::charge(const std::string& user_id, JobKind kind) {
    std::string key = quota_key(user_id, kind);
    // Only the first charge of the day sets the expiry
    int64_t total = store_->incr_by(key, 1);
    if (total == 1) {
        store_->incr_by(key, 0, QUOTA_TTL_SECONDS);
    }
    return total;
}

RateLimiter::QuotaInfo RateLimiter::reserve(const std::string& user_id, Plan plan, JobKind kind) {
    QuotaInfo info;
    info.limit = config_.limit_for(kind, plan);
    info.used = charge(user_id, kind);

    if (info.limit == UNLIMITED) {
        info.remaining = UNLIMITED;
        info.can_submit = true;
        return info;
    }
    if (info.used > info.limit) {
        refund(user_id, kind);
        info.used = info.limit;
        info.remaining = 0;
        info.can_submit = false;
        info.reason = limit_reached_message(info.limit, plan, kind);
        return info;
    }
    info.remaining = info.limit - info.used;
    info.can_submit = true;
    return info;
}

void RateLimiter::refund(const std::string& user_id, JobKind kind) {
    store_->incr_by(quota_key(user_id, kind), -1);
}

} // namespace capsulerun
