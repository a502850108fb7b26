#include "memory_store.h"
#include "errors.h"
#include <chrono>
#include <stdexcept>

namespace capsulerun {

namespace {

int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace

MemoryStore::MemoryStore() : clock_(steady_now_ms) {}

MemoryStore::MemoryStore(Clock clock) : clock_(std::move(clock)) {}

MemoryStore::Entry* MemoryStore::find_live(const std::string& key) {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return nullptr;
    }
    if (it->second.expires_at_ms != 0 && it->second.expires_at_ms <= clock_()) {
        values_.erase(it);
        return nullptr;
    }
    return &it->second;
}

int64_t MemoryStore::expiry_for(int ttl_seconds) const {
    return ttl_seconds > 0 ? clock_() + static_cast<int64_t>(ttl_seconds) * 1000 : 0;
}

void MemoryStore::maybe_fail() {
    if (failures_pending_ > 0) {
        --failures_pending_;
        throw StoreError("Simulated store failure");
    }
}

void MemoryStore::fail_next(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_pending_ = count;
}

std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail();
    Entry* entry = find_live(key);
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

void MemoryStore::set(const std::string& key, const std::string& value, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail();
    values_[key] = Entry{value, expiry_for(ttl_seconds)};
}

bool MemoryStore::set_if_absent(const std::string& key, const std::string& value, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail();
    if (find_live(key)) {
        return false;
    }
    values_[key] = Entry{value, expiry_for(ttl_seconds)};
    return true;
}

bool MemoryStore::compare_and_set(const std::string& key, const std::string& expected,
                                  const std::string& value, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail();
    Entry* entry = find_live(key);
    if (!entry || entry->value != expected) {
        return false;
    }
    entry->value = value;
    entry->expires_at_ms = expiry_for(ttl_seconds);
    return true;
}

bool MemoryStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail();
    bool existed = find_live(key) != nullptr;
    values_.erase(key);
    return existed;
}

int64_t MemoryStore::incr_by(const std::string& key, int64_t delta, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail();
    Entry* entry = find_live(key);
    int64_t current = 0;
    if (entry) {
        try {
            current = std::stoll(entry->value);
        } catch (const std::exception&) {
            throw StoreError("Value at " + key + " is not an integer");
        }
    }

    int64_t updated = current + delta;
    int64_t expires = entry ? entry->expires_at_ms : 0;
    if (ttl_seconds > 0) {
        expires = expiry_for(ttl_seconds);
    }
    values_[key] = Entry{std::to_string(updated), expires};
    return updated;
}

int64_t MemoryStore::ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail();
    Entry* entry = find_live(key);
    if (!entry) {
        return -2;
    }
    if (entry->expires_at_ms == 0) {
        return -1;
    }
    // Round up like Redis reports partial seconds
    return (entry->expires_at_ms - clock_() + 999) / 1000;
}

int64_t MemoryStore::push_tail(const std::string& list, const std::string& value) {
    int64_t length;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_fail();
        auto& items = lists_[list];
        items.push_back(value);
        length = static_cast<int64_t>(items.size());
    }
    list_cv_.notify_all();
    return length;
}

int64_t MemoryStore::list_length(const std::string& list) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybe_fail();
    auto it = lists_.find(list);
    return it == lists_.end() ? 0 : static_cast<int64_t>(it->second.size());
}

std::optional<std::pair<std::string, std::string>>
MemoryStore::pop_head_blocking(const std::vector<std::string>& keys, int timeout_seconds) {
    std::unique_lock<std::mutex> lock(mutex_);
    maybe_fail();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    while (true) {
        for (const auto& key : keys) {
            auto it = lists_.find(key);
            if (it != lists_.end() && !it->second.empty()) {
                std::string value = std::move(it->second.front());
                it->second.pop_front();
                return std::make_pair(key, std::move(value));
            }
        }
        if (list_cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            // One last look so a push racing the deadline is not lost
            for (const auto& key : keys) {
                auto it = lists_.find(key);
                if (it != lists_.end() && !it->second.empty()) {
                    std::string value = std::move(it->second.front());
                    it->second.pop_front();
                    return std::make_pair(key, std::move(value));
                }
            }
            return std::nullopt;
        }
    }
}

} // namespace capsulerun
