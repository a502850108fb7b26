#pragma once

#include "kv_store.h"
#include <map>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>

namespace capsulerun {

// In-process store: one mutex serializes every operation and a condition
// variable wakes blocked poppers. Expired keys are dropped lazily on access.
class MemoryStore : public KeyValueStore {
public:
    // Milliseconds on a monotonic clock; injectable so tests can advance time
    using Clock = std::function<int64_t()>;

    MemoryStore();
    explicit MemoryStore(Clock clock);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, int ttl_seconds = 0) override;
    bool set_if_absent(const std::string& key, const std::string& value, int ttl_seconds) override;
    bool compare_and_set(const std::string& key, const std::string& expected,
                         const std::string& value, int ttl_seconds = 0) override;
    bool del(const std::string& key) override;
    int64_t incr_by(const std::string& key, int64_t delta, int ttl_seconds = 0) override;
    int64_t ttl(const std::string& key) override;

    int64_t push_tail(const std::string& list, const std::string& value) override;
    int64_t list_length(const std::string& list) override;
    std::optional<std::pair<std::string, std::string>>
    pop_head_blocking(const std::vector<std::string>& keys, int timeout_seconds) override;

    bool ping() override { return true; }

    // Test hook: make the next N operations throw StoreError
    void fail_next(int count);

private:
    struct Entry {
        std::string value;
        int64_t expires_at_ms = 0;      // 0 = never
    };

    Clock clock_;
    std::mutex mutex_;
    std::condition_variable list_cv_;
    std::map<std::string, Entry> values_;
    std::map<std::string, std::deque<std::string>> lists_;
    int failures_pending_ = 0;

    // Callers hold mutex_
    Entry* find_live(const std::string& key);
    int64_t expiry_for(int ttl_seconds) const;
    void maybe_fail();
};

} // namespace capsulerun
