#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <memory>
#include <cstdint>

namespace capsulerun {

// Shared key-value and list store used by the API and worker processes.
// Every operation is atomic with respect to other callers. Backends raise
// StoreError when the store cannot be reached.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    // ttl_seconds <= 0 stores without expiry
    virtual void set(const std::string& key, const std::string& value, int ttl_seconds = 0) = 0;

    // Returns false when the key already holds a live value
    virtual bool set_if_absent(const std::string& key, const std::string& value, int ttl_seconds) = 0;

    // Replace the value only if it currently equals expected
    virtual bool compare_and_set(const std::string& key, const std::string& expected,
                                 const std::string& value, int ttl_seconds = 0) = 0;

    virtual bool del(const std::string& key) = 0;

    // Atomic add; a missing key counts as 0. ttl_seconds > 0 refreshes expiry
    virtual int64_t incr_by(const std::string& key, int64_t delta, int ttl_seconds = 0) = 0;

    // Remaining lifetime: -2 when missing, -1 when the key has no expiry
    virtual int64_t ttl(const std::string& key) = 0;

    // FIFO lists
    virtual int64_t push_tail(const std::string& list, const std::string& value) = 0;
    virtual int64_t list_length(const std::string& list) = 0;

    // Pops from the first non-empty list in keys order, waiting up to
    // timeout_seconds. Returns {list, value} or nullopt on timeout.
    virtual std::optional<std::pair<std::string, std::string>>
    pop_head_blocking(const std::vector<std::string>& keys, int timeout_seconds) = 0;

    virtual bool ping() = 0;
};

struct StoreConfig {
    std::string backend = "memory";     // "memory" or "redis"
    std::string redis_host = "localhost";
    int redis_port = 6379;
};

// Throws std::invalid_argument for unknown backends and StoreError when the
// backend cannot be created
std::shared_ptr<KeyValueStore> create_store(const StoreConfig& config);

} // namespace capsulerun
