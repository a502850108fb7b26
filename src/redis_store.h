#pragma once

#include "kv_store.h"
#include <mutex>
#include <memory>

struct redisContext;
struct redisReply;

namespace capsulerun {

// RAII wrapper around a hiredis context
class RedisConnection {
public:
    RedisConnection(const std::string& host, int port);
    ~RedisConnection();

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };
    using Reply = std::unique_ptr<redisReply, ReplyDeleter>;

    // Sends one command; throws StoreError on I/O or server errors
    Reply command(const std::vector<std::string>& args);

    bool is_valid() const;

private:
    redisContext* context_;
};

// Store backed by a Redis server. Ordinary commands share one connection;
// blocking pops borrow a dedicated connection so they never stall others.
class RedisStore : public KeyValueStore {
public:
    RedisStore(const std::string& host, int port);
    ~RedisStore() override;

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

    bool ping() override;

private:
    std::string host_;
    int port_;

    std::mutex mutex_;
    std::unique_ptr<RedisConnection> conn_;

    std::mutex idle_mutex_;
    std::vector<std::unique_ptr<RedisConnection>> idle_blocking_;

    // Callers hold mutex_; reconnects after a broken connection
    RedisConnection& connection();
    RedisConnection::Reply run(const std::vector<std::string>& args);

    std::unique_ptr<RedisConnection> borrow_blocking();
    void return_blocking(std::unique_ptr<RedisConnection> conn);
};

} // namespace capsulerun
