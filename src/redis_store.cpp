#include "redis_store.h"
#include "errors.h"
#include <hiredis/hiredis.h>
#include <iostream>

namespace capsulerun {

namespace {

std::string reply_string(const redisReply* reply) {
    return std::string(reply->str, reply->len);
}

} // namespace

void RedisConnection::ReplyDeleter::operator()(redisReply* reply) const {
    if (reply) {
        freeReplyObject(reply);
    }
}

RedisConnection::RedisConnection(const std::string& host, int port) {
    context_ = redisConnect(host.c_str(), port);
    if (!context_ || context_->err) {
        std::string error = context_ ? context_->errstr : "Unknown connection error";
        if (context_) {
            redisFree(context_);
        }
        throw StoreError("Redis connection failed: " + error);
    }
}

RedisConnection::~RedisConnection() {
    if (context_) {
        redisFree(context_);
    }
}

bool RedisConnection::is_valid() const {
    return context_ && !context_->err;
}

RedisConnection::Reply RedisConnection::command(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    Reply reply(static_cast<redisReply*>(
        redisCommandArgv(context_, static_cast<int>(argv.size()), argv.data(), argvlen.data())));
    if (!reply) {
        throw StoreError(std::string("Redis I/O error: ") + (context_->errstr[0] ? context_->errstr : "no reply"));
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        throw StoreError("Redis error: " + reply_string(reply.get()));
    }
    return reply;
}

RedisStore::RedisStore(const std::string& host, int port)
    : host_(host), port_(port), conn_(std::make_unique<RedisConnection>(host, port)) {
    std::cout << "[Store] Connected to Redis at " << host_ << ":" << port_ << std::endl;
}

RedisStore::~RedisStore() = default;

RedisConnection& RedisStore::connection() {
    if (!conn_ || !conn_->is_valid()) {
        std::cerr << "[Store] Reconnecting to Redis at " << host_ << ":" << port_ << std::endl;
        conn_ = std::make_unique<RedisConnection>(host_, port_);
    }
    return *conn_;
}

RedisConnection::Reply RedisStore::run(const std::vector<std::string>& args) {
    try {
        return connection().command(args);
    } catch (const StoreError&) {
        // Drop the connection so no half-finished WATCH/MULTI state leaks into the next call
        conn_.reset();
        throw;
    }
}

std::optional<std::string> RedisStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = run({"GET", key});
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    return reply_string(reply.get());
}

void RedisStore::set(const std::string& key, const std::string& value, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ttl_seconds > 0) {
        run({"SET", key, value, "EX", std::to_string(ttl_seconds)});
    } else {
        run({"SET", key, value});
    }
}

bool RedisStore::set_if_absent(const std::string& key, const std::string& value, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> args = {"SET", key, value, "NX"};
    if (ttl_seconds > 0) {
        args.push_back("EX");
        args.push_back(std::to_string(ttl_seconds));
    }
    auto reply = run(args);
    return reply->type != REDIS_REPLY_NIL;
}

bool RedisStore::compare_and_set(const std::string& key, const std::string& expected,
                                 const std::string& value, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    run({"WATCH", key});

    auto current = run({"GET", key});
    if (current->type == REDIS_REPLY_NIL || reply_string(current.get()) != expected) {
        run({"UNWATCH"});
        return false;
    }

    run({"MULTI"});
    if (ttl_seconds > 0) {
        run({"SET", key, value, "EX", std::to_string(ttl_seconds)});
    } else {
        run({"SET", key, value});
    }
    auto exec = run({"EXEC"});
    // A nil EXEC reply means the watched key changed under us
    return exec->type == REDIS_REPLY_ARRAY;
}

bool RedisStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = run({"DEL", key});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

int64_t RedisStore::incr_by(const std::string& key, int64_t delta, int ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ttl_seconds <= 0) {
        auto reply = run({"INCRBY", key, std::to_string(delta)});
        return reply->integer;
    }

    run({"MULTI"});
    run({"INCRBY", key, std::to_string(delta)});
    run({"EXPIRE", key, std::to_string(ttl_seconds)});
    auto exec = run({"EXEC"});
    if (exec->type != REDIS_REPLY_ARRAY || exec->elements < 1 ||
        exec->element[0]->type != REDIS_REPLY_INTEGER) {
        throw StoreError("Unexpected INCRBY transaction reply for " + key);
    }
    return exec->element[0]->integer;
}

int64_t RedisStore::ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = run({"TTL", key});
    return reply->integer;
}

int64_t RedisStore::push_tail(const std::string& list, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = run({"RPUSH", list, value});
    return reply->integer;
}

int64_t RedisStore::list_length(const std::string& list) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = run({"LLEN", list});
    return reply->integer;
}

std::unique_ptr<RedisConnection> RedisStore::borrow_blocking() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        if (!idle_blocking_.empty()) {
            auto conn = std::move(idle_blocking_.back());
            idle_blocking_.pop_back();
            if (conn->is_valid()) {
                return conn;
            }
        }
    }
    return std::make_unique<RedisConnection>(host_, port_);
}

void RedisStore::return_blocking(std::unique_ptr<RedisConnection> conn) {
    if (!conn->is_valid()) {
        return;
    }
    std::lock_guard<std::mutex> lock(idle_mutex_);
    idle_blocking_.push_back(std::move(conn));
}

std::optional<std::pair<std::string, std::string>>
RedisStore::pop_head_blocking(const std::vector<std::string>& keys, int timeout_seconds) {
    std::vector<std::string> args = {"BLPOP"};
    args.insert(args.end(), keys.begin(), keys.end());
    args.push_back(std::to_string(timeout_seconds));

    auto conn = borrow_blocking();
    auto reply = conn->command(args);
    return_blocking(std::move(conn));

    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
        return std::nullopt;
    }
    return std::make_pair(reply_string(reply->element[0]), reply_string(reply->element[1]));
}

bool RedisStore::ping() {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto reply = run({"PING"});
        return reply->type == REDIS_REPLY_STATUS;
    } catch (const StoreError& e) {
        std::cerr << "[Store] Ping failed: " << e.what() << std::endl;
        return false;
    }
}

} // namespace capsulerun
