#include "config.h"
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace capsulerun {

namespace {

int parse_int(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " must be an integer, got '" + value + "'");
    }
}

bool parse_bool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // namespace

ServiceConfig ServiceConfig::from_env() {
    return from_env([](const char* name) { return std::getenv(name); });
}

ServiceConfig ServiceConfig::from_env(const EnvLookup& lookup) {
    ServiceConfig config;
    auto env = [&lookup](const char* name) -> std::string {
        const char* value = lookup(name);
        return value ? value : "";
    };

    std::string v;
    if (!(v = env("CAPSULERUN_MODE")).empty()) config.mode = v;
    if (!(v = env("CAPSULERUN_PORT")).empty()) config.port = parse_int("CAPSULERUN_PORT", v);
    if (!(v = env("CAPSULERUN_WORKERS")).empty()) config.workers = parse_int("CAPSULERUN_WORKERS", v);
    if (!(v = env("CAPSULERUN_STORE")).empty()) config.store.backend = v;
    if (!(v = env("REDIS_HOST")).empty()) config.store.redis_host = v;
    if (!(v = env("REDIS_PORT")).empty()) config.store.redis_port = parse_int("REDIS_PORT", v);
    if (!(v = env("PISTON_URL")).empty()) config.sandbox.base_url = v;
    if (!(v = env("GENERATION_URL")).empty()) config.generation_url = v;
    if (!(v = env("CAPSULERUN_MAX_GENERATION_JOBS")).empty()) {
        config.admission.max_concurrent_generation = parse_int("CAPSULERUN_MAX_GENERATION_JOBS", v);
    }
    if (!(v = env("CAPSULERUN_MAX_EXECUTION_JOBS")).empty()) {
        config.admission.max_concurrent_execution = parse_int("CAPSULERUN_MAX_EXECUTION_JOBS", v);
    }
    if (!(v = env("CAPSULERUN_SEMANTIC_CACHE")).empty()) {
        config.admission.semantic_cache_enabled = parse_bool(v);
        config.worker.semantic_cache_enabled = config.admission.semantic_cache_enabled;
    }
    if (!(v = env("CAPSULERUN_CIRCUIT_THRESHOLD")).empty()) {
        config.circuit.failure_threshold = parse_int("CAPSULERUN_CIRCUIT_THRESHOLD", v);
    }
    if (!(v = env("CAPSULERUN_CIRCUIT_OPEN_SECONDS")).empty()) {
        config.circuit.open_seconds = parse_int("CAPSULERUN_CIRCUIT_OPEN_SECONDS", v);
    }
    if (!(v = env("CAPSULERUN_SYNC_TIMEOUT")).empty()) {
        config.sync_timeout_seconds = parse_int("CAPSULERUN_SYNC_TIMEOUT", v);
    }
    return config;
}

bool ServiceConfig::apply_args(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        auto next = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--mode") {
            mode = next();
        } else if (arg == "--port") {
            port = parse_int("--port", next());
        } else if (arg == "--workers") {
            workers = parse_int("--workers", next());
        } else if (arg == "--store") {
            store.backend = next();
        } else if (arg == "--redis-host") {
            store.redis_host = next();
        } else if (arg == "--redis-port") {
            store.redis_port = parse_int("--redis-port", next());
        } else if (arg == "--piston-url") {
            sandbox.base_url = next();
        } else if (arg == "--generation-url") {
            generation_url = next();
        } else if (arg == "--no-semantic-cache") {
            admission.semantic_cache_enabled = false;
            worker.semantic_cache_enabled = false;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return true;
}

void ServiceConfig::validate() const {
    if (mode != "api" && mode != "worker" && mode != "all") {
        throw std::invalid_argument("--mode must be api, worker or all");
    }
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("--port must be between 1 and 65535");
    }
    if (workers < 1) {
        throw std::invalid_argument("--workers must be at least 1");
    }
    if (store.backend != "memory" && store.backend != "redis") {
        throw std::invalid_argument("--store must be memory or redis");
    }
    if (store.backend == "memory" && mode != "all") {
        throw std::invalid_argument("The memory store is process-local; use --store redis with --mode " + mode);
    }
    if (admission.max_concurrent_generation < 1 || admission.max_concurrent_execution < 1) {
        throw std::invalid_argument("Concurrency caps must be at least 1");
    }
}

std::string ServiceConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --mode api|worker|all    Processes to run (default all)\n"
        << "  --port N                 HTTP port (default " << DEFAULT_PORT << ")\n"
        << "  --workers N              Worker loops in this process (default 1)\n"
        << "  --store memory|redis     Shared store backend (default memory)\n"
        << "  --redis-host HOST        Redis host (default localhost)\n"
        << "  --redis-port N           Redis port (default " << DEFAULT_REDIS_PORT << ")\n"
        << "  --piston-url URL         Sandbox base URL\n"
        << "  --generation-url URL     Generation service endpoint\n"
        << "  --no-semantic-cache      Disable the generation result cache\n"
        << "Environment: CAPSULERUN_MODE, CAPSULERUN_PORT, CAPSULERUN_WORKERS, CAPSULERUN_STORE,\n"
        << "  REDIS_HOST, REDIS_PORT, PISTON_URL, GENERATION_URL, CAPSULERUN_MAX_GENERATION_JOBS,\n"
        << "  CAPSULERUN_MAX_EXECUTION_JOBS, CAPSULERUN_SEMANTIC_CACHE, CAPSULERUN_CIRCUIT_THRESHOLD,\n"
        << "  CAPSULERUN_CIRCUIT_OPEN_SECONDS, CAPSULERUN_SYNC_TIMEOUT\n";
    return out.str();
}

} // namespace capsulerun
