#include "kv_store.h"
#include "memory_store.h"
#include "errors.h"
#include <stdexcept>

#ifdef CAPSULERUN_HAVE_REDIS
#include "redis_store.h"
#endif

namespace capsulerun {

std::shared_ptr<KeyValueStore> create_store(const StoreConfig& config) {
    if (config.backend == "memory") {
        return std::make_shared<MemoryStore>();
    }
    if (config.backend == "redis") {
#ifdef CAPSULERUN_HAVE_REDIS
        return std::make_shared<RedisStore>(config.redis_host, config.redis_port);
#else
        throw StoreError("capsulerun was built without Redis support (hiredis not found)");
#endif
    }
    throw std::invalid_argument("Unknown store backend: " + config.backend);
}

} // namespace capsulerun
