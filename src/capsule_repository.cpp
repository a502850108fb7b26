#include "capsule_repository.h"
#include "hash_utils.h"
#include "job.h"

namespace capsulerun {

namespace {

constexpr size_t MAX_TITLE_LENGTH = 80;

} // namespace

std::string InMemoryCapsuleRepository::create(const Capsule& capsule) {
    Capsule stored = capsule;
    stored.id = "cap_" + HashUtils::random_hex(8);
    stored.created_at_ms = current_time_ms();
    stored.updated_at_ms = stored.created_at_ms;

    std::lock_guard<std::mutex> lock(mutex_);
    capsules_[stored.id] = stored;
    return stored.id;
}

std::optional<Capsule> InMemoryCapsuleRepository::find(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = capsules_.find(id);
    if (it == capsules_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryCapsuleRepository::update(const Capsule& capsule) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = capsules_.find(capsule.id);
    if (it == capsules_.end()) {
        return false;
    }
    int64_t created = it->second.created_at_ms;
    it->second = capsule;
    it->second.created_at_ms = created;
    it->second.updated_at_ms = current_time_ms();
    return true;
}

size_t InMemoryCapsuleRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capsules_.size();
}

std::string capsule_title(const Json::Value& content, const std::string& prompt) {
    if (content.isObject()) {
        if (content["title"].isString() && !content["title"].asString().empty()) {
            return content["title"].asString();
        }
        const Json::Value& meta = content["metadata"];
        if (meta.isObject() && meta["title"].isString() && !meta["title"].asString().empty()) {
            return meta["title"].asString();
        }
    }
    if (prompt.size() <= MAX_TITLE_LENGTH) {
        return prompt;
    }
    return prompt.substr(0, MAX_TITLE_LENGTH - 3) + "...";
}

} // namespace capsulerun
