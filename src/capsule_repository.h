#pragma once

#include <json/json.h>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace capsulerun {

struct Capsule {
    std::string id;
    std::string owner_id;
    std::string title;
    std::string language;
    std::string difficulty;
    Json::Value content;
    double quality_score = 0.0;
    std::string source_job_id;
    int64_t created_at_ms = 0;
    int64_t updated_at_ms = 0;
};

// Keyed access to persisted capsules; the relational store lives behind this
class CapsuleRepository {
public:
    virtual ~CapsuleRepository() = default;

    // Assigns and returns the id
    virtual std::string create(const Capsule& capsule) = 0;
    virtual std::optional<Capsule> find(const std::string& id) = 0;

    // False when the id is unknown
    virtual bool update(const Capsule& capsule) = 0;
};

class InMemoryCapsuleRepository : public CapsuleRepository {
public:
    std::string create(const Capsule& capsule) override;
    std::optional<Capsule> find(const std::string& id) override;
    bool update(const Capsule& capsule) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Capsule> capsules_;
};

// Title from the generated content, falling back to the prompt
std::string capsule_title(const Json::Value& content, const std::string& prompt);

} // namespace capsulerun
