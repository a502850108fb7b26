#pragma once

#include "http_client.h"
#include "constants.h"
#include <json/json.h>
#include <map>
#include <memory>
#include <string>

namespace capsulerun {

struct GenerationContext {
    std::string job_id;
    std::string user_id;
    std::string prompt;
    std::string language;
    std::string difficulty;
};

struct GenerationOutcome {
    bool success = false;
    Json::Value content;
    double quality_score = 0.0;
    std::map<std::string, int64_t> stage_timings_ms;
    int64_t duration_ms = 0;
    std::string error;
};

// The AI pipeline as one opaque call. Implementations report failure through
// the outcome instead of throwing.
class GenerationEngine {
public:
    virtual ~GenerationEngine() = default;
    virtual GenerationOutcome generate(const GenerationContext& context) = 0;
};

// Posts the context as JSON to a generation service endpoint
class HttpGenerationEngine : public GenerationEngine {
public:
    HttpGenerationEngine(const std::string& url, std::shared_ptr<HttpTransport> transport,
                         long timeout_ms = GENERATION_TIMEOUT_MS);

    GenerationOutcome generate(const GenerationContext& context) override;

    // Accepts snake_case or camelCase field names from the service
    static GenerationOutcome parse_response(const Json::Value& body);

private:
    std::string url_;
    std::shared_ptr<HttpTransport> transport_;
    long timeout_ms_;
};

} // namespace capsulerun
