#include "generation_engine.h"
#include "json_utils.h"
#include <chrono>
#include <iostream>

namespace capsulerun {

namespace {

const Json::Value& first_member(const Json::Value& obj, const char* a, const char* b) {
    return obj.isMember(a) ? obj[a] : obj[b];
}

} // namespace

HttpGenerationEngine::HttpGenerationEngine(const std::string& url,
                                           std::shared_ptr<HttpTransport> transport,
                                           long timeout_ms)
    : url_(url), transport_(std::move(transport)), timeout_ms_(timeout_ms) {}

GenerationOutcome HttpGenerationEngine::parse_response(const Json::Value& body) {
    GenerationOutcome outcome;
    if (!body.isObject()) {
        outcome.error = "Generation service returned a non-object response";
        return outcome;
    }

    outcome.success = JsonUtils::get_bool(body, "success");
    outcome.content = first_member(body, "content", "capsule");

    const Json::Value& score = first_member(body, "quality_score", "qualityScore");
    if (score.isNumeric()) {
        outcome.quality_score = score.asDouble();
    }

    const Json::Value& stages = first_member(body, "stage_timings_ms", "stageTimings");
    if (stages.isObject()) {
        for (const auto& name : stages.getMemberNames()) {
            if (stages[name].isNumeric()) {
                outcome.stage_timings_ms[name] = stages[name].asInt64();
            }
        }
    }

    const Json::Value& error = body["error"];
    if (error.isString()) {
        outcome.error = error.asString();
    } else if (error.isObject()) {
        outcome.error = JsonUtils::get_string(error, "message", "Generation failed");
    }

    if (outcome.success && outcome.content.isNull()) {
        outcome.success = false;
        outcome.error = "Generation service reported success without content";
    }
    if (!outcome.success && outcome.error.empty()) {
        outcome.error = "Generation failed";
    }
    return outcome;
}

GenerationOutcome HttpGenerationEngine::generate(const GenerationContext& context) {
    Json::Value request;
    request["job_id"] = context.job_id;
    request["user_id"] = context.user_id;
    request["prompt"] = context.prompt;
    request["language"] = context.language;
    request["difficulty"] = context.difficulty;

    auto start = std::chrono::steady_clock::now();
    GenerationOutcome outcome;
    try {
        ClientResponse resp = transport_->post_json(url_, JsonUtils::write_compact(request), timeout_ms_);
        if (resp.status < 200 || resp.status >= 300) {
            outcome.error = "Generation service returned HTTP " + std::to_string(resp.status);
        } else {
            Json::Value parsed;
            std::string errors;
            if (JsonUtils::parse(resp.body, parsed, &errors)) {
                outcome = parse_response(parsed);
            } else {
                outcome.error = "Generation service returned malformed JSON: " + errors;
            }
        }
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }

    outcome.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    if (!outcome.success) {
        std::cerr << "[Generation] " << context.job_id << " failed: " << outcome.error << std::endl;
    }
    return outcome;
}

} // namespace capsulerun
