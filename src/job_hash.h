#pragma once
#include <string>
#include "job.h"

namespace capsulerun {

// The fields of a request that decide whether two submissions are the same job
struct JobDefinition {
    JobKind kind = JobKind::EXECUTION;
    std::string user_id;
    std::string language;
    std::string text;           // prompt for generation, source code for execution
    std::string stdin_data;     // execution only

    // SHA-256 over user|text|language[|stdin], truncated to 32 hex chars.
    // Generation prompts are trimmed and lowercased first; code is hashed as is.
    std::string calculate_hash() const;

    // "idemp:<hash>"
    std::string idempotency_key() const;
};

// Lowercase, trim and collapse internal whitespace runs to one space
std::string normalize_prompt(const std::string& prompt);

// "gencache:<language>:<hash of normalized prompt>"
std::string semantic_cache_key(const std::string& language, const std::string& prompt);

} // namespace capsulerun
