#include "job_hash.h"
#include "hash_utils.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace capsulerun {

namespace {

constexpr size_t HASH_LENGTH = 32;

std::string trim_lower(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;

    std::string out = s.substr(start, end - start);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string JobDefinition::calculate_hash() const {
    std::ostringstream job_data;
    job_data << user_id << "|";
    if (kind == JobKind::GENERATION) {
        job_data << normalize_prompt(text) << "|" << language;
    } else {
        job_data << text << "|" << language << "|" << stdin_data;
    }
    return HashUtils::sha256_string(job_data.str()).substr(0, HASH_LENGTH);
}

std::string JobDefinition::idempotency_key() const {
    return "idemp:" + calculate_hash();
}

std::string normalize_prompt(const std::string& prompt) {
    std::string lowered = trim_lower(prompt);
    std::string out;
    out.reserve(lowered.size());
    bool in_space = false;
    for (char c : lowered) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) {
            out += ' ';
        }
        in_space = false;
        out += c;
    }
    return out;
}

std::string semantic_cache_key(const std::string& language, const std::string& prompt) {
    std::string hash = HashUtils::sha256_string(normalize_prompt(prompt)).substr(0, HASH_LENGTH);
    return "gencache:" + language + ":" + hash;
}

} // namespace capsulerun
