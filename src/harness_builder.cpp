#include "harness_builder.h"
#include "hash_utils.h"
#include "json_utils.h"
#include "language_table.h"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace capsulerun {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Single pass over the template, so placeholder text inside user code is
// never expanded. User code goes in base64 encoded.
std::string render(const std::string& tmpl, const std::string& user_code,
                   const std::string& test_data, const std::string& function_name) {
    std::string out;
    out.reserve(tmpl.size() + user_code.size() * 2 + test_data.size());

    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find("{{", pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        size_t close = tmpl.find("}}", open + 2);
        if (close == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }

        out.append(tmpl, pos, open - pos);
        std::string name = tmpl.substr(open + 2, close - open - 2);
        if (name == "USER_CODE_BASE64") {
            out += HashUtils::base64_encode(user_code);
        } else if (name == "TEST_DATA") {
            out += test_data;
        } else if (name == "FUNCTION_NAME") {
            out += function_name;
        } else {
            out.append(tmpl, open, close + 2 - open);
        }
        pos = close + 2;
    }
    return out;
}

} // namespace

TestCase test_case_from_json(const Json::Value& json) {
    if (!json.isObject()) {
        throw std::invalid_argument("Test case must be an object");
    }

    TestCase tc;
    const Json::Value& args = json.isMember("input_args") ? json["input_args"] : json["input"];
    if (args.isNull()) {
        tc.input_args = Json::Value(Json::arrayValue);
    } else if (args.isArray()) {
        tc.input_args = args;
    } else {
        throw std::invalid_argument("Test case input_args must be an array");
    }

    tc.expected_output = json.isMember("expected_output") ? json["expected_output"] : json["expected"];
    tc.description = JsonUtils::get_string(json, "description");
    tc.hidden = JsonUtils::get_bool(json, "hidden");
    return tc;
}

std::string harness_outcome_to_string(HarnessOutcome outcome) {
    switch (outcome) {
        case HarnessOutcome::PASSED:        return "passed";
        case HarnessOutcome::FAILED:        return "failed";
        case HarnessOutcome::ERROR:         return "error";
        case HarnessOutcome::INDETERMINATE: return "indeterminate";
    }
    return "indeterminate";
}

bool HarnessBuilder::is_identifier(const std::string& name) {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_' || first == '$')) return false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || uc == '_' || uc == '$')) return false;
    }
    return true;
}

bool HarnessBuilder::has_template(const std::string& language) {
    const LanguageSpec* spec = LanguageTable::find(language);
    return spec && spec->harness_template;
}

std::string HarnessBuilder::encode_test_data(const TestCase& test_case) {
    Json::Value data;
    data["input_args"] = test_case.input_args;
    data["expected_output"] = test_case.expected_output;
    return HashUtils::base64_encode(JsonUtils::write_compact(data));
}

std::string HarnessBuilder::build(const std::string& user_code, const TestCase& test_case,
                                  const std::string& language, const std::string& function_name) {
    const LanguageSpec* spec = LanguageTable::find(language);
    if (!spec || !spec->harness_template) {
        return user_code;
    }
    if (!is_identifier(function_name)) {
        throw std::invalid_argument("Invalid function name: '" + function_name + "'");
    }
    return render(spec->harness_template, user_code, encode_test_data(test_case), function_name);
}

ParsedOutcome HarnessBuilder::parse_outcome(const std::string& stdout_text) {
    ParsedOutcome parsed;
    std::istringstream stream(stdout_text);
    std::string line;
    while (std::getline(stream, line)) {
        std::string t = trim(line);
        if (t == PASS_MARKER) {
            parsed = {HarnessOutcome::PASSED, ""};
        } else if (starts_with(t, FAIL_MARKER)) {
            parsed = {HarnessOutcome::FAILED, trim(t.substr(std::string(FAIL_MARKER).size()))};
        } else if (starts_with(t, ERROR_MARKER)) {
            parsed = {HarnessOutcome::ERROR, trim(t.substr(std::string(ERROR_MARKER).size()))};
        }
    }
    return parsed;
}

} // namespace capsulerun
