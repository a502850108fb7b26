#pragma once

#include <string>
#include <json/json.h>

namespace capsulerun {

struct TestCase {
    Json::Value input_args = Json::Value(Json::arrayValue);
    Json::Value expected_output;
    std::string description;
    bool hidden = false;
};

// Accepts {input_args|input, expected_output|expected, description, hidden}.
// Throws std::invalid_argument when input_args is not an array.
TestCase test_case_from_json(const Json::Value& json);

enum class HarnessOutcome {
    PASSED,
    FAILED,
    ERROR,
    INDETERMINATE       // No sentinel line, or no template for the language
};

std::string harness_outcome_to_string(HarnessOutcome outcome);

struct ParsedOutcome {
    HarnessOutcome outcome = HarnessOutcome::INDETERMINATE;
    std::string detail;         // Text after the sentinel prefix
};

// Wraps user code in a per-language test template that seeds every
// randomness source, runs the target function on the embedded test data and
// prints exactly one sentinel line
class HarnessBuilder {
public:
    static constexpr const char* PASS_MARKER = "TEST_PASSED";
    static constexpr const char* FAIL_MARKER = "TEST_FAILED:";
    static constexpr const char* ERROR_MARKER = "TEST_ERROR:";

    // Returns user_code unchanged when the language has no template.
    // Throws std::invalid_argument when function_name is not an identifier.
    static std::string build(const std::string& user_code, const TestCase& test_case,
                             const std::string& language, const std::string& function_name);

    static bool has_template(const std::string& language);

    // The last sentinel line wins, so user prints cannot fake a result
    static ParsedOutcome parse_outcome(const std::string& stdout_text);

    static bool is_identifier(const std::string& name);

    // Compact JSON {input_args, expected_output}, base64 encoded
    static std::string encode_test_data(const TestCase& test_case);
};

} // namespace capsulerun
