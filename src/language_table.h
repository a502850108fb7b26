#pragma once

#include <string>
#include <vector>

namespace capsulerun {

// One supported language: how the sandbox runs it and whether we can wrap
// it in a test harness. Adding a language means adding a row.
struct LanguageSpec {
    std::string name;               // Logical name used by the API
    std::string runtime;            // Sandbox runtime identifier
    std::string version;            // Sandbox runtime version
    std::string filename;           // Canonical entry file
    bool executable;
    bool generatable;
    const char* harness_template;   // nullptr when no harness exists
};

class LanguageTable {
public:
    // Case-insensitive; accepts a few aliases (python3, js, node, c++, ts).
    // Returns nullptr for unknown languages.
    static const LanguageSpec* find(const std::string& name);

    static const std::vector<LanguageSpec>& all();

    static bool is_executable(const std::string& name);
    static bool is_generatable(const std::string& name);

    // Names accepted for a job kind, for error messages
    static std::string executable_names();
    static std::string generatable_names();
};

} // namespace capsulerun
