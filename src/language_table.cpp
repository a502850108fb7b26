#include "language_table.h"
#include <algorithm>
#include <cctype>
#include <map>

namespace capsulerun {

namespace {

// Placeholders: {{USER_CODE_BASE64}}, {{TEST_DATA}} (base64 JSON), {{FUNCTION_NAME}}.
// User code is decoded and run inside the guarded block so that import,
// syntax and top-level errors still end in a sentinel line.
const char* PYTHON_HARNESS = R"PY(import os
import sys
if os.environ.get('PYTHONHASHSEED') != '0':
    os.environ['PYTHONHASHSEED'] = '0'
    try:
        os.execv(sys.executable, [sys.executable] + sys.argv)
    except OSError:
        pass

import json
import base64
import random
random.seed(42)
try:
    import numpy as np
    np.random.seed(42)
except ImportError:
    pass

def _capsule_normalize(value):
    if isinstance(value, bool) or value is None:
        return value
    if isinstance(value, float):
        return round(value, 6)
    if isinstance(value, (list, tuple)):
        return [_capsule_normalize(v) for v in value]
    if isinstance(value, (set, frozenset)):
        return sorted((_capsule_normalize(v) for v in value), key=repr)
    if isinstance(value, dict):
        return {str(k): _capsule_normalize(v) for k, v in value.items()}
    return value

_capsule_data = json.loads(base64.b64decode('{{TEST_DATA}}').decode('utf-8'))
try:
    exec(compile(base64.b64decode('{{USER_CODE_BASE64}}').decode('utf-8'), '<submission>', 'exec'), globals())
    _capsule_actual = _capsule_normalize({{FUNCTION_NAME}}(*_capsule_data['input_args']))
    _capsule_expected = _capsule_normalize(_capsule_data['expected_output'])
    if _capsule_actual == _capsule_expected:
        print('TEST_PASSED')
    else:
        print('TEST_FAILED: expected=' + json.dumps(_capsule_expected, default=repr) +
              ' actual=' + json.dumps(_capsule_actual, default=repr))
except Exception as _capsule_error:
    print('TEST_ERROR: ' + type(_capsule_error).__name__ + ': ' + str(_capsule_error))
sys.stdout.flush()
)PY";

const char* JAVASCRIPT_HARNESS = R"JS((function () {
  let seed = 42;
  Math.random = function () {
    seed = (seed + 0x6D2B79F5) | 0;
    let t = Math.imul(seed ^ (seed >>> 15), 1 | seed);
    t = (t + Math.imul(t ^ (t >>> 7), 61 | t)) ^ t;
    return ((t ^ (t >>> 14)) >>> 0) / 4294967296;
  };
})();

function __capsuleNormalize(value) {
  if (typeof value === 'number') {
    return Number.isInteger(value) ? value : Math.round(value * 1e6) / 1e6;
  }
  if (value instanceof Set) {
    return Array.from(value).map(__capsuleNormalize)
      .sort((a, b) => JSON.stringify(a).localeCompare(JSON.stringify(b)));
  }
  if (value instanceof Map) {
    return __capsuleNormalize(Object.fromEntries(value));
  }
  if (Array.isArray(value)) {
    return value.map(__capsuleNormalize);
  }
  if (value && typeof value === 'object') {
    const out = {};
    for (const key of Object.keys(value).sort()) {
      out[key] = __capsuleNormalize(value[key]);
    }
    return out;
  }
  return value === undefined ? null : value;
}

const __capsuleData = JSON.parse(Buffer.from('{{TEST_DATA}}', 'base64').toString('utf8'));
try {
  const __capsuleSource = Buffer.from('{{USER_CODE_BASE64}}', 'base64').toString('utf8');
  const __capsuleTarget = new Function('require', 'module', 'exports',
    __capsuleSource + '\n;return ({{FUNCTION_NAME}});')(require, module, exports);
  const actual = __capsuleNormalize(__capsuleTarget(...__capsuleData.input_args));
  const expected = __capsuleNormalize(__capsuleData.expected_output);
  if (JSON.stringify(actual) === JSON.stringify(expected)) {
    console.log('TEST_PASSED');
  } else {
    console.log('TEST_FAILED: expected=' + JSON.stringify(expected) + ' actual=' + JSON.stringify(actual));
  }
} catch (e) {
  console.log('TEST_ERROR: ' + (e && e.message ? e.message : String(e)));
}
)JS";

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const std::map<std::string, std::string>& aliases() {
    static const std::map<std::string, std::string> table = {
        {"python3", "python"},
        {"py", "python"},
        {"js", "javascript"},
        {"node", "javascript"},
        {"ts", "typescript"},
        {"c++", "cpp"},
        {"cs", "csharp"},
        {"c#", "csharp"},
        {"sqlite3", "sql"}
    };
    return table;
}

std::string join_names(bool (*pred)(const LanguageSpec&)) {
    std::string out;
    for (const auto& spec : LanguageTable::all()) {
        if (!pred(spec)) continue;
        if (!out.empty()) out += ", ";
        out += spec.name;
    }
    return out;
}

} // namespace

const std::vector<LanguageSpec>& LanguageTable::all() {
    static const std::vector<LanguageSpec> table = {
        // name          runtime        version    filename        exec   gen    harness
        {"python",     "python",      "3.10.0",  "main.py",      true,  true,  PYTHON_HARNESS},
        {"javascript", "javascript",  "18.15.0", "main.js",      true,  true,  JAVASCRIPT_HARNESS},
        {"typescript", "typescript",  "5.0.3",   "main.ts",      true,  true,  nullptr},
        {"java",       "java",        "15.0.2",  "Main.java",    true,  true,  nullptr},
        {"cpp",        "c++",         "10.2.0",  "main.cpp",     true,  true,  nullptr},
        {"c",          "c",           "10.2.0",  "main.c",       true,  false, nullptr},
        {"csharp",     "csharp",      "6.12.0",  "main.cs",      true,  false, nullptr},
        {"go",         "go",          "1.16.2",  "main.go",      true,  false, nullptr},
        {"php",        "php",         "8.2.3",   "main.php",     true,  false, nullptr},
        {"ruby",       "ruby",        "3.0.1",   "main.rb",      true,  false, nullptr},
        {"rust",       "rust",        "1.68.2",  "main.rs",      true,  false, nullptr},
        {"sql",        "sqlite3",     "3.36.0",  "main.sql",     true,  true,  nullptr},
    };
    return table;
}

const LanguageSpec* LanguageTable::find(const std::string& name) {
    std::string key = to_lower(name);
    auto alias = aliases().find(key);
    if (alias != aliases().end()) {
        key = alias->second;
    }
    for (const auto& spec : all()) {
        if (spec.name == key) {
            return &spec;
        }
    }
    return nullptr;
}

bool LanguageTable::is_executable(const std::string& name) {
    const LanguageSpec* spec = find(name);
    return spec && spec->executable;
}

bool LanguageTable::is_generatable(const std::string& name) {
    const LanguageSpec* spec = find(name);
    return spec && spec->generatable;
}

std::string LanguageTable::executable_names() {
    return join_names([](const LanguageSpec& s) { return s.executable; });
}

std::string LanguageTable::generatable_names() {
    return join_names([](const LanguageSpec& s) { return s.generatable; });
}

} // namespace capsulerun
