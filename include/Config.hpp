// Config.hpp
#pragma once
#include <string>
#include <nlohmann/json.hpp>

// Upper bound for recursion_limit; deeper Claro calls would exhaust the native stack.
constexpr int MAX_RECURSION_LIMIT = 1000;

// Settings read from an optional JSON configuration file.
struct InterpreterConfig {
    int recursion_limit = 100;
    bool debug = false;
    std::string prompt = "Claro> ";
    std::string locale;                                     // Empty keeps the "C" locale
    nlohmann::json globals = nlohmann::json::object();      // Preset global variables
};

namespace Config {
    // Parses a JSON document into `config`. Unknown keys are ignored.
    // On malformed JSON or a badly typed key, sets FILE_IO and leaves
    // `config` untouched.
    bool load_json(const std::string& text, InterpreterConfig& config);

    // Reads the file and hands it to load_json.
    bool load_file(const std::string& path, InterpreterConfig& config);
}
