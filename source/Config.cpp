// Config.cpp
#include "Config.hpp"
#include "Error.hpp"
#include <fstream>
#include <sstream>

bool Config::load_json(const std::string& text, InterpreterConfig& config) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e) {
        Error::set(Error::FILE_IO, 0, std::string("Invalid configuration: ") + e.what());
        return false;
    }
    if (!j.is_object()) {
        Error::set(Error::FILE_IO, 0, "Invalid configuration: top level must be an object");
        return false;
    }

    // Work on a copy so a bad key leaves the caller's config as it was.
    InterpreterConfig loaded = config;
    if (j.contains("recursion_limit")) {
        const auto& limit = j["recursion_limit"];
        if (!limit.is_number_integer() || limit.get<long long>() <= 0 ||
            limit.get<long long>() > MAX_RECURSION_LIMIT) {
            Error::set(Error::FILE_IO, 0, "Invalid configuration: recursion_limit must be an integer from 1 to " +
                std::to_string(MAX_RECURSION_LIMIT));
            return false;
        }
        loaded.recursion_limit = limit.get<int>();
    }
    if (j.contains("debug")) {
        if (!j["debug"].is_boolean()) {
            Error::set(Error::FILE_IO, 0, "Invalid configuration: debug must be true or false");
            return false;
        }
        loaded.debug = j["debug"].get<bool>();
    }
    if (j.contains("prompt")) {
        if (!j["prompt"].is_string()) {
            Error::set(Error::FILE_IO, 0, "Invalid configuration: prompt must be a string");
            return false;
        }
        loaded.prompt = j["prompt"].get<std::string>();
    }
    if (j.contains("locale")) {
        if (!j["locale"].is_string()) {
            Error::set(Error::FILE_IO, 0, "Invalid configuration: locale must be a string");
            return false;
        }
        loaded.locale = j["locale"].get<std::string>();
    }
    if (j.contains("globals")) {
        if (!j["globals"].is_object()) {
            Error::set(Error::FILE_IO, 0, "Invalid configuration: globals must be an object");
            return false;
        }
        loaded.globals = j["globals"];
    }

    config = loaded;
    return true;
}

bool Config::load_file(const std::string& path, InterpreterConfig& config) {
    std::ifstream infile(path);
    if (!infile) {
        Error::set(Error::FILE_IO, 0, "Cannot open configuration file '" + path + "'");
        return false;
    }
    std::stringstream buffer;
    buffer << infile.rdbuf();
    return load_json(buffer.str(), config);
}
