#pragma once

#include <functional>
#include <vector>
#include <string>
#include <unordered_map>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "Types.hpp"

namespace Builtins {
    // All native functions take the evaluated arguments and the line being
    // executed (for error reporting) and return a single ClaroValue.
    // Failures are reported through Error::set.
    using NativeFunction = std::function<ClaroValue(const std::vector<ClaroValue>&, uint32_t)>;

    struct FunctionInfo {
        std::string name;
        int min_args = 0;
        int max_args = 0;   // -1 for variable args
        NativeFunction native_impl = nullptr;
    };

    using FunctionTable = std::unordered_map<std::string, FunctionInfo>;

    // The table of expression-level functions, keyed by upper-case name.
    const FunctionTable& table();

    // Looks up a function case-insensitively. Returns nullptr if unknown.
    const FunctionInfo* find(const std::string& name);
}

ClaroValue json_to_claro_value(const nlohmann::json& j);
nlohmann::json claro_to_json_value(const ClaroValue& val);
