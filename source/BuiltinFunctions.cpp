#include "BuiltinFunctions.hpp"
#include "ExpressionEvaluator.hpp"
#include "StringUtils.hpp"
#include "Error.hpp"
#include <algorithm>
#include <cmath>
#include <cctype>
#include <stdexcept>

namespace {

    // Sets a type mismatch naming the function and the offending type.
    ClaroValue type_error(const std::string& func, const ClaroValue& val, uint32_t line) {
        Error::set(Error::TYPE_MISMATCH, line, func + " does not accept a " + type_name(val));
        return false;
    }

    ClaroValue builtin_len(const std::vector<ClaroValue>& args, uint32_t line) {
        const ClaroValue& val = args[0];
        if (std::holds_alternative<std::string>(val)) {
            return static_cast<long long>(std::get<std::string>(val).size());
        }
        if (std::holds_alternative<std::shared_ptr<Array>>(val)) {
            const auto& arr_ptr = std::get<std::shared_ptr<Array>>(val);
            return static_cast<long long>(arr_ptr ? arr_ptr->data.size() : 0);
        }
        if (std::holds_alternative<std::shared_ptr<Map>>(val)) {
            const auto& map_ptr = std::get<std::shared_ptr<Map>>(val);
            return static_cast<long long>(map_ptr ? map_ptr->data.size() : 0);
        }
        return type_error("LEN", val, line);
    }

    ClaroValue builtin_str(const std::vector<ClaroValue>& args, uint32_t) {
        return to_string(args[0]);
    }

    // Parses a whole string as a number; sets EXPRESSION_ERROR on junk.
    bool parse_number(const std::string& func, const std::string& text, double& out, uint32_t line) {
        std::string s = StringUtils::trimmed(text);
        try {
            size_t consumed = 0;
            out = std::stod(s, &consumed);
            if (consumed == s.size()) return true;
        }
        catch (const std::invalid_argument&) {}
        catch (const std::out_of_range&) {}
        Error::set(Error::EXPRESSION_ERROR, line, func + ": cannot convert '" + text + "' to a number");
        return false;
    }

    // Truncates toward zero; values outside the integer range are an error.
    ClaroValue truncate_to_integer(double d, uint32_t line) {
        if (!fits_integer(d)) {
            Error::set(Error::EXPRESSION_ERROR, line, "INT: value out of integer range");
            return false;
        }
        return static_cast<long long>(d);
    }

    ClaroValue builtin_int(const std::vector<ClaroValue>& args, uint32_t line) {
        const ClaroValue& val = args[0];
        if (std::holds_alternative<std::string>(val)) {
            double d = 0.0;
            if (!parse_number("INT", std::get<std::string>(val), d, line)) return false;
            return truncate_to_integer(d, line);
        }
        if (std::holds_alternative<double>(val)) return truncate_to_integer(std::get<double>(val), line);
        if (is_numeric(val)) return to_integer(val);
        return type_error("INT", val, line);
    }

    ClaroValue builtin_float(const std::vector<ClaroValue>& args, uint32_t line) {
        const ClaroValue& val = args[0];
        if (std::holds_alternative<std::string>(val)) {
            double d = 0.0;
            if (!parse_number("FLOAT", std::get<std::string>(val), d, line)) return false;
            return d;
        }
        if (is_numeric(val)) return to_double(val);
        return type_error("FLOAT", val, line);
    }

    ClaroValue builtin_upper(const std::vector<ClaroValue>& args, uint32_t) {
        return StringUtils::to_upper(to_string(args[0]));
    }

    ClaroValue builtin_lower(const std::vector<ClaroValue>& args, uint32_t) {
        std::string s = to_string(args[0]);
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    // RANGE(stop), RANGE(start, stop) or RANGE(start, stop, step); stop is exclusive.
    ClaroValue builtin_range(const std::vector<ClaroValue>& args, uint32_t line) {
        for (const auto& arg : args) {
            if (!is_numeric(arg)) return type_error("RANGE", arg, line);
        }
        long long start = 0, stop = 0, step = 1;
        if (args.size() == 1) {
            stop = to_integer(args[0]);
        }
        else {
            start = to_integer(args[0]);
            stop = to_integer(args[1]);
            if (args.size() == 3) step = to_integer(args[2]);
        }
        if (step == 0) {
            Error::set(Error::EXPRESSION_ERROR, line, "RANGE: step must not be zero");
            return false;
        }
        std::vector<ClaroValue> elements;
        for (long long i = start; step > 0 ? i < stop : i > stop;) {
            elements.push_back(i);
            if (!checked_add(i, step, i)) break;
        }
        return make_array(std::move(elements));
    }

    ClaroValue builtin_keys(const std::vector<ClaroValue>& args, uint32_t line) {
        if (!std::holds_alternative<std::shared_ptr<Map>>(args[0])) {
            return type_error("KEYS", args[0], line);
        }
        std::vector<ClaroValue> keys;
        const auto& map_ptr = std::get<std::shared_ptr<Map>>(args[0]);
        if (map_ptr) {
            for (const auto& pair : map_ptr->data) keys.push_back(pair.first);
        }
        return make_array(std::move(keys));
    }

    ClaroValue builtin_contains(const std::vector<ClaroValue>& args, uint32_t line) {
        const ClaroValue& container = args[0];
        const ClaroValue& item = args[1];
        if (std::holds_alternative<std::string>(container)) {
            return std::get<std::string>(container).find(to_string(item)) != std::string::npos;
        }
        if (std::holds_alternative<std::shared_ptr<Array>>(container)) {
            const auto& arr_ptr = std::get<std::shared_ptr<Array>>(container);
            if (!arr_ptr) return false;
            return std::any_of(arr_ptr->data.begin(), arr_ptr->data.end(),
                [&item](const ClaroValue& elem) { return values_equal(elem, item); });
        }
        if (std::holds_alternative<std::shared_ptr<Map>>(container)) {
            const auto& map_ptr = std::get<std::shared_ptr<Map>>(container);
            return map_ptr && map_ptr->data.count(to_string(item)) > 0;
        }
        return type_error("CONTAINS", container, line);
    }

    // FORMAT("{} + {} = {}", a, b, c) fills each {} with the next argument.
    ClaroValue builtin_format(const std::vector<ClaroValue>& args, uint32_t line) {
        const std::string fmt = to_string(args[0]);
        std::string result;
        size_t next_arg = 1;
        for (size_t i = 0; i < fmt.size(); ++i) {
            if (fmt[i] == '{' && i + 1 < fmt.size() && fmt[i + 1] == '}') {
                if (next_arg >= args.size()) {
                    Error::set(Error::EXPRESSION_ERROR, line, "FORMAT: not enough arguments for format string");
                    return false;
                }
                result += to_string(args[next_arg++]);
                ++i;
            }
            else {
                result += fmt[i];
            }
        }
        return result;
    }

    ClaroValue builtin_abs(const std::vector<ClaroValue>& args, uint32_t line) {
        const ClaroValue& val = args[0];
        if (std::holds_alternative<long long>(val)) {
            long long n = std::get<long long>(val);
            if (n >= 0) return n;
            long long negated = 0;
            if (checked_sub(0, n, negated)) return negated;
            return -static_cast<double>(n);
        }
        if (is_numeric(val)) return std::fabs(to_double(val));
        return type_error("ABS", val, line);
    }

    ClaroValue builtin_type(const std::vector<ClaroValue>& args, uint32_t) {
        return type_name(args[0]);
    }

    Builtins::FunctionTable build_table() {
        Builtins::FunctionTable table;
        // Helper lambda to make registration cleaner
        auto register_func = [&](const std::string& name, int min_args, int max_args, Builtins::NativeFunction func_ptr) {
            Builtins::FunctionInfo info;
            info.name = name;
            info.min_args = min_args;
            info.max_args = max_args;
            info.native_impl = func_ptr;
            table[StringUtils::to_upper(info.name)] = info;
            };

        register_func("LEN", 1, 1, builtin_len);
        register_func("STR", 1, 1, builtin_str);
        register_func("INT", 1, 1, builtin_int);
        register_func("FLOAT", 1, 1, builtin_float);
        register_func("UPPER", 1, 1, builtin_upper);
        register_func("LOWER", 1, 1, builtin_lower);
        register_func("RANGE", 1, 3, builtin_range);
        register_func("KEYS", 1, 1, builtin_keys);
        register_func("CONTAINS", 2, 2, builtin_contains);
        register_func("FORMAT", 1, -1, builtin_format); // -1 for variable args
        register_func("ABS", 1, 1, builtin_abs);
        register_func("TYPE", 1, 1, builtin_type);
        return table;
    }
} // end anonymous namespace

const Builtins::FunctionTable& Builtins::table() {
    static const FunctionTable builtin_table = build_table();
    return builtin_table;
}

const Builtins::FunctionInfo* Builtins::find(const std::string& name) {
    const auto& functions = table();
    auto it = functions.find(StringUtils::to_upper(name));
    if (it == functions.end()) return nullptr;
    return &it->second;
}

ClaroValue json_to_claro_value(const nlohmann::json& j) {
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number_integer()) return j.get<long long>();
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    if (j.is_array()) {
        auto arr = std::make_shared<Array>();
        for (const auto& item : j) {
            arr->data.push_back(json_to_claro_value(item));
        }
        return arr;
    }
    if (j.is_object()) {
        auto map = std::make_shared<Map>();
        for (auto& [key, value] : j.items()) {
            map->data[key] = json_to_claro_value(value);
        }
        return map;
    }
    // JSON null has no Claro counterpart; it becomes an empty string.
    return std::string("");
}

nlohmann::json claro_to_json_value(const ClaroValue& val) {
    return std::visit([](auto&& arg) -> nlohmann::json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::shared_ptr<Map>>) {
            nlohmann::json obj = nlohmann::json::object();
            if (arg) {
                for (const auto& pair : arg->data) {
                    obj[pair.first] = claro_to_json_value(pair.second);
                }
            }
            return obj;
        }
        else if constexpr (std::is_same_v<T, std::shared_ptr<Array>>) {
            nlohmann::json arr = nlohmann::json::array();
            if (arg) {
                for (const auto& item : arg->data) {
                    arr.push_back(claro_to_json_value(item));
                }
            }
            return arr;
        }
        else {
            // bool, long long, double and std::string map directly
            return nlohmann::json(arg);
        }
        }, val);
}
