#pragma once
#include <variant>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <unordered_map>
#include <limits>

// Forward-declare the containers so ClaroValue can know they exist.
struct Array;
struct Map;

// --- Use a std::shared_ptr to break the circular dependency ---
using ClaroValue = std::variant<bool, long long, double, std::string, std::shared_ptr<Array>, std::shared_ptr<Map>>;

// A variable environment: name -> value.
using Environment = std::unordered_map<std::string, ClaroValue>;

// --- An ordered sequence of values ---
struct Array {
    std::vector<ClaroValue> data;

    Array() = default;
    explicit Array(std::vector<ClaroValue> elements) : data(std::move(elements)) {}

    size_t size() const {
        return data.size();
    }

    bool operator==(const Array& other) const {
        return data == other.data;
    }
};

// --- A mapping from string keys to values (ordered by key) ---
struct Map {
    std::map<std::string, ClaroValue> data;

    bool operator==(const Map& other) const {
        return data == other.data;
    }
};

//==============================================================================
// HELPER FUNCTIONS
// We define them here as 'inline' so they can be used across
// multiple .cpp files without causing linker errors.
//==============================================================================

inline bool is_numeric(const ClaroValue& val) {
    return std::holds_alternative<long long>(val) || std::holds_alternative<double>(val) || std::holds_alternative<bool>(val);
}

// Helper to convert a ClaroValue to a double for math operations.
// It treats booleans as 1.0 or 0.0.
inline double to_double(const ClaroValue& val) {
    if (std::holds_alternative<double>(val)) {
        return std::get<double>(val);
    }
    if (std::holds_alternative<long long>(val)) {
        return static_cast<double>(std::get<long long>(val));
    }
    if (std::holds_alternative<bool>(val)) {
        return std::get<bool>(val) ? 1.0 : 0.0;
    }
    return 0.0;
}

// True if the double truncates to a value a long long can hold.
inline bool fits_integer(double d) {
    return d >= -9223372036854775808.0 && d < 9223372036854775808.0;
}

// Doubles outside the long long range saturate; NaN becomes 0.
inline long long to_integer(const ClaroValue& val) {
    if (std::holds_alternative<long long>(val)) {
        return std::get<long long>(val);
    }
    double d = to_double(val);
    if (d != d) return 0;
    if (!fits_integer(d)) {
        return d < 0 ? std::numeric_limits<long long>::min() : std::numeric_limits<long long>::max();
    }
    return static_cast<long long>(d);
}

// Checked integer arithmetic. Each returns false on overflow and leaves out untouched.
inline bool checked_add(long long a, long long b, long long& out) {
    if ((b > 0 && a > std::numeric_limits<long long>::max() - b) ||
        (b < 0 && a < std::numeric_limits<long long>::min() - b)) return false;
    out = a + b;
    return true;
}

inline bool checked_sub(long long a, long long b, long long& out) {
    if ((b < 0 && a > std::numeric_limits<long long>::max() + b) ||
        (b > 0 && a < std::numeric_limits<long long>::min() + b)) return false;
    out = a - b;
    return true;
}

inline bool checked_mul(long long a, long long b, long long& out) {
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    const long long max = std::numeric_limits<long long>::max();
    const long long min = std::numeric_limits<long long>::min();
    if (a > 0) {
        if (b > 0 ? a > max / b : b < min / a) return false;
    }
    else {
        if (b > 0 ? a < min / b : (a != 0 && b < max / a)) return false;
    }
    out = a * b;
    return true;
}

// Truthiness: zero, empty strings and empty containers are false.
inline bool to_bool(const ClaroValue& val) {
    if (std::holds_alternative<bool>(val)) {
        return std::get<bool>(val);
    }
    if (std::holds_alternative<long long>(val)) {
        return std::get<long long>(val) != 0;
    }
    if (std::holds_alternative<double>(val)) {
        return std::get<double>(val) != 0.0;
    }
    if (std::holds_alternative<std::string>(val)) {
        return !std::get<std::string>(val).empty();
    }
    if (std::holds_alternative<std::shared_ptr<Array>>(val)) {
        const auto& arr_ptr = std::get<std::shared_ptr<Array>>(val);
        return arr_ptr && !arr_ptr->data.empty();
    }
    if (std::holds_alternative<std::shared_ptr<Map>>(val)) {
        const auto& map_ptr = std::get<std::shared_ptr<Map>>(val);
        return map_ptr && !map_ptr->data.empty();
    }
    return false;
}

// Structural equality; containers compare by content, not by pointer.
inline bool values_equal(const ClaroValue& a, const ClaroValue& b) {
    if (is_numeric(a) && is_numeric(b)) {
        if (std::holds_alternative<long long>(a) && std::holds_alternative<long long>(b)) {
            return std::get<long long>(a) == std::get<long long>(b);
        }
        return to_double(a) == to_double(b);
    }
    if (std::holds_alternative<std::string>(a) && std::holds_alternative<std::string>(b)) {
        return std::get<std::string>(a) == std::get<std::string>(b);
    }
    if (std::holds_alternative<std::shared_ptr<Array>>(a) && std::holds_alternative<std::shared_ptr<Array>>(b)) {
        const auto& l = std::get<std::shared_ptr<Array>>(a);
        const auto& r = std::get<std::shared_ptr<Array>>(b);
        if (!l || !r) return l == r;
        if (l->data.size() != r->data.size()) return false;
        for (size_t i = 0; i < l->data.size(); ++i) {
            if (!values_equal(l->data[i], r->data[i])) return false;
        }
        return true;
    }
    if (std::holds_alternative<std::shared_ptr<Map>>(a) && std::holds_alternative<std::shared_ptr<Map>>(b)) {
        const auto& l = std::get<std::shared_ptr<Map>>(a);
        const auto& r = std::get<std::shared_ptr<Map>>(b);
        if (!l || !r) return l == r;
        if (l->data.size() != r->data.size()) return false;
        for (const auto& pair : l->data) {
            auto it = r->data.find(pair.first);
            if (it == r->data.end() || !values_equal(pair.second, it->second)) return false;
        }
        return true;
    }
    return false;
}

// Name of the dynamic type, used by TYPE() and in error messages.
inline std::string type_name(const ClaroValue& val) {
    switch (val.index()) {
    case 0: return "BOOLEAN";
    case 1: return "INTEGER";
    case 2: return "FLOAT";
    case 3: return "STRING";
    case 4: return "LIST";
    case 5: return "DICT";
    }
    return "UNKNOWN";
}

inline ClaroValue make_array(std::vector<ClaroValue> elements = {}) {
    return std::make_shared<Array>(std::move(elements));
}

inline ClaroValue make_map() {
    return std::make_shared<Map>();
}
