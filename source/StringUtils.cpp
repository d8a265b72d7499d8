// StringUtils.cpp
#include "StringUtils.hpp"
#include <cctype>   // Required for isspace, isalpha, isdigit
#include <algorithm>// Required for std::find_if

namespace {
    // Walks `s` and calls on_top_level(i) for every character that sits outside
    // quotes and brackets. A quote char toggles quoting; brackets adjust depth.
    template <typename Callback>
    void scan_top_level(const std::string& s, Callback on_top_level) {
        int depth = 0;
        char quote = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (quote) {
                if (c == quote) quote = 0;
                continue;
            }
            if (c == '"' || c == '\'') { quote = c; continue; }
            if (c == '(' || c == '[' || c == '{') { depth++; continue; }
            if (c == ')' || c == ']' || c == '}') { if (depth > 0) depth--; continue; }
            if (depth == 0) {
                if (!on_top_level(i)) return;
            }
        }
    }
}

bool StringUtils::isspace(char c) {
    // The cast is important for handling different character sets correctly.
    return std::isspace(static_cast<unsigned char>(c));
}

bool StringUtils::isletter(char c) {
    return std::isalpha(static_cast<unsigned char>(c));
}

bool StringUtils::isdigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c));
}

bool StringUtils::is_identifier(const std::string& s) {
    if (s.empty() || !(isletter(s[0]) || s[0] == '_')) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return StringUtils::isletter(c) || StringUtils::isdigit(c) || c == '_';
        });
}

// Trim from both ends
void StringUtils::trim(std::string& s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
        return !std::isspace(ch);
        }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
        }).base(), s.end());
}

std::string StringUtils::trimmed(std::string s) {
    trim(s);
    return s;
}

// to_upper
std::string StringUtils::to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::pair<std::string, std::string> StringUtils::split_first_word(const std::string& s) {
    std::string text = trimmed(s);
    size_t pos = 0;
    while (pos < text.size() && !isspace(text[pos])) pos++;
    std::string first = text.substr(0, pos);
    std::string rest = pos < text.size() ? trimmed(text.substr(pos)) : "";
    return { first, rest };
}

std::vector<std::string> StringUtils::split_top_level(const std::string& s, char separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    scan_top_level(s, [&](size_t i) {
        if (s[i] == separator) {
            std::string piece = trimmed(s.substr(start, i - start));
            if (!piece.empty()) parts.push_back(piece);
            start = i + 1;
        }
        return true;
        });
    std::string last = trimmed(s.substr(start));
    if (!last.empty()) parts.push_back(last);
    return parts;
}

std::vector<std::string> StringUtils::split_top_level_words(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    scan_top_level(s, [&](size_t i) {
        if (isspace(s[i])) {
            std::string piece = trimmed(s.substr(start, i - start));
            if (!piece.empty()) parts.push_back(piece);
            start = i + 1;
        }
        return true;
        });
    std::string last = trimmed(s.substr(start));
    if (!last.empty()) parts.push_back(last);
    return parts;
}

size_t StringUtils::find_top_level_word(const std::string& s, const std::string& word) {
    const std::string upper_word = to_upper(word);
    size_t found = std::string::npos;
    scan_top_level(s, [&](size_t i) {
        if (i + upper_word.size() > s.size()) return false;
        bool starts_word = (i == 0) || isspace(s[i - 1]);
        size_t after = i + upper_word.size();
        bool ends_word = (after == s.size()) || isspace(s[after]);
        if (starts_word && ends_word && to_upper(s.substr(i, upper_word.size())) == upper_word) {
            found = i;
            return false;
        }
        return true;
        });
    return found;
}
