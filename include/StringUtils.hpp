// StringUtils.hpp
#pragma once
#include <string>
#include <vector>
#include <utility>

namespace StringUtils {
    // Checks if a character is a whitespace character.
    bool isspace(char c);

    // Checks if a character is an alphabet letter.
    bool isletter(char c);

    // Checks if a character is a digit.
    bool isdigit(char c);

    // True for a valid variable/function name: letter or '_' first, then letters, digits, '_'.
    bool is_identifier(const std::string& s);

    // Removes leading and trailing whitespace.
    void trim(std::string& s);
    std::string trimmed(std::string s);

    // Converts a string to uppercase.
    std::string to_upper(std::string s);

    // Splits off the first whitespace-delimited word: "PRINT x + 1" -> {"PRINT", "x + 1"}.
    std::pair<std::string, std::string> split_first_word(const std::string& s);

    // Splits on `separator` at nesting depth 0, ignoring separators inside
    // quotes, (), [] and {}. Pieces are trimmed; empty pieces are dropped.
    std::vector<std::string> split_top_level(const std::string& s, char separator);

    // Splits on whitespace at nesting depth 0 (same quoting rules as above).
    std::vector<std::string> split_top_level_words(const std::string& s);

    // Finds `word` as a standalone, case-insensitive word at nesting depth 0.
    // Returns std::string::npos if not found.
    size_t find_top_level_word(const std::string& s, const std::string& word);
}
