// TextIO.cpp
#include "TextIO.hpp"
#include <iostream>
#include <string>

void TextIO::print(const std::string& message) {
    std::cout << message;
}

void TextIO::nl() {
    std::cout << '\n';
}

std::optional<std::string> TextIO::read_line(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        std::cin.clear();
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

void TextIO::debug(uint32_t line_number, const std::string& text) {
    std::cout << "[DEBUG] line " << line_number << ": " << text << '\n';
}
