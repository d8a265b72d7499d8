// TextIO.hpp
#pragma once
#include <iostream>
#include <string>
#include <sstream>
#include <streambuf>
#include <optional>
#include <cstdint>

// Temporarily captures everything written to std::cout.
class CoutRedirector {
private:
    std::stringstream m_targetStream;
    std::streambuf* m_originalBuffer;
public:
    CoutRedirector() {
        m_originalBuffer = std::cout.rdbuf();
        std::cout.rdbuf(m_targetStream.rdbuf());
    }
    ~CoutRedirector() {
        std::cout.rdbuf(m_originalBuffer);
    }
    std::string getString() const {
        return m_targetStream.str();
    }
};

// A namespace for all text input/output related functions
namespace TextIO {
    void print(const std::string& message);
    void nl(); // Newline

    // Prints the prompt and blocks for one line from stdin.
    // Returns std::nullopt at end of input.
    std::optional<std::string> read_line(const std::string& prompt);

    // "[DEBUG] line <n>: <text>"
    void debug(uint32_t line_number, const std::string& text);
}
