// Error.hpp
#pragma once
#include <cstdint>
#include <string>

namespace Error {
    // Error codes. Every code is recoverable inside a TRY region.
    enum Code : uint8_t {
        OK = 0,
        INVALID_STATEMENT = 1,
        MISSING_ARGUMENT = 2,
        FUNCTION_DEFINITION = 3,
        UNTERMINATED_BLOCK = 4,
        UNDEFINED_FUNCTION = 5,
        ARITY_MISMATCH = 6,
        TYPE_MISMATCH = 7,
        NOT_ITERABLE = 8,
        EXPRESSION_ERROR = 9,
        RECURSION_LIMIT = 10,
        CONTROL_SIGNAL_OUTSIDE_LOOP = 11,
        FILE_IO = 12
    };

    // A copy of the error state, so a FINALLY block can run with a clean
    // slate and the pending error can be put back afterwards.
    struct State {
        uint8_t code = OK;
        uint32_t line_number = 0;
        std::string custom_message;
    };

    // Sets the current error code. The first error wins until clear().
    void set(uint8_t errorCode, uint32_t lineNumber, const std::string& customMessage = "");

    // Gets the current error code.
    uint8_t get();

    // Line number (1-based, original source) of the current error.
    uint32_t line();

    // Full message of the current error, without the line number.
    std::string message();

    // Clears the current error (sets it to 0).
    void clear();

    State save();
    void restore(const State& state);

    // Prints the message for the current error.
    void print();

    // A helper to get the message for a specific code.
    std::string getMessage(uint8_t errorCode);
}
