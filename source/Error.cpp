// Error.cpp
#include "Error.hpp"
#include "TextIO.hpp" // We need this to print the error messages.
#include <vector>
#include <string>

namespace {
    // These variables hold the current error state.
    // They are in an anonymous namespace, making them accessible only within this file.
    uint8_t current_error_code = 0;
    uint32_t error_line_number = 0;
    std::string custom_error_message = "";

    const std::vector<std::string> errorMessages = {
            "OK",                               // 0
            "Invalid statement",                // 1
            "Missing argument",                 // 2
            "Function definition error",        // 3
            "Unterminated block",               // 4
            "Undefined function",               // 5
            "Wrong number of arguments",        // 6
            "Type Mismatch",                    // 7
            "Value is not iterable",            // 8
            "Expression error",                 // 9
            "Recursion limit exceeded",         // 10
            "BREAK/CONTINUE outside loop",      // 11
            "File I/O Error"                    // 12
    };
}

void Error::set(uint8_t errorCode, uint32_t lineNumber, const std::string& customMessage) {
    // Keep the original cause when a failure cascades up through callers.
    if (current_error_code != 0) {
        return;
    }
    current_error_code = errorCode;
    error_line_number = lineNumber;
    custom_error_message = customMessage;
}

uint8_t Error::get() {
    return current_error_code;
}

uint32_t Error::line() {
    return error_line_number;
}

std::string Error::message() {
    if (current_error_code == 0) {
        return "";
    }
    std::string message = getMessage(current_error_code);
    if (!custom_error_message.empty()) {
        message += ", " + custom_error_message;
    }
    return message;
}

void Error::clear() {
    current_error_code = 0;
    error_line_number = 0;
    custom_error_message.clear();
}

Error::State Error::save() {
    return State{ current_error_code, error_line_number, custom_error_message };
}

void Error::restore(const State& state) {
    current_error_code = state.code;
    error_line_number = state.line_number;
    custom_error_message = state.custom_message;
}

std::string Error::getMessage(uint8_t errorCode) {
    if (errorCode < errorMessages.size()) {
        return errorMessages[errorCode];
    }
    return "Unknown Error";
}

void Error::print() {
    if (current_error_code != 0) {
        TextIO::print("? Error #" + std::to_string(current_error_code) + ", " + message());
        if (error_line_number > 0) {
            TextIO::print(" IN LINE " + std::to_string(error_line_number));
        }
        TextIO::nl();
    }
}
