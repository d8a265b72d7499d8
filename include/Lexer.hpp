// Lexer.hpp
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "Tokens.hpp"

struct Token {
    Tokens::ID id = Tokens::ID::NOCMD;
    std::string text;   // Literal text: number digits, string contents, identifier name
};

namespace Lexer {
    // Breaks an expression into tokens. The returned vector always ends with
    // a NOCMD token. On an unexpected character it sets EXPRESSION_ERROR and
    // returns false.
    bool tokenize(const std::string& expr, uint32_t line_number, std::vector<Token>& out);
}
