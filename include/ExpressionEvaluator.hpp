// ExpressionEvaluator.hpp
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "Types.hpp"
#include "Lexer.hpp"

// Printable form of a value. Doubles use the LocaleManager locale with six
// fractional digits and trailing zeros removed; booleans print TRUE/FALSE.
std::string to_string(const ClaroValue& val);

class ExpressionEvaluator {
public:
    // Evaluates `expr` against `env`. On failure sets EXPRESSION_ERROR or
    // TYPE_MISMATCH (tagged with line_number) and returns FALSE.
    static ClaroValue evaluate(const std::string& expr, const Environment& env, uint32_t line_number);

private:
    ExpressionEvaluator(const std::string& expr, const Environment& env, uint32_t line_number);

    // Precedence levels, loosest first.
    ClaroValue evaluate_expression();   // OR
    ClaroValue parse_and();             // AND
    ClaroValue parse_not();             // NOT
    ClaroValue parse_comparison();      // == != < > <= >=
    ClaroValue parse_term();            // + -
    ClaroValue parse_factor();          // * / % MOD
    ClaroValue parse_unary();           // unary -, +
    ClaroValue parse_power();           // ^ ** (right associative)
    ClaroValue parse_postfix();         // x[i]
    ClaroValue parse_primary();
    ClaroValue parse_array_literal();
    ClaroValue parse_map_literal();
    ClaroValue parse_function_call(const std::string& name);

    ClaroValue apply_arithmetic(Tokens::ID op, const ClaroValue& left, const ClaroValue& right);
    ClaroValue apply_comparison(Tokens::ID op, const ClaroValue& left, const ClaroValue& right);
    ClaroValue apply_index(const ClaroValue& container, const ClaroValue& index);

    const Token& peek() const { return tokens[pos]; }
    bool accept(Tokens::ID id);

    // Runtime failure (type, lookup, arithmetic). Suppressed while the right
    // operand of a short-circuited AND/OR is being skipped.
    ClaroValue fail(uint8_t code, const std::string& cause);
    // Malformed expression; never suppressed.
    ClaroValue syntax_error(const std::string& cause);

    const std::string& expr;
    const Environment& env;
    uint32_t line_number;
    std::vector<Token> tokens;
    size_t pos = 0;
    int skip_depth = 0;
};
