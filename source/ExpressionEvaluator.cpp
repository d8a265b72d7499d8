// ExpressionEvaluator.cpp
#include "ExpressionEvaluator.hpp"
#include "BuiltinFunctions.hpp"
#include "LocaleManager.hpp"
#include "Error.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
    bool is_integral(const ClaroValue& val) {
        return std::holds_alternative<long long>(val) || std::holds_alternative<bool>(val);
    }

    // Exponentiation by squaring; false if the result leaves the long long range.
    bool integer_power(long long base, long long exponent, long long& out) {
        long long result = 1;
        while (exponent > 0) {
            if (exponent & 1) {
                if (!checked_mul(result, base, result)) return false;
            }
            exponent >>= 1;
            if (exponent > 0 && !checked_mul(base, base, base)) return false;
        }
        out = result;
        return true;
    }

    // Quotes strings nested inside containers so ["1"] and [1] print differently.
    std::string element_to_string(const ClaroValue& val) {
        if (std::holds_alternative<std::string>(val)) {
            return "\"" + std::get<std::string>(val) + "\"";
        }
        return to_string(val);
    }

    std::string token_text(const Token& token) {
        if (token.id == Tokens::ID::NOCMD) return "end of expression";
        if (token.id == Tokens::ID::STRING) return "\"" + token.text + "\"";
        return "'" + token.text + "'";
    }
}

std::string to_string(const ClaroValue& val) {
    // std::visit will execute the correct lambda block based on the type currently held in val
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, bool>) {
            return arg ? "TRUE" : "FALSE";
        }
        else if constexpr (std::is_same_v<T, double>) {
            std::stringstream ss;
            ss.imbue(LocaleManager::get_current_locale());
            ss << std::fixed << std::setprecision(6) << arg;

            std::string s = ss.str();
            char decimal_point = std::use_facet<std::numpunct<char>>(LocaleManager::get_current_locale()).decimal_point();
            if (s.find(decimal_point) != std::string::npos) {
                s.erase(s.find_last_not_of('0') + 1, std::string::npos);
                if (!s.empty() && s.back() == decimal_point) {
                    s.pop_back();
                }
            }
            if (s == "-0") s = "0";
            return s;
        }
        else if constexpr (std::is_same_v<T, long long>) {
            return std::to_string(arg);
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        }
        else if constexpr (std::is_same_v<T, std::shared_ptr<Array>>) {
            if (!arg) return "[]";
            std::string result = "[";
            for (size_t i = 0; i < arg->data.size(); ++i) {
                if (i > 0) result += ", ";
                result += element_to_string(arg->data[i]);
            }
            return result + "]";
        }
        else if constexpr (std::is_same_v<T, std::shared_ptr<Map>>) {
            if (!arg) return "{}";
            std::string result = "{";
            bool first = true;
            for (const auto& pair : arg->data) {
                if (!first) result += ", ";
                result += "\"" + pair.first + "\": " + element_to_string(pair.second);
                first = false;
            }
            return result + "}";
        }
        return "";
        }, val);
}

ExpressionEvaluator::ExpressionEvaluator(const std::string& expr, const Environment& env, uint32_t line_number)
    : expr(expr), env(env), line_number(line_number) {
}

ClaroValue ExpressionEvaluator::evaluate(const std::string& expr, const Environment& env, uint32_t line_number) {
    ExpressionEvaluator evaluator(expr, env, line_number);
    if (!Lexer::tokenize(expr, line_number, evaluator.tokens)) return false;
    if (evaluator.peek().id == Tokens::ID::NOCMD) {
        return evaluator.syntax_error("empty expression");
    }

    ClaroValue result = evaluator.evaluate_expression();
    if (Error::get() != 0) return false;

    if (evaluator.peek().id != Tokens::ID::NOCMD) {
        return evaluator.syntax_error("unexpected " + token_text(evaluator.peek()));
    }
    return result;
}

bool ExpressionEvaluator::accept(Tokens::ID id) {
    if (tokens[pos].id != id) return false;
    pos++;
    return true;
}

ClaroValue ExpressionEvaluator::fail(uint8_t code, const std::string& cause) {
    if (skip_depth == 0) {
        Error::set(code, line_number, expr + ": " + cause);
    }
    return false;
}

ClaroValue ExpressionEvaluator::syntax_error(const std::string& cause) {
    Error::set(Error::EXPRESSION_ERROR, line_number, expr + ": " + cause);
    return false;
}

// Level 1: OR (short-circuit)
ClaroValue ExpressionEvaluator::evaluate_expression() {
    ClaroValue left = parse_and();
    while (Error::get() == 0 && peek().id == Tokens::ID::OR) {
        pos++;
        bool result = to_bool(left);
        if (result) skip_depth++;
        ClaroValue right = parse_and();
        if (result) skip_depth--;
        if (Error::get() != 0) return false;
        left = result || to_bool(right);
    }
    return left;
}

// Level 2: AND (short-circuit)
ClaroValue ExpressionEvaluator::parse_and() {
    ClaroValue left = parse_not();
    while (Error::get() == 0 && peek().id == Tokens::ID::AND) {
        pos++;
        bool result = to_bool(left);
        if (!result) skip_depth++;
        ClaroValue right = parse_not();
        if (!result) skip_depth--;
        if (Error::get() != 0) return false;
        left = result && to_bool(right);
    }
    return left;
}

// Level 3: NOT binds looser than comparisons, so NOT a == b is NOT (a == b)
ClaroValue ExpressionEvaluator::parse_not() {
    if (accept(Tokens::ID::NOT)) {
        ClaroValue operand = parse_not();
        if (Error::get() != 0) return false;
        return !to_bool(operand);
    }
    return parse_comparison();
}

// Level 4: comparisons
ClaroValue ExpressionEvaluator::parse_comparison() {
    ClaroValue left = parse_term();
    while (Error::get() == 0) {
        Tokens::ID op = peek().id;
        if (op != Tokens::ID::C_EQ && op != Tokens::ID::C_NE && op != Tokens::ID::C_LT &&
            op != Tokens::ID::C_GT && op != Tokens::ID::C_LE && op != Tokens::ID::C_GE) {
            break;
        }
        pos++;
        ClaroValue right = parse_term();
        if (Error::get() != 0) return false;
        left = apply_comparison(op, left, right);
    }
    return left;
}

// Level 5: + and -
ClaroValue ExpressionEvaluator::parse_term() {
    ClaroValue left = parse_factor();
    while (Error::get() == 0) {
        Tokens::ID op = peek().id;
        if (op != Tokens::ID::C_PLUS && op != Tokens::ID::C_MINUS) break;
        pos++;
        ClaroValue right = parse_factor();
        if (Error::get() != 0) return false;
        left = apply_arithmetic(op, left, right);
    }
    return left;
}

// Level 6: *, /, % and MOD
ClaroValue ExpressionEvaluator::parse_factor() {
    ClaroValue left = parse_unary();
    while (Error::get() == 0) {
        Tokens::ID op = peek().id;
        if (op != Tokens::ID::C_ASTR && op != Tokens::ID::C_SLASH &&
            op != Tokens::ID::C_PERCENT && op != Tokens::ID::MOD) {
            break;
        }
        pos++;
        ClaroValue right = parse_unary();
        if (Error::get() != 0) return false;
        left = apply_arithmetic(op == Tokens::ID::MOD ? Tokens::ID::C_PERCENT : op, left, right);
    }
    return left;
}

// Level 7: unary minus/plus. -2^2 is -(2^2).
ClaroValue ExpressionEvaluator::parse_unary() {
    if (accept(Tokens::ID::C_MINUS)) {
        ClaroValue operand = parse_unary();
        if (Error::get() != 0) return false;
        if (std::holds_alternative<long long>(operand)) {
            long long negated = 0;
            if (checked_sub(0, std::get<long long>(operand), negated)) return negated;
            return -static_cast<double>(std::get<long long>(operand));
        }
        if (std::holds_alternative<double>(operand)) return -std::get<double>(operand);
        if (std::holds_alternative<bool>(operand)) return -to_integer(operand);
        return fail(Error::TYPE_MISMATCH, "cannot negate a " + type_name(operand));
    }
    if (accept(Tokens::ID::C_PLUS)) {
        ClaroValue operand = parse_unary();
        if (Error::get() != 0) return false;
        if (!is_numeric(operand)) return fail(Error::TYPE_MISMATCH, "unary + needs a number, got " + type_name(operand));
        return operand;
    }
    return parse_power();
}

// Level 8: ^ and ** (right associative)
ClaroValue ExpressionEvaluator::parse_power() {
    ClaroValue base = parse_postfix();
    if (Error::get() != 0) return false;
    if (accept(Tokens::ID::C_CARET)) {
        ClaroValue exponent = parse_unary();
        if (Error::get() != 0) return false;
        return apply_arithmetic(Tokens::ID::C_CARET, base, exponent);
    }
    return base;
}

// Level 9: indexing
ClaroValue ExpressionEvaluator::parse_postfix() {
    ClaroValue value = parse_primary();
    while (Error::get() == 0 && accept(Tokens::ID::C_LEFTBRACKET)) {
        ClaroValue index = evaluate_expression();
        if (Error::get() != 0) return false;
        if (!accept(Tokens::ID::C_RIGHTBRACKET)) {
            return syntax_error("expected ']' but found " + token_text(peek()));
        }
        value = apply_index(value, index);
    }
    return value;
}

// Level 10: literals, names, calls and parentheses
ClaroValue ExpressionEvaluator::parse_primary() {
    const Token token = peek();
    switch (token.id) {
    case Tokens::ID::NUMBER: {
        pos++;
        bool is_float = token.text.find_first_of(".eE") != std::string::npos;
        try {
            if (!is_float) return std::stoll(token.text);
        }
        catch (const std::out_of_range&) {
            // Too large for an integer; fall through to double.
        }
        try {
            size_t consumed = 0;
            double value = std::stod(token.text, &consumed);
            if (consumed == token.text.size()) return value;
        }
        catch (const std::exception&) {
        }
        return syntax_error("malformed number '" + token.text + "'");
    }
    case Tokens::ID::STRING:
        pos++;
        return token.text;
    case Tokens::ID::JD_TRUE:
        pos++;
        return true;
    case Tokens::ID::JD_FALSE:
        pos++;
        return false;
    case Tokens::ID::VARIANT: {
        pos++;
        if (peek().id == Tokens::ID::C_LEFTPAREN) {
            return parse_function_call(token.text);
        }
        auto it = env.find(token.text);
        if (it == env.end()) {
            return fail(Error::EXPRESSION_ERROR, "undefined variable '" + token.text + "'");
        }
        return it->second;
    }
    case Tokens::ID::C_LEFTPAREN: {
        pos++;
        ClaroValue value = evaluate_expression();
        if (Error::get() != 0) return false;
        if (!accept(Tokens::ID::C_RIGHTPAREN)) {
            return syntax_error("expected ')' but found " + token_text(peek()));
        }
        return value;
    }
    case Tokens::ID::C_LEFTBRACKET:
        return parse_array_literal();
    case Tokens::ID::C_LEFTBRACE:
        return parse_map_literal();
    default:
        return syntax_error("unexpected " + token_text(token));
    }
}

ClaroValue ExpressionEvaluator::parse_array_literal() {
    pos++; // Consume '['
    std::vector<ClaroValue> elements;
    if (!accept(Tokens::ID::C_RIGHTBRACKET)) {
        while (true) {
            elements.push_back(evaluate_expression());
            if (Error::get() != 0) return false;
            if (accept(Tokens::ID::C_RIGHTBRACKET)) break;
            if (!accept(Tokens::ID::C_COMMA)) {
                return syntax_error("expected ',' or ']' in list literal");
            }
        }
    }
    return make_array(std::move(elements));
}

// --- FUNCTION TO PARSE MAP LITERALS ---
ClaroValue ExpressionEvaluator::parse_map_literal() {
    pos++; // Consume '{'
    auto new_map_ptr = std::make_shared<Map>();
    if (accept(Tokens::ID::C_RIGHTBRACE)) {
        return new_map_ptr;
    }

    while (true) {
        // 1. Key: a bare name before ':' is taken literally, anything else is evaluated
        std::string key_str;
        if (peek().id == Tokens::ID::VARIANT && tokens[pos + 1].id == Tokens::ID::C_COLON) {
            key_str = peek().text;
            pos++;
        }
        else {
            ClaroValue key_val = evaluate_expression();
            if (Error::get() != 0) return false;
            key_str = to_string(key_val);
        }

        // 2. Expect Colon
        if (!accept(Tokens::ID::C_COLON)) {
            return syntax_error("expected ':' after map key");
        }

        // 3. Parse Value
        ClaroValue value = evaluate_expression();
        if (Error::get() != 0) return false;
        new_map_ptr->data[key_str] = value;

        // 4. Check for separator
        if (accept(Tokens::ID::C_RIGHTBRACE)) break;
        if (!accept(Tokens::ID::C_COMMA)) {
            return syntax_error("expected ',' or '}' in map literal");
        }
    }
    return new_map_ptr;
}

ClaroValue ExpressionEvaluator::parse_function_call(const std::string& name) {
    pos++; // Consume '('
    std::vector<ClaroValue> args;
    if (!accept(Tokens::ID::C_RIGHTPAREN)) {
        while (true) {
            args.push_back(evaluate_expression());
            if (Error::get() != 0) return false;
            if (accept(Tokens::ID::C_RIGHTPAREN)) break;
            if (!accept(Tokens::ID::C_COMMA)) {
                return syntax_error("expected ',' or ')' in call to " + name);
            }
        }
    }

    const Builtins::FunctionInfo* info = Builtins::find(name);
    if (!info) {
        return fail(Error::EXPRESSION_ERROR, "unknown function '" + name + "'");
    }
    const int count = static_cast<int>(args.size());
    if (count < info->min_args || (info->max_args >= 0 && count > info->max_args)) {
        return fail(Error::EXPRESSION_ERROR, info->name + " called with " + std::to_string(count) + " argument(s)");
    }
    if (skip_depth > 0) return false;
    return info->native_impl(args, line_number);
}

ClaroValue ExpressionEvaluator::apply_arithmetic(Tokens::ID op, const ClaroValue& left, const ClaroValue& right) {
    // --- String and list concatenation ---
    if (op == Tokens::ID::C_PLUS) {
        if (std::holds_alternative<std::string>(left) || std::holds_alternative<std::string>(right)) {
            return to_string(left) + to_string(right);
        }
        if (std::holds_alternative<std::shared_ptr<Array>>(left) && std::holds_alternative<std::shared_ptr<Array>>(right)) {
            const auto& l = std::get<std::shared_ptr<Array>>(left);
            const auto& r = std::get<std::shared_ptr<Array>>(right);
            std::vector<ClaroValue> joined = l->data;
            joined.insert(joined.end(), r->data.begin(), r->data.end());
            return make_array(std::move(joined));
        }
    }
    // --- "ab" * 3 repeats the string ---
    if (op == Tokens::ID::C_ASTR && std::holds_alternative<std::string>(left) && is_integral(right)) {
        std::string result;
        for (long long i = 0; i < to_integer(right); ++i) result += std::get<std::string>(left);
        return result;
    }

    if (!is_numeric(left) || !is_numeric(right)) {
        return fail(Error::TYPE_MISMATCH, "unsupported operand types " + type_name(left) + " and " + type_name(right));
    }

    const bool integral = is_integral(left) && is_integral(right);
    if ((op == Tokens::ID::C_SLASH || op == Tokens::ID::C_PERCENT) && to_double(right) == 0.0) {
        return fail(Error::EXPRESSION_ERROR, "division by zero");
    }

    if (integral) {
        long long l = to_integer(left);
        long long r = to_integer(right);
        // Results that do not fit a long long widen to double, like oversized literals.
        long long result = 0;
        switch (op) {
        case Tokens::ID::C_PLUS:
            if (checked_add(l, r, result)) return result;
            return static_cast<double>(l) + static_cast<double>(r);
        case Tokens::ID::C_MINUS:
            if (checked_sub(l, r, result)) return result;
            return static_cast<double>(l) - static_cast<double>(r);
        case Tokens::ID::C_ASTR:
            if (checked_mul(l, r, result)) return result;
            return static_cast<double>(l) * static_cast<double>(r);
        case Tokens::ID::C_SLASH: return static_cast<double>(l) / static_cast<double>(r);
        case Tokens::ID::C_PERCENT:
            if (r == -1) return 0LL;
            return l % r;
        case Tokens::ID::C_CARET:
            if (r >= 0 && integer_power(l, r, result)) return result;
            return std::pow(static_cast<double>(l), static_cast<double>(r));
        default: break;
        }
    }
    else {
        double l = to_double(left);
        double r = to_double(right);
        switch (op) {
        case Tokens::ID::C_PLUS: return l + r;
        case Tokens::ID::C_MINUS: return l - r;
        case Tokens::ID::C_ASTR: return l * r;
        case Tokens::ID::C_SLASH: return l / r;
        case Tokens::ID::C_PERCENT: return std::fmod(l, r);
        case Tokens::ID::C_CARET: return std::pow(l, r);
        default: break;
        }
    }
    return syntax_error("unknown operator");
}

ClaroValue ExpressionEvaluator::apply_comparison(Tokens::ID op, const ClaroValue& left, const ClaroValue& right) {
    if (op == Tokens::ID::C_EQ) return values_equal(left, right);
    if (op == Tokens::ID::C_NE) return !values_equal(left, right);

    int order = 0;
    if (is_numeric(left) && is_numeric(right)) {
        double l = to_double(left);
        double r = to_double(right);
        order = (l < r) ? -1 : (l > r ? 1 : 0);
    }
    else if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
        order = std::get<std::string>(left).compare(std::get<std::string>(right));
    }
    else {
        return fail(Error::TYPE_MISMATCH, "cannot compare " + type_name(left) + " with " + type_name(right));
    }

    switch (op) {
    case Tokens::ID::C_LT: return order < 0;
    case Tokens::ID::C_GT: return order > 0;
    case Tokens::ID::C_LE: return order <= 0;
    case Tokens::ID::C_GE: return order >= 0;
    default: return false;
    }
}

ClaroValue ExpressionEvaluator::apply_index(const ClaroValue& container, const ClaroValue& index) {
    if (std::holds_alternative<std::shared_ptr<Map>>(container)) {
        const auto& map_ptr = std::get<std::shared_ptr<Map>>(container);
        const std::string key = to_string(index);
        auto it = map_ptr->data.find(key);
        if (it == map_ptr->data.end()) {
            return fail(Error::EXPRESSION_ERROR, "key '" + key + "' not found");
        }
        return it->second;
    }

    long long size = 0;
    if (std::holds_alternative<std::shared_ptr<Array>>(container)) {
        size = static_cast<long long>(std::get<std::shared_ptr<Array>>(container)->data.size());
    }
    else if (std::holds_alternative<std::string>(container)) {
        size = static_cast<long long>(std::get<std::string>(container).size());
    }
    else {
        return fail(Error::TYPE_MISMATCH, "a " + type_name(container) + " cannot be indexed");
    }

    if (!is_integral(index)) {
        return fail(Error::TYPE_MISMATCH, "index must be an integer, got " + type_name(index));
    }
    long long i = to_integer(index);
    if (i < 0) i += size;
    if (i < 0 || i >= size) {
        return fail(Error::EXPRESSION_ERROR, "index " + std::to_string(to_integer(index)) + " out of range");
    }

    if (std::holds_alternative<std::string>(container)) {
        return std::string(1, std::get<std::string>(container)[static_cast<size_t>(i)]);
    }
    return std::get<std::shared_ptr<Array>>(container)->data[static_cast<size_t>(i)];
}
