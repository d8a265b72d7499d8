// Lexer.cpp
#include "Lexer.hpp"
#include "Statements.hpp"
#include "StringUtils.hpp"
#include "Error.hpp"

namespace {
    // Reads a quoted string starting at expr[pos] (the opening quote).
    // Supports \n, \t, \\ and escaped quotes.
    bool read_string(const std::string& expr, size_t& pos, std::string& out) {
        const char quote = expr[pos++];
        while (pos < expr.size()) {
            char c = expr[pos++];
            if (c == quote) return true;
            if (c == '\\' && pos < expr.size()) {
                char next = expr[pos++];
                switch (next) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                default: out += next; break;
                }
                continue;
            }
            out += c;
        }
        return false; // No closing quote
    }

    // Two-character operators first, then single characters.
    Tokens::ID match_operator(const std::string& expr, size_t& pos) {
        const char c = expr[pos];
        const char n = pos + 1 < expr.size() ? expr[pos + 1] : '\0';
        auto two = [&](Tokens::ID id) { pos += 2; return id; };
        auto one = [&](Tokens::ID id) { pos += 1; return id; };

        if (c == '*' && n == '*') return two(Tokens::ID::C_CARET);
        if (c == '=' && n == '=') return two(Tokens::ID::C_EQ);
        if (c == '!' && n == '=') return two(Tokens::ID::C_NE);
        if (c == '<' && n == '>') return two(Tokens::ID::C_NE);
        if (c == '<' && n == '=') return two(Tokens::ID::C_LE);
        if (c == '>' && n == '=') return two(Tokens::ID::C_GE);
        if (c == '&' && n == '&') return two(Tokens::ID::AND);
        if (c == '|' && n == '|') return two(Tokens::ID::OR);

        switch (c) {
        case '+': return one(Tokens::ID::C_PLUS);
        case '-': return one(Tokens::ID::C_MINUS);
        case '*': return one(Tokens::ID::C_ASTR);
        case '/': return one(Tokens::ID::C_SLASH);
        case '%': return one(Tokens::ID::C_PERCENT);
        case '^': return one(Tokens::ID::C_CARET);
        case '=': return one(Tokens::ID::C_EQ);
        case '<': return one(Tokens::ID::C_LT);
        case '>': return one(Tokens::ID::C_GT);
        case '!': return one(Tokens::ID::NOT);
        case '(': return one(Tokens::ID::C_LEFTPAREN);
        case ')': return one(Tokens::ID::C_RIGHTPAREN);
        case '[': return one(Tokens::ID::C_LEFTBRACKET);
        case ']': return one(Tokens::ID::C_RIGHTBRACKET);
        case '{': return one(Tokens::ID::C_LEFTBRACE);
        case '}': return one(Tokens::ID::C_RIGHTBRACE);
        case ',': return one(Tokens::ID::C_COMMA);
        case ':': return one(Tokens::ID::C_COLON);
        }
        return Tokens::ID::NOCMD;
    }
}

bool Lexer::tokenize(const std::string& expr, uint32_t line_number, std::vector<Token>& out) {
    out.clear();
    size_t pos = 0;
    while (pos < expr.size()) {
        const char c = expr[pos];
        if (StringUtils::isspace(c)) {
            pos++;
            continue;
        }

        // --- Numbers: 12, 3.5, .5, 1e3 ---
        if (StringUtils::isdigit(c) || (c == '.' && pos + 1 < expr.size() && StringUtils::isdigit(expr[pos + 1]))) {
            size_t start = pos;
            while (pos < expr.size() && (StringUtils::isdigit(expr[pos]) || expr[pos] == '.')) pos++;
            if (pos < expr.size() && (expr[pos] == 'e' || expr[pos] == 'E')) {
                size_t exp_pos = pos + 1;
                if (exp_pos < expr.size() && (expr[exp_pos] == '+' || expr[exp_pos] == '-')) exp_pos++;
                if (exp_pos < expr.size() && StringUtils::isdigit(expr[exp_pos])) {
                    pos = exp_pos;
                    while (pos < expr.size() && StringUtils::isdigit(expr[pos])) pos++;
                }
            }
            out.push_back({ Tokens::ID::NUMBER, expr.substr(start, pos - start) });
            continue;
        }

        // --- Strings ---
        if (c == '"' || c == '\'') {
            std::string contents;
            if (!read_string(expr, pos, contents)) {
                Error::set(Error::EXPRESSION_ERROR, line_number, expr + ": unterminated string literal");
                return false;
            }
            out.push_back({ Tokens::ID::STRING, contents });
            continue;
        }

        // --- Identifiers and word operators ---
        if (StringUtils::isletter(c) || c == '_') {
            size_t start = pos;
            while (pos < expr.size() && (StringUtils::isletter(expr[pos]) || StringUtils::isdigit(expr[pos]) || expr[pos] == '_')) pos++;
            std::string word = expr.substr(start, pos - start);
            Tokens::ID op = Statements::get_operator(word);
            out.push_back({ op == Tokens::ID::NOCMD ? Tokens::ID::VARIANT : op, word });
            continue;
        }

        size_t start = pos;
        Tokens::ID op = match_operator(expr, pos);
        if (op == Tokens::ID::NOCMD) {
            Error::set(Error::EXPRESSION_ERROR, line_number, expr + ": unexpected character '" + std::string(1, c) + "'");
            return false;
        }
        out.push_back({ op, expr.substr(start, pos - start) });
    }
    out.push_back({ Tokens::ID::NOCMD, "" });
    return true;
}
