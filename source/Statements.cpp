// Statements.cpp
#include "Statements.hpp"
#include "StringUtils.hpp"
#include <string>
#include <unordered_map>

namespace {
    // The keyword lookup table. Using std::unordered_map is very efficient.
    const std::unordered_map<std::string, Tokens::ID> keyword_map = {
        {"PRINT",    Tokens::ID::PRINT},
        {"VARIABLE", Tokens::ID::VARIABLE},
        {"SET",      Tokens::ID::SET},
        {"STRING",   Tokens::ID::STRTYPE},
        {"LIST",     Tokens::ID::LIST},
        {"DICT",     Tokens::ID::DICT},
        {"IF",       Tokens::ID::IF},
        {"ELSE",     Tokens::ID::ELSE},
        {"WHILE",    Tokens::ID::WHILE},
        {"FOR",      Tokens::ID::FOR},
        {"FUNC",     Tokens::ID::FUNC},
        {"CALL",     Tokens::ID::CALL},
        {"RETURN",   Tokens::ID::RETURN},
        {"TRY",      Tokens::ID::TRY},
        {"EXCEPT",   Tokens::ID::EXCEPT},
        {"CATCH",    Tokens::ID::EXCEPT},
        {"FINALLY",  Tokens::ID::FINALLY},
        {"BREAK",    Tokens::ID::BREAK},
        {"CONTINUE", Tokens::ID::CONTINUE},
        {"INPUT",    Tokens::ID::INPUT},
        {"COMMENT",  Tokens::ID::COMMENT},
        {"REM",      Tokens::ID::COMMENT},
        {"END",      Tokens::ID::END},
        {"GET",      Tokens::ID::GET},
        {"REPEAT",   Tokens::ID::REPEAT},
        {"CONCAT",   Tokens::ID::CONCAT},
        {"STACK",    Tokens::ID::STACK},
        {"TRACE",    Tokens::ID::TRACE},
        {"DEBUG",    Tokens::ID::DEBUG},
        {"EXIT",     Tokens::ID::EXIT}
    };

    const std::unordered_map<std::string, Tokens::ID> operator_map = {
        {"AND",   Tokens::ID::AND},
        {"OR",    Tokens::ID::OR},
        {"NOT",   Tokens::ID::NOT},
        {"MOD",   Tokens::ID::MOD},
        {"TRUE",  Tokens::ID::JD_TRUE},
        {"FALSE", Tokens::ID::JD_FALSE}
    };
} // end anonymous namespace

Tokens::ID Statements::get(const std::string& statement) {
    // Keywords are case-insensitive.
    auto it = keyword_map.find(StringUtils::to_upper(statement));
    if (it != keyword_map.end()) {
        return it->second;
    }
    return Tokens::ID::NOCMD;
}

Tokens::ID Statements::get_operator(const std::string& word) {
    auto it = operator_map.find(StringUtils::to_upper(word));
    if (it != operator_map.end()) {
        return it->second;
    }
    return Tokens::ID::NOCMD;
}

bool Statements::opens_block(Tokens::ID token) {
    switch (token) {
    case Tokens::ID::IF:
    case Tokens::ID::WHILE:
    case Tokens::ID::FOR:
    case Tokens::ID::FUNC:
    case Tokens::ID::TRY:
        return true;
    default:
        return false;
    }
}
