// Tokens.hpp
#pragma once
#include <cstdint>

namespace Tokens {
    // One enum for statement keywords and expression tokens, so the
    // keyword table and the lexer share the same vocabulary.
    enum class ID : uint8_t {
        NOCMD = 0,          // Not a keyword / end of token stream

        // --- Statement keywords ---
        PRINT,
        VARIABLE,
        SET,
        STRTYPE,            // STRING statement
        LIST,
        DICT,
        IF,
        ELSE,
        WHILE,
        FOR,
        FUNC,
        CALL,
        RETURN,
        TRY,
        EXCEPT,             // EXCEPT or CATCH
        FINALLY,
        BREAK,
        CONTINUE,
        INPUT,
        COMMENT,            // COMMENT or REM
        END,
        GET,
        REPEAT,
        CONCAT,
        STACK,
        TRACE,
        DEBUG,
        EXIT,

        // --- Expression tokens ---
        NUMBER,
        STRING,             // String literal
        VARIANT,            // Identifier
        JD_TRUE,
        JD_FALSE,
        AND,
        OR,
        NOT,
        MOD,
        C_PLUS,
        C_MINUS,
        C_ASTR,
        C_SLASH,
        C_PERCENT,
        C_CARET,
        C_EQ,
        C_NE,
        C_LT,
        C_GT,
        C_LE,
        C_GE,
        C_LEFTPAREN,
        C_RIGHTPAREN,
        C_LEFTBRACKET,
        C_RIGHTBRACKET,
        C_LEFTBRACE,
        C_RIGHTBRACE,
        C_COMMA,
        C_COLON
    };
}
