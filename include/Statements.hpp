// Statements.hpp
#pragma once
#include <string>
#include "Tokens.hpp"

namespace Statements {
    // Looks up a string to see if it's a statement keyword.
    // If it is, it returns the corresponding token ID.
    // Otherwise, it returns NOCMD.
    Tokens::ID get(const std::string& statement);

    // Looks up word operators and literals used inside expressions
    // (AND, OR, NOT, MOD, TRUE, FALSE). Returns NOCMD otherwise.
    Tokens::ID get_operator(const std::string& word);

    // Keywords that open a block closed by END.
    bool opens_block(Tokens::ID token);
}
