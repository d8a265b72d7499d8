// BlockResolver.hpp
#pragma once
#include <cstddef>
#include "Program.hpp"

namespace BlockResolver {
    // Marks an optional section (ELSE, EXCEPT, FINALLY) that is absent.
    constexpr size_t NOT_FOUND = static_cast<size_t>(-1);

    // Index of the END that closes the block opened at open_index.
    // Sets UNTERMINATED_BLOCK (FUNCTION_DEFINITION for FUNC) with the
    // opening line's number and returns NOT_FOUND if there is none.
    size_t find_close(const LineSequence& lines, size_t open_index);

    // Like find_close, but an ELSE at the same depth also matches.
    size_t find_else_or_close(const LineSequence& lines, size_t open_index);

    struct TrySections {
        size_t except_index = NOT_FOUND;
        size_t finally_index = NOT_FOUND;
        size_t end_index = NOT_FOUND;
    };

    // Splits a TRY region at its top-level EXCEPT/CATCH and FINALLY lines.
    // end_index is NOT_FOUND (and the error set) if the region never closes.
    TrySections find_try_sections(const LineSequence& lines, size_t open_index);
}
