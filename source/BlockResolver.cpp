// BlockResolver.cpp
#include "BlockResolver.hpp"
#include "Statements.hpp"
#include "Error.hpp"

namespace {
    // Walks forward from open_index + 1 tracking nesting depth and calls
    // on_depth_zero(index) for every line at the opener's own depth.
    // Returns the index of the matching END, or NOT_FOUND.
    template <typename Callback>
    size_t scan_block(const LineSequence& lines, size_t open_index, Callback on_depth_zero) {
        int depth = 0;
        for (size_t i = open_index + 1; i < lines.size(); ++i) {
            const Tokens::ID keyword = lines[i].keyword;
            if (Statements::opens_block(keyword)) {
                depth++;
                continue;
            }
            if (keyword == Tokens::ID::END) {
                if (depth == 0) return i;
                depth--;
                continue;
            }
            if (depth == 0 && !on_depth_zero(i)) return i;
        }
        return BlockResolver::NOT_FOUND;
    }

    void report_unterminated(const LineSequence& lines, size_t open_index) {
        const SourceLine& opener = lines[open_index];
        if (opener.keyword == Tokens::ID::FUNC) {
            Error::set(Error::FUNCTION_DEFINITION, opener.line_number, "FUNC without END");
        }
        else {
            Error::set(Error::UNTERMINATED_BLOCK, opener.line_number, opener.keyword_text + " without END");
        }
    }
}

size_t BlockResolver::find_close(const LineSequence& lines, size_t open_index) {
    size_t end = scan_block(lines, open_index, [](size_t) { return true; });
    if (end == NOT_FOUND) report_unterminated(lines, open_index);
    return end;
}

size_t BlockResolver::find_else_or_close(const LineSequence& lines, size_t open_index) {
    size_t found = scan_block(lines, open_index, [&lines](size_t i) {
        return lines[i].keyword != Tokens::ID::ELSE;
        });
    if (found == NOT_FOUND) report_unterminated(lines, open_index);
    return found;
}

BlockResolver::TrySections BlockResolver::find_try_sections(const LineSequence& lines, size_t open_index) {
    TrySections sections;
    sections.end_index = scan_block(lines, open_index, [&](size_t i) {
        if (lines[i].keyword == Tokens::ID::EXCEPT && sections.except_index == NOT_FOUND && sections.finally_index == NOT_FOUND) {
            sections.except_index = i;
        }
        else if (lines[i].keyword == Tokens::ID::FINALLY && sections.finally_index == NOT_FOUND) {
            sections.finally_index = i;
        }
        return true;
        });
    if (sections.end_index == NOT_FOUND) report_unterminated(lines, open_index);
    return sections;
}
