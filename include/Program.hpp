// Program.hpp
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include "Tokens.hpp"

// One executable line of a Claro program.
struct SourceLine {
    std::string text;           // Trimmed line text
    Tokens::ID keyword = Tokens::ID::NOCMD;
    std::string keyword_text;   // First word as written
    std::string args;           // Everything after the keyword
    uint32_t line_number = 0;   // 1-based line in the original source
};

using LineSequence = std::vector<SourceLine>;

namespace Program {
    // Splits source text into executable lines. Blank lines and comment
    // lines ('#' or '\'') are dropped; original line numbers are kept.
    LineSequence parse(const std::string& source, uint32_t first_line_number = 1);

    // Builds a single line record (keyword resolved, args split off).
    SourceLine make_line(const std::string& text, uint32_t line_number);

    // Reads and parses a file. Sets FILE_IO and returns false on failure.
    bool load_file(const std::string& path, LineSequence& out);
}
