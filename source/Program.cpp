// Program.cpp
#include "Program.hpp"
#include "Statements.hpp"
#include "StringUtils.hpp"
#include "Error.hpp"
#include <fstream>
#include <sstream>

namespace {
    bool is_comment_line(const std::string& text) {
        return !text.empty() && (text[0] == '#' || text[0] == '\'');
    }
}

SourceLine Program::make_line(const std::string& text, uint32_t line_number) {
    SourceLine line;
    line.text = StringUtils::trimmed(text);
    line.line_number = line_number;
    auto parts = StringUtils::split_first_word(line.text);
    line.keyword_text = parts.first;
    line.args = parts.second;
    line.keyword = Statements::get(parts.first);
    return line;
}

LineSequence Program::parse(const std::string& source, uint32_t first_line_number) {
    LineSequence lines;
    std::stringstream stream(source);
    std::string raw;
    uint32_t line_number = first_line_number;
    while (std::getline(stream, raw)) {
        std::string text = StringUtils::trimmed(raw);
        if (!text.empty() && !is_comment_line(text)) {
            lines.push_back(make_line(text, line_number));
        }
        line_number++;
    }
    return lines;
}

bool Program::load_file(const std::string& path, LineSequence& out) {
    std::ifstream infile(path);
    if (!infile) {
        Error::set(Error::FILE_IO, 0, "Cannot open file '" + path + "'");
        return false;
    }
    std::stringstream buffer;
    buffer << infile.rdbuf();
    out = parse(buffer.str());
    return true;
}
