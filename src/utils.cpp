// ============================================================================
// utils.cpp — Sentence files and string helpers
// ============================================================================

#include "normform/utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace normform {

// ── read_sentences ──────────────────────────────────────────────────────────

std::vector<NumberedSentence> read_sentences(std::istream& in) {
    std::vector<NumberedSentence> sentences;
    std::string line;
    std::uint32_t line_num = 0;

    while (std::getline(in, line)) {
        ++line_num;
        std::string text = strip_comment(line);
        if (text.empty()) continue;
        sentences.push_back(NumberedSentence{line_num, std::move(text)});
    }
    return sentences;
}

std::vector<NumberedSentence> read_sentence_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }
    return read_sentences(file);
}

// ── trim ────────────────────────────────────────────────────────────────────

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ── strip_comment ───────────────────────────────────────────────────────────

std::string strip_comment(const std::string& line) {
    return trim(line.substr(0, line.find('#')));
}

// ── to_lower ────────────────────────────────────────────────────────────────

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // namespace normform
