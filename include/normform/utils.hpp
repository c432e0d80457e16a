// ============================================================================
// normform/utils.hpp — Sentence files and string helpers
// ============================================================================
//
// A sentence file holds one formula per line.  '#' starts a comment that
// runs to the end of the line; blank and comment-only lines are skipped but
// still counted, so diagnostics report the line number of the file.
//
// ============================================================================

#ifndef NORMFORM_UTILS_HPP
#define NORMFORM_UTILS_HPP

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace normform {

// ── Sentence files ──────────────────────────────────────────────────────────

struct NumberedSentence {
    std::uint32_t line = 1;   // 1-based line in the source file
    std::string   text;       // comment stripped, trimmed, never empty
};

/// Collect the sentences of a stream.
std::vector<NumberedSentence> read_sentences(std::istream& in);

/// Open `path` and collect its sentences.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<NumberedSentence> read_sentence_file(const std::string& path);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Everything before the first '#', trimmed.
std::string strip_comment(const std::string& line);

/// ASCII lower-case copy.  Used for the case-insensitive cnf/dnf mode.
std::string to_lower(std::string s);

}  // namespace normform

#endif  // NORMFORM_UTILS_HPP
