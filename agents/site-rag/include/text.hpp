#pragma once
#include <string>
#include <vector>
#include <stdexcept>

// Canonical form for storage and tokenization: malformed UTF-8 bytes and
// control characters removed (tab and newline kept until whitespace
// folding), whitespace runs folded to
// " ", "\n" or "\n\n", ends trimmed. normalize_text(normalize_text(x)) ==
// normalize_text(x).
std::string normalize_text(const std::string& text);

struct SentenceSplitError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// English-oriented sentence boundary detection. Throws SentenceSplitError on
// input it cannot segment (invalid UTF-8).
std::vector<std::string> split_sentences(const std::string& text);

// Length unit for chunk budgets: whitespace-separated words.
std::size_t word_count(const std::string& text);

bool is_valid_utf8(const std::string& text);
