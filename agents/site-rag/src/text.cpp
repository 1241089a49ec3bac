#include "../include/text.hpp"
#include <cctype>
#include <unordered_set>

namespace {

bool is_removed_control(unsigned char c) {
    if (c == '\t' || c == '\n' || c == '\r') return false;
    return c < 0x20 || c == 0x7F;
}

// Byte length of a whitespace character starting at i, 0 if none.
// Covers ASCII blanks and U+00A0 (no-break space).
size_t whitespace_len(const std::string& s, size_t i) {
    unsigned char c = (unsigned char)s[i];
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') return 1;
    if (c == 0xC2 && i + 1 < s.size() && (unsigned char)s[i + 1] == 0xA0) return 2;
    return 0;
}

// Length of the well-formed UTF-8 sequence starting at i, 0 if malformed.
size_t utf8_sequence_len(const std::string& s, size_t i) {
    unsigned char c = (unsigned char)s[i];
    size_t len;
    if (c < 0x80) return 1;
    else if ((c & 0xE0) == 0xC0 && c >= 0xC2) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0 && c <= 0xF4) len = 4;
    else return 0;
    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        if (((unsigned char)s[i + k] & 0xC0) != 0x80) return 0;
    }
    return len;
}

const std::unordered_set<std::string>& abbreviations() {
    static const std::unordered_set<std::string> abbrevs = {
        "mr", "mrs", "ms", "dr", "prof", "sr", "jr", "st", "vs", "etc",
        "e.g", "i.e", "no", "nos", "inc", "ltd", "co", "corp", "dept",
        "fig", "approx", "govt", "jan", "feb", "mar", "apr", "jun", "jul",
        "aug", "sep", "sept", "oct", "nov", "dec", "u.s", "a.m", "p.m",
        "hon", "rev", "est", "vol", "pp", "ph.d", "b.a", "m.a", "b.sc",
        "m.sc", "b.com", "m.com"
    };
    return abbrevs;
}

bool is_closing(const std::string& s, size_t i, size_t& len) {
    unsigned char c = (unsigned char)s[i];
    if (c == '"' || c == '\'' || c == ')' || c == ']') { len = 1; return true; }
    // U+2019 and U+201D
    if (c == 0xE2 && i + 2 < s.size() && (unsigned char)s[i + 1] == 0x80 &&
        ((unsigned char)s[i + 2] == 0x99 || (unsigned char)s[i + 2] == 0x9D)) {
        len = 3;
        return true;
    }
    return false;
}

// The word ending right before a '.' at position dot, lowercased, with
// leading punctuation stripped.
std::string word_before(const std::string& s, size_t start, size_t dot) {
    size_t b = dot;
    while (b > start && !std::isspace((unsigned char)s[b - 1])) --b;
    std::string w;
    for (size_t i = b; i < dot; ++i) w.push_back((char)std::tolower((unsigned char)s[i]));
    while (!w.empty() && (w.front() == '(' || w.front() == '"' || w.front() == '\'')) w.erase(w.begin());
    return w;
}

void push_sentence(std::vector<std::string>& out, const std::string& s, size_t b, size_t e) {
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    if (e > b) out.push_back(s.substr(b, e - b));
}

}

std::string normalize_text(const std::string& text) {
    if (text.empty()) return text;

    // Decode as UTF-8 so a dropped byte can never leave a removable
    // sequence behind for a second pass.
    std::string cleaned;
    cleaned.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8_sequence_len(text, i);
        if (len == 0) { ++i; continue; }
        unsigned char c = (unsigned char)text[i];
        bool c1 = len == 2 && c == 0xC2 && (unsigned char)text[i + 1] <= 0x9F;
        if (!(len == 1 && is_removed_control(c)) && !c1) cleaned.append(text, i, len);
        i += len;
    }

    std::string out;
    out.reserve(cleaned.size());
    i = 0;
    while (i < cleaned.size()) {
        size_t wl = whitespace_len(cleaned, i);
        if (!wl) {
            out.push_back(cleaned[i++]);
            continue;
        }
        int newlines = 0;
        while (i < cleaned.size() && (wl = whitespace_len(cleaned, i)) != 0) {
            if (cleaned[i] == '\n') ++newlines;
            i += wl;
        }
        if (out.empty() || i >= cleaned.size()) continue;
        if (newlines >= 2) out += "\n\n";
        else if (newlines == 1) out += "\n";
        else out += " ";
    }
    return out;
}

bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8_sequence_len(text, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

std::vector<std::string> split_sentences(const std::string& text) {
    if (!is_valid_utf8(text)) throw SentenceSplitError("input is not valid UTF-8");

    std::vector<std::string> out;
    const size_t n = text.size();
    size_t start = 0;
    size_t i = 0;
    while (i < n) {
        char c = text[i];
        if (c == '\n') {
            push_sentence(out, text, start, i);
            start = ++i;
            continue;
        }
        if (c != '.' && c != '!' && c != '?') { ++i; continue; }

        size_t term_begin = i;
        while (i < n && (text[i] == '.' || text[i] == '!' || text[i] == '?')) ++i;
        size_t close_len = 0;
        while (i < n && is_closing(text, i, close_len)) i += close_len;
        if (i < n && !std::isspace((unsigned char)text[i])) continue;

        if (i - term_begin == 1 && c == '.') {
            std::string w = word_before(text, start, term_begin);
            bool abbrev = abbreviations().count(w) > 0 ||
                          (w.size() == 1 && std::isalpha((unsigned char)w[0]));
            size_t next = i;
            while (next < n && (text[next] == ' ' || text[next] == '\t')) ++next;
            bool lower_follows = next < n && std::islower((unsigned char)text[next]);
            if (abbrev || lower_follows) continue;
        }
        push_sentence(out, text, start, i);
        start = i;
    }
    push_sentence(out, text, start, n);
    return out;
}

std::size_t word_count(const std::string& text) {
    std::size_t count = 0;
    bool in_word = false;
    for (char c : text) {
        if (std::isspace((unsigned char)c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++count;
        }
    }
    return count;
}
