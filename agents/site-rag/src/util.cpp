#include "../include/util.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <cstdlib>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

int getenv_int_or(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("invalid integer in ") + key + ": " + v);
    }
}

std::string sha1_hex(const std::string& bytes) {
    SHA_CTX ctx;
    SHA1_Init(&ctx);
    SHA1_Update(&ctx, bytes.data(), bytes.size());
    unsigned char md[SHA_DIGEST_LENGTH];
    SHA1_Final(md, &ctx);
    std::ostringstream oss;
    for (int i = 0; i < SHA_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

void write_binary_file(const std::filesystem::path& p, const std::string& bytes) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot write " + p.string());
    f.write(bytes.data(), (std::streamsize)bytes.size());
    if (!f) throw std::runtime_error("short write to " + p.string());
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream ss(text);
    std::string w;
    while (ss >> w) out.push_back(w);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string title_from_filename(const std::string& filename) {
    std::string stem = filename;
    if (ends_with(to_lower(stem), ".pdf")) stem.resize(stem.size() - 4);
    std::string out;
    bool word_start = true;
    for (char c : stem) {
        if (c == '_') c = ' ';
        unsigned char uc = (unsigned char)c;
        if (std::isalpha(uc)) {
            out.push_back(word_start ? (char)std::toupper(uc) : (char)std::tolower(uc));
            word_start = false;
        } else {
            out.push_back(c);
            word_start = true;
        }
    }
    return out;
}
