#include "../include/chunker.hpp"
#include "../include/text.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace {
Chunk make_chunk(const Source& src, std::string text, int ordinal) {
    Chunk c;
    c.text = std::move(text);
    c.source_uri = src.uri;
    c.source_kind = src.kind;
    c.source_title = src.title;
    c.ordinal = ordinal;
    return c;
}
}

std::string render_source_header(const Source& src) {
    const char* label = src.kind == SourceKind::Pdf ? "PDF" : "WEB";
    const std::string& name = src.name.empty() ? src.uri : src.name;
    return "SOURCE: " + src.title + " (" + label + ": " + name + ")";
}

Chunker::Chunker(ChunkConfig cfg) : cfg_(cfg) {
    if (cfg_.max_tokens < 1) cfg_.max_tokens = 1;
}

std::vector<Chunk> Chunker::chunk(const Source& src) const {
    const std::string header = render_source_header(src);
    try {
        auto sentences = split_sentences(src.raw_text);
        return chunk_sentences(sentences, src, header);
    } catch (const std::exception& e) {
        std::cerr << "[chunker] Sentence split failed for " << src.uri << ": " << e.what()
                  << "; using word windows" << std::endl;
    }
    return chunk_word_windows(src, header);
}

std::vector<Chunk> Chunker::chunk_sentences(const std::vector<std::string>& sentences, const Source& src,
                                            const std::string& header) const {
    const std::size_t max_tokens = (std::size_t)cfg_.max_tokens;
    const std::size_t header_words = word_count(header);
    std::vector<Chunk> out;

    std::vector<std::string> buf{header};
    std::size_t buf_words = header_words;
    auto flush = [&]() {
        if (buf.size() > 1) out.push_back(make_chunk(src, join(buf, " "), (int)out.size()));
        buf.assign(1, header);
        buf_words = header_words;
    };

    for (const auto& sentence : sentences) {
        std::size_t words = word_count(sentence);
        if (words == 0) continue;

        if (header_words + words > max_tokens) {
            // A sentence that cannot fit even alone is cut into windows.
            flush();
            auto parts = split_words(sentence);
            std::size_t window = max_tokens > header_words ? max_tokens - header_words : 1;
            for (std::size_t i = 0; i < parts.size(); i += window) {
                std::size_t end = std::min(parts.size(), i + window);
                std::vector<std::string> piece(parts.begin() + (long)i, parts.begin() + (long)end);
                out.push_back(make_chunk(src, header + " " + join(piece, " "), (int)out.size()));
            }
            continue;
        }

        if (buf_words + words > max_tokens) flush();
        buf.push_back(sentence);
        buf_words += words;
    }
    flush();
    return out;
}

std::vector<Chunk> Chunker::chunk_word_windows(const Source& src, const std::string& header) const {
    std::vector<Chunk> out;
    auto words = split_words(src.raw_text);
    const std::size_t window = (std::size_t)cfg_.max_tokens;
    for (std::size_t i = 0; i < words.size(); i += window) {
        std::size_t end = std::min(words.size(), i + window);
        std::vector<std::string> piece(words.begin() + (long)i, words.begin() + (long)end);
        std::string text = join(piece, " ");
        if (trim(text).size() < cfg_.min_fallback_chars) continue;
        out.push_back(make_chunk(src, header + " - " + text, (int)out.size()));
    }
    return out;
}

std::vector<Chunk> dedup_chunks(std::vector<Chunk> chunks) {
    std::vector<Chunk> out;
    out.reserve(chunks.size());
    std::unordered_set<std::string> seen;
    for (auto& c : chunks) {
        if (!seen.insert(c.text).second) continue;
        c.ordinal = (int)out.size();
        out.push_back(std::move(c));
    }
    return out;
}
