#pragma once
#include "extractor.hpp"
#include "config.hpp"
#include <string>
#include <vector>

// Retrieval unit. `text` always starts with the rendered provenance header;
// the structured fields carry the same attribution for code that needs it.
struct Chunk {
    std::string text;
    std::string source_uri;
    SourceKind source_kind{SourceKind::Web};
    std::string source_title;
    int ordinal{0};
};

// "SOURCE: <title> (WEB: <url>)" / "SOURCE: <title> (PDF: <filename>)"
std::string render_source_header(const Source& src);

class Chunker {
public:
    explicit Chunker(ChunkConfig cfg = {});

    // Sentence-packed chunks of src.raw_text. Falls back to word windows when
    // sentence segmentation fails; never throws on text content.
    std::vector<Chunk> chunk(const Source& src) const;

    std::vector<Chunk> chunk_sentences(const std::vector<std::string>& sentences, const Source& src,
                                       const std::string& header) const;
    std::vector<Chunk> chunk_word_windows(const Source& src, const std::string& header) const;

private:
    ChunkConfig cfg_;
};

// Drops repeated texts keeping first occurrences, then renumbers ordinals 0..n-1.
std::vector<Chunk> dedup_chunks(std::vector<Chunk> chunks);
