#include <gtest/gtest.h>
#include "../include/chunker.hpp"
#include "../include/text.hpp"
#include "../include/util.hpp"

namespace {
Source web_source(const std::string& text) {
    Source s;
    s.uri = "https://site.test/p";
    s.kind = SourceKind::Web;
    s.title = "T";
    s.name = s.uri;
    s.raw_text = text;
    return s;
}

// Five words each.
std::string sentences(int n) {
    std::string out;
    for (int i = 0; i < n; ++i) {
        if (i) out += " ";
        out += "Sentence number " + std::to_string(i) + " is here.";
    }
    return out;
}
}

TEST(Chunker, HeaderRendering) {
    Source pdf;
    pdf.uri = "https://site.test/files/doc.pdf";
    pdf.kind = SourceKind::Pdf;
    pdf.title = "Doc";
    pdf.name = "doc.pdf";
    EXPECT_EQ(render_source_header(pdf), "SOURCE: Doc (PDF: doc.pdf)");
    EXPECT_EQ(render_source_header(web_source("")), "SOURCE: T (WEB: https://site.test/p)");
}

TEST(Chunker, RespectsTokenBudget) {
    ChunkConfig cfg;
    cfg.max_tokens = 20;
    Chunker chunker(cfg);
    auto chunks = chunker.chunk(web_source(sentences(12)));

    ASSERT_GT(chunks.size(), 1u);
    const std::string header = render_source_header(web_source(""));
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_LE(word_count(chunks[i].text), 20u);
        EXPECT_EQ(chunks[i].text.rfind(header, 0), 0u);
        EXPECT_EQ(chunks[i].ordinal, (int)i);
        EXPECT_EQ(chunks[i].source_uri, "https://site.test/p");
        EXPECT_EQ(chunks[i].source_kind, SourceKind::Web);
    }
}

TEST(Chunker, SentencesAreNeverSplitAcrossChunks) {
    ChunkConfig cfg;
    cfg.max_tokens = 20;
    Chunker chunker(cfg);
    auto chunks = chunker.chunk(web_source(sentences(12)));

    for (int i = 0; i < 12; ++i) {
        std::string s = "Sentence number " + std::to_string(i) + " is here.";
        int holders = 0;
        for (const auto& c : chunks) holders += c.text.find(s) != std::string::npos;
        EXPECT_EQ(holders, 1) << s;
    }
}

TEST(Chunker, OversizedSentenceIsWindowed) {
    ChunkConfig cfg;
    cfg.max_tokens = 20;
    Chunker chunker(cfg);
    std::vector<std::string> words;
    for (int i = 0; i < 50; ++i) words.push_back("w" + std::to_string(i));
    auto chunks = chunker.chunk(web_source(join(words, " ") + "."));

    ASSERT_GE(chunks.size(), 3u);
    std::vector<std::string> seen;
    const size_t header_words = word_count(render_source_header(web_source("")));
    for (const auto& c : chunks) {
        EXPECT_LE(word_count(c.text), 20u);
        auto parts = split_words(c.text);
        seen.insert(seen.end(), parts.begin() + (long)header_words, parts.end());
    }
    ASSERT_EQ(seen.size(), 50u);
    EXPECT_EQ(seen.front(), "w0");
    EXPECT_EQ(seen.back(), "w49.");
}

TEST(Chunker, EmptyTextYieldsNoChunks) {
    Chunker chunker;
    EXPECT_TRUE(chunker.chunk(web_source("")).empty());
    EXPECT_TRUE(chunker.chunk(web_source("   \n ")).empty());
}

TEST(Chunker, FallsBackToWordWindowsOnSegmentationFailure) {
    Chunker chunker;
    std::string text = "Invalid byte \xFF here and then plenty of ordinary words follow so the window is long enough";
    auto chunks = chunker.chunk(web_source(text));
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].text.rfind("SOURCE: T (WEB: https://site.test/p) - Invalid byte", 0), 0u);
}

TEST(Chunker, FallbackDropsTinyWindows) {
    Chunker chunker;
    Source s = web_source("tiny \xFF");
    EXPECT_TRUE(chunker.chunk_word_windows(s, render_source_header(s)).empty());
}

TEST(Chunker, DedupKeepsFirstAndRenumbers) {
    std::vector<Chunk> in(4);
    in[0].text = "a"; in[0].source_uri = "first";
    in[1].text = "b";
    in[2].text = "a"; in[2].source_uri = "second";
    in[3].text = "c";
    for (int i = 0; i < 4; ++i) in[(size_t)i].ordinal = i;

    auto out = dedup_chunks(in);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].source_uri, "first");
    EXPECT_EQ(out[1].text, "b");
    EXPECT_EQ(out[2].text, "c");
    EXPECT_EQ(out[2].ordinal, 2);
}
