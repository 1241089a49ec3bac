#pragma once
#include <string>
#include <vector>
#include <optional>

enum class SourceKind { Web, Pdf };

const char* source_kind_name(SourceKind kind); // "web" | "pdf"
std::optional<SourceKind> parse_source_kind(const std::string& name);

// One crawled unit. `name` is what the provenance header shows: the URL for
// web pages, the local filename for PDFs.
struct Source {
    std::string uri;
    SourceKind kind{SourceKind::Web};
    std::string title;
    std::string name;
    std::string raw_text;
};

struct ExtractedText {
    std::string text;
    std::string title;
    SourceKind kind{SourceKind::Web};
};

class SourceExtractor {
public:
    virtual ~SourceExtractor() = default;
    // No value when the input holds no usable text. Throws on input that
    // cannot be opened at all.
    virtual std::optional<ExtractedText> extract(const std::string& raw) const = 0;
};

// Outbound references found on a page, unresolved.
struct PageLinks {
    std::vector<std::string> hrefs;
    std::vector<std::string> scripts; // inline <script> bodies
};

// RAII owner of a gumbo parse tree.
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html);
    ~HtmlDocument();
    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    std::string title() const;
    PageLinks links() const;
    // Text blocks in document order, script/style/nav/footer/header skipped.
    std::vector<std::string> text_blocks() const;

private:
    struct GumboInternalOutput* output_{nullptr};
};

class HtmlExtractor : public SourceExtractor {
public:
    static constexpr std::size_t kMinPageChars = 100;
    static constexpr const char* kFallbackTitle = "No Title";

    std::optional<ExtractedText> extract(const std::string& raw) const override;
    std::optional<ExtractedText> extract(const HtmlDocument& doc) const;
};

class PdfExtractor : public SourceExtractor {
public:
    // `raw` holds the PDF file bytes.
    std::optional<ExtractedText> extract(const std::string& raw) const override;
};
