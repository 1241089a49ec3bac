#include "../include/extractor.hpp"
#include "../include/text.hpp"
#include "../include/util.hpp"
#include <gumbo.h>
#include <poppler-document.h>
#include <poppler-page.h>
#include <memory>
#include <stdexcept>

namespace {

bool is_skipped(GumboTag tag) {
    return tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NAV ||
           tag == GUMBO_TAG_FOOTER || tag == GUMBO_TAG_HEADER;
}

bool is_heading(GumboTag tag) {
    switch (tag) {
    case GUMBO_TAG_TITLE:
    case GUMBO_TAG_H1: case GUMBO_TAG_H2: case GUMBO_TAG_H3:
    case GUMBO_TAG_H4: case GUMBO_TAG_H5: case GUMBO_TAG_H6:
        return true;
    default:
        return false;
    }
}

bool is_text_block(GumboTag tag) {
    switch (tag) {
    case GUMBO_TAG_P: case GUMBO_TAG_LI: case GUMBO_TAG_TD: case GUMBO_TAG_TH:
    case GUMBO_TAG_DIV: case GUMBO_TAG_SPAN: case GUMBO_TAG_ARTICLE: case GUMBO_TAG_SECTION:
        return true;
    default:
        return false;
    }
}

std::string attr(const GumboNode* node, const char* name) {
    const GumboAttribute* a = gumbo_get_attribute(&node->v.element.attributes, name);
    return a ? std::string(a->value) : std::string();
}

// Stripped text nodes under `node`, joined with single spaces.
void collect_text(const GumboNode* node, std::string& out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA) {
        std::string t = trim(node->v.text.text);
        if (!t.empty()) {
            if (!out.empty()) out.push_back(' ');
            out += t;
        }
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) return;
    if (is_skipped(node->v.element.tag)) return;
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_text(static_cast<const GumboNode*>(children->data[i]), out);
    }
}

std::string node_text(const GumboNode* node) {
    std::string out;
    collect_text(node, out);
    return out;
}

const GumboNode* find_first(const GumboNode* node, GumboTag tag) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT) return nullptr;
    if (node->type == GUMBO_NODE_ELEMENT && node->v.element.tag == tag) return node;
    const GumboVector* children = node->type == GUMBO_NODE_DOCUMENT ?
        &node->v.document.children : &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        if (auto* hit = find_first(static_cast<const GumboNode*>(children->data[i]), tag)) return hit;
    }
    return nullptr;
}

void walk_blocks(const GumboNode* node, std::vector<std::string>& out) {
    if (node->type != GUMBO_NODE_ELEMENT) return;
    const GumboElement& el = node->v.element;
    if (is_skipped(el.tag)) return;

    if (is_heading(el.tag)) {
        std::string t = node_text(node);
        if (t.size() > 3) out.push_back("HEADING: " + t);
    } else if (is_text_block(el.tag)) {
        std::string t = node_text(node);
        if (t.size() > 20) out.push_back(t);
    } else if (el.tag == GUMBO_TAG_META) {
        if (to_lower(attr(node, "name")) == "description") {
            std::string content = trim(attr(node, "content"));
            if (!content.empty()) out.push_back("META: " + content);
        }
    } else if (el.tag == GUMBO_TAG_IMG) {
        std::string alt = trim(attr(node, "alt"));
        if (alt.size() > 5) out.push_back("IMAGE: " + alt);
    }

    for (unsigned int i = 0; i < el.children.length; ++i) {
        walk_blocks(static_cast<const GumboNode*>(el.children.data[i]), out);
    }
}

void walk_links(const GumboNode* node, PageLinks& out) {
    if (node->type != GUMBO_NODE_ELEMENT) return;
    const GumboElement& el = node->v.element;
    if (el.tag == GUMBO_TAG_A) {
        std::string href = trim(attr(node, "href"));
        if (!href.empty()) out.hrefs.push_back(href);
    } else if (el.tag == GUMBO_TAG_SCRIPT) {
        std::string body;
        for (unsigned int i = 0; i < el.children.length; ++i) {
            auto* child = static_cast<const GumboNode*>(el.children.data[i]);
            if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_CDATA ||
                child->type == GUMBO_NODE_WHITESPACE) {
                body += child->v.text.text;
            }
        }
        if (!body.empty()) out.scripts.push_back(std::move(body));
    }
    for (unsigned int i = 0; i < el.children.length; ++i) {
        walk_links(static_cast<const GumboNode*>(el.children.data[i]), out);
    }
}

}

const char* source_kind_name(SourceKind kind) {
    return kind == SourceKind::Pdf ? "pdf" : "web";
}

std::optional<SourceKind> parse_source_kind(const std::string& name) {
    if (name == "web") return SourceKind::Web;
    if (name == "pdf") return SourceKind::Pdf;
    return std::nullopt;
}

HtmlDocument::HtmlDocument(const std::string& html) {
    output_ = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (!output_) throw std::runtime_error("gumbo_parse failed");
}

HtmlDocument::~HtmlDocument() {
    if (output_) gumbo_destroy_output(&kGumboDefaultOptions, output_);
}

std::string HtmlDocument::title() const {
    const GumboNode* t = find_first(output_->document, GUMBO_TAG_TITLE);
    return t ? normalize_text(node_text(t)) : std::string();
}

PageLinks HtmlDocument::links() const {
    PageLinks out;
    walk_links(output_->root, out);
    return out;
}

std::vector<std::string> HtmlDocument::text_blocks() const {
    std::vector<std::string> out;
    walk_blocks(output_->root, out);
    return out;
}

std::optional<ExtractedText> HtmlExtractor::extract(const std::string& raw) const {
    HtmlDocument doc(raw);
    return extract(doc);
}

std::optional<ExtractedText> HtmlExtractor::extract(const HtmlDocument& doc) const {
    ExtractedText out;
    out.kind = SourceKind::Web;
    out.text = normalize_text(join(doc.text_blocks(), "\n"));
    if (out.text.size() < kMinPageChars) return std::nullopt;
    out.title = doc.title();
    if (out.title.empty()) out.title = kFallbackTitle;
    return out;
}

std::optional<ExtractedText> PdfExtractor::extract(const std::string& raw) const {
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(raw.data(), (int)raw.size()));
    if (!doc) throw std::runtime_error("cannot open PDF document");
    if (doc->is_locked()) throw std::runtime_error("PDF document is encrypted");

    std::vector<std::string> pages;
    for (int i = 0; i < doc->pages(); ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) continue;
        auto bytes = page->text().to_utf8();
        std::string text = normalize_text(std::string(bytes.begin(), bytes.end()));
        if (!text.empty()) pages.push_back(std::move(text));
    }
    std::string full = normalize_text(join(pages, "\n"));
    if (full.empty()) return std::nullopt;

    ExtractedText out;
    out.kind = SourceKind::Pdf;
    out.text = std::move(full);
    return out;
}
