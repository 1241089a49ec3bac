#pragma once
#include "config.hpp"
#include "extractor.hpp"
#include "fetcher.hpp"
#include <deque>
#include <string>
#include <unordered_set>
#include <vector>

// Insertion-ordered set of URIs.
class UriSet {
public:
    bool add(const std::string& uri);
    bool contains(const std::string& uri) const { return index_.count(uri) > 0; }
    const std::vector<std::string>& items() const { return items_; }
    std::size_t size() const { return items_.size(); }

private:
    std::vector<std::string> items_;
    std::unordered_set<std::string> index_;
};

struct Frontier {
    std::unordered_set<std::string> visited;
    std::deque<std::string> queue;
    std::unordered_set<std::string> queued;
    UriSet pdf_links;

    bool enqueue(const std::string& uri);
};

struct DiscoveredLinks {
    std::vector<std::string> pages;
    std::vector<std::string> pdfs;
};

struct CrawlResult {
    std::vector<Source> pages;         // crawl order
    std::vector<std::string> pdf_links; // discovery order, unique
    int urls_visited{0};
};

enum class CrawlState { Seeding, Fetching, Discovering, Done };

// Breadth-first, single-threaded traversal of one site.
class Crawler {
public:
    Crawler(Fetcher& fetcher, CrawlConfig cfg);

    CrawlResult run();
    CrawlState state() const { return state_; }

    // URLs listed by sitemap.xml, sitemap_index.xml and robots.txt sitemaps.
    // Failures are swallowed.
    std::vector<std::string> discover_sitemaps();
    DiscoveredLinks discover_links(const PageLinks& links, const std::string& current_url) const;
    bool same_origin(const std::string& url) const;

private:
    std::vector<std::string> fetch_sitemap(const std::string& url, int depth);

    Fetcher& fetcher_;
    CrawlConfig cfg_;
    std::string origin_;
    CrawlState state_{CrawlState::Seeding};
};

struct PdfRecord {
    std::string url;
    std::string filename;
    std::string file_path;
    std::string sha1;
    Source source;
};

// Second crawl phase: download, store and extract discovered PDFs.
class PdfCollector {
public:
    PdfCollector(Fetcher& fetcher, CrawlConfig cfg);

    // One record per PDF that yielded text. Per-document failures are logged
    // and skipped. Local filenames are unique within one call.
    std::vector<PdfRecord> collect(const std::vector<std::string>& pdf_links);

    // Filename from the URL path, or document_<n>.pdf when it has none.
    static std::string local_filename(const std::string& url, int next_index);

private:
    Fetcher& fetcher_;
    CrawlConfig cfg_;
    std::string origin_;
};

// Lowercased netloc of a URL, empty when unparseable.
std::string origin_of(const std::string& url);
