#include "../include/crawler.hpp"
#include "../include/url.hpp"
#include "../include/util.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

const std::vector<std::string>& excluded_extensions() {
    static const std::vector<std::string> exts = {
        ".jpg", ".jpeg", ".png", ".gif", ".webp", ".svg", ".bmp", ".ico",
        ".zip", ".rar", ".7z", ".tar", ".gz",
        ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx"
    };
    return exts;
}

bool is_excluded(const UrlParts& u) {
    std::string path = to_lower(u.path);
    for (const auto& ext : excluded_extensions()) {
        if (ends_with(path, ext)) return true;
    }
    return false;
}

bool is_pdf_url(const std::string& url) {
    return ends_with(to_lower(url), ".pdf");
}

std::string xml_unescape(std::string s) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&apos;", "'"}
    };
    for (const auto& e : entities) {
        size_t pos = 0;
        std::string from = e.first;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), e.second);
            pos += 1;
        }
    }
    return s;
}

// Every <loc>...</loc> value, tag names matched case-insensitively.
std::vector<std::string> sitemap_locs(const std::string& body) {
    std::vector<std::string> out;
    std::string lower = to_lower(body);
    size_t pos = 0;
    while ((pos = lower.find("<loc>", pos)) != std::string::npos) {
        size_t start = pos + 5;
        size_t end = lower.find("</loc>", start);
        if (end == std::string::npos) break;
        std::string value = trim(body.substr(start, end - start));
        if (!value.empty() && value.find('<') == std::string::npos) out.push_back(xml_unescape(value));
        pos = end + 6;
    }
    return out;
}

// Quoted string literals in script text that end in ".pdf".
std::vector<std::string> script_pdf_paths(const std::string& script) {
    std::vector<std::string> out;
    size_t pos = 0;
    while ((pos = script.find_first_of("\"'", pos)) != std::string::npos) {
        size_t close = script.find(script[pos], pos + 1);
        if (close == std::string::npos) break;
        std::string literal = script.substr(pos + 1, close - pos - 1);
        if (literal.size() > 4 && ends_with(to_lower(literal), ".pdf")) out.push_back(literal);
        pos = close + 1;
    }
    return out;
}

// name, or name with _2, _3, ... before the extension when already taken.
std::string unique_filename(const std::string& name, std::unordered_set<std::string>& taken) {
    std::string stem = name.substr(0, name.size() - 4);
    std::string ext = name.substr(name.size() - 4);
    std::string candidate = name;
    for (int n = 2; !taken.insert(candidate).second; ++n) {
        candidate = stem + "_" + std::to_string(n) + ext;
    }
    return candidate;
}

void pause_ms(int ms) {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}

std::string origin_of(const std::string& url) {
    auto u = parse_url(url);
    return u ? u->netloc() : std::string();
}

bool UriSet::add(const std::string& uri) {
    if (!index_.insert(uri).second) return false;
    items_.push_back(uri);
    return true;
}

bool Frontier::enqueue(const std::string& uri) {
    if (visited.count(uri) || !queued.insert(uri).second) return false;
    queue.push_back(uri);
    return true;
}

Crawler::Crawler(Fetcher& fetcher, CrawlConfig cfg)
    : fetcher_(fetcher), cfg_(std::move(cfg)), origin_(origin_of(cfg_.base_url)) {
    if (origin_.empty()) throw std::runtime_error("invalid base URL: " + cfg_.base_url);
}

bool Crawler::same_origin(const std::string& url) const {
    return origin_of(url) == origin_;
}

std::vector<std::string> Crawler::fetch_sitemap(const std::string& url, int depth) {
    std::vector<std::string> out;
    try {
        auto r = fetcher_.get(url, cfg_.sitemap_timeout_ms);
        if (r.status != 200) return out;
        if (ends_with(to_lower(url), "robots.txt")) {
            if (depth > 0) return out;
            std::istringstream lines(r.body);
            std::string line;
            while (std::getline(lines, line)) {
                line = trim(line);
                if (to_lower(line.substr(0, 8)) != "sitemap:") continue;
                auto nested = fetch_sitemap(trim(line.substr(8)), depth + 1);
                out.insert(out.end(), nested.begin(), nested.end());
            }
            return out;
        }
        auto locs = sitemap_locs(r.body);
        out.insert(out.end(), locs.begin(), locs.end());
    } catch (const std::exception& e) {
        std::cerr << "[crawler] Sitemap " << url << " skipped: " << e.what() << std::endl;
    }
    return out;
}

std::vector<std::string> Crawler::discover_sitemaps() {
    UriSet found;
    for (const char* path : {"/sitemap.xml", "/sitemap_index.xml", "/robots.txt"}) {
        auto url = resolve_url(cfg_.base_url, path);
        if (!url) continue;
        for (const auto& u : fetch_sitemap(*url, 0)) found.add(u);
    }
    return found.items();
}

DiscoveredLinks Crawler::discover_links(const PageLinks& links, const std::string& current_url) const {
    DiscoveredLinks out;
    UriSet pages, pdfs;
    for (const auto& href : links.hrefs) {
        auto abs = resolve_url(current_url, href);
        if (!abs) continue;
        if (is_pdf_url(*abs)) {
            pdfs.add(*abs);
            continue;
        }
        auto u = parse_url(*abs);
        if (!u || u->netloc() != origin_ || is_excluded(*u)) continue;
        pages.add(*abs);
    }

    for (const auto& script : links.scripts) {
        for (const auto& path : script_pdf_paths(script)) {
            auto abs = resolve_url(current_url, path);
            if (abs && same_origin(*abs)) pdfs.add(*abs);
        }
    }
    out.pages = pages.items();
    out.pdfs = pdfs.items();
    return out;
}

CrawlResult Crawler::run() {
    CrawlResult result;
    Frontier frontier;
    HtmlExtractor extractor;

    state_ = CrawlState::Seeding;
    if (auto seed = parse_url(cfg_.base_url)) frontier.enqueue(seed->str());
    if (cfg_.discover_sitemaps) {
        auto listed = discover_sitemaps();
        if (!listed.empty()) std::cout << "[crawler] Found " << listed.size() << " URLs from sitemaps" << std::endl;
        for (const auto& u : listed) {
            if (auto parsed = parse_url(u)) frontier.enqueue(parsed->str());
        }
    }

    int processed = 0;
    while (!frontier.queue.empty() && processed < cfg_.max_pages) {
        state_ = CrawlState::Fetching;
        std::string url = frontier.queue.front();
        frontier.queue.pop_front();
        frontier.queued.erase(url);

        if (frontier.visited.count(url)) continue;
        if (!same_origin(url)) continue;
        frontier.visited.insert(url);
        ++processed;

        std::cout << "[crawler] [" << processed << "/" << cfg_.max_pages << "] " << url << std::endl;
        try {
            auto r = fetcher_.get(url, cfg_.page_timeout_ms);
            if (r.status != 200) {
                std::cerr << "[crawler] Status " << r.status << " for " << url << std::endl;
                pause_ms(cfg_.delay_ms);
                continue;
            }

            state_ = CrawlState::Discovering;
            HtmlDocument doc(r.body);
            if (auto text = extractor.extract(doc)) {
                Source src;
                src.uri = url;
                src.kind = SourceKind::Web;
                src.title = text->title;
                src.name = url;
                src.raw_text = std::move(text->text);
                result.pages.push_back(std::move(src));
            }

            auto found = discover_links(doc.links(), url);
            for (const auto& u : found.pages) frontier.enqueue(u);
            for (const auto& p : found.pdfs) {
                if (frontier.pdf_links.add(p)) std::cout << "[crawler] Found PDF: " << p << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[crawler] Error processing " << url << ": " << e.what() << std::endl;
        }
        pause_ms(cfg_.delay_ms);
    }
    state_ = CrawlState::Done;

    result.pdf_links = frontier.pdf_links.items();
    result.urls_visited = (int)frontier.visited.size();
    std::cout << "[crawler] Done: " << result.pages.size() << " pages with content, "
              << result.urls_visited << " URLs visited, " << result.pdf_links.size() << " PDFs found" << std::endl;
    return result;
}

PdfCollector::PdfCollector(Fetcher& fetcher, CrawlConfig cfg)
    : fetcher_(fetcher), cfg_(std::move(cfg)), origin_(origin_of(cfg_.base_url)) {}

std::string PdfCollector::local_filename(const std::string& url, int next_index) {
    std::string name = url_filename(url);
    if (!ends_with(to_lower(name), ".pdf") || name.size() <= 4) {
        name = "document_" + std::to_string(next_index) + ".pdf";
    }
    return name;
}

std::vector<PdfRecord> PdfCollector::collect(const std::vector<std::string>& pdf_links) {
    std::vector<PdfRecord> out;
    std::unordered_set<std::string> seen_hashes;
    std::unordered_set<std::string> taken_names;
    PdfExtractor extractor;
    int attempt = 0;

    std::error_code ec;
    std::filesystem::create_directories(cfg_.pdf_dir, ec);
    if (ec) {
        std::cerr << "[pdf] Cannot create " << cfg_.pdf_dir << ": " << ec.message() << std::endl;
        return out;
    }

    for (const auto& url : pdf_links) {
        if (cfg_.pdf_same_domain_only && origin_of(url) != origin_) {
            std::cerr << "[pdf] Skipping off-site PDF: " << url << std::endl;
            continue;
        }
        std::string filename = local_filename(url, ++attempt);
        try {
            auto bytes = fetcher_.download(url, cfg_.pdf_timeout_ms);
            if (!bytes) continue;

            std::string sha = sha1_hex(*bytes);
            if (!seen_hashes.insert(sha).second) {
                std::cout << "[pdf] Duplicate content, skipping: " << url << std::endl;
                continue;
            }
            filename = unique_filename(filename, taken_names);
            auto path = std::filesystem::path(cfg_.pdf_dir) / filename;
            write_binary_file(path, *bytes);

            auto text = extractor.extract(*bytes);
            if (!text) {
                std::cerr << "[pdf] No text extracted from: " << filename << std::endl;
                continue;
            }
            PdfRecord rec;
            rec.url = url;
            rec.filename = filename;
            rec.file_path = path.string();
            rec.sha1 = sha;
            rec.source.uri = url;
            rec.source.kind = SourceKind::Pdf;
            rec.source.title = title_from_filename(filename);
            rec.source.name = filename;
            rec.source.raw_text = std::move(text->text);
            out.push_back(std::move(rec));
            std::cout << "[pdf] Processed: " << filename << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[pdf] Error processing " << url << ": " << e.what() << std::endl;
        }
    }
    return out;
}
