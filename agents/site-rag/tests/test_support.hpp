#pragma once
#include "../include/answerer.hpp"
#include "../include/config.hpp"
#include "../include/embedder.hpp"
#include "../include/fetcher.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// In-memory web site. Unknown URLs answer 404.
class FakeFetcher : public Fetcher {
public:
    void page(const std::string& url, const std::string& body, long status = 200) {
        std::lock_guard<std::mutex> lock(mtx_);
        pages_[url] = FetchResult{status, body};
    }
    void file(const std::string& url, const std::string& bytes) {
        std::lock_guard<std::mutex> lock(mtx_);
        files_[url] = bytes;
    }
    // Requests block until the returned promise is fulfilled.
    std::promise<void> hold() {
        std::promise<void> p;
        std::lock_guard<std::mutex> lock(mtx_);
        gate_ = p.get_future().share();
        return p;
    }

    FetchResult get(const std::string& uri, long /*timeout_ms*/) override {
        wait_gate();
        std::lock_guard<std::mutex> lock(mtx_);
        requests_.push_back(uri);
        auto it = pages_.find(uri);
        if (it == pages_.end()) return FetchResult{404, ""};
        return it->second;
    }

    std::optional<std::string> download(const std::string& uri, long /*timeout_ms*/) override {
        wait_gate();
        std::lock_guard<std::mutex> lock(mtx_);
        downloads_.push_back(uri);
        auto it = files_.find(uri);
        if (it == files_.end()) return std::nullopt;
        return it->second;
    }

    int count(const std::string& uri) const {
        std::lock_guard<std::mutex> lock(mtx_);
        int n = 0;
        for (const auto& r : requests_) n += r == uri;
        return n;
    }
    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_;
    }
    std::vector<std::string> downloads() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return downloads_;
    }

private:
    void wait_gate() {
        std::shared_future<void> gate;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            gate = gate_;
        }
        if (gate.valid()) gate.wait();
    }

    mutable std::mutex mtx_;
    std::map<std::string, FetchResult> pages_;
    std::map<std::string, std::string> files_;
    std::vector<std::string> requests_;
    std::vector<std::string> downloads_;
    std::shared_future<void> gate_;
};

// Deterministic bag-of-words embedding: lowercase alphanumeric words hashed
// into kDim buckets, then L2-normalized.
class FakeEmbedder : public Embedder {
public:
    static constexpr std::size_t kDim = 256;

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override {
        if (fail.load()) throw std::runtime_error("embedding service unavailable");
        calls.fetch_add(1);
        std::vector<std::vector<float>> out;
        for (const auto& t : texts) out.push_back(vectorize(t));
        return out;
    }

    static std::vector<float> vectorize(const std::string& text) {
        std::vector<float> v(kDim, 0.0f);
        std::string word;
        auto flush = [&]() {
            if (word.empty()) return;
            v[std::hash<std::string>{}(word) % kDim] += 1.0f;
            word.clear();
        };
        for (char c : text) {
            unsigned char uc = (unsigned char)c;
            if (std::isalnum(uc)) word.push_back((char)std::tolower(uc));
            else flush();
        }
        flush();
        double norm = 0.0;
        for (float x : v) norm += (double)x * x;
        if (norm > 0) {
            for (float& x : v) x = (float)(x / std::sqrt(norm));
        }
        return v;
    }

    std::atomic<bool> fail{false};
    std::atomic<int> calls{0};
};

class FakeAnswerer : public Answerer {
public:
    std::string answer(const std::string& prompt, const std::vector<std::string>& context) override {
        std::lock_guard<std::mutex> lock(mtx_);
        last_prompt_ = prompt;
        last_context_ = context;
        return reply_;
    }
    std::vector<std::string> suggest(const std::string& /*question*/, const std::string& /*answer*/) override {
        std::lock_guard<std::mutex> lock(mtx_);
        return suggestions_;
    }

    void set_reply(const std::string& r) { std::lock_guard<std::mutex> lock(mtx_); reply_ = r; }
    void set_suggestions(std::vector<std::string> s) { std::lock_guard<std::mutex> lock(mtx_); suggestions_ = std::move(s); }
    std::string last_prompt() const { std::lock_guard<std::mutex> lock(mtx_); return last_prompt_; }
    std::vector<std::string> last_context() const { std::lock_guard<std::mutex> lock(mtx_); return last_context_; }

private:
    mutable std::mutex mtx_;
    std::string reply_{"Fees are due in March."};
    std::vector<std::string> suggestions_;
    std::string last_prompt_;
    std::vector<std::string> last_context_;
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> seq{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("site_rag_test_" + std::to_string(stamp) + "_" + std::to_string(seq.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline std::string html_page(const std::string& title, const std::vector<std::string>& paragraphs,
                             const std::vector<std::string>& links = {}) {
    std::string out = "<html><head><title>" + title + "</title></head><body>";
    for (const auto& p : paragraphs) out += "<p>" + p + "</p>";
    for (const auto& l : links) out += "<a href=\"" + l + "\">link</a>";
    out += "</body></html>";
    return out;
}

// Minimal PDF with one Helvetica text block per page.
inline std::string make_pdf(const std::vector<std::string>& pages) {
    auto escape = [](const std::string& s) {
        std::string out;
        for (char c : s) {
            if (c == '(' || c == ')' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        return out;
    };
    auto content_for = [&](const std::string& text) {
        // Wrap to keep every line inside the page box.
        std::vector<std::string> lines;
        std::istringstream words(text);
        std::string w, line;
        while (words >> w) {
            if (!line.empty() && line.size() + 1 + w.size() > 60) {
                lines.push_back(line);
                line.clear();
            }
            if (!line.empty()) line += " ";
            line += w;
        }
        if (!line.empty()) lines.push_back(line);
        std::string s = "BT /F1 12 Tf 72 720 Td 14 TL\n";
        for (const auto& l : lines) s += "(" + escape(l) + ") Tj T*\n";
        s += "ET\n";
        return s;
    };

    const int n = (int)pages.size();
    std::vector<std::string> objects;
    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    std::string kids;
    for (int i = 0; i < n; ++i) kids += std::to_string(4 + 2 * i) + " 0 R ";
    objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(n) + " >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>");
    for (int i = 0; i < n; ++i) {
        objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
                          "/Resources << /Font << /F1 3 0 R >> >> /Contents " +
                          std::to_string(5 + 2 * i) + " 0 R >>");
        std::string stream = content_for(pages[(size_t)i]);
        objects.push_back("<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" + stream + "endstream");
    }

    std::string pdf = "%PDF-1.4\n";
    std::vector<std::size_t> offsets;
    for (std::size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }
    std::size_t xref = pdf.size();
    pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
    pdf += "0000000000 65535 f \n";
    for (auto off : offsets) {
        char entry[32];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", off);
        pdf += entry;
    }
    pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R >>\n";
    pdf += "startxref\n" + std::to_string(xref) + "\n%%EOF\n";
    return pdf;
}

// Two content pages and one PDF under https://site.test/.
inline void build_site(FakeFetcher& f) {
    f.page("https://site.test/",
           html_page("Page A",
                     {"Admissions are open to all applicants who finish secondary school.",
                      "Tuition fees are paid each semester before classes begin."},
                     {"/b", "/files/doc.pdf"}));
    f.page("https://site.test/b",
           html_page("Page B",
                     {"The campus library opens at eight and closes at ten every weekday.",
                      "Students may borrow up to ten books at a time from the library."},
                     {"/"}));
    f.file("https://site.test/files/doc.pdf",
           make_pdf({"Fees are due in March and may be paid online or at the bursar office.",
                     "Late payments carry a small penalty added to the next invoice."}));
}

inline SiteRagConfig test_rag_config(const TempDir& dir) {
    SiteRagConfig cfg;
    cfg.crawl.base_url = "https://site.test/";
    cfg.crawl.delay_ms = 0;
    cfg.crawl.discover_sitemaps = false;
    cfg.crawl.pdf_dir = dir.file("pdfs");
    cfg.store.db_path = dir.file("kb.db");
    return cfg;
}
