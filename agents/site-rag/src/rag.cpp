#include "../include/rag.hpp"
#include "../include/crawler.hpp"
#include "../include/retrieval.hpp"
#include "../include/url.hpp"
#include "../include/util.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <unordered_set>

namespace {
double now_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

// First n bytes of s, shortened so a UTF-8 sequence is never cut.
std::string utf8_prefix(const std::string& s, std::size_t n) {
    if (s.size() <= n) return s;
    while (n > 0 && ((unsigned char)s[n] & 0xC0) == 0x80) --n;
    return s.substr(0, n);
}
}

std::shared_ptr<const KnowledgeSnapshot> ReadinessGuard::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return snap_;
}

void ReadinessGuard::publish(std::shared_ptr<const KnowledgeSnapshot> snap) {
    std::lock_guard<std::mutex> lock(mtx_);
    snap_ = std::move(snap);
    failed_ = false;
    last_error_.clear();
}

void ReadinessGuard::mark_failed(const std::string& error) {
    std::lock_guard<std::mutex> lock(mtx_);
    failed_ = true;
    last_error_ = error;
}

bool ReadinessGuard::ready() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return snap_ && !failed_;
}

std::string ReadinessGuard::last_error() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_error_;
}

BuildSupervisor::~BuildSupervisor() {
    wait();
}

bool BuildSupervisor::try_start(std::function<void()> task) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) return false;
    // The previous worker has released the slot; reap it before reuse.
    if (worker_.joinable()) worker_.join();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        last_error_.clear();
    }
    worker_ = std::thread([this, task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mtx_);
            last_error_ = e.what();
        }
        busy_.store(false);
    });
    return true;
}

void BuildSupervisor::wait() {
    if (worker_.joinable()) worker_.join();
}

std::string BuildSupervisor::last_error() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_error_;
}

const char* build_mode_name(BuildMode mode) {
    switch (mode) {
    case BuildMode::LoadOrBuild: return "load-or-build";
    case BuildMode::Update: return "update";
    case BuildMode::ForceRebuild: return "force-rebuild";
    }
    return "unknown";
}

void ConversationHistory::add(Exchange e) {
    std::lock_guard<std::mutex> lock(mtx_);
    items_.push_back(std::move(e));
    while (items_.size() > capacity_) items_.pop_front();
}

std::vector<Exchange> ConversationHistory::recent() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<Exchange>(items_.begin(), items_.end());
}

void ConversationHistory::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    items_.clear();
}

std::string build_context_question(const std::string& question, const std::vector<Exchange>& history) {
    if (history.empty()) return question;
    std::size_t first = history.size() > 5 ? history.size() - 5 : 0;
    std::vector<std::string> lines;
    for (std::size_t i = first; i < history.size(); ++i) {
        lines.push_back("Previous: " + history[i].question + " Answer: " + utf8_prefix(history[i].answer, 100));
    }
    return "Context: " + join(lines, " ") + "\n\nCurrent question: " + question;
}

std::string helpful_links(const std::vector<Chunk>& chunks) {
    std::vector<std::string> urls;
    std::unordered_set<std::string> seen;
    for (const auto& c : chunks) {
        if (c.source_kind != SourceKind::Web || c.source_uri.empty()) continue;
        if (!seen.insert(c.source_uri).second) continue;
        urls.push_back(c.source_uri);
        if (urls.size() == 3) break;
    }
    if (urls.empty()) return {};

    std::string out = "\n\n**Helpful Links:**\n";
    for (std::size_t i = 0; i < urls.size(); ++i) {
        std::string name = urls[i];
        if (auto u = parse_url(urls[i])) {
            name = u->host;
            std::string page = url_filename(urls[i]);
            if (page.empty() && u->path.size() > 1) {
                std::string dir = u->path.substr(0, u->path.size() - 1);
                page = dir.substr(dir.find_last_of('/') + 1);
            }
            if (!page.empty() && page != name) name += " - " + utf8_prefix(page, 20);
        }
        out += std::to_string(i + 1) + ". [" + name + "](" + urls[i] + ")\n";
    }
    return out;
}

const std::vector<std::string>& default_suggestions() {
    static const std::vector<std::string> fallback = {"Tell me more", "What about fees?", "How to apply?"};
    return fallback;
}

KnowledgeBase::KnowledgeBase(SiteRagConfig cfg,
                             std::shared_ptr<Fetcher> fetcher,
                             std::shared_ptr<Embedder> embedder,
                             std::shared_ptr<Answerer> answerer,
                             std::shared_ptr<SessionStore> store)
    : cfg_(std::move(cfg)),
      fetcher_(std::move(fetcher)),
      embedder_(std::move(embedder)),
      answerer_(std::move(answerer)),
      store_(std::move(store)) {}

KnowledgeBase::~KnowledgeBase() {
    supervisor_.wait();
}

bool KnowledgeBase::start_build(BuildMode mode) {
    bool started = supervisor_.try_start([this, mode]() { run_build(mode); });
    if (!started) std::cerr << "[build] Refused " << build_mode_name(mode) << ": already building" << std::endl;
    return started;
}

void KnowledgeBase::wait_for_build() {
    supervisor_.wait();
}

void KnowledgeBase::run_build(BuildMode mode) {
    std::cout << "[build] Starting " << build_mode_name(mode) << std::endl;
    try {
        if (mode == BuildMode::LoadOrBuild && load_from_store()) return;
        if (mode == BuildMode::ForceRebuild) {
            int n = store_->deactivate_all();
            std::cout << "[build] Marked " << n << " session(s) inactive" << std::endl;
            clear_pdf_dir();
        }
        auto snap = crawl_and_index();
        std::cout << "[OK] Knowledge base ready: " << snap->chunks.size() << " chunks from "
                  << snap->stats.pages_crawled << " pages and " << snap->stats.pdfs_processed << " PDFs" << std::endl;
        guard_.publish(std::move(snap));
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Build (" << build_mode_name(mode) << ") failed: " << e.what() << std::endl;
        guard_.mark_failed(e.what());
        throw;
    }
}

bool KnowledgeBase::load_from_store() {
    auto loaded = store_->load_latest();
    if (!loaded || loaded->chunks.empty()) return false;

    auto snap = std::make_shared<KnowledgeSnapshot>();
    snap->chunks = std::move(loaded->chunks);
    snap->index = VectorIndex(embedder_);
    snap->index.attach(std::move(loaded->embeddings));
    snap->stats = loaded->session.stats;
    snap->stats.chunks_created = (int)snap->chunks.size();
    snap->source = "database";
    std::cout << "[OK] Ready from saved session " << loaded->session.id << std::endl;
    guard_.publish(std::move(snap));
    return true;
}

std::shared_ptr<KnowledgeSnapshot> KnowledgeBase::crawl_and_index() {
    Crawler crawler(*fetcher_, cfg_.crawl);
    auto crawl = crawler.run();

    PdfCollector collector(*fetcher_, cfg_.crawl);
    auto pdfs = collector.collect(crawl.pdf_links);
    std::cout << "[build] Processed " << pdfs.size() << " PDFs" << std::endl;

    Chunker chunker(cfg_.chunk);
    std::vector<Chunk> all;
    auto add_source = [&](const Source& src) {
        try {
            auto parts = chunker.chunk(src);
            all.insert(all.end(), std::make_move_iterator(parts.begin()), std::make_move_iterator(parts.end()));
        } catch (const std::exception& e) {
            std::cerr << "[build] Chunking failed for " << src.uri << ": " << e.what() << std::endl;
        }
    };
    for (const auto& page : crawl.pages) add_source(page);
    for (const auto& pdf : pdfs) add_source(pdf.source);

    std::size_t total = all.size();
    auto snap = std::make_shared<KnowledgeSnapshot>();
    snap->chunks = dedup_chunks(std::move(all));
    std::cout << "[build] Created " << total << " chunks, " << snap->chunks.size() << " unique" << std::endl;

    snap->index = VectorIndex::build(snap->chunks, embedder_);
    snap->stats.timestamp = now_seconds();
    snap->stats.pages_crawled = (int)crawl.pages.size();
    snap->stats.pdfs_processed = (int)pdfs.size();
    snap->stats.chunks_created = (int)snap->chunks.size();
    snap->stats.base_url = cfg_.crawl.base_url;
    snap->source = "fresh crawl";

    store_->save(snap->chunks, snap->index.matrix(), snap->stats, pdfs);
    return snap;
}

void KnowledgeBase::clear_pdf_dir() {
    std::error_code ec;
    std::filesystem::directory_iterator it(cfg_.crawl.pdf_dir, ec);
    if (ec) return;
    for (const auto& entry : it) {
        if (!entry.is_regular_file()) continue;
        std::filesystem::remove(entry.path(), ec);
        if (ec) std::cerr << "[build] Could not delete " << entry.path() << ": " << ec.message() << std::endl;
    }
}

StatusReport KnowledgeBase::status() const {
    StatusReport s;
    s.ready = guard_.ready();
    s.building = supervisor_.busy();
    s.last_error = guard_.last_error();
    if (auto snap = guard_.snapshot()) {
        s.chunk_count = snap->chunks.size();
        s.pages_crawled = snap->stats.pages_crawled;
        s.pdfs_processed = snap->stats.pdfs_processed;
        s.last_build_time = snap->stats.timestamp;
        s.source = snap->source;
    }
    return s;
}

QueryResult KnowledgeBase::query(const std::string& question, const std::vector<Exchange>& recent_history) {
    QueryResult res;
    std::string q = trim(question);
    if (q.empty()) {
        res.error = "No question provided";
        return res;
    }
    auto snap = guard_.snapshot();
    if (!snap || !guard_.ready()) {
        res.error = "System is still loading the knowledge base";
        return res;
    }

    try {
        RetrievalEngine engine(snap->index, snap->chunks);
        res.sources = engine.search(q, cfg_.server.top_k);
        std::vector<std::string> context;
        for (const auto& c : res.sources) context.push_back(c.text);
        std::string raw = answerer_->answer(build_context_question(q, recent_history), context);
        res.answer = format_answer(raw) + helpful_links(res.sources);
    } catch (const std::exception& e) {
        res.error = std::string("Error: ") + e.what();
        res.answer.clear();
        return res;
    }

    try {
        res.suggestions = answerer_->suggest(q, res.answer);
    } catch (const std::exception& e) {
        std::cerr << "[query] Suggestions unavailable: " << e.what() << std::endl;
        res.suggestions.clear();
    }
    if (res.suggestions.empty()) res.suggestions = default_suggestions();
    return res;
}

StoreStats KnowledgeBase::store_stats() {
    return store_->stats();
}
