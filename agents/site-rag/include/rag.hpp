#pragma once
#include "answerer.hpp"
#include "chunker.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "fetcher.hpp"
#include "store.hpp"
#include "vector_index.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Immutable, fully built knowledge base served to the query path.
struct KnowledgeSnapshot {
    std::vector<Chunk> chunks;
    VectorIndex index;
    CrawlStats stats;
    std::string source; // "database" | "fresh crawl"
};

// Holds the published snapshot. Readers get a shared reference that stays
// valid while a newer snapshot is swapped in.
class ReadinessGuard {
public:
    std::shared_ptr<const KnowledgeSnapshot> snapshot() const;
    void publish(std::shared_ptr<const KnowledgeSnapshot> snap);
    void mark_failed(const std::string& error);
    bool ready() const;
    std::string last_error() const;

private:
    mutable std::mutex mtx_;
    std::shared_ptr<const KnowledgeSnapshot> snap_;
    bool failed_{false};
    std::string last_error_;
};

// Runs at most one background task; a second start while busy is refused.
class BuildSupervisor {
public:
    ~BuildSupervisor();

    bool try_start(std::function<void()> task);
    bool busy() const { return busy_.load(); }
    void wait();
    std::string last_error() const;

private:
    std::atomic<bool> busy_{false};
    std::thread worker_;
    mutable std::mutex mtx_;
    std::string last_error_;
};

enum class BuildMode { LoadOrBuild, Update, ForceRebuild };

const char* build_mode_name(BuildMode mode);

struct Exchange {
    std::string question;
    std::string answer;
};

// Last N question/answer pairs, oldest first.
class ConversationHistory {
public:
    explicit ConversationHistory(std::size_t capacity = 5) : capacity_(capacity) {}
    void add(Exchange e);
    std::vector<Exchange> recent() const;
    void clear();

private:
    std::size_t capacity_;
    mutable std::mutex mtx_;
    std::deque<Exchange> items_;
};

struct StatusReport {
    bool ready{false};
    bool building{false};
    std::size_t chunk_count{0};
    int pages_crawled{0};
    int pdfs_processed{0};
    double last_build_time{0.0};
    std::string source;
    std::string last_error;
};

struct QueryResult {
    std::string answer;
    std::vector<std::string> suggestions;
    std::vector<Chunk> sources;
    std::string error; // non-empty on failure; answer is then empty
};

// "Context: Previous: <q> Answer: <a, 100 chars> ...\n\nCurrent question: <q>"
// over the last five exchanges; the bare question when history is empty.
std::string build_context_question(const std::string& question, const std::vector<Exchange>& history);

// "**Helpful Links:**" block for up to three distinct web sources.
std::string helpful_links(const std::vector<Chunk>& chunks);

const std::vector<std::string>& default_suggestions();

class KnowledgeBase {
public:
    KnowledgeBase(SiteRagConfig cfg,
                  std::shared_ptr<Fetcher> fetcher,
                  std::shared_ptr<Embedder> embedder,
                  std::shared_ptr<Answerer> answerer,
                  std::shared_ptr<SessionStore> store);
    ~KnowledgeBase();

    // Returns false ("already building") when a build holds the slot.
    bool start_build(BuildMode mode);
    void wait_for_build();

    StatusReport status() const;
    QueryResult query(const std::string& question, const std::vector<Exchange>& recent_history);
    StoreStats store_stats();

    std::shared_ptr<const KnowledgeSnapshot> snapshot() const { return guard_.snapshot(); }

private:
    void run_build(BuildMode mode);
    bool load_from_store();
    std::shared_ptr<KnowledgeSnapshot> crawl_and_index();
    void clear_pdf_dir();

    SiteRagConfig cfg_;
    std::shared_ptr<Fetcher> fetcher_;
    std::shared_ptr<Embedder> embedder_;
    std::shared_ptr<Answerer> answerer_;
    std::shared_ptr<SessionStore> store_;
    ReadinessGuard guard_;
    BuildSupervisor supervisor_;
};
