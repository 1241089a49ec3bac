#pragma once
#include "chunker.hpp"
#include "crawler.hpp"
#include "vector_index.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct CrawlStats {
    double timestamp{0.0}; // unix seconds
    int pages_crawled{0};
    int pdfs_processed{0};
    int chunks_created{0};
    std::string base_url;
};

struct SessionInfo {
    std::int64_t id{0};
    std::string status; // "active" | "inactive"
    CrawlStats stats;
};

struct LoadedSession {
    SessionInfo session;
    std::vector<Chunk> chunks;
    EmbeddingMatrix embeddings;
};

struct StoreStats {
    int total_sessions{0};
    int active_sessions{0};
    int web_chunks{0};
    int pdf_chunks{0};
    int total_chunks{0};
    int total_pdfs{0};
};

// Versioned knowledge-base snapshots in SQLite. At most one session is
// active; older ones are kept as inactive rows.
class SessionStore {
public:
    explicit SessionStore(const std::string& db_path);
    ~SessionStore();
    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Writes a new active session in one transaction and deactivates the
    // previous ones. Throws and leaves the store unchanged on any failure.
    std::int64_t save(const std::vector<Chunk>& chunks,
                      const EmbeddingMatrix& embeddings,
                      const CrawlStats& stats,
                      const std::vector<PdfRecord>& pdfs = {});

    // Latest active session, or no value when there is none or it fails
    // validation (missing blob, row count or size mismatch). Never throws.
    std::optional<LoadedSession> load_latest();

    std::optional<SessionInfo> latest_session();
    std::vector<SessionInfo> sessions();
    int deactivate_all();
    StoreStats stats();

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    std::optional<LoadedSession> load_latest_locked();

    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_session_stmt_ {nullptr};
    struct sqlite3_stmt* insert_chunk_stmt_ {nullptr};
    struct sqlite3_stmt* insert_embeddings_stmt_ {nullptr};
    struct sqlite3_stmt* insert_pdf_stmt_ {nullptr};
    struct sqlite3_stmt* latest_session_stmt_ {nullptr};
    struct sqlite3_stmt* chunks_by_session_stmt_ {nullptr};
    struct sqlite3_stmt* embeddings_by_session_stmt_ {nullptr};
    std::mutex mtx_;
};
