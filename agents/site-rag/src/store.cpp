#include "../include/store.hpp"
#include <sqlite3.h>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace {
void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

void bind_blob(sqlite3_stmt* st, int idx, const std::string& v) {
    if (v.empty()) sqlite3_bind_zeroblob(st, idx, 0);
    else sqlite3_bind_blob(st, idx, v.data(), (int)v.size(), SQLITE_TRANSIENT);
}

std::string col_text(sqlite3_stmt* st, int idx) {
    const unsigned char* t = sqlite3_column_text(st, idx);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
}

void step_done(sqlite3* db, sqlite3_stmt* st, const char* what) {
    if (sqlite3_step(st) != SQLITE_DONE) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_reset(st);
        throw std::runtime_error(std::string(what) + " failed: " + msg);
    }
    sqlite3_reset(st);
}

double now_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { run("BEGIN IMMEDIATE;"); }
    ~Transaction() {
        if (done_) return;
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[store] ROLLBACK failed: " << (err ? err : "unknown") << std::endl;
            sqlite3_free(err);
        }
    }
    void commit() { run("COMMIT;"); done_ = true; }

private:
    void run(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown";
            sqlite3_free(err);
            throw std::runtime_error(std::string("SQLite error on ") + sql + " " + msg);
        }
    }
    sqlite3* db_;
    bool done_{false};
};

SessionInfo read_session(sqlite3_stmt* st) {
    SessionInfo s;
    s.id = sqlite3_column_int64(st, 0);
    s.stats.timestamp = sqlite3_column_double(st, 1);
    s.stats.pages_crawled = sqlite3_column_int(st, 2);
    s.stats.pdfs_processed = sqlite3_column_int(st, 3);
    s.stats.chunks_created = sqlite3_column_int(st, 4);
    s.stats.base_url = col_text(st, 5);
    s.status = col_text(st, 6);
    return s;
}
}

SessionStore::SessionStore(const std::string& db_path) {
    auto parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SessionStore::~SessionStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SessionStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA foreign_keys=ON;");
    exec("CREATE TABLE IF NOT EXISTS crawl_sessions (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  created_at REAL NOT NULL,\n"
         "  pages_crawled INTEGER DEFAULT 0,\n"
         "  pdfs_processed INTEGER DEFAULT 0,\n"
         "  chunks_created INTEGER DEFAULT 0,\n"
         "  base_url TEXT,\n"
         "  status TEXT NOT NULL DEFAULT 'active' CHECK (status IN ('active', 'inactive'))\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS content_chunks (\n"
         "  id INTEGER PRIMARY KEY,\n"
         "  session_id INTEGER NOT NULL REFERENCES crawl_sessions(id) ON DELETE CASCADE,\n"
         "  chunk_text TEXT NOT NULL,\n"
         "  source_url TEXT,\n"
         "  source_type TEXT CHECK (source_type IN ('web', 'pdf')),\n"
         "  source_title TEXT,\n"
         "  chunk_index INTEGER NOT NULL\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS embeddings_data (\n"
         "  id INTEGER PRIMARY KEY,\n"
         "  session_id INTEGER NOT NULL REFERENCES crawl_sessions(id) ON DELETE CASCADE,\n"
         "  embeddings_binary BLOB NOT NULL,\n"
         "  row_count INTEGER NOT NULL,\n"
         "  dimension INTEGER NOT NULL\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS pdf_files (\n"
         "  id INTEGER PRIMARY KEY,\n"
         "  session_id INTEGER NOT NULL REFERENCES crawl_sessions(id) ON DELETE CASCADE,\n"
         "  filename TEXT NOT NULL,\n"
         "  original_url TEXT,\n"
         "  file_path TEXT,\n"
         "  sha1 TEXT,\n"
         "  text_content TEXT\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_content_chunks_session ON content_chunks(session_id, chunk_index);");
    exec("CREATE INDEX IF NOT EXISTS idx_embeddings_session ON embeddings_data(session_id);");
    exec("CREATE INDEX IF NOT EXISTS idx_sessions_status ON crawl_sessions(status);");
}

void SessionStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void SessionStore::prepare_statements() {
    auto prepare = [&](const char* sql, sqlite3_stmt** st) {
        if (sqlite3_prepare_v2(db_, sql, -1, st, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    };
    prepare("INSERT INTO crawl_sessions \n"
            "(created_at, pages_crawled, pdfs_processed, chunks_created, base_url, status) \n"
            "VALUES (?, ?, ?, ?, ?, 'active');", &insert_session_stmt_);
    prepare("INSERT INTO content_chunks \n"
            "(session_id, chunk_text, source_url, source_type, source_title, chunk_index) \n"
            "VALUES (?, ?, ?, ?, ?, ?);", &insert_chunk_stmt_);
    prepare("INSERT INTO embeddings_data (session_id, embeddings_binary, row_count, dimension) \n"
            "VALUES (?, ?, ?, ?);", &insert_embeddings_stmt_);
    prepare("INSERT INTO pdf_files (session_id, filename, original_url, file_path, sha1, text_content) \n"
            "VALUES (?, ?, ?, ?, ?, ?);", &insert_pdf_stmt_);
    prepare("SELECT id, created_at, pages_crawled, pdfs_processed, chunks_created, base_url, status \n"
            "FROM crawl_sessions WHERE status = 'active' ORDER BY id DESC LIMIT 1;", &latest_session_stmt_);
    prepare("SELECT chunk_text, source_url, source_type, source_title, chunk_index \n"
            "FROM content_chunks WHERE session_id = ? ORDER BY chunk_index;", &chunks_by_session_stmt_);
    prepare("SELECT embeddings_binary, row_count, dimension FROM embeddings_data \n"
            "WHERE session_id = ? ORDER BY id DESC LIMIT 1;", &embeddings_by_session_stmt_);
}

void SessionStore::close_statements() {
    for (sqlite3_stmt** st : {&insert_session_stmt_, &insert_chunk_stmt_, &insert_embeddings_stmt_,
                              &insert_pdf_stmt_, &latest_session_stmt_, &chunks_by_session_stmt_,
                              &embeddings_by_session_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

std::int64_t SessionStore::save(const std::vector<Chunk>& chunks,
                                const EmbeddingMatrix& embeddings,
                                const CrawlStats& stats,
                                const std::vector<PdfRecord>& pdfs) {
    if (embeddings.rows != chunks.size()) {
        throw std::invalid_argument("embedding rows (" + std::to_string(embeddings.rows) +
                                    ") do not match chunk count (" + std::to_string(chunks.size()) + ")");
    }
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);

    exec("UPDATE crawl_sessions SET status = 'inactive' WHERE status = 'active';");

    sqlite3_clear_bindings(insert_session_stmt_);
    sqlite3_bind_double(insert_session_stmt_, 1, stats.timestamp > 0 ? stats.timestamp : now_seconds());
    sqlite3_bind_int(insert_session_stmt_, 2, stats.pages_crawled);
    sqlite3_bind_int(insert_session_stmt_, 3, stats.pdfs_processed);
    sqlite3_bind_int(insert_session_stmt_, 4, (int)chunks.size());
    bind_text(insert_session_stmt_, 5, stats.base_url);
    step_done(db_, insert_session_stmt_, "insert session");
    std::int64_t session_id = sqlite3_last_insert_rowid(db_);

    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& c = chunks[i];
        sqlite3_clear_bindings(insert_chunk_stmt_);
        sqlite3_bind_int64(insert_chunk_stmt_, 1, session_id);
        bind_text(insert_chunk_stmt_, 2, c.text);
        bind_text(insert_chunk_stmt_, 3, c.source_uri);
        bind_text(insert_chunk_stmt_, 4, source_kind_name(c.source_kind));
        bind_text(insert_chunk_stmt_, 5, c.source_title);
        sqlite3_bind_int(insert_chunk_stmt_, 6, (int)i);
        step_done(db_, insert_chunk_stmt_, "insert chunk");
    }

    sqlite3_clear_bindings(insert_embeddings_stmt_);
    sqlite3_bind_int64(insert_embeddings_stmt_, 1, session_id);
    bind_blob(insert_embeddings_stmt_, 2, embeddings.to_blob());
    sqlite3_bind_int64(insert_embeddings_stmt_, 3, (sqlite3_int64)embeddings.rows);
    sqlite3_bind_int64(insert_embeddings_stmt_, 4, (sqlite3_int64)embeddings.dim);
    step_done(db_, insert_embeddings_stmt_, "insert embeddings");

    for (const auto& pdf : pdfs) {
        sqlite3_clear_bindings(insert_pdf_stmt_);
        sqlite3_bind_int64(insert_pdf_stmt_, 1, session_id);
        bind_text(insert_pdf_stmt_, 2, pdf.filename);
        bind_text(insert_pdf_stmt_, 3, pdf.url);
        bind_text(insert_pdf_stmt_, 4, pdf.file_path);
        bind_text(insert_pdf_stmt_, 5, pdf.sha1);
        bind_text(insert_pdf_stmt_, 6, pdf.source.raw_text);
        step_done(db_, insert_pdf_stmt_, "insert pdf file");
    }

    tx.commit();
    std::cout << "[store] Saved session " << session_id << " with " << chunks.size() << " chunks" << std::endl;
    return session_id;
}

std::optional<LoadedSession> SessionStore::load_latest() {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
        auto out = load_latest_locked();
        sqlite3_reset(latest_session_stmt_);
        sqlite3_reset(chunks_by_session_stmt_);
        sqlite3_reset(embeddings_by_session_stmt_);
        return out;
    } catch (const std::exception& e) {
        sqlite3_reset(latest_session_stmt_);
        sqlite3_reset(chunks_by_session_stmt_);
        sqlite3_reset(embeddings_by_session_stmt_);
        std::cerr << "[store] Load failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<LoadedSession> SessionStore::load_latest_locked() {
    sqlite3_reset(latest_session_stmt_);
    if (sqlite3_step(latest_session_stmt_) != SQLITE_ROW) {
        std::cout << "[store] No saved session found" << std::endl;
        return std::nullopt;
    }
    LoadedSession out;
    out.session = read_session(latest_session_stmt_);
    const std::int64_t id = out.session.id;

    sqlite3_reset(chunks_by_session_stmt_);
    sqlite3_clear_bindings(chunks_by_session_stmt_);
    sqlite3_bind_int64(chunks_by_session_stmt_, 1, id);
    int rc;
    while ((rc = sqlite3_step(chunks_by_session_stmt_)) == SQLITE_ROW) {
        Chunk c;
        c.text = col_text(chunks_by_session_stmt_, 0);
        c.source_uri = col_text(chunks_by_session_stmt_, 1);
        c.source_kind = parse_source_kind(col_text(chunks_by_session_stmt_, 2)).value_or(SourceKind::Web);
        c.source_title = col_text(chunks_by_session_stmt_, 3);
        c.ordinal = (int)out.chunks.size();
        out.chunks.push_back(std::move(c));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("reading chunks: ") + sqlite3_errmsg(db_));

    sqlite3_reset(embeddings_by_session_stmt_);
    sqlite3_clear_bindings(embeddings_by_session_stmt_);
    sqlite3_bind_int64(embeddings_by_session_stmt_, 1, id);
    if (sqlite3_step(embeddings_by_session_stmt_) != SQLITE_ROW) {
        std::cerr << "[store] Session " << id << " rejected: no embeddings" << std::endl;
        return std::nullopt;
    }
    const void* blob = sqlite3_column_blob(embeddings_by_session_stmt_, 0);
    auto bytes = (std::size_t)sqlite3_column_bytes(embeddings_by_session_stmt_, 0);
    auto rows = sqlite3_column_int64(embeddings_by_session_stmt_, 1);
    auto dim = sqlite3_column_int64(embeddings_by_session_stmt_, 2);
    if (rows < 0 || dim < 0 || (std::size_t)rows != out.chunks.size()) {
        std::cerr << "[store] Session " << id << " rejected: " << rows << " embedding rows for "
                  << out.chunks.size() << " chunks" << std::endl;
        return std::nullopt;
    }
    auto matrix = EmbeddingMatrix::from_blob(blob, bytes, (std::size_t)rows, (std::size_t)dim);
    if (!matrix) {
        std::cerr << "[store] Session " << id << " rejected: blob of " << bytes << " bytes does not hold "
                  << rows << "x" << dim << " floats" << std::endl;
        return std::nullopt;
    }
    out.embeddings = std::move(*matrix);
    std::cout << "[store] Loaded " << out.chunks.size() << " chunks from session " << id << std::endl;
    return out;
}

std::optional<SessionInfo> SessionStore::latest_session() {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(latest_session_stmt_);
    std::optional<SessionInfo> out;
    int rc = sqlite3_step(latest_session_stmt_);
    if (rc == SQLITE_ROW) out = read_session(latest_session_stmt_);
    sqlite3_reset(latest_session_stmt_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) throw std::runtime_error(std::string("latest session: ") + sqlite3_errmsg(db_));
    return out;
}

std::vector<SessionInfo> SessionStore::sessions() {
    std::lock_guard<std::mutex> lock(mtx_);
    const char* sql = "SELECT id, created_at, pages_crawled, pdfs_processed, chunks_created, base_url, status \n"
                      "FROM crawl_sessions ORDER BY id;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare sessions failed: ") + sqlite3_errmsg(db_));
    }
    std::vector<SessionInfo> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) out.push_back(read_session(st));
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("list sessions: ") + sqlite3_errmsg(db_));
    return out;
}

int SessionStore::deactivate_all() {
    std::lock_guard<std::mutex> lock(mtx_);
    exec("UPDATE crawl_sessions SET status = 'inactive' WHERE status = 'active';");
    return sqlite3_changes(db_);
}

StoreStats SessionStore::stats() {
    std::lock_guard<std::mutex> lock(mtx_);
    const char* sql =
        "SELECT \n"
        "  (SELECT COUNT(*) FROM crawl_sessions),\n"
        "  (SELECT COUNT(*) FROM crawl_sessions WHERE status = 'active'),\n"
        "  COALESCE(SUM(CASE WHEN c.source_type = 'web' THEN 1 ELSE 0 END), 0),\n"
        "  COALESCE(SUM(CASE WHEN c.source_type = 'pdf' THEN 1 ELSE 0 END), 0),\n"
        "  COUNT(c.id),\n"
        "  (SELECT COUNT(*) FROM pdf_files WHERE session_id IN \n"
        "     (SELECT id FROM crawl_sessions WHERE status = 'active'))\n"
        "FROM content_chunks c \n"
        "WHERE c.session_id IN (SELECT id FROM crawl_sessions WHERE status = 'active');";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare stats failed: ") + sqlite3_errmsg(db_));
    }
    StoreStats s;
    if (sqlite3_step(st) == SQLITE_ROW) {
        s.total_sessions = sqlite3_column_int(st, 0);
        s.active_sessions = sqlite3_column_int(st, 1);
        s.web_chunks = sqlite3_column_int(st, 2);
        s.pdf_chunks = sqlite3_column_int(st, 3);
        s.total_chunks = sqlite3_column_int(st, 4);
        s.total_pdfs = sqlite3_column_int(st, 5);
    } else {
        std::string msg = sqlite3_errmsg(db_);
        sqlite3_finalize(st);
        throw std::runtime_error("stats query failed: " + msg);
    }
    sqlite3_finalize(st);
    return s;
}
