#include "../include/rag.hpp"
#include "../include/util.hpp"
#include <curl/curl.h>
#include <iostream>
#include <memory>

static void usage() {
    std::cerr << "site_rag_cli usage:\n"
              << "  build [--rebuild] [--url <base>] [--db <dbfile>] [--pdf-dir <dir>] [--max-pages N] [--delay-ms N]\n"
              << "  query --question \"...\" [--db <dbfile>] [--top-k N] [--ollama <url>] [--llm <name>]\n"
              << "  status [--db <dbfile>]\n"
              << "  stats [--db <dbfile>]\n";
}

static void apply_common_flags(SiteRagConfig& cfg, int argc, char** argv, int& i) {
    std::string a = argv[i];
    if (a == "--db" && i + 1 < argc) cfg.store.db_path = argv[++i];
    else if (a == "--url" && i + 1 < argc) cfg.crawl.base_url = argv[++i];
    else if (a == "--pdf-dir" && i + 1 < argc) cfg.crawl.pdf_dir = argv[++i];
    else if (a == "--max-pages" && i + 1 < argc) cfg.crawl.max_pages = std::stoi(argv[++i]);
    else if (a == "--delay-ms" && i + 1 < argc) cfg.crawl.delay_ms = std::stoi(argv[++i]);
    else if (a == "--top-k" && i + 1 < argc) cfg.server.top_k = std::stoi(argv[++i]);
    else if (a == "--ollama" && i + 1 < argc) cfg.embed.ollama_url = cfg.llm.ollama_url = argv[++i];
    else if (a == "--embed-model" && i + 1 < argc) cfg.embed.embed_model = argv[++i];
    else if (a == "--llm" && i + 1 < argc) cfg.llm.llm_model = argv[++i];
}

static std::unique_ptr<KnowledgeBase> make_knowledge_base(const SiteRagConfig& cfg) {
    return std::make_unique<KnowledgeBase>(cfg,
                                           std::make_shared<CurlFetcher>(),
                                           std::make_shared<OllamaEmbedder>(cfg.embed),
                                           std::make_shared<OllamaAnswerer>(cfg.llm),
                                           std::make_shared<SessionStore>(cfg.store.db_path));
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[ERROR] curl_global_init failed\n";
        return 1;
    }
    int rc = 0;
    try {
        SiteRagConfig cfg = load_config_from_env();
        if (cmd == "build") {
            bool rebuild = false;
            for (int i = 2; i < argc; ++i) {
                if (std::string(argv[i]) == "--rebuild") rebuild = true;
                else apply_common_flags(cfg, argc, argv, i);
            }
            auto kb = make_knowledge_base(cfg);
            kb->start_build(rebuild ? BuildMode::ForceRebuild : BuildMode::Update);
            kb->wait_for_build();
            auto st = kb->status();
            if (!st.ready) {
                std::cerr << "[ERROR] Build failed: " << st.last_error << "\n";
                rc = 1;
            } else {
                std::cout << "[OK] Chunks: " << st.chunk_count << " pages: " << st.pages_crawled
                          << " pdfs: " << st.pdfs_processed << "\n";
            }
        } else if (cmd == "query") {
            std::string question;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--question" && i + 1 < argc) question = argv[++i];
                else apply_common_flags(cfg, argc, argv, i);
            }
            if (question.empty()) { usage(); curl_global_cleanup(); return 2; }
            auto kb = make_knowledge_base(cfg);
            kb->start_build(BuildMode::LoadOrBuild);
            kb->wait_for_build();
            auto res = kb->query(question, {});
            if (!res.error.empty()) {
                std::cerr << "[ERROR] " << res.error << "\n";
                rc = 1;
            } else {
                std::cout << "\n==== Answer ====\n\n" << res.answer << "\n\n";
                std::cout << "==== Sources ====\n";
                int n = 1;
                for (auto& s : res.sources) {
                    std::cout << "[" << n++ << "] " << s.source_title << " - " << s.source_uri << "\n";
                }
                std::cout << "\n==== Follow-ups ====\n";
                for (auto& s : res.suggestions) std::cout << "- " << s << "\n";
            }
        } else if (cmd == "status" || cmd == "stats") {
            for (int i = 2; i < argc; ++i) apply_common_flags(cfg, argc, argv, i);
            SessionStore store(cfg.store.db_path);
            if (cmd == "status") {
                auto s = store.latest_session();
                if (!s) {
                    std::cout << "No active session\n";
                } else {
                    std::cout << "Session " << s->id << " (" << s->status << ") base_url=" << s->stats.base_url
                              << " pages=" << s->stats.pages_crawled << " pdfs=" << s->stats.pdfs_processed
                              << " chunks=" << s->stats.chunks_created << " built_at=" << (long long)s->stats.timestamp << "\n";
                }
            } else {
                auto st = store.stats();
                std::cout << "sessions: " << st.total_sessions << " (active " << st.active_sessions << ")\n"
                          << "chunks: " << st.total_chunks << " (web " << st.web_chunks << ", pdf " << st.pdf_chunks << ")\n"
                          << "pdfs: " << st.total_pdfs << "\n";
            }
        } else {
            usage();
            rc = 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
