#include "../include/config.hpp"
#include "../include/util.hpp"

SiteRagConfig load_config_from_env() {
    SiteRagConfig c;
    c.crawl.base_url = getenv_or("SITE_RAG_BASE_URL", c.crawl.base_url);
    c.crawl.max_pages = getenv_int_or("SITE_RAG_MAX_PAGES", c.crawl.max_pages);
    c.crawl.delay_ms = getenv_int_or("SITE_RAG_CRAWL_DELAY_MS", c.crawl.delay_ms);
    c.crawl.pdf_dir = getenv_or("SITE_RAG_PDF_DIR", c.crawl.pdf_dir);

    c.chunk.max_tokens = getenv_int_or("SITE_RAG_MAX_TOKENS", c.chunk.max_tokens);

    std::string ollama = getenv_or("OLLAMA_URL", c.embed.ollama_url);
    c.embed.ollama_url = ollama;
    c.embed.embed_model = getenv_or("SITE_RAG_EMBED_MODEL", c.embed.embed_model);
    c.llm.ollama_url = ollama;
    c.llm.llm_model = getenv_or("SITE_RAG_LLM_MODEL", c.llm.llm_model);

    c.store.db_path = getenv_or("SITE_RAG_DB_PATH", c.store.db_path);

    c.server.port = getenv_int_or("SITE_RAG_PORT", c.server.port);
    c.server.top_k = getenv_int_or("SITE_RAG_TOP_K", c.server.top_k);
    return c;
}
