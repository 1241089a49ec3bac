#pragma once
#include <string>

struct CrawlConfig {
    std::string base_url{"https://www.example.org/"};
    int max_pages{1000};
    int delay_ms{500};
    long page_timeout_ms{20000};
    long pdf_timeout_ms{30000};
    long sitemap_timeout_ms{10000};
    bool discover_sitemaps{true};
    bool pdf_same_domain_only{true};
    std::string pdf_dir{"./data/pdfs"};
};

struct ChunkConfig {
    int max_tokens{600};
    std::size_t min_fallback_chars{50};
};

struct EmbedConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"all-minilm"};
    int timeout_ms{120000};
    int batch_size{32};
};

struct LlmConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"mistral"};
    int timeout_ms{240000};
};

struct StoreConfig {
    std::string db_path{"./data/site-rag.db"};
};

struct ServerConfig {
    int port{5000};
    int top_k{3};
    std::size_t history_size{5};
};

struct SiteRagConfig {
    CrawlConfig crawl;
    ChunkConfig chunk;
    EmbedConfig embed;
    LlmConfig llm;
    StoreConfig store;
    ServerConfig server;
};

// Defaults overridden by SITE_RAG_* / OLLAMA_URL environment variables.
SiteRagConfig load_config_from_env();
