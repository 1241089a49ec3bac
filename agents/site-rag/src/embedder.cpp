#include "../include/embedder.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

OllamaEmbedder::OllamaEmbedder(EmbedConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
    if (cfg_.batch_size < 1) cfg_.batch_size = 1;
}

std::vector<std::vector<float>> OllamaEmbedder::embed_batch(const std::vector<std::string>& batch) {
    json body = {
        {"model", cfg_.embed_model},
        {"input", batch}
    };
    auto r = http_post_json(cfg_.ollama_url + "/api/embed", body.dump(), cfg_.timeout_ms);
    if (r.status < 200 || r.status >= 300) {
        throw std::runtime_error("embedding failed: status " + std::to_string(r.status));
    }
    auto data = json::parse(r.body);
    std::vector<std::vector<float>> out;
    for (auto& row : data.at("embeddings")) {
        std::vector<float> vec;
        vec.reserve(row.size());
        for (auto& v : row) vec.push_back(v.get<float>());
        out.push_back(std::move(vec));
    }
    if (out.size() != batch.size()) {
        throw std::runtime_error("embedding failed: expected " + std::to_string(batch.size()) +
                                 " vectors, got " + std::to_string(out.size()));
    }
    return out;
}

std::vector<std::vector<float>> OllamaEmbedder::embed(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); i += (size_t)cfg_.batch_size) {
        size_t end = std::min(texts.size(), i + (size_t)cfg_.batch_size);
        std::vector<std::string> batch(texts.begin() + (long)i, texts.begin() + (long)end);
        for (auto& vec : embed_batch(batch)) {
            if (!out.empty() && vec.size() != out.front().size()) {
                throw std::runtime_error("embedding dimension changed mid-build");
            }
            out.push_back(std::move(vec));
        }
    }
    return out;
}
