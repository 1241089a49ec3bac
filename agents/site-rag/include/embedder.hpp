#pragma once
#include "config.hpp"
#include <string>
#include <vector>

// The system-wide embedding function. Indexed and query vectors always go
// through the same instance so they stay comparable.
class Embedder {
public:
    virtual ~Embedder() = default;
    // One vector per input, same order, all of the same dimension.
    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;
};

class OllamaEmbedder : public Embedder {
public:
    explicit OllamaEmbedder(EmbedConfig cfg);
    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;

private:
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& batch);

    EmbedConfig cfg_;
};
