#include "../include/retrieval.hpp"
#include <iostream>

RetrievalEngine::RetrievalEngine(const VectorIndex& index, const std::vector<Chunk>& chunks)
    : index_(index), chunks_(chunks) {}

std::vector<Chunk> RetrievalEngine::search(const std::string& question, int k) const {
    std::vector<Chunk> out;
    try {
        for (int ordinal : index_.search(question, k)) {
            if (ordinal >= 0 && (size_t)ordinal < chunks_.size()) out.push_back(chunks_[(size_t)ordinal]);
        }
    } catch (const std::exception& e) {
        std::cerr << "[retrieval] Search failed, answering without context: " << e.what() << std::endl;
        out.clear();
    }
    return out;
}

std::vector<std::string> RetrievalEngine::search_texts(const std::string& question, int k) const {
    std::vector<std::string> out;
    for (auto& c : search(question, k)) out.push_back(std::move(c.text));
    return out;
}
