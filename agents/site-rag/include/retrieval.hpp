#pragma once
#include "chunker.hpp"
#include "vector_index.hpp"
#include <string>
#include <vector>

class RetrievalEngine {
public:
    RetrievalEngine(const VectorIndex& index, const std::vector<Chunk>& chunks);

    // Top-k chunks for the question, nearest first. Fewer (or none) when the
    // index is small or any step fails; never throws.
    std::vector<Chunk> search(const std::string& question, int k = 3) const;
    std::vector<std::string> search_texts(const std::string& question, int k = 3) const;

private:
    const VectorIndex& index_;
    const std::vector<Chunk>& chunks_;
};
