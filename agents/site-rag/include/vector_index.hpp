#pragma once
#include "chunker.hpp"
#include "embedder.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Row-major float32 matrix, one row per chunk.
struct EmbeddingMatrix {
    std::size_t rows{0};
    std::size_t dim{0};
    std::vector<float> data;

    // Throws std::invalid_argument on rows of differing length.
    static EmbeddingMatrix from_rows(const std::vector<std::vector<float>>& rows);
    const float* row(std::size_t i) const { return data.data() + i * dim; }

    // Raw float32 bytes in host order; dimensions are stored next to the blob.
    std::string to_blob() const;
    // No value when the byte size does not match rows * dim.
    static std::optional<EmbeddingMatrix> from_blob(const void* bytes, std::size_t size,
                                                    std::size_t rows, std::size_t dim);
};

// Exact nearest-neighbour search by squared Euclidean distance.
class VectorIndex {
public:
    VectorIndex() = default;
    explicit VectorIndex(std::shared_ptr<Embedder> embedder);

    static VectorIndex build(const std::vector<Chunk>& chunks, std::shared_ptr<Embedder> embedder);
    void attach(EmbeddingMatrix matrix);

    // Ordinals of the k nearest rows, nearest first; equal distances keep
    // insertion order. Empty for an empty index.
    std::vector<int> search(const std::string& query, int k = 3) const;
    std::vector<int> search_vector(const std::vector<float>& query, int k = 3) const;

    std::size_t size() const { return matrix_.rows; }
    std::size_t dim() const { return matrix_.dim; }
    const EmbeddingMatrix& matrix() const { return matrix_; }

private:
    std::shared_ptr<Embedder> embedder_;
    EmbeddingMatrix matrix_;
};

float squared_l2(const float* a, const float* b, std::size_t dim);
