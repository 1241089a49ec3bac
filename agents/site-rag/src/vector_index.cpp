#include "../include/vector_index.hpp"
#include <algorithm>
#include <cstring>
#include <numeric>
#include <stdexcept>

EmbeddingMatrix EmbeddingMatrix::from_rows(const std::vector<std::vector<float>>& rows) {
    EmbeddingMatrix m;
    m.rows = rows.size();
    m.dim = rows.empty() ? 0 : rows.front().size();
    m.data.reserve(m.rows * m.dim);
    for (const auto& r : rows) {
        if (r.size() != m.dim) throw std::invalid_argument("embedding rows have differing dimensions");
        m.data.insert(m.data.end(), r.begin(), r.end());
    }
    return m;
}

std::string EmbeddingMatrix::to_blob() const {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size() * sizeof(float));
}

std::optional<EmbeddingMatrix> EmbeddingMatrix::from_blob(const void* bytes, std::size_t size,
                                                          std::size_t rows, std::size_t dim) {
    if (size != rows * dim * sizeof(float)) return std::nullopt;
    if (rows > 0 && dim == 0) return std::nullopt;
    EmbeddingMatrix m;
    m.rows = rows;
    m.dim = dim;
    m.data.resize(rows * dim);
    if (size) std::memcpy(m.data.data(), bytes, size);
    return m;
}

float squared_l2(const float* a, const float* b, std::size_t dim) {
    double sum = 0.0;
    for (std::size_t i = 0; i < dim; ++i) {
        double d = (double)a[i] - (double)b[i];
        sum += d * d;
    }
    return (float)sum;
}

VectorIndex::VectorIndex(std::shared_ptr<Embedder> embedder) : embedder_(std::move(embedder)) {}

VectorIndex VectorIndex::build(const std::vector<Chunk>& chunks, std::shared_ptr<Embedder> embedder) {
    VectorIndex index(std::move(embedder));
    if (chunks.empty()) return index;

    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const auto& c : chunks) texts.push_back(c.text);
    auto rows = index.embedder_->embed(texts);
    if (rows.size() != chunks.size()) {
        throw std::runtime_error("embedder returned " + std::to_string(rows.size()) + " vectors for " +
                                 std::to_string(chunks.size()) + " chunks");
    }
    index.attach(EmbeddingMatrix::from_rows(rows));
    return index;
}

void VectorIndex::attach(EmbeddingMatrix matrix) {
    matrix_ = std::move(matrix);
}

std::vector<int> VectorIndex::search(const std::string& query, int k) const {
    if (matrix_.rows == 0 || k <= 0) return {};
    if (!embedder_) throw std::runtime_error("vector index has no embedder");
    auto q = embedder_->embed({query});
    if (q.size() != 1) throw std::runtime_error("embedder returned no query vector");
    return search_vector(q.front(), k);
}

std::vector<int> VectorIndex::search_vector(const std::vector<float>& query, int k) const {
    if (matrix_.rows == 0 || k <= 0) return {};
    if (query.size() != matrix_.dim) {
        throw std::runtime_error("query dimension " + std::to_string(query.size()) +
                                 " does not match index dimension " + std::to_string(matrix_.dim));
    }
    std::vector<float> dist(matrix_.rows);
    for (std::size_t i = 0; i < matrix_.rows; ++i) dist[i] = squared_l2(matrix_.row(i), query.data(), matrix_.dim);

    std::vector<int> order(matrix_.rows);
    std::iota(order.begin(), order.end(), 0);
    std::size_t n = std::min<std::size_t>((std::size_t)k, order.size());
    std::partial_sort(order.begin(), order.begin() + (long)n, order.end(), [&](int a, int b) {
        if (dist[a] != dist[b]) return dist[a] < dist[b];
        return a < b;
    });
    order.resize(n);
    return order;
}
