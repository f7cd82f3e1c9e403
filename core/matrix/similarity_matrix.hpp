#pragma once

#include "matrix/sparse_matrix.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace reasongraph {

struct SimilarityMatrixStats {
    SparseMatrixStats matrix;
    size_t thoughts = 0;
    double avg_connections = 0.0;
};

// ─── SimilarityMatrix ──────────────────────────────────────────
// Symmetric thought-to-thought similarity over a SparseMatrix.
// Thought ids are mapped to dense indices on first sight; capacity
// doubles when an index runs past the current size.

class SimilarityMatrix {
public:
    explicit SimilarityMatrix(double threshold = 0.3, size_t initial_size = 1000);

    /// Dense index for the id, assigning a new one if needed.
    size_t registerThought(const std::string& thought_id);
    bool isRegistered(const std::string& thought_id) const;
    std::optional<size_t> indexOf(const std::string& thought_id) const;

    /// Symmetric write. Unregistered ids are registered first.
    void set(const std::string& a, const std::string& b, double value);

    /// 0 for never-computed, below-threshold and unknown pairs alike.
    double get(const std::string& a, const std::string& b) const;

    /// nullopt if the pair was never computed; 0.0 if it was computed
    /// and fell below the threshold; the stored value otherwise.
    std::optional<double> lookup(const std::string& a, const std::string& b) const;

    /// Top-k stored (nonzero) entries of the id's row, descending, self
    /// excluded. Ties are broken by thought id.
    std::vector<std::pair<std::string, double>> mostSimilar(const std::string& thought_id,
                                                            size_t k) const;

    /// Connected components of the graph of cells >= min_similarity.
    /// Only components with at least two members are returned.
    std::vector<std::vector<std::string>> clusters(double min_similarity) const;

    size_t size() const { return ids_.size(); }
    size_t capacity() const { return matrix_.rows(); }
    double threshold() const { return matrix_.threshold(); }

    SimilarityMatrixStats stats() const;

private:
    SparseMatrix matrix_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::string> ids_;
    std::unordered_set<uint64_t> computed_;   // unordered index pairs

    static uint64_t pairKey(size_t a, size_t b);
};

} // namespace reasongraph
