#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

namespace reasongraph {

struct SparseEntry {
    size_t row = 0;
    size_t col = 0;
    double value = 0.0;
};

struct SparseMatrixStats {
    size_t rows = 0;
    size_t cols = 0;
    size_t nonzero = 0;
    double sparsity = 1.0;      // fraction of cells not stored
    double threshold = 0.0;
    size_t approx_bytes = 0;
};

// ─── SparseMatrix ──────────────────────────────────────────────
// 2-D numeric store that only materializes cells with |v| >= threshold.
// Writing a sub-threshold value deletes the cell. Absent cells read 0.

class SparseMatrix {
public:
    SparseMatrix(size_t rows, size_t cols, double threshold = 0.0);

    /// Throws std::out_of_range if (row, col) is outside the matrix.
    void set(size_t row, size_t col, double value);
    double get(size_t row, size_t col) const;
    bool contains(size_t row, size_t col) const;

    /// Stored cells of one row, in no particular order.
    std::vector<std::pair<size_t, double>> row(size_t row) const;
    std::vector<SparseEntry> nonZeroEntries() const;

    /// Grow to at least n x n. Never shrinks; stored cells are kept.
    void resize(size_t n);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    size_t nonZeroCount() const { return cells_.size(); }
    double threshold() const { return threshold_; }

    SparseMatrixStats stats() const;

private:
    size_t rows_;
    size_t cols_;
    double threshold_;
    std::unordered_map<uint64_t, double> cells_;

    uint64_t key(size_t row, size_t col) const {
        return (static_cast<uint64_t>(row) << 32) | static_cast<uint64_t>(col);
    }
    void checkBounds(size_t row, size_t col) const;
};

} // namespace reasongraph
