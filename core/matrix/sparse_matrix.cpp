#include "matrix/sparse_matrix.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace reasongraph {

SparseMatrix::SparseMatrix(size_t rows, size_t cols, double threshold)
    : rows_(rows), cols_(cols), threshold_(threshold) {}

void SparseMatrix::checkBounds(size_t row, size_t col) const {
    if (row >= rows_ || col >= cols_) {
        throw std::out_of_range("Index (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") out of bounds for " +
                                std::to_string(rows_) + "x" + std::to_string(cols_) +
                                " matrix");
    }
}

void SparseMatrix::set(size_t row, size_t col, double value) {
    checkBounds(row, col);
    if (std::fabs(value) >= threshold_) {
        cells_[key(row, col)] = value;
    } else {
        cells_.erase(key(row, col));
    }
}

double SparseMatrix::get(size_t row, size_t col) const {
    auto it = cells_.find(key(row, col));
    return it != cells_.end() ? it->second : 0.0;
}

bool SparseMatrix::contains(size_t row, size_t col) const {
    return cells_.count(key(row, col)) > 0;
}

std::vector<std::pair<size_t, double>> SparseMatrix::row(size_t row) const {
    std::vector<std::pair<size_t, double>> out;
    for (const auto& [k, v] : cells_) {
        if (static_cast<size_t>(k >> 32) == row) {
            out.emplace_back(static_cast<size_t>(k & 0xffffffffULL), v);
        }
    }
    return out;
}

std::vector<SparseEntry> SparseMatrix::nonZeroEntries() const {
    std::vector<SparseEntry> out;
    out.reserve(cells_.size());
    for (const auto& [k, v] : cells_) {
        out.push_back({static_cast<size_t>(k >> 32),
                       static_cast<size_t>(k & 0xffffffffULL), v});
    }
    return out;
}

void SparseMatrix::resize(size_t n) {
    if (n > rows_) rows_ = n;
    if (n > cols_) cols_ = n;
}

SparseMatrixStats SparseMatrix::stats() const {
    SparseMatrixStats s;
    s.rows = rows_;
    s.cols = cols_;
    s.nonzero = cells_.size();
    const double total = static_cast<double>(rows_) * static_cast<double>(cols_);
    s.sparsity = total > 0.0 ? 1.0 - static_cast<double>(cells_.size()) / total : 1.0;
    s.threshold = threshold_;
    // key + value + bucket/node overhead
    s.approx_bytes = cells_.size() * (sizeof(uint64_t) + sizeof(double) + 2 * sizeof(void*));
    return s;
}

} // namespace reasongraph
