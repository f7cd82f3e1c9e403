#include "matrix/similarity_matrix.hpp"

#include <algorithm>

namespace reasongraph {

SimilarityMatrix::SimilarityMatrix(double threshold, size_t initial_size)
    : matrix_(initial_size, initial_size, threshold) {}

uint64_t SimilarityMatrix::pairKey(size_t a, size_t b) {
    if (a > b) std::swap(a, b);
    return (static_cast<uint64_t>(a) << 32) | static_cast<uint64_t>(b);
}

size_t SimilarityMatrix::registerThought(const std::string& thought_id) {
    auto it = index_.find(thought_id);
    if (it != index_.end()) return it->second;

    size_t idx = ids_.size();
    if (idx >= matrix_.rows()) {
        matrix_.resize(std::max(matrix_.rows() * 2, idx + 1));
    }
    index_.emplace(thought_id, idx);
    ids_.push_back(thought_id);
    return idx;
}

bool SimilarityMatrix::isRegistered(const std::string& thought_id) const {
    return index_.count(thought_id) > 0;
}

std::optional<size_t> SimilarityMatrix::indexOf(const std::string& thought_id) const {
    auto it = index_.find(thought_id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

void SimilarityMatrix::set(const std::string& a, const std::string& b, double value) {
    size_t ia = registerThought(a);
    size_t ib = registerThought(b);
    matrix_.set(ia, ib, value);
    matrix_.set(ib, ia, value);
    computed_.insert(pairKey(ia, ib));
}

double SimilarityMatrix::get(const std::string& a, const std::string& b) const {
    auto ia = indexOf(a);
    auto ib = indexOf(b);
    if (!ia || !ib) return 0.0;
    return matrix_.get(*ia, *ib);
}

std::optional<double> SimilarityMatrix::lookup(const std::string& a, const std::string& b) const {
    auto ia = indexOf(a);
    auto ib = indexOf(b);
    if (!ia || !ib) return std::nullopt;
    if (!computed_.count(pairKey(*ia, *ib))) return std::nullopt;
    return matrix_.get(*ia, *ib);
}

std::vector<std::pair<std::string, double>>
SimilarityMatrix::mostSimilar(const std::string& thought_id, size_t k) const {
    std::vector<std::pair<std::string, double>> out;
    auto idx = indexOf(thought_id);
    if (!idx || k == 0) return out;

    for (const auto& [col, value] : matrix_.row(*idx)) {
        if (col == *idx) continue;
        out.emplace_back(ids_[col], value);
    }
    std::sort(out.begin(), out.end(), [](const auto& x, const auto& y) {
        if (x.second != y.second) return x.second > y.second;
        return x.first < y.first;
    });
    if (out.size() > k) out.resize(k);
    return out;
}

std::vector<std::vector<std::string>> SimilarityMatrix::clusters(double min_similarity) const {
    // Adjacency from stored cells only; absent cells are below threshold.
    std::vector<std::vector<size_t>> adjacency(ids_.size());
    for (const auto& e : matrix_.nonZeroEntries()) {
        if (e.row == e.col || e.value < min_similarity) continue;
        if (e.row < ids_.size() && e.col < ids_.size()) {
            adjacency[e.row].push_back(e.col);
        }
    }

    std::vector<std::vector<std::string>> result;
    std::vector<bool> visited(ids_.size(), false);
    for (size_t start = 0; start < ids_.size(); start++) {
        if (visited[start]) continue;

        std::vector<size_t> component;
        std::vector<size_t> stack = {start};
        visited[start] = true;
        while (!stack.empty()) {
            size_t current = stack.back();
            stack.pop_back();
            component.push_back(current);
            for (size_t next : adjacency[current]) {
                if (!visited[next]) {
                    visited[next] = true;
                    stack.push_back(next);
                }
            }
        }

        if (component.size() > 1) {
            std::sort(component.begin(), component.end());
            std::vector<std::string> members;
            members.reserve(component.size());
            for (size_t i : component) members.push_back(ids_[i]);
            result.push_back(std::move(members));
        }
    }
    return result;
}

SimilarityMatrixStats SimilarityMatrix::stats() const {
    SimilarityMatrixStats s;
    s.matrix = matrix_.stats();
    s.thoughts = ids_.size();
    s.avg_connections = ids_.empty()
        ? 0.0
        : static_cast<double>(matrix_.nonZeroCount()) / static_cast<double>(ids_.size());
    return s;
}

} // namespace reasongraph
