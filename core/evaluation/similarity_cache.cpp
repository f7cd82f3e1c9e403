#include "evaluation/similarity_cache.hpp"

namespace reasongraph {

SimilarityCache::SimilarityCache(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

std::string SimilarityCache::key(const std::string& a, const std::string& b) {
    return a < b ? a + '\x1f' + b : b + '\x1f' + a;
}

std::optional<double> SimilarityCache::get(const std::string& a, const std::string& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key(a, b));
    if (it == index_.end()) {
        misses_++;
        return std::nullopt;
    }
    order_.splice(order_.begin(), order_, it->second);
    hits_++;
    return it->second->second;
}

void SimilarityCache::put(const std::string& a, const std::string& b, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string k = key(a, b);
    auto it = index_.find(k);
    if (it != index_.end()) {
        it->second->second = value;
        order_.splice(order_.begin(), order_, it->second);
        return;
    }

    order_.emplace_front(k, value);
    index_.emplace(std::move(k), order_.begin());
    if (order_.size() > capacity_) {
        index_.erase(order_.back().first);
        order_.pop_back();
    }
}

void SimilarityCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    index_.clear();
    hits_ = 0;
    misses_ = 0;
}

size_t SimilarityCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

size_t SimilarityCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t SimilarityCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

// ─── EmbeddingCache ────────────────────────────────────────────

EmbeddingCache::EmbeddingCache(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

std::optional<Embedding> EmbeddingCache::get(const std::string& thought_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(thought_id);
    if (it == index_.end()) return std::nullopt;
    order_.splice(order_.begin(), order_, it->second);
    return it->second->second;
}

void EmbeddingCache::put(const std::string& thought_id, Embedding embedding) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(thought_id);
    if (it != index_.end()) {
        it->second->second = std::move(embedding);
        order_.splice(order_.begin(), order_, it->second);
        return;
    }

    order_.emplace_front(thought_id, std::move(embedding));
    index_.emplace(thought_id, order_.begin());
    if (order_.size() > capacity_) {
        index_.erase(order_.back().first);
        order_.pop_back();
    }
}

void EmbeddingCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    index_.clear();
}

size_t EmbeddingCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

} // namespace reasongraph
