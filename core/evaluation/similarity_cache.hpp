#pragma once

#include "semantic/embedding_provider.hpp"

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace reasongraph {

// ─── SimilarityCache ───────────────────────────────────────────
// Bounded LRU of pairwise similarities keyed by unordered thought-id
// pair. Internally locked; shared by evaluations on different branches.

class SimilarityCache {
public:
    explicit SimilarityCache(size_t capacity = 1000);

    std::optional<double> get(const std::string& a, const std::string& b);
    void put(const std::string& a, const std::string& b, double value);
    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t hits() const;
    size_t misses() const;

private:
    using Entry = std::pair<std::string, double>;

    size_t capacity_;
    mutable std::mutex mutex_;
    std::list<Entry> order_;   // front = most recent
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    size_t hits_ = 0;
    size_t misses_ = 0;

    static std::string key(const std::string& a, const std::string& b);
};

// ─── EmbeddingCache ────────────────────────────────────────────
// Bounded LRU of embeddings keyed by thought id.

class EmbeddingCache {
public:
    explicit EmbeddingCache(size_t capacity = 1000);

    std::optional<Embedding> get(const std::string& thought_id);
    void put(const std::string& thought_id, Embedding embedding);
    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    using Entry = std::pair<std::string, Embedding>;

    size_t capacity_;
    mutable std::mutex mutex_;
    std::list<Entry> order_;   // front = most recent
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

} // namespace reasongraph
