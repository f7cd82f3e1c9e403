#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <string>
#include <vector>

namespace reasongraph {

using Embedding = std::vector<float>;

/// Cosine similarity in [-1, 1]. 0 for empty, mismatched or zero vectors.
double cosineSimilarity(const Embedding& a, const Embedding& b);

// ─── EmbeddingProvider ─────────────────────────────────────────
// The only suspension point in the engine. Implementations may be slow
// or remote; callers wait through embedWithTimeout().

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::future<Embedding> embed(const std::string& text) = 0;

    virtual double similarity(const Embedding& a, const Embedding& b) const {
        return cosineSimilarity(a, b);
    }

    virtual std::string name() const = 0;
};

/// Wait for provider.embed(text) for at most timeout. Throws
/// ProviderError (code ProviderTimeout) when the wait expires and
/// ProviderError (code SemanticAnalysisError) when the provider fails.
Embedding embedWithTimeout(EmbeddingProvider& provider, const std::string& text,
                           std::chrono::milliseconds timeout);

// ─── HashingEmbeddingProvider ──────────────────────────────────
// Deterministic bag-of-words embedding: each lower-cased word is hashed
// to a signed bucket, then the vector is L2-normalised. Needs no model
// and answers immediately.

class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension = 256);

    std::future<Embedding> embed(const std::string& text) override;
    std::string name() const override { return "hashing"; }

    Embedding embedNow(const std::string& text) const;
    size_t dimension() const { return dimension_; }

private:
    size_t dimension_;
};

} // namespace reasongraph
