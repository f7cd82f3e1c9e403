#include "semantic/embedding_provider.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/text_utils.hpp"

#include <cmath>
#include <cstdint>

namespace reasongraph {

double cosineSimilarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a <= 0.0 || norm_b <= 0.0) return 0.0;

    double sim = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    if (sim > 1.0) sim = 1.0;
    if (sim < -1.0) sim = -1.0;
    return sim;
}

Embedding embedWithTimeout(EmbeddingProvider& provider, const std::string& text,
                           std::chrono::milliseconds timeout) {
    std::future<Embedding> pending;
    try {
        pending = provider.embed(text);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw ProviderError(provider.name() + " provider failed: " + e.what());
    }

    if (!pending.valid()) {
        throw ProviderError(provider.name() + " provider returned no result");
    }

    // Deferred futures run on get(); only a real wait can time out.
    if (pending.wait_for(timeout) == std::future_status::timeout) {
        Logger::warn(provider.name() + " provider timed out after " +
                     std::to_string(timeout.count()) + " ms");
        throw ProviderError(provider.name() + " provider timed out", ErrorCode::ProviderTimeout);
    }

    try {
        return pending.get();
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        Logger::warn(provider.name() + " provider failed: " + e.what());
        throw ProviderError(provider.name() + " provider failed: " + e.what());
    }
}

// ─── HashingEmbeddingProvider ──────────────────────────────────

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension)
    : dimension_(dimension) {
    if (dimension_ == 0) {
        throw ConfigurationError("embedding.dimension", "must be positive");
    }
}

Embedding HashingEmbeddingProvider::embedNow(const std::string& text) const {
    Embedding v(dimension_, 0.0f);
    for (const auto& word : tokenizeWords(text)) {
        uint64_t h = 0xcbf29ce484222325ULL;
        for (unsigned char c : word) {
            h ^= c;
            h *= 0x100000001b3ULL;
        }
        size_t bucket = static_cast<size_t>(h % dimension_);
        float sign = ((h >> 63) & 1ULL) ? -1.0f : 1.0f;
        v[bucket] += sign;
    }

    double norm = 0.0;
    for (float x : v) norm += static_cast<double>(x) * x;
    if (norm > 0.0) {
        const float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& x : v) x *= inv;
    }
    return v;
}

std::future<Embedding> HashingEmbeddingProvider::embed(const std::string& text) {
    std::promise<Embedding> done;
    done.set_value(embedNow(text));
    return done.get_future();
}

} // namespace reasongraph
