#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace reasongraph {

struct BloomFilterStats {
    size_t size_bits = 0;
    size_t hash_functions = 0;
    size_t elements = 0;
    double false_positive_rate = 0.0;
    size_t size_bytes = 0;
};

// ─── BloomFilter ───────────────────────────────────────────────
// Probabilistic set membership. No false negatives; the false positive
// rate grows with every insertion and is reported by
// falsePositiveRate().
//
// Sizing follows the usual optimum for n expected elements at rate p:
//   m = ceil(-n ln p / (ln 2)^2),  k = ceil((m / n) ln 2)

class BloomFilter {
public:
    /// Throws ConfigurationError if expected_elements == 0 or the rate is
    /// outside (0, 1).
    BloomFilter(size_t expected_elements, double false_positive_rate);

    void add(const std::string& item);
    bool contains(const std::string& item) const;

    /// Estimated current rate: (1 - e^{-k·count/m})^k.
    double falsePositiveRate() const;

    void clear();

    size_t sizeBits() const { return size_; }
    size_t hashFunctions() const { return hash_functions_; }
    size_t elementCount() const { return elements_; }

    BloomFilterStats stats() const;

private:
    size_t size_ = 0;
    size_t hash_functions_ = 0;
    size_t elements_ = 0;
    std::vector<uint8_t> bits_;

    size_t position(const std::string& item, uint32_t seed) const;
    void setBit(size_t index);
    bool testBit(size_t index) const;
};

} // namespace reasongraph
