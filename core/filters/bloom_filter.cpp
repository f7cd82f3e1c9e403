#include "filters/bloom_filter.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>

namespace reasongraph {

namespace {

constexpr uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime  = 0x100000001b3ULL;

uint64_t mix64(uint64_t x) {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

// FNV-1a over the item with the seed folded into the offset basis,
// finished with a splitmix64 avalanche so nearby seeds decorrelate.
uint64_t seededHash(const std::string& item, uint32_t seed) {
    uint64_t h = kFnvOffset ^ mix64(static_cast<uint64_t>(seed) + 0x9e3779b97f4a7c15ULL);
    for (unsigned char c : item) {
        h ^= c;
        h *= kFnvPrime;
    }
    return mix64(h);
}

} // namespace

BloomFilter::BloomFilter(size_t expected_elements, double false_positive_rate) {
    if (expected_elements == 0) {
        throw ConfigurationError("bloom filter", "expected_elements must be positive");
    }
    if (!(false_positive_rate > 0.0 && false_positive_rate < 1.0)) {
        throw ConfigurationError("bloom filter", "false_positive_rate must be within (0, 1)");
    }

    const double n = static_cast<double>(expected_elements);
    const double ln2 = std::log(2.0);
    size_ = static_cast<size_t>(std::ceil(-n * std::log(false_positive_rate) / (ln2 * ln2)));
    size_ = std::max<size_t>(size_, 1);
    hash_functions_ = static_cast<size_t>(std::ceil((static_cast<double>(size_) / n) * ln2));
    hash_functions_ = std::max<size_t>(hash_functions_, 1);

    bits_.assign((size_ + 7) / 8, 0);
}

void BloomFilter::add(const std::string& item) {
    for (size_t i = 0; i < hash_functions_; i++) {
        setBit(position(item, static_cast<uint32_t>(i)));
    }
    elements_++;
}

bool BloomFilter::contains(const std::string& item) const {
    for (size_t i = 0; i < hash_functions_; i++) {
        if (!testBit(position(item, static_cast<uint32_t>(i)))) {
            return false;  // definitely absent
        }
    }
    return true;
}

double BloomFilter::falsePositiveRate() const {
    const double k = static_cast<double>(hash_functions_);
    const double ratio = static_cast<double>(elements_) / static_cast<double>(size_);
    return std::pow(1.0 - std::exp(-k * ratio), k);
}

void BloomFilter::clear() {
    std::fill(bits_.begin(), bits_.end(), 0);
    elements_ = 0;
}

BloomFilterStats BloomFilter::stats() const {
    return {size_, hash_functions_, elements_, falsePositiveRate(), bits_.size()};
}

size_t BloomFilter::position(const std::string& item, uint32_t seed) const {
    return static_cast<size_t>(seededHash(item, seed) % size_);
}

void BloomFilter::setBit(size_t index) {
    bits_[index / 8] |= static_cast<uint8_t>(1u << (index % 8));
}

bool BloomFilter::testBit(size_t index) const {
    return (bits_[index / 8] & (1u << (index % 8))) != 0;
}

} // namespace reasongraph
