#include "graph/content_hash.hpp"
#include "common/errors.hpp"
#include "common/text_utils.hpp"

#include <openssl/evp.h>

#include <memory>

namespace reasongraph {

std::string contentHash(const std::string& content, size_t length) {
    const std::string normalized = trim(content);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
    if (!ctx) {
        throw Error(ErrorCode::InternalError, "SHA-256: cannot allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), normalized.data(), normalized.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw Error(ErrorCode::InternalError, "SHA-256 digest failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; i++) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    if (length < out.size()) out.resize(length);
    return out;
}

} // namespace reasongraph
