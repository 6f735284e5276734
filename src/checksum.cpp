#include "checksum.hpp"
#include "errors.hpp"
#include <fstream>
#include <new>
#include <openssl/crypto.h>
#include <openssl/evp.h>

// Helper for managing EVP_MD_CTX context
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

namespace ferry {

namespace {

const size_t FILE_READ_BLOCK = 1024 * 1024;

EVP_MD_CTX* new_sha256_ctx() {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        throw std::bad_alloc();
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::bad_alloc();
    }
    return ctx;
}

} // namespace

namespace checksum {

Digest digest(const uint8_t* data, size_t len) {
    EVP_MD_CTX_ptr mdctx(new_sha256_ctx(), &EVP_MD_CTX_free);

    EVP_DigestUpdate(mdctx.get(), data, len);

    Digest hash(EVP_MAX_MD_SIZE);
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(mdctx.get(), hash.data(), &hash_len);
    hash.resize(hash_len);
    return hash;
}

Digest digest(const std::vector<uint8_t>& payload) {
    return digest(payload.data(), payload.size());
}

Digest digest(const std::string& payload) {
    return digest(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

bool equal(const Digest& a, const Digest& b) {
    if (a.size() != b.size() || a.empty()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool verify(const uint8_t* data, size_t len, const Digest& expected) {
    if (expected.size() != DIGEST_SIZE) {
        return false;
    }
    return equal(digest(data, len), expected);
}

bool verify(const std::vector<uint8_t>& payload, const Digest& expected) {
    return verify(payload.data(), payload.size(), expected);
}

} // namespace checksum

// --- StreamHasher ---

void StreamHasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

StreamHasher::StreamHasher() : ctx_(new_sha256_ctx()) {}

StreamHasher::~StreamHasher() = default;

void StreamHasher::update(const uint8_t* data, size_t len) {
    if (finished_) {
        throw std::logic_error("StreamHasher::update after finish");
    }
    EVP_DigestUpdate(ctx_.get(), data, len);
}

Digest StreamHasher::finish() {
    if (finished_) {
        throw std::logic_error("StreamHasher::finish called twice");
    }
    finished_ = true;
    Digest hash(EVP_MAX_MD_SIZE);
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(ctx_.get(), hash.data(), &hash_len);
    hash.resize(hash_len);
    return hash;
}

Digest digest_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError(path, "cannot open file for hashing");
    }
    StreamHasher hasher;
    std::vector<char> buffer(FILE_READ_BLOCK);
    while (file) {
        file.read(buffer.data(), buffer.size());
        std::streamsize count = file.gcount();
        if (count > 0) {
            hasher.update(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<size_t>(count));
        }
    }
    if (file.bad()) {
        throw IoError(path, "read failed while hashing");
    }
    return hasher.finish();
}

} // namespace ferry
