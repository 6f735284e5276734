#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace ferry {

// SHA-256, 32 bytes.
const size_t DIGEST_SIZE = 32;

using Digest = std::vector<uint8_t>;

namespace checksum {

// Digest of a byte buffer. Safe to call concurrently.
Digest digest(const uint8_t* data, size_t len);
Digest digest(const std::vector<uint8_t>& payload);
Digest digest(const std::string& payload);

// Recomputes the digest and compares it in constant time. Never throws on
// mismatch or a wrongly sized `expected`; returns false instead.
bool verify(const uint8_t* data, size_t len, const Digest& expected);
bool verify(const std::vector<uint8_t>& payload, const Digest& expected);

// Constant-time comparison of two digests.
bool equal(const Digest& a, const Digest& b);

} // namespace checksum

// Incremental digest over a stream of buffers (whole-file hash).
class StreamHasher {
public:
    StreamHasher();
    ~StreamHasher();

    StreamHasher(const StreamHasher&) = delete;
    StreamHasher& operator=(const StreamHasher&) = delete;

    void update(const uint8_t* data, size_t len);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    // Produces the digest; the hasher cannot be updated afterwards.
    Digest finish();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool finished_ = false;
};

// Whole-file digest, read in CHUNK-sized blocks. Throws IoError.
Digest digest_file(const std::string& path);

} // namespace ferry
