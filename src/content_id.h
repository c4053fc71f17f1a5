#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace filepunch {

constexpr size_t CONTENT_ID_SIZE = 32;

/**
 * SHA-256 digest of a file's full content. The only key the rendezvous
 * server matches on.
 */
struct ContentId {
    std::array<uint8_t, CONTENT_ID_SIZE> bytes{};

    std::string to_hex() const;

    /**
     * Parse 64 hex characters (either case)
     * @param hex Hex text
     * @param out Parsed id, untouched on failure
     * @return true on success
     */
    static bool from_hex(const std::string& hex, ContentId& out);

    /**
     * Build from raw digest bytes
     * @return false unless exactly CONTENT_ID_SIZE bytes are given
     */
    static bool from_bytes(const uint8_t* data, size_t size, ContentId& out);

    bool operator==(const ContentId& other) const { return bytes == other.bytes; }
    bool operator!=(const ContentId& other) const { return bytes != other.bytes; }
    bool operator<(const ContentId& other) const { return bytes < other.bytes; }
};

struct ContentIdHash {
    size_t operator()(const ContentId& id) const {
        // The digest is already uniformly distributed
        size_t value = 0;
        for (size_t i = 0; i < sizeof(size_t); ++i) {
            value = (value << 8) | id.bytes[i];
        }
        return value;
    }
};

/**
 * Incremental SHA-256 over OpenSSL EVP
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    /**
     * Finish the digest. The hasher is reset afterwards.
     */
    ContentId finish();

private:
    EVP_MD_CTX* ctx_;

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
};

ContentId compute_content_id(const std::vector<uint8_t>& data);

/**
 * Hash a file from disk in fixed-size chunks
 * @param path File path
 * @param id Output digest
 * @param file_size Output size in bytes
 * @return false if the file cannot be read
 */
bool compute_content_id(const std::string& path, ContentId& id, uint64_t& file_size);

} // namespace filepunch
