#include "content_id.h"
#include "fs.h"
#include "logger.h"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

namespace filepunch {

namespace {

constexpr size_t HASH_CHUNK_SIZE = 16 * 1024;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string ContentId::to_hex() const {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(CONTENT_ID_SIZE * 2);
    for (uint8_t byte : bytes) {
        hex.push_back(digits[byte >> 4]);
        hex.push_back(digits[byte & 0x0F]);
    }
    return hex;
}

bool ContentId::from_hex(const std::string& hex, ContentId& out) {
    if (hex.size() != CONTENT_ID_SIZE * 2) {
        return false;
    }

    ContentId parsed;
    for (size_t i = 0; i < CONTENT_ID_SIZE; ++i) {
        int high = hex_value(hex[2 * i]);
        int low = hex_value(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        parsed.bytes[i] = static_cast<uint8_t>((high << 4) | low);
    }

    out = parsed;
    return true;
}

bool ContentId::from_bytes(const uint8_t* data, size_t size, ContentId& out) {
    if (data == nullptr || size != CONTENT_ID_SIZE) {
        return false;
    }
    std::copy(data, data + size, out.bytes.begin());
    return true;
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("SHA-256 context initialization failed");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const uint8_t* data, size_t size) {
    if (size > 0) {
        EVP_DigestUpdate(ctx_, data, size);
    }
}

ContentId Sha256::finish() {
    ContentId id;
    unsigned int length = 0;
    EVP_DigestFinal_ex(ctx_, id.bytes.data(), &length);
    EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr);
    return id;
}

ContentId compute_content_id(const std::vector<uint8_t>& data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finish();
}

bool compute_content_id(const std::string& path, ContentId& id, uint64_t& file_size) {
    Sha256 hasher;
    uint64_t total = 0;

    bool ok = read_file_in_chunks(path, HASH_CHUNK_SIZE, [&](const uint8_t* data, size_t size) {
        hasher.update(data, size);
        total += size;
        return true;
    });

    if (!ok) {
        LOG_ERROR("content", "Failed to hash " << path);
        return false;
    }

    id = hasher.finish();
    file_size = total;
    LOG_DEBUG("content", "Hashed " << path << " (" << total << " bytes): " << id.to_hex());
    return true;
}

} // namespace filepunch
