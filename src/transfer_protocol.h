#pragma once

#include "content_id.h"
#include <cstdint>
#include <vector>

namespace filepunch {

/**
 * Peer session opening and range messages exchanged over an established
 * secure session. The chunk loop itself belongs to the application; these
 * helpers fix the message layouts and the range rules.
 *
 *   subscriber -> publisher   ContentId (32 bytes)
 *   publisher  -> subscriber  HashOk{file_size u64}, or the session is closed
 *   subscriber -> publisher   RangeRequest{start u64, length u64}
 *   publisher  -> subscriber  chunks of at most MAX_MESSAGE_SIZE bytes
 */

// Largest range a publisher serves per request; bounds what one request queues
constexpr uint64_t MAX_RANGE_LENGTH = 64 * 1024;

std::vector<uint8_t> encode_content_request(const ContentId& content_id);
bool decode_content_request(const std::vector<uint8_t>& data, ContentId& content_id);

std::vector<uint8_t> encode_hash_ok(uint64_t file_size);
bool decode_hash_ok(const std::vector<uint8_t>& data, uint64_t& file_size);

struct RangeRequest {
    uint64_t start;
    uint64_t length;  // 0 means reject / done

    RangeRequest() : start(0), length(0) {}
    RangeRequest(uint64_t start, uint64_t length) : start(start), length(length) {}
};

std::vector<uint8_t> encode_range_request(const RangeRequest& request);
bool decode_range_request(const std::vector<uint8_t>& data, RangeRequest& request);

enum class RangeValidation {
    OK,
    REJECT,          // length 0
    INVALID_RANGE,   // extends past the end of the file, or longer than MAX_RANGE_LENGTH
    RANGE_OVERFLOW   // start + length does not fit in 64 bits
};

const char* range_validation_to_string(RangeValidation validation);
RangeValidation validate_range(const RangeRequest& request, uint64_t file_size);

/**
 * Running SHA-256 over received bytes, compared against the ContentId once
 * the transfer completes
 */
class ContentVerifier {
public:
    explicit ContentVerifier(const ContentId& expected);

    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    /**
     * Finish hashing and compare. The verifier cannot be reused afterwards.
     */
    bool verify();

    uint64_t bytes_received() const { return bytes_received_; }
    const ContentId& actual() const { return actual_; }

private:
    ContentId expected_;
    ContentId actual_;
    Sha256 hasher_;
    uint64_t bytes_received_;
    bool finished_;
};

} // namespace filepunch
