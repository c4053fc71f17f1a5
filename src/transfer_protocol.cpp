#include "transfer_protocol.h"
#include "wire_format.h"
#include <limits>

namespace filepunch {

std::vector<uint8_t> encode_content_request(const ContentId& content_id) {
    return std::vector<uint8_t>(content_id.bytes.begin(), content_id.bytes.end());
}

bool decode_content_request(const std::vector<uint8_t>& data, ContentId& content_id) {
    return ContentId::from_bytes(data.data(), data.size(), content_id);
}

std::vector<uint8_t> encode_hash_ok(uint64_t file_size) {
    ByteWriter writer(8);
    writer.write_uint64(file_size);
    return writer.release();
}

bool decode_hash_ok(const std::vector<uint8_t>& data, uint64_t& file_size) {
    ByteReader reader(data);
    return reader.read_uint64(file_size) && reader.at_end();
}

std::vector<uint8_t> encode_range_request(const RangeRequest& request) {
    ByteWriter writer(16);
    writer.write_uint64(request.start);
    writer.write_uint64(request.length);
    return writer.release();
}

bool decode_range_request(const std::vector<uint8_t>& data, RangeRequest& request) {
    ByteReader reader(data);
    RangeRequest decoded;
    if (!reader.read_uint64(decoded.start) || !reader.read_uint64(decoded.length) || !reader.at_end()) {
        return false;
    }
    request = decoded;
    return true;
}

const char* range_validation_to_string(RangeValidation validation) {
    switch (validation) {
        case RangeValidation::OK: return "ok";
        case RangeValidation::REJECT: return "reject";
        case RangeValidation::INVALID_RANGE: return "invalid range";
        case RangeValidation::RANGE_OVERFLOW: return "range overflow";
    }
    return "unknown";
}

RangeValidation validate_range(const RangeRequest& request, uint64_t file_size) {
    if (request.length == 0) {
        return RangeValidation::REJECT;
    }
    if (request.start > std::numeric_limits<uint64_t>::max() - request.length) {
        return RangeValidation::RANGE_OVERFLOW;
    }
    if (request.start + request.length > file_size || request.length > MAX_RANGE_LENGTH) {
        return RangeValidation::INVALID_RANGE;
    }
    return RangeValidation::OK;
}

ContentVerifier::ContentVerifier(const ContentId& expected)
    : expected_(expected), bytes_received_(0), finished_(false) {
}

void ContentVerifier::update(const uint8_t* data, size_t size) {
    if (finished_) {
        return;
    }
    hasher_.update(data, size);
    bytes_received_ += size;
}

bool ContentVerifier::verify() {
    if (!finished_) {
        actual_ = hasher_.finish();
        finished_ = true;
    }
    return actual_ == expected_;
}

} // namespace filepunch
