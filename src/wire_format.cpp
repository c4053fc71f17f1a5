#include "wire_format.h"
#include <cstring>

namespace filepunch {

void ByteWriter::write_uint8(uint8_t value) {
    buffer_.push_back(value);
}

void ByteWriter::write_uint16(uint16_t value) {
    buffer_.push_back(static_cast<uint8_t>(value >> 8));
    buffer_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::write_uint32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void ByteWriter::write_uint64(uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void ByteWriter::write_bytes(const uint8_t* data, size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);
}

void ByteWriter::write_bytes(const std::vector<uint8_t>& data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void ByteWriter::write_zeros(size_t count) {
    buffer_.insert(buffer_.end(), count, 0);
}

void ByteWriter::write_string(const std::string& value) {
    size_t length = value.size() > 0xFFFF ? 0xFFFF : value.size();
    write_uint16(static_cast<uint16_t>(length));
    buffer_.insert(buffer_.end(), value.begin(), value.begin() + length);
}

bool ByteWriter::write_address(const SocketAddress& address) {
    if (!address.is_specified()) {
        write_uint8(wire::FAMILY_UNSPECIFIED);
        write_uint16(address.port);
        return true;
    }

    if (address.is_ipv6()) {
        uint8_t raw[16];
        if (inet_pton(AF_INET6, address.ip.c_str(), raw) != 1) {
            return false;
        }
        write_uint8(wire::FAMILY_IPV6);
        write_bytes(raw, sizeof(raw));
    } else {
        uint8_t raw[4];
        if (inet_pton(AF_INET, address.ip.c_str(), raw) != 1) {
            return false;
        }
        write_uint8(wire::FAMILY_IPV4);
        write_bytes(raw, sizeof(raw));
    }
    write_uint16(address.port);
    return true;
}

bool ByteReader::read_uint8(uint8_t& value) {
    if (remaining() < 1) return false;
    value = data_[offset_++];
    return true;
}

bool ByteReader::read_uint16(uint16_t& value) {
    if (remaining() < 2) return false;
    value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return true;
}

bool ByteReader::read_uint32(uint32_t& value) {
    if (remaining() < 4) return false;
    value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | data_[offset_ + i];
    }
    offset_ += 4;
    return true;
}

bool ByteReader::read_uint64(uint64_t& value) {
    if (remaining() < 8) return false;
    value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data_[offset_ + i];
    }
    offset_ += 8;
    return true;
}

bool ByteReader::read_bytes(uint8_t* out, size_t count) {
    if (remaining() < count) return false;
    memcpy(out, data_ + offset_, count);
    offset_ += count;
    return true;
}

bool ByteReader::read_bytes(std::vector<uint8_t>& out, size_t count) {
    if (remaining() < count) return false;
    out.assign(data_ + offset_, data_ + offset_ + count);
    offset_ += count;
    return true;
}

bool ByteReader::read_string(std::string& value) {
    size_t start = offset_;
    uint16_t length = 0;
    if (!read_uint16(length) || remaining() < length) {
        offset_ = start;
        return false;
    }
    value.assign(reinterpret_cast<const char*>(data_ + offset_), length);
    offset_ += length;
    return true;
}

bool ByteReader::read_address(SocketAddress& address) {
    size_t start = offset_;
    uint8_t family = 0;
    if (!read_uint8(family)) {
        return false;
    }

    char text[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;

    switch (family) {
        case wire::FAMILY_UNSPECIFIED:
            if (!read_uint16(port)) break;
            address = SocketAddress("", port);
            return true;

        case wire::FAMILY_IPV4: {
            uint8_t raw[4];
            if (!read_bytes(raw, sizeof(raw)) || !read_uint16(port)) break;
            inet_ntop(AF_INET, raw, text, sizeof(text));
            address = SocketAddress(text, port);
            return true;
        }

        case wire::FAMILY_IPV6: {
            uint8_t raw[16];
            if (!read_bytes(raw, sizeof(raw)) || !read_uint16(port)) break;
            inet_ntop(AF_INET6, raw, text, sizeof(text));
            address = SocketAddress(text, port);
            return true;
        }

        default:
            break;
    }

    offset_ = start;
    return false;
}

bool ByteReader::skip(size_t count) {
    if (remaining() < count) return false;
    offset_ += count;
    return true;
}

} // namespace filepunch
