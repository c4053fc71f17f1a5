#pragma once

#include "socket.h"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace filepunch {

// Address family tags used on the wire
namespace wire {
    constexpr uint8_t FAMILY_UNSPECIFIED = 0;
    constexpr uint8_t FAMILY_IPV4 = 4;
    constexpr uint8_t FAMILY_IPV6 = 6;
}

/**
 * Appends big-endian fields to a byte buffer
 */
class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve) { buffer_.reserve(reserve); }

    void write_uint8(uint8_t value);
    void write_uint16(uint16_t value);
    void write_uint32(uint32_t value);
    void write_uint64(uint64_t value);
    void write_bytes(const uint8_t* data, size_t size);
    void write_bytes(const std::vector<uint8_t>& data);
    void write_zeros(size_t count);

    /**
     * Write a u16 length followed by the string bytes (truncated to 65535)
     */
    void write_string(const std::string& value);

    /**
     * Write {family u8, address 0|4|16 bytes, port u16}
     * @return false if the address is not numeric
     */
    bool write_address(const SocketAddress& address);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> release() { return std::move(buffer_); }
    size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * Reads big-endian fields from a byte range. Every read checks the remaining
 * length and returns false on underrun without consuming anything.
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size), offset_(0) {}
    explicit ByteReader(const std::vector<uint8_t>& data) : ByteReader(data.data(), data.size()) {}

    bool read_uint8(uint8_t& value);
    bool read_uint16(uint16_t& value);
    bool read_uint32(uint32_t& value);
    bool read_uint64(uint64_t& value);
    bool read_bytes(uint8_t* out, size_t count);
    bool read_bytes(std::vector<uint8_t>& out, size_t count);
    bool read_string(std::string& value);
    bool read_address(SocketAddress& address);
    bool skip(size_t count);

    size_t remaining() const { return size_ - offset_; }
    size_t offset() const { return offset_; }
    bool at_end() const { return offset_ == size_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

} // namespace filepunch
