#include <gtest/gtest.h>
#include "wire_format.h"
#include "transfer_protocol.h"
#include <limits>
#include <vector>

using namespace filepunch;

TEST(WireFormatTest, IntegersAreBigEndian) {
    ByteWriter writer;
    writer.write_uint8(0x01);
    writer.write_uint16(0x0203);
    writer.write_uint32(0x04050607);
    writer.write_uint64(0x08090a0b0c0d0e0fULL);

    std::vector<uint8_t> expected = {
        0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
        0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f
    };
    EXPECT_EQ(writer.data(), expected);

    ByteReader reader(writer.data());
    uint8_t a = 0;
    uint16_t b = 0;
    uint32_t c = 0;
    uint64_t d = 0;
    ASSERT_TRUE(reader.read_uint8(a));
    ASSERT_TRUE(reader.read_uint16(b));
    ASSERT_TRUE(reader.read_uint32(c));
    ASSERT_TRUE(reader.read_uint64(d));
    EXPECT_EQ(a, 0x01);
    EXPECT_EQ(b, 0x0203);
    EXPECT_EQ(c, 0x04050607u);
    EXPECT_EQ(d, 0x08090a0b0c0d0e0fULL);
    EXPECT_TRUE(reader.at_end());
}

TEST(WireFormatTest, UnderrunConsumesNothing) {
    std::vector<uint8_t> data = {0xaa, 0xbb, 0xcc};
    ByteReader reader(data);

    uint32_t value = 0;
    EXPECT_FALSE(reader.read_uint32(value));
    EXPECT_EQ(reader.offset(), 0u);

    uint16_t half = 0;
    EXPECT_TRUE(reader.read_uint16(half));
    EXPECT_EQ(half, 0xaabb);
    EXPECT_FALSE(reader.skip(2));
    EXPECT_TRUE(reader.skip(1));
    EXPECT_TRUE(reader.at_end());
}

TEST(WireFormatTest, StringsCarryLengthPrefix) {
    ByteWriter writer;
    writer.write_string("punch");
    ASSERT_EQ(writer.size(), 7u);
    EXPECT_EQ(writer.data()[0], 0x00);
    EXPECT_EQ(writer.data()[1], 0x05);

    ByteReader reader(writer.data());
    std::string text;
    ASSERT_TRUE(reader.read_string(text));
    EXPECT_EQ(text, "punch");

    // Length prefix claims more than is present
    std::vector<uint8_t> truncated = {0x00, 0x09, 'a', 'b'};
    ByteReader short_reader(truncated);
    EXPECT_FALSE(short_reader.read_string(text));
    EXPECT_EQ(short_reader.offset(), 0u);
}

TEST(WireFormatTest, AddressEncoding) {
    ByteWriter writer;
    ASSERT_TRUE(writer.write_address(SocketAddress("203.0.113.9", 40000)));
    std::vector<uint8_t> expected = {wire::FAMILY_IPV4, 203, 0, 113, 9, 0x9c, 0x40};
    EXPECT_EQ(writer.data(), expected);

    ByteWriter v6;
    ASSERT_TRUE(v6.write_address(SocketAddress("2001:db8::1", 443)));
    ASSERT_EQ(v6.size(), 1u + 16u + 2u);
    EXPECT_EQ(v6.data()[0], wire::FAMILY_IPV6);

    SocketAddress decoded;
    ByteReader reader(v6.data());
    ASSERT_TRUE(reader.read_address(decoded));
    EXPECT_EQ(decoded.ip, "2001:db8::1");
    EXPECT_EQ(decoded.port, 443);
}

TEST(WireFormatTest, UnspecifiedAddressKeepsPort) {
    ByteWriter writer;
    ASSERT_TRUE(writer.write_address(SocketAddress("", 5000)));
    std::vector<uint8_t> expected = {wire::FAMILY_UNSPECIFIED, 0x13, 0x88};
    EXPECT_EQ(writer.data(), expected);

    SocketAddress decoded("1.2.3.4", 1);
    ByteReader reader(writer.data());
    ASSERT_TRUE(reader.read_address(decoded));
    EXPECT_FALSE(decoded.is_specified());
    EXPECT_EQ(decoded.port, 5000);
}

TEST(WireFormatTest, MalformedAddressesRejected) {
    ByteWriter writer;
    EXPECT_FALSE(writer.write_address(SocketAddress("not-an-ip", 80)));

    std::vector<uint8_t> unknown_family = {9, 1, 2, 3, 4, 0, 80};
    SocketAddress address;
    ByteReader reader(unknown_family);
    EXPECT_FALSE(reader.read_address(address));
    EXPECT_EQ(reader.offset(), 0u);

    std::vector<uint8_t> truncated = {wire::FAMILY_IPV4, 10, 0, 0};
    ByteReader short_reader(truncated);
    EXPECT_FALSE(short_reader.read_address(address));
    EXPECT_EQ(short_reader.offset(), 0u);
}

//=============================================================================
// Transfer messages
//=============================================================================

TEST(TransferProtocolTest, ContentRequestIsRawDigest) {
    ContentId id = compute_content_id(std::vector<uint8_t>{'x'});
    std::vector<uint8_t> encoded = encode_content_request(id);
    ASSERT_EQ(encoded.size(), CONTENT_ID_SIZE);

    ContentId decoded;
    ASSERT_TRUE(decode_content_request(encoded, decoded));
    EXPECT_EQ(decoded, id);

    encoded.pop_back();
    EXPECT_FALSE(decode_content_request(encoded, decoded));
}

TEST(TransferProtocolTest, HashOkCarriesFileSize) {
    std::vector<uint8_t> encoded = encode_hash_ok(0x0102030405ULL);
    std::vector<uint8_t> expected = {0, 0, 0, 0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_EQ(encoded, expected);

    uint64_t size = 0;
    ASSERT_TRUE(decode_hash_ok(encoded, size));
    EXPECT_EQ(size, 0x0102030405ULL);

    encoded.push_back(0);
    EXPECT_FALSE(decode_hash_ok(encoded, size));
}

TEST(TransferProtocolTest, RangeRequestLayout) {
    std::vector<uint8_t> encoded = encode_range_request(RangeRequest(65536, 1024));
    ASSERT_EQ(encoded.size(), 16u);
    EXPECT_EQ(encoded[5], 0x01);
    EXPECT_EQ(encoded[14], 0x04);

    RangeRequest decoded;
    ASSERT_TRUE(decode_range_request(encoded, decoded));
    EXPECT_EQ(decoded.start, 65536u);
    EXPECT_EQ(decoded.length, 1024u);

    encoded.resize(15);
    RangeRequest untouched(7, 7);
    EXPECT_FALSE(decode_range_request(encoded, untouched));
    EXPECT_EQ(untouched.start, 7u);
}

TEST(TransferProtocolTest, RangeValidation) {
    const uint64_t file_size = 1000;
    EXPECT_EQ(validate_range(RangeRequest(0, 1000), file_size), RangeValidation::OK);
    EXPECT_EQ(validate_range(RangeRequest(999, 1), file_size), RangeValidation::OK);
    EXPECT_EQ(validate_range(RangeRequest(0, 0), file_size), RangeValidation::REJECT);
    EXPECT_EQ(validate_range(RangeRequest(999, 2), file_size), RangeValidation::INVALID_RANGE);
    EXPECT_EQ(validate_range(RangeRequest(1000, 1), file_size), RangeValidation::INVALID_RANGE);

    const uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(validate_range(RangeRequest(max, 1), file_size), RangeValidation::RANGE_OVERFLOW);
    EXPECT_EQ(validate_range(RangeRequest(max - 10, 11), max), RangeValidation::RANGE_OVERFLOW);
}

TEST(TransferProtocolTest, RangeLengthIsCapped) {
    const uint64_t file_size = 10 * MAX_RANGE_LENGTH;
    EXPECT_EQ(validate_range(RangeRequest(0, MAX_RANGE_LENGTH), file_size), RangeValidation::OK);
    EXPECT_EQ(validate_range(RangeRequest(file_size - MAX_RANGE_LENGTH, MAX_RANGE_LENGTH), file_size),
              RangeValidation::OK);

    // A whole-file request would make the publisher queue the entire file
    EXPECT_EQ(validate_range(RangeRequest(0, file_size), file_size), RangeValidation::INVALID_RANGE);
    EXPECT_EQ(validate_range(RangeRequest(0, MAX_RANGE_LENGTH + 1), file_size), RangeValidation::INVALID_RANGE);
}
