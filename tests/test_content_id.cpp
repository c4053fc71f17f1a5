#include <gtest/gtest.h>
#include "content_id.h"
#include "fs.h"
#include "transfer_protocol.h"
#include <cctype>
#include <string>
#include <unordered_set>
#include <vector>

using namespace filepunch;

namespace {

const char* const ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const char* const EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // anonymous namespace

class ContentIdTest : public ::testing::Test {
protected:
    void TearDown() override {
        delete_file("content_id_test.bin");
    }
};

TEST_F(ContentIdTest, KnownDigests) {
    EXPECT_EQ(compute_content_id(to_bytes("abc")).to_hex(), ABC_SHA256);
    EXPECT_EQ(compute_content_id(std::vector<uint8_t>()).to_hex(), EMPTY_SHA256);
}

TEST_F(ContentIdTest, HexParsing) {
    ContentId id;
    ASSERT_TRUE(ContentId::from_hex(ABC_SHA256, id));
    EXPECT_EQ(id.to_hex(), ABC_SHA256);
    EXPECT_EQ(id.bytes[0], 0xba);
    EXPECT_EQ(id.bytes[31], 0xad);

    // Upper case accepted, printed back lower case
    std::string upper = ABC_SHA256;
    for (auto& c : upper) {
        c = static_cast<char>(toupper(c));
    }
    ContentId from_upper;
    ASSERT_TRUE(ContentId::from_hex(upper, from_upper));
    EXPECT_EQ(from_upper, id);
}

TEST_F(ContentIdTest, InvalidHexLeavesOutputUntouched) {
    ContentId id;
    ASSERT_TRUE(ContentId::from_hex(ABC_SHA256, id));
    ContentId before = id;

    EXPECT_FALSE(ContentId::from_hex("", id));
    EXPECT_FALSE(ContentId::from_hex(std::string(ABC_SHA256).substr(2), id));
    EXPECT_FALSE(ContentId::from_hex(std::string(ABC_SHA256) + "00", id));
    std::string bad = ABC_SHA256;
    bad[40] = 'g';
    EXPECT_FALSE(ContentId::from_hex(bad, id));
    EXPECT_EQ(id, before);
}

TEST_F(ContentIdTest, FromBytesRequiresFullDigest) {
    std::vector<uint8_t> raw(CONTENT_ID_SIZE, 0x11);
    ContentId id;
    EXPECT_TRUE(ContentId::from_bytes(raw.data(), raw.size(), id));
    EXPECT_EQ(id.bytes[5], 0x11);
    EXPECT_FALSE(ContentId::from_bytes(raw.data(), raw.size() - 1, id));
    EXPECT_FALSE(ContentId::from_bytes(nullptr, CONTENT_ID_SIZE, id));
}

TEST_F(ContentIdTest, IncrementalHashMatchesOneShot) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 100000; ++i) {
        data.push_back(static_cast<uint8_t>(i * 7));
    }

    Sha256 hasher;
    hasher.update(data.data(), 1);
    hasher.update(data.data() + 1, 4095);
    hasher.update(data.data() + 4096, data.size() - 4096);
    EXPECT_EQ(hasher.finish(), compute_content_id(data));

    // The hasher starts over after finish()
    hasher.update(to_bytes("abc"));
    EXPECT_EQ(hasher.finish().to_hex(), ABC_SHA256);
}

TEST_F(ContentIdTest, FileDigestMatchesMemoryDigest) {
    std::string content(50000, 'x');
    content += "tail";
    ASSERT_TRUE(create_file("content_id_test.bin", content));

    ContentId id;
    uint64_t size = 0;
    ASSERT_TRUE(compute_content_id("content_id_test.bin", id, size));
    EXPECT_EQ(size, content.size());
    EXPECT_EQ(id, compute_content_id(to_bytes(content)));

    EXPECT_FALSE(compute_content_id("content_id_missing.bin", id, size));
}

TEST_F(ContentIdTest, UsableAsHashKey) {
    std::unordered_set<ContentId, ContentIdHash> ids;
    ids.insert(compute_content_id(to_bytes("a")));
    ids.insert(compute_content_id(to_bytes("b")));
    ids.insert(compute_content_id(to_bytes("a")));
    EXPECT_EQ(ids.size(), 2u);
}

TEST_F(ContentIdTest, VerifierDetectsMismatch) {
    ContentId expected = compute_content_id(to_bytes("hello world"));

    ContentVerifier good(expected);
    good.update(to_bytes("hello "));
    good.update(to_bytes("world"));
    EXPECT_EQ(good.bytes_received(), 11u);
    EXPECT_TRUE(good.verify());

    ContentVerifier bad(expected);
    bad.update(to_bytes("hello w0rld"));
    EXPECT_FALSE(bad.verify());
    EXPECT_EQ(bad.actual(), compute_content_id(to_bytes("hello w0rld")));
}
