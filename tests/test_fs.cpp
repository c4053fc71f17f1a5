#include <gtest/gtest.h>
#include "fs.h"
#include <string>
#include <vector>

using namespace filepunch;

class FSTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Cleanup any leftover test files
        cleanup();
    }

    void TearDown() override {
        cleanup();
    }

    void cleanup() {
        delete_file("test_file.txt");
        delete_file("test_file.txt.tmp");
        delete_file("test_chunks.bin");
        delete_file("test_sparse.bin");
        delete_file("zero_size.bin");
    }
};

TEST_F(FSTest, BasicFileOperations) {
    EXPECT_FALSE(file_exists("test_file.txt"));
    EXPECT_EQ(get_file_size("test_file.txt"), -1);

    ASSERT_TRUE(create_file("test_file.txt", "Hello, World!"));
    EXPECT_TRUE(file_exists("test_file.txt"));
    EXPECT_FALSE(file_exists("test_file.txt.tmp"));
    EXPECT_EQ(get_file_size("test_file.txt"), 13);

    std::string content;
    ASSERT_TRUE(read_file_text("test_file.txt", content));
    EXPECT_EQ(content, "Hello, World!");

    // Overwrite replaces the content
    ASSERT_TRUE(create_file("test_file.txt", "short"));
    ASSERT_TRUE(read_file_text("test_file.txt", content));
    EXPECT_EQ(content, "short");

    EXPECT_TRUE(delete_file("test_file.txt"));
    EXPECT_FALSE(file_exists("test_file.txt"));
}

TEST_F(FSTest, NonExistentFileOperations) {
    std::string content;
    EXPECT_FALSE(read_file_text("does_not_exist.txt", content));
    EXPECT_FALSE(delete_file("does_not_exist.txt"));
    EXPECT_FALSE(file_exists(""));
    EXPECT_FALSE(create_file("", "data"));

    uint8_t buffer[4];
    EXPECT_FALSE(read_file_chunk("does_not_exist.txt", 0, buffer, sizeof(buffer)));
}

TEST_F(FSTest, ReadFileInChunks) {
    std::string data;
    for (int i = 0; i < 1000; ++i) {
        data.push_back(static_cast<char>(i % 251));
    }
    ASSERT_TRUE(create_file("test_chunks.bin", data));

    std::vector<size_t> sizes;
    std::string collected;
    bool ok = read_file_in_chunks("test_chunks.bin", 300, [&](const uint8_t* chunk, size_t size) {
        sizes.push_back(size);
        collected.append(reinterpret_cast<const char*>(chunk), size);
        return true;
    });

    EXPECT_TRUE(ok);
    EXPECT_EQ(collected, data);
    ASSERT_EQ(sizes.size(), 4u);
    EXPECT_EQ(sizes[3], 100u);

    // Callback can stop the read early
    int calls = 0;
    ok = read_file_in_chunks("test_chunks.bin", 300, [&](const uint8_t*, size_t) {
        ++calls;
        return false;
    });
    EXPECT_FALSE(ok);
    EXPECT_EQ(calls, 1);

    EXPECT_FALSE(read_file_in_chunks("test_chunks.bin", 0, [](const uint8_t*, size_t) { return true; }));
}

TEST_F(FSTest, EmptyFileYieldsNoChunks) {
    ASSERT_TRUE(create_file("zero_size.bin", ""));
    EXPECT_EQ(get_file_size("zero_size.bin"), 0);

    int calls = 0;
    EXPECT_TRUE(read_file_in_chunks("zero_size.bin", 64, [&](const uint8_t*, size_t) {
        ++calls;
        return true;
    }));
    EXPECT_EQ(calls, 0);
}

TEST_F(FSTest, FileChunkOperations) {
    ASSERT_TRUE(create_file("test_chunks.bin", "0123456789"));

    char buffer[4] = {0};
    ASSERT_TRUE(read_file_chunk("test_chunks.bin", 3, buffer, 4));
    EXPECT_EQ(std::string(buffer, 4), "3456");

    // Reading past the end fails
    EXPECT_FALSE(read_file_chunk("test_chunks.bin", 8, buffer, 4));

    ASSERT_TRUE(write_file_chunk("test_chunks.bin", 2, "ab", 2));
    std::string content;
    ASSERT_TRUE(read_file_text("test_chunks.bin", content));
    EXPECT_EQ(content, "01ab456789");
}

TEST_F(FSTest, WriteChunksOutOfOrderCreatesFile) {
    EXPECT_FALSE(file_exists("test_sparse.bin"));

    ASSERT_TRUE(write_file_chunk("test_sparse.bin", 5, "world", 5));
    ASSERT_TRUE(write_file_chunk("test_sparse.bin", 0, "hello", 5));

    std::string content;
    ASSERT_TRUE(read_file_text("test_sparse.bin", content));
    EXPECT_EQ(content, "helloworld");
    EXPECT_EQ(get_file_size("test_sparse.bin"), 10);
}
