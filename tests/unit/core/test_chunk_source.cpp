/**
 * @file test_chunk_source.cpp
 * @brief Unit tests for file and memory chunk sources
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/core/chunk_source.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

namespace kcenon::resumable_upload::test {

namespace {

auto make_bytes(std::size_t size) -> chunk_bytes {
    chunk_bytes data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::byte>(i % 251);
    }
    return data;
}

}  // namespace

// =============================================================================
// file_chunk_source Tests
// =============================================================================

class FileChunkSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "resumable_upload_test_source";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const chunk_bytes& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(FileChunkSourceTest, OpenReportsLength) {
    auto path = create_test_file("clip.bin", make_bytes(4096));

    auto source = file_chunk_source::open(path);

    ASSERT_TRUE(source.has_value()) << source.error().message;
    EXPECT_EQ((*source)->length(), 4096u);
    EXPECT_EQ((*source)->name(), path.string());
    EXPECT_EQ((*source)->path(), path);
}

TEST_F(FileChunkSourceTest, ReadRange) {
    auto content = make_bytes(4096);
    auto path = create_test_file("clip.bin", content);
    auto source = file_chunk_source::open(path);
    ASSERT_TRUE(source.has_value());

    auto data = (*source)->read(1000, 1500);

    ASSERT_TRUE(data.has_value());
    ASSERT_EQ(data->size(), 500u);
    EXPECT_TRUE(std::equal(data->begin(), data->end(), content.begin() + 1000));
}

TEST_F(FileChunkSourceTest, ReadsAreIndependentOfOrder) {
    auto content = make_bytes(300);
    auto path = create_test_file("clip.bin", content);
    auto source = file_chunk_source::open(path);
    ASSERT_TRUE(source.has_value());

    auto tail = (*source)->read(200, 300);
    auto head = (*source)->read(0, 100);

    ASSERT_TRUE(tail.has_value());
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ((*tail)[0], content[200]);
    EXPECT_EQ((*head)[0], content[0]);
}

TEST_F(FileChunkSourceTest, MissingFile) {
    auto source = file_chunk_source::open(test_dir_ / "missing.bin");

    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::file_not_found);
}

TEST_F(FileChunkSourceTest, EmptyFile) {
    auto path = create_test_file("empty.bin", {});

    auto source = file_chunk_source::open(path);

    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::file_empty);
}

TEST_F(FileChunkSourceTest, DirectoryIsUnreadable) {
    auto source = file_chunk_source::open(test_dir_);

    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::file_unreadable);
}

TEST_F(FileChunkSourceTest, ReadPastEndFails) {
    auto path = create_test_file("clip.bin", make_bytes(100));
    auto source = file_chunk_source::open(path);
    ASSERT_TRUE(source.has_value());

    auto data = (*source)->read(50, 101);

    ASSERT_FALSE(data.has_value());
    EXPECT_EQ(data.error().code, error_code::invalid_chunk_range);
}

// =============================================================================
// memory_chunk_source Tests
// =============================================================================

class MemoryChunkSourceTest : public ::testing::Test {};

TEST_F(MemoryChunkSourceTest, LengthAndName) {
    memory_chunk_source source(make_bytes(64), "buffer");

    EXPECT_EQ(source.length(), 64u);
    EXPECT_EQ(source.name(), "buffer");
}

TEST_F(MemoryChunkSourceTest, ReadRange) {
    auto content = make_bytes(64);
    memory_chunk_source source(content);

    auto data = source.read(10, 20);

    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, chunk_bytes(content.begin() + 10, content.begin() + 20));
}

TEST_F(MemoryChunkSourceTest, EmptyAndInvertedRangesRejected) {
    memory_chunk_source source(make_bytes(64));

    EXPECT_FALSE(source.read(10, 10).has_value());
    EXPECT_FALSE(source.read(20, 10).has_value());
    EXPECT_FALSE(source.read(0, 65).has_value());
}

}  // namespace kcenon::resumable_upload::test
