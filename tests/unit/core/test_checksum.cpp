/**
 * @file test_checksum.cpp
 * @brief Unit tests for SHA-256 content checksums
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_adapter/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace kcenon::transfer_adapter::test {

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("transfer_adapter_checksum_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    static auto to_bytes(const std::string& s) -> std::vector<std::byte> {
        std::vector<std::byte> bytes(s.size());
        if (!s.empty()) {
            std::memcpy(bytes.data(), s.data(), s.size());
        }
        return bytes;
    }

    std::filesystem::path test_dir_;
};

// SHA-256 Tests

TEST_F(ChecksumTest, SHA256_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::sha256(empty),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, SHA256_KnownValue) {
    EXPECT_EQ(checksum::sha256(to_bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, SHA256_TwoBlockMessage) {
    // 56 bytes forces the length into a second block
    EXPECT_EQ(checksum::sha256(to_bytes(
                  "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_F(ChecksumTest, SHA256_IncrementalMatchesOneShot) {
    std::string content(100000, '\0');
    std::mt19937 gen(7);
    for (auto& c : content) {
        c = static_cast<char>(gen() & 0xff);
    }

    sha256_hasher hasher;
    for (std::size_t offset = 0; offset < content.size(); offset += 777) {
        hasher.update(std::string_view(content).substr(offset, 777));
    }
    EXPECT_EQ(hasher.finish(), checksum::sha256(to_bytes(content)));
}

TEST_F(ChecksumTest, SHA256_HasherResetsAfterFinish) {
    sha256_hasher hasher;
    hasher.update("abc");
    auto first = hasher.finish();
    hasher.update("abc");
    EXPECT_EQ(hasher.finish(), first);
}

TEST_F(ChecksumTest, SHA256_File) {
    auto path = create_test_file("abc.txt", "abc");
    auto digest = checksum::sha256_file(path);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, SHA256_FileMissing) {
    auto digest = checksum::sha256_file(test_dir_ / "missing");
    ASSERT_FALSE(digest.has_value());
    EXPECT_EQ(digest.error().code, error_code::local_object_missing);
}

TEST_F(ChecksumTest, IsSha256Oid) {
    EXPECT_TRUE(checksum::is_sha256_oid(
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    EXPECT_FALSE(checksum::is_sha256_oid("abc"));
    EXPECT_FALSE(checksum::is_sha256_oid(
        "zz7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

}  // namespace kcenon::transfer_adapter::test
