#include <gtest/gtest.h>
#include <sandkeeper/utils/hash_utils.hpp>

#include <chrono>
#include <fstream>
#include <random>

using namespace sandkeeper::utils;
namespace fs = std::filesystem;

namespace {

constexpr const char* kEmptySha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << content;
}

} // namespace

class HashUtilsTest : public ::testing::Test {
protected:
    fs::path root_;

    void SetUp() override {
        std::random_device rd;
        root_ = fs::temp_directory_path() /
                ("sandkeeper_hash_" + std::to_string(rd()) + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }
};

// ===========================================================================
// Digests
// ===========================================================================

TEST(HashDigestTest, KnownVectors) {
    EXPECT_EQ(HashUtils::ComputeSHA256(std::string()), kEmptySha256);
    EXPECT_EQ(HashUtils::ComputeSHA256(std::string("abc")), kAbcSha256);
}

TEST(HashDigestTest, BinaryToHexPadsBytes) {
    const unsigned char bytes[] = {0x00, 0x0a, 0xff};
    EXPECT_EQ(HashUtils::BinaryToHex(bytes, 3), "000aff");
}

TEST_F(HashUtilsTest, FileDigestMatchesStringDigest) {
    WriteFile(root_ / "abc.txt", "abc");
    EXPECT_EQ(HashUtils::ComputeSHA256(root_ / "abc.txt"), kAbcSha256);
}

TEST_F(HashUtilsTest, MissingFileThrows) {
    EXPECT_THROW(HashUtils::ComputeSHA256(root_ / "missing.bin"), std::runtime_error);
}

// ===========================================================================
// Manifest
// ===========================================================================

TEST_F(HashUtilsTest, ManifestIsSortedWithGenericPaths) {
    WriteFile(root_ / "z.txt", "");
    WriteFile(root_ / "dir" / "abc.txt", "abc");

    auto manifest = HashUtils::BuildManifest(root_);

    ASSERT_EQ(manifest.size(), 2u);
    EXPECT_EQ(manifest[0].relative_path, "dir/abc.txt");
    EXPECT_EQ(manifest[0].size, 3u);
    EXPECT_EQ(manifest[0].sha256, kAbcSha256);
    EXPECT_EQ(manifest[1].relative_path, "z.txt");
    EXPECT_EQ(manifest[1].sha256, kEmptySha256);
}

TEST_F(HashUtilsTest, ManifestSkipsSymlinks) {
    WriteFile(root_ / "real.txt", "abc");
    fs::create_symlink("real.txt", root_ / "alias.txt");

    auto manifest = HashUtils::BuildManifest(root_);

    ASSERT_EQ(manifest.size(), 1u);
    EXPECT_EQ(manifest[0].relative_path, "real.txt");
}

TEST_F(HashUtilsTest, ManifestOfNonDirectoryThrows) {
    WriteFile(root_ / "file.txt", "x");
    EXPECT_THROW(HashUtils::BuildManifest(root_ / "file.txt"), std::runtime_error);
}
