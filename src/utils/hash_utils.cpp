/**
 * @file hash_utils.cpp
 * @brief OpenSSL SHA-256 helpers
 *
 * @date 2025
 */

#include "sandkeeper/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>
#include <openssl/sha.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sandkeeper {
namespace utils {

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

// Compute SHA256 hash (file)
std::string HashUtils::ComputeSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    SHA256_CTX sha256_context;
    SHA256_Init(&sha256_context);

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        SHA256_Update(&sha256_context, buffer, file.gcount());
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &sha256_context);

    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

std::vector<FileDigest> HashUtils::BuildManifest(const std::filesystem::path& root) {
    if (!std::filesystem::is_directory(root)) {
        throw std::runtime_error("Not a directory: " + root.string());
    }

    std::vector<FileDigest> manifest;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_symlink() || !entry.is_regular_file()) {
            continue;
        }
        FileDigest digest;
        digest.relative_path = entry.path().lexically_relative(root).generic_string();
        digest.size = entry.file_size();
        digest.sha256 = ComputeSHA256(entry.path());
        manifest.push_back(std::move(digest));
    }

    std::sort(manifest.begin(), manifest.end(),
              [](const FileDigest& a, const FileDigest& b) {
                  return a.relative_path < b.relative_path;
              });

    spdlog::debug("Manifest of {}: {} files", root.string(), manifest.size());
    return manifest;
}

} // namespace utils
} // namespace sandkeeper
