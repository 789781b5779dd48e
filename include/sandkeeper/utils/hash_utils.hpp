/**
 * @file hash_utils.hpp
 * @brief SHA-256 digests for workspace archives and files
 *
 * Upload results carry the SHA-256 of the transferred archive so a caller
 * can correlate it with what the remote side extracted. The CLI manifest
 * command prints per-file digests of a workspace tree to compare a local
 * directory with one read back from a sandbox.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sandkeeper {
namespace utils {

/**
 * @struct FileDigest
 * @brief Digest of one file within a workspace tree
 */
struct FileDigest {
    std::string relative_path;   ///< Path relative to the tree root, '/' separated
    std::uintmax_t size{0};      ///< File size in bytes
    std::string sha256;          ///< Lowercase hex SHA-256
};

/**
 * @class HashUtils
 * @brief OpenSSL backed hashing helpers
 *
 * All methods are static and thread-safe.
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a file, streamed in 8 KiB blocks
     * @throws std::runtime_error if the file cannot be opened
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /**
     * @brief SHA-256 of an in-memory buffer
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Digest every regular file below root, sorted by relative path
     * @throws std::runtime_error if root is not a directory or a file is unreadable
     */
    static std::vector<FileDigest> BuildManifest(const std::filesystem::path& root);

    /**
     * @brief Convert raw digest bytes to lowercase hex
     */
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace sandkeeper
