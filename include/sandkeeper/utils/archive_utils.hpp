/**
 * @file archive_utils.hpp
 * @brief tar.gz packing and hardened extraction of workspace trees
 *
 * Workspace archives are gzip compressed POSIX tar streams built entirely
 * in memory. Entries are stored with paths relative to the workspace root
 * and carry the mode and modification time of the source file.
 *
 * Extraction validates every entry before anything touches the disk: an
 * archive containing a single entry that would land outside the target
 * directory is rejected as a whole.
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
 * @struct ExtractionSummary
 * @brief Counts reported by ArchiveUtils::ExtractTarGz
 */
struct ExtractionSummary {
    std::size_t files{0};          ///< Regular files written
    std::size_t directories{0};    ///< Directory entries processed
    std::size_t links{0};          ///< Symlinks and hardlinks created
    std::uintmax_t bytes{0};       ///< Sum of regular file sizes
};

/**
 * @class ArchiveUtils
 * @brief libarchive wrappers used by the workspace sync
 *
 * **Usage Example**:
 * @code
 * auto files = ArchiveUtils::CollectFiles("./workspace");
 * if (!files.empty()) {
 *     std::string tarball = ArchiveUtils::CreateTarGz("./workspace", files);
 *     // ... transfer ...
 *     auto summary = ArchiveUtils::ExtractTarGz(tarball, "./restored");
 *     spdlog::info("{} files restored", summary.files);
 * }
 * @endcode
 */
class ArchiveUtils {
public:
    /**
     * @brief Relative paths of every regular file below root, sorted
     *
     * Symlinks are not followed and are not collected.
     *
     * @throws std::filesystem::filesystem_error on traversal errors
     */
    static std::vector<std::filesystem::path> CollectFiles(const std::filesystem::path& root);

    /**
     * @brief Build a tar.gz in memory from files relative to root
     * @param root Workspace root
     * @param relative_files Files to store, relative to root
     * @return Compressed archive bytes
     * @throws ArchiveError if a file cannot be read or libarchive fails
     */
    static std::string CreateTarGz(const std::filesystem::path& root,
                                   const std::vector<std::filesystem::path>& relative_files);

    /**
     * @brief Entry pathnames in archive order
     * @throws ArchiveError if the data is not a readable archive
     */
    static std::vector<std::string> ListEntries(const std::string& data);

    /**
     * @brief Extract an archive held in memory below destination
     *
     * The destination is created if it does not exist. Entries with an
     * absolute path, a path escaping destination, a link target escaping
     * destination, or a device/fifo/socket type cause the archive to be
     * rejected before any entry is written.
     *
     * @throws ArchiveError on rejection or libarchive failure
     */
    static ExtractionSummary ExtractTarGz(const std::string& data,
                                          const std::filesystem::path& destination);

    /**
     * @brief True if relative, once joined to root and normalized, stays below root
     */
    static bool IsContained(const std::filesystem::path& root,
                            const std::filesystem::path& relative);
};

} // namespace utils
} // namespace sandkeeper
