/**
 * @file workspace_sync.hpp
 * @brief Upload and download of a local workspace to/from a sandbox
 *
 * Two upload strategies exist side by side; which one is used is decided
 * per resource type by configuration, never negotiated per call:
 *
 * - **Signed URL** (large payloads): build a tar.gz in memory, ask the
 *   service for a short-lived write URL, PUT the archive there, then ask
 *   the service to fetch and extract it.
 * - **Direct multipart**: POST every file as a multipart part named by
 *   its relative path, plus a "paths" field listing all of them so nested
 *   directories can be rebuilt server side.
 *
 * Both fail fast: the first failed step aborts the upload with SyncError.
 * A directory without files is a successful no-op, not an error.
 *
 * Download fetches a tar.gz either directly from the dump endpoint or via
 * a signed read URL returned by it, and extracts it with traversal
 * protection.
 *
 * @date 2025
 */

#pragma once

#include "sandkeeper/core/name_resolution.hpp"
#include "sandkeeper/core/remote_client.hpp"
#include "sandkeeper/utils/archive_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace sandkeeper {
namespace sync {

/**
 * @enum UploadStrategy
 * @brief How a workspace reaches the sandbox
 */
enum class UploadStrategy {
    SIGNED_URL,        ///< upload-url → PUT archive → initialize
    DIRECT_MULTIPART   ///< single multipart POST of all files
};

/**
 * @enum DownloadMode
 * @brief How the dump endpoint delivers the archive
 */
enum class DownloadMode {
    SIGNED_URL,        ///< dump returns {download_url}, archive fetched from it
    DIRECT_STREAM      ///< dump returns the archive bytes
};

/**
 * @enum UploadStatus
 */
enum class UploadStatus {
    UPLOADED,           ///< Transfer and extraction trigger succeeded
    NOTHING_TO_UPLOAD   ///< No files; no remote call was made
};

std::string UploadStrategyToString(UploadStrategy strategy);
std::string DownloadModeToString(DownloadMode mode);

/**
 * @struct SyncConfig
 * @brief Workspace sync configuration
 */
struct SyncConfig {
    UploadStrategy default_strategy{UploadStrategy::SIGNED_URL};
    std::map<std::string, UploadStrategy> strategy_by_resource_type{
        {core::kGroupedResourceType, UploadStrategy::SIGNED_URL}
    };
    DownloadMode download_mode{DownloadMode::SIGNED_URL};
    std::chrono::seconds timeout{120};   ///< Per request
};

/**
 * @struct UploadResult
 * @brief Outcome of a successful (or no-op) upload
 */
struct UploadResult {
    UploadStatus status{UploadStatus::NOTHING_TO_UPLOAD};
    UploadStrategy strategy{UploadStrategy::SIGNED_URL};
    std::string sandbox_id;
    std::size_t file_count{0};
    std::size_t payload_bytes{0};     ///< Archive size, or summed file sizes for multipart
    std::string archive_sha256;       ///< Empty for multipart uploads
    nlohmann::json response;          ///< Final acknowledgement from the service
    std::string message;
};

/**
 * @struct DownloadResult
 */
struct DownloadResult {
    std::string sandbox_id;
    std::filesystem::path destination;
    std::size_t archive_bytes{0};
    utils::ExtractionSummary extracted;
};

/**
 * @class WorkspaceSync
 * @brief Moves workspace trees between local disk and a sandbox
 *
 * Keyed only by sandbox id; the sandbox itself is obtained from the
 * resource manager.
 *
 * **Usage Example**:
 * @code
 * auto manager = SandboxResourceManager::FromEnvironment(ManagerConfig{});
 * manager->AcquireMany({"filesystem", "terminal"});
 *
 * if (auto id = manager->FindSandboxId("local_dev")) {
 *     WorkspaceSync sync(manager->Client());
 *     sync.Upload(*id, "./initial_workspace");
 *     // ... agent runs ...
 *     sync.Download(*id, "./agent_workspace");
 * }
 * @endcode
 */
class WorkspaceSync {
public:
    explicit WorkspaceSync(core::RemoteResourceClient client, SyncConfig config = SyncConfig{});

    /**
     * @brief Strategy configured for a resource type
     */
    UploadStrategy StrategyFor(const std::string& resource_type) const;

    /**
     * @brief Upload every regular file below directory
     * @throws SyncError if directory is missing or any step fails
     */
    UploadResult Upload(const std::string& sandbox_id,
                        const std::filesystem::path& directory,
                        const std::string& resource_type = core::kGroupedResourceType);

    /**
     * @brief Upload a pre-built tar.gz through the signed URL flow
     *
     * An empty file is a no-op.
     *
     * @throws SyncError if the file cannot be read or any step fails
     */
    UploadResult UploadTarball(const std::string& sandbox_id,
                               const std::filesystem::path& tarball_path,
                               const std::string& resource_type = core::kGroupedResourceType);

    /**
     * @brief Read the sandbox workspace back into destination
     *
     * destination is created if absent.
     *
     * @throws SyncError on transfer failure or a rejected archive
     */
    DownloadResult Download(const std::string& sandbox_id,
                            const std::filesystem::path& destination,
                            const std::string& resource_type = core::kGroupedResourceType);

    const SyncConfig& GetConfig() const { return config_; }

private:
    core::RemoteResourceClient client_;
    SyncConfig config_;

    void TransferSignedUrl(const std::string& resource_type,
                           const std::string& sandbox_id,
                           const std::string& archive,
                           UploadResult& result);
    void TransferMultipart(const std::string& resource_type,
                           const std::string& sandbox_id,
                           const std::filesystem::path& directory,
                           const std::vector<std::filesystem::path>& files,
                           UploadResult& result);

    std::string FetchArchive(const std::string& resource_type, const std::string& sandbox_id);

    utils::HttpResponse Send(const utils::HttpRequest& request, const std::string& step);
};

} // namespace sync
} // namespace sandkeeper
