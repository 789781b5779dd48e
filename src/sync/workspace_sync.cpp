/**
 * @file workspace_sync.cpp
 * @brief Implementation of workspace upload/download
 *
 * **Signed URL Upload**:
 * ```
 * 1. POST {api}/sandbox/{type}/{id}/upload-url   → {"upload_url": ...}
 * 2. PUT  <upload_url>  (application/gzip, no credential)
 * 3. POST {api}/sandbox/{type}/{id}/initialize   → ack
 * ```
 *
 * **Multipart Upload**:
 * ```
 * POST {api}/sandbox/{type}/{id}/upload
 *   files=<part, filename = relative path>  (one per file)
 *   paths=["a.txt", "dir/b.txt", ...]
 * ```
 *
 * **Download**:
 * ```
 * GET {api}/sandbox/{type}/{id}/dump → archive bytes            (DIRECT_STREAM)
 *                                    → {"download_url": ...}
 *     GET <download_url>             → archive bytes            (SIGNED_URL)
 * ```
 *
 * @date 2025
 */

#include "sandkeeper/sync/workspace_sync.hpp"
#include "sandkeeper/core/errors.hpp"
#include "sandkeeper/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace sandkeeper {
namespace sync {

namespace {

json ParseAck(const std::string& body) {
    if (body.empty()) {
        return json::object();
    }
    try {
        return json::parse(body);
    } catch (const json::parse_error&) {
        return json(body);
    }
}

std::string RequireStringField(const std::string& body, const char* field, const std::string& step) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw SyncError(step + ": invalid JSON response: " + e.what());
    }
    if (!j.is_object() || !j.contains(field) || !j[field].is_string() ||
        j[field].get<std::string>().empty()) {
        throw SyncError(step + ": response has no '" + field + "'");
    }
    return j[field].get<std::string>();
}

} // anonymous namespace

std::string UploadStrategyToString(UploadStrategy strategy) {
    switch (strategy) {
        case UploadStrategy::SIGNED_URL:       return "signed-url";
        case UploadStrategy::DIRECT_MULTIPART: return "multipart";
    }
    return "signed-url";
}

std::string DownloadModeToString(DownloadMode mode) {
    switch (mode) {
        case DownloadMode::SIGNED_URL:    return "signed-url";
        case DownloadMode::DIRECT_STREAM: return "direct";
    }
    return "signed-url";
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

WorkspaceSync::WorkspaceSync(core::RemoteResourceClient client, SyncConfig config)
    : client_(std::move(client))
    , config_(std::move(config)) {
    spdlog::debug("Workspace sync: default strategy {}, download mode {}",
                  UploadStrategyToString(config_.default_strategy),
                  DownloadModeToString(config_.download_mode));
}

UploadStrategy WorkspaceSync::StrategyFor(const std::string& resource_type) const {
    auto it = config_.strategy_by_resource_type.find(resource_type);
    return it != config_.strategy_by_resource_type.end() ? it->second : config_.default_strategy;
}

utils::HttpResponse WorkspaceSync::Send(const utils::HttpRequest& request, const std::string& step) {
    auto response = client_.Transport()->Perform(request);
    if (auto failure = core::RemoteResourceClient::CheckResponse(response)) {
        throw SyncError(step + " failed: " + core::FailureKindToString(failure->kind) +
                        " (" + failure->message + ")");
    }
    return response;
}

// ============================================================================
// UPLOAD
// ============================================================================

UploadResult WorkspaceSync::Upload(const std::string& sandbox_id,
                                   const std::filesystem::path& directory,
                                   const std::string& resource_type) {
    if (!std::filesystem::is_directory(directory)) {
        throw SyncError("Workspace is not a directory: " + directory.string());
    }

    UploadResult result;
    result.sandbox_id = sandbox_id;
    result.strategy = StrategyFor(resource_type);

    std::vector<std::filesystem::path> files;
    try {
        files = utils::ArchiveUtils::CollectFiles(directory);
    } catch (const std::filesystem::filesystem_error& e) {
        throw SyncError(std::string("Cannot scan workspace: ") + e.what());
    }

    if (files.empty()) {
        result.status = UploadStatus::NOTHING_TO_UPLOAD;
        result.message = "No files to upload";
        spdlog::info("Workspace {} is empty, nothing to upload", directory.string());
        return result;
    }

    result.file_count = files.size();

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("UPLOADING WORKSPACE");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Directory: {}", directory.string());
    spdlog::info("Sandbox: {} ({})", sandbox_id, resource_type);
    spdlog::info("Strategy: {}", UploadStrategyToString(result.strategy));
    spdlog::info("Files: {}", files.size());

    if (result.strategy == UploadStrategy::DIRECT_MULTIPART) {
        TransferMultipart(resource_type, sandbox_id, directory, files, result);
    } else {
        std::string archive;
        try {
            archive = utils::ArchiveUtils::CreateTarGz(directory, files);
        } catch (const ArchiveError& e) {
            throw SyncError(std::string("Cannot build workspace archive: ") + e.what());
        }
        TransferSignedUrl(resource_type, sandbox_id, archive, result);
    }

    result.status = UploadStatus::UPLOADED;
    spdlog::info("✓ Uploaded {} files ({} bytes) to sandbox {}",
                 result.file_count, result.payload_bytes, sandbox_id);
    return result;
}

UploadResult WorkspaceSync::UploadTarball(const std::string& sandbox_id,
                                          const std::filesystem::path& tarball_path,
                                          const std::string& resource_type) {
    std::ifstream file(tarball_path, std::ios::binary);
    if (!file.is_open()) {
        throw SyncError("Cannot open tarball: " + tarball_path.string());
    }
    std::string archive((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    UploadResult result;
    result.sandbox_id = sandbox_id;
    result.strategy = UploadStrategy::SIGNED_URL;

    if (archive.empty()) {
        result.status = UploadStatus::NOTHING_TO_UPLOAD;
        result.message = "Empty tarball";
        spdlog::info("Tarball {} is empty, nothing to upload", tarball_path.string());
        return result;
    }

    spdlog::info("Uploading tarball {} ({} bytes) to sandbox {}",
                 tarball_path.string(), archive.size(), sandbox_id);

    TransferSignedUrl(resource_type, sandbox_id, archive, result);

    result.status = UploadStatus::UPLOADED;
    spdlog::info("✓ Tarball uploaded to sandbox {}", sandbox_id);
    return result;
}

void WorkspaceSync::TransferSignedUrl(const std::string& resource_type,
                                      const std::string& sandbox_id,
                                      const std::string& archive,
                                      UploadResult& result) {
    result.payload_bytes = archive.size();
    result.archive_sha256 = utils::HashUtils::ComputeSHA256(archive);
    spdlog::debug("Archive: {} bytes, sha256 {}", archive.size(), result.archive_sha256);

    // Step 1: signed write URL
    auto url_request = client_.AuthorizedRequest(utils::HttpMethod::POST,
                                                 client_.SandboxUrl(resource_type, sandbox_id, "upload-url"),
                                                 config_.timeout);
    auto url_response = Send(url_request, "upload-url");
    std::string upload_url = RequireStringField(url_response.body, "upload_url", "upload-url");
    spdlog::info("✓ Obtained upload URL");

    // Step 2: transfer the archive; the signed URL carries its own authorization
    utils::HttpRequest put_request;
    put_request.method = utils::HttpMethod::PUT;
    put_request.url = upload_url;
    put_request.timeout = config_.timeout;
    put_request.headers["Content-Type"] = "application/gzip";
    put_request.body = archive;
    Send(put_request, "archive transfer");
    spdlog::info("✓ Transferred archive ({} bytes)", archive.size());

    // Step 3: extraction trigger
    auto init_request = client_.AuthorizedRequest(utils::HttpMethod::POST,
                                                  client_.SandboxUrl(resource_type, sandbox_id, "initialize"),
                                                  config_.timeout);
    auto init_response = Send(init_request, "initialize");
    result.response = ParseAck(init_response.body);
    spdlog::info("✓ Extraction triggered");
}

void WorkspaceSync::TransferMultipart(const std::string& resource_type,
                                      const std::string& sandbox_id,
                                      const std::filesystem::path& directory,
                                      const std::vector<std::filesystem::path>& files,
                                      UploadResult& result) {
    auto request = client_.AuthorizedRequest(utils::HttpMethod::POST,
                                             client_.SandboxUrl(resource_type, sandbox_id, "upload"),
                                             config_.timeout);

    json paths = json::array();
    for (const auto& relative : files) {
        auto absolute = directory / relative;

        utils::MultipartPart part;
        part.name = "files";
        part.filename = relative.generic_string();
        part.file_path = absolute;
        part.content_type = "application/octet-stream";
        request.multipart.push_back(std::move(part));

        paths.push_back(relative.generic_string());

        std::error_code ec;
        auto size = std::filesystem::file_size(absolute, ec);
        if (ec) {
            throw SyncError("Cannot read " + absolute.string() + ": " + ec.message());
        }
        result.payload_bytes += static_cast<std::size_t>(size);
    }

    utils::MultipartPart paths_part;
    paths_part.name = "paths";
    paths_part.data = paths.dump();
    paths_part.content_type = "application/json";
    request.multipart.push_back(std::move(paths_part));

    auto response = Send(request, "multipart upload");
    result.response = ParseAck(response.body);
}

// ============================================================================
// DOWNLOAD
// ============================================================================

std::string WorkspaceSync::FetchArchive(const std::string& resource_type, const std::string& sandbox_id) {
    auto dump_request = client_.AuthorizedRequest(utils::HttpMethod::GET,
                                                  client_.SandboxUrl(resource_type, sandbox_id, "dump"),
                                                  config_.timeout);
    auto dump_response = Send(dump_request, "dump");

    if (config_.download_mode == DownloadMode::DIRECT_STREAM) {
        return std::move(dump_response.body);
    }

    std::string download_url = RequireStringField(dump_response.body, "download_url", "dump");
    spdlog::info("✓ Obtained download URL");

    utils::HttpRequest archive_request;
    archive_request.method = utils::HttpMethod::GET;
    archive_request.url = download_url;
    archive_request.timeout = config_.timeout;
    auto archive_response = Send(archive_request, "archive download");
    return std::move(archive_response.body);
}

DownloadResult WorkspaceSync::Download(const std::string& sandbox_id,
                                       const std::filesystem::path& destination,
                                       const std::string& resource_type) {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("DOWNLOADING WORKSPACE");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Sandbox: {} ({})", sandbox_id, resource_type);
    spdlog::info("Destination: {}", destination.string());
    spdlog::info("Mode: {}", DownloadModeToString(config_.download_mode));

    DownloadResult result;
    result.sandbox_id = sandbox_id;
    result.destination = destination;

    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        throw SyncError("Cannot create " + destination.string() + ": " + ec.message());
    }

    std::string archive = FetchArchive(resource_type, sandbox_id);
    result.archive_bytes = archive.size();

    if (archive.empty()) {
        spdlog::warn("Sandbox {} returned an empty archive, nothing extracted", sandbox_id);
        return result;
    }

    try {
        result.extracted = utils::ArchiveUtils::ExtractTarGz(archive, destination);
    } catch (const ArchiveError& e) {
        throw SyncError(std::string("Rejected workspace archive: ") + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        throw SyncError(std::string("Cannot extract workspace archive: ") + e.what());
    }

    spdlog::info("✓ Extracted {} files ({} bytes) into {}",
                 result.extracted.files, result.extracted.bytes, destination.string());
    return result;
}

} // namespace sync
} // namespace sandkeeper
