/**
 * @file archive_utils.cpp
 * @brief libarchive implementation of workspace packing and extraction
 *
 * **Packing**:
 * ```
 * archive_write_new → gzip filter → pax restricted format
 *   → per file: stat → entry (relative path) → header → data blocks
 *   → close (flushes the gzip trailer into the output string)
 * ```
 *
 * **Extraction** runs two passes over the in-memory archive:
 * 1. Validation: every header is checked for path, link and type safety.
 * 2. Deployment: entries are re-rooted under the destination and written
 *    with archive_write_disk using SECURE_NODOTDOT and SECURE_SYMLINKS.
 *
 * @date 2025
 */

#include "sandkeeper/utils/archive_utils.hpp"
#include "sandkeeper/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>

namespace sandkeeper {
namespace utils {

namespace {

struct ReadArchiveDeleter {
    void operator()(archive* a) const {
        archive_read_close(a);
        archive_read_free(a);
    }
};

struct WriteArchiveDeleter {
    void operator()(archive* a) const {
        archive_write_free(a);
    }
};

struct DiskArchiveDeleter {
    void operator()(archive* a) const {
        archive_write_close(a);
        archive_write_free(a);
    }
};

struct EntryDeleter {
    void operator()(archive_entry* e) const {
        archive_entry_free(e);
    }
};

using ReadArchive = std::unique_ptr<archive, ReadArchiveDeleter>;
using WriteArchive = std::unique_ptr<archive, WriteArchiveDeleter>;
using DiskArchive = std::unique_ptr<archive, DiskArchiveDeleter>;
using Entry = std::unique_ptr<archive_entry, EntryDeleter>;

std::string ErrorOf(archive* a, const std::string& context) {
    const char* message = archive_error_string(a);
    return context + ": " + (message ? message : "unknown libarchive error");
}

la_ssize_t AppendToString(archive*, void* client_data, const void* buffer, size_t length) {
    auto* output = static_cast<std::string*>(client_data);
    output->append(static_cast<const char*>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

ReadArchive OpenMemoryReader(const std::string& data) {
    ReadArchive reader(archive_read_new());
    if (!reader) {
        throw ArchiveError("archive_read_new failed");
    }

    archive_read_support_filter_all(reader.get());
    archive_read_support_format_all(reader.get());

    int rv = archive_read_open_memory(reader.get(), data.data(), data.size());
    if (rv != ARCHIVE_OK) {
        throw ArchiveError(ErrorOf(reader.get(), "cannot open archive"));
    }
    return reader;
}

void CopyData(archive* source, archive* target) {
    const void* buffer = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;

    while (true) {
        int rv = archive_read_data_block(source, &buffer, &size, &offset);
        if (rv == ARCHIVE_EOF) {
            return;
        }
        if (rv != ARCHIVE_OK) {
            throw ArchiveError(ErrorOf(source, "read failed"));
        }
        if (archive_write_data_block(target, buffer, size, offset) != ARCHIVE_OK) {
            throw ArchiveError(ErrorOf(target, "write failed"));
        }
    }
}

// Rejects entries that could write outside destination. Called for every
// entry before extraction starts.
void ValidateEntry(const std::filesystem::path& destination, archive_entry* entry) {
    const char* raw_path = archive_entry_pathname(entry);
    if (!raw_path || raw_path[0] == '\0') {
        throw ArchiveError("archive entry without a path");
    }

    std::filesystem::path path(raw_path);
    if (path.is_absolute() || path.has_root_name() || path.has_root_directory()) {
        throw ArchiveError(std::string("absolute path in archive: ") + raw_path);
    }
    if (!ArchiveUtils::IsContained(destination, path)) {
        throw ArchiveError(std::string("archive entry escapes destination: ") + raw_path);
    }

    if (const char* hardlink = archive_entry_hardlink(entry)) {
        std::filesystem::path target(hardlink);
        if (target.is_absolute() || !ArchiveUtils::IsContained(destination, target)) {
            throw ArchiveError(std::string("hardlink escapes destination: ") + raw_path +
                               " -> " + hardlink);
        }
    }

    switch (archive_entry_filetype(entry)) {
        case AE_IFREG:
        case AE_IFDIR:
            break;
        case AE_IFLNK: {
            const char* link = archive_entry_symlink(entry);
            if (!link) {
                throw ArchiveError(std::string("symlink without target: ") + raw_path);
            }
            std::filesystem::path target(link);
            if (target.is_absolute() ||
                !ArchiveUtils::IsContained(destination, path.parent_path() / target)) {
                throw ArchiveError(std::string("symlink escapes destination: ") + raw_path +
                                   " -> " + link);
            }
            break;
        }
        default:
            // Hardlink entries carry no file type of their own.
            if (archive_entry_hardlink(entry)) {
                break;
            }
            throw ArchiveError(std::string("unsupported entry type: ") + raw_path);
    }
}

} // anonymous namespace

// ============================================================================
// COLLECTION
// ============================================================================

std::vector<std::filesystem::path> ArchiveUtils::CollectFiles(const std::filesystem::path& root) {
    std::vector<std::filesystem::path> files;

    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_symlink() || !entry.is_regular_file()) {
            continue;
        }
        files.push_back(entry.path().lexically_relative(root));
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool ArchiveUtils::IsContained(const std::filesystem::path& root,
                               const std::filesystem::path& relative) {
    auto normalized_root = root.lexically_normal();
    if (!normalized_root.has_filename() && normalized_root.has_relative_path()) {
        normalized_root = normalized_root.parent_path();
    }
    auto normalized =(normalized_root / relative).lexically_normal();
    auto rel = normalized.lexically_relative(normalized_root);

    if (rel.empty()) {
        return false;
    }
    auto first = *rel.begin();
    return first != "..";
}

// ============================================================================
// PACKING
// ============================================================================

std::string ArchiveUtils::CreateTarGz(const std::filesystem::path& root,
                                      const std::vector<std::filesystem::path>& relative_files) {
    std::string output;

    WriteArchive writer(archive_write_new());
    if (!writer) {
        throw ArchiveError("archive_write_new failed");
    }

    if (archive_write_add_filter_gzip(writer.get()) != ARCHIVE_OK ||
        archive_write_set_format_pax_restricted(writer.get()) != ARCHIVE_OK) {
        throw ArchiveError(ErrorOf(writer.get(), "cannot configure tar.gz writer"));
    }
    archive_write_set_bytes_in_last_block(writer.get(), 1);

    if (archive_write_open(writer.get(), &output, nullptr, &AppendToString, nullptr) != ARCHIVE_OK) {
        throw ArchiveError(ErrorOf(writer.get(), "cannot open tar.gz writer"));
    }

    std::array<char, 64 * 1024> buffer;

    for (const auto& relative : relative_files) {
        auto source = root / relative;

        struct stat st;
        if (::stat(source.c_str(), &st) != 0) {
            throw ArchiveError("cannot stat " + source.string());
        }

        Entry entry(archive_entry_new());
        archive_entry_copy_stat(entry.get(), &st);
        archive_entry_set_pathname(entry.get(), relative.generic_string().c_str());

        if (archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK) {
            throw ArchiveError(ErrorOf(writer.get(), "cannot write header for " + relative.generic_string()));
        }

        std::ifstream file(source, std::ios::binary);
        if (!file.is_open()) {
            throw ArchiveError("cannot open " + source.string());
        }
        while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
            auto count = static_cast<size_t>(file.gcount());
            if (archive_write_data(writer.get(), buffer.data(), count) < 0) {
                throw ArchiveError(ErrorOf(writer.get(), "cannot write data for " + relative.generic_string()));
            }
        }
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        throw ArchiveError(ErrorOf(writer.get(), "cannot finish tar.gz"));
    }

    spdlog::debug("Packed {} files from {} into {} bytes",
                  relative_files.size(), root.string(), output.size());
    return output;
}

// ============================================================================
// INSPECTION
// ============================================================================

std::vector<std::string> ArchiveUtils::ListEntries(const std::string& data) {
    std::vector<std::string> entries;
    auto reader = OpenMemoryReader(data);

    archive_entry* entry = nullptr;
    while (true) {
        int rv = archive_read_next_header(reader.get(), &entry);
        if (rv == ARCHIVE_EOF) {
            break;
        }
        if (rv != ARCHIVE_OK) {
            throw ArchiveError(ErrorOf(reader.get(), "cannot read header"));
        }
        const char* path = archive_entry_pathname(entry);
        entries.emplace_back(path ? path : "");
        archive_read_data_skip(reader.get());
    }
    return entries;
}

// ============================================================================
// EXTRACTION
// ============================================================================

ExtractionSummary ArchiveUtils::ExtractTarGz(const std::string& data,
                                             const std::filesystem::path& destination) {
    std::filesystem::create_directories(destination);
    // SECURE_SYMLINKS must only see links the archive itself creates.
    auto prefix = std::filesystem::canonical(destination);

    // Pass 1: validate everything before writing anything.
    {
        auto reader = OpenMemoryReader(data);
        archive_entry* entry = nullptr;
        while (true) {
            int rv = archive_read_next_header(reader.get(), &entry);
            if (rv == ARCHIVE_EOF) {
                break;
            }
            if (rv != ARCHIVE_OK) {
                throw ArchiveError(ErrorOf(reader.get(), "cannot read header"));
            }
            ValidateEntry(prefix, entry);
            archive_read_data_skip(reader.get());
        }
    }

    // Pass 2: deploy.
    ExtractionSummary summary;
    auto reader = OpenMemoryReader(data);

    DiskArchive target(archive_write_disk_new());
    if (!target) {
        throw ArchiveError("archive_write_disk_new failed");
    }

    int flags = ARCHIVE_EXTRACT_TIME |
                ARCHIVE_EXTRACT_PERM |
                ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                ARCHIVE_EXTRACT_SECURE_NODOTDOT;

    archive_write_disk_set_options(target.get(), flags);
    archive_write_disk_set_standard_lookup(target.get());

    archive_entry* entry = nullptr;
    while (true) {
        int rv = archive_read_next_header(reader.get(), &entry);
        if (rv == ARCHIVE_EOF) {
            break;
        }
        if (rv != ARCHIVE_OK) {
            throw ArchiveError(ErrorOf(reader.get(), "cannot read header"));
        }

        // Prepend the target path so the entry lands below destination.
        auto pathname = (prefix / archive_entry_pathname(entry)).lexically_normal();
        archive_entry_set_pathname(entry, pathname.c_str());

        if (const char* hardlink = archive_entry_hardlink(entry)) {
            auto link = (prefix / hardlink).lexically_normal();
            archive_entry_set_hardlink(entry, link.c_str());
        }

        rv = archive_write_header(target.get(), entry);
        if (rv < ARCHIVE_WARN) {
            throw ArchiveError(ErrorOf(target.get(), "cannot create " + pathname.string()));
        }
        if (rv == ARCHIVE_WARN) {
            spdlog::warn("{}", ErrorOf(target.get(), pathname.string()));
        }

        auto type = archive_entry_filetype(entry);
        if (archive_entry_hardlink(entry) || type == AE_IFLNK) {
            summary.links++;
        } else if (type == AE_IFDIR) {
            summary.directories++;
        } else if (type == AE_IFREG) {
            summary.files++;
            summary.bytes += static_cast<std::uintmax_t>(archive_entry_size(entry));
        }

        if (archive_entry_size(entry) > 0) {
            CopyData(reader.get(), target.get());
        }

        if (archive_write_finish_entry(target.get()) < ARCHIVE_WARN) {
            throw ArchiveError(ErrorOf(target.get(), "cannot finish " + pathname.string()));
        }
    }

    spdlog::debug("Extracted {} files ({} bytes) to {}", summary.files, summary.bytes, prefix.string());
    return summary;
}

} // namespace utils
} // namespace sandkeeper
