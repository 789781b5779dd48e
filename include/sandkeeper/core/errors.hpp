/**
 * @file errors.hpp
 * @brief Exception types raised by sandkeeper
 *
 * Only conditions that cannot be recovered from at the call site are raised
 * as exceptions. Per-name acquisition failures and release failures are
 * logged and reported through return values instead.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sandkeeper {

/**
 * @class CredentialError
 * @brief Bearer credential is missing or empty
 *
 * Raised when a client, manager or sync object is constructed without a
 * credential, or when the configured environment variable is unset.
 */
class CredentialError : public std::runtime_error {
public:
    explicit CredentialError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ConfigError
 * @brief Configuration file could not be read or has the wrong shape
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ArchiveError
 * @brief libarchive failure or an archive entry rejected during extraction
 */
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class SyncError
 * @brief Workspace upload or download failed
 *
 * Uploads are all-or-nothing: any failed step aborts the whole transfer
 * and surfaces as a SyncError.
 */
class SyncError : public std::runtime_error {
public:
    explicit SyncError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace sandkeeper
