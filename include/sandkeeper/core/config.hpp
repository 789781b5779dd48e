/**
 * @file config.hpp
 * @brief Configuration loading and fluent construction
 *
 * Every setting has an in-class default, so an empty (or absent) config
 * file yields a working setup against the public provisioning service.
 * A config file only needs to name what it changes:
 *
 * ```json
 * {
 *   "client":  { "api_base": "https://sandbox.internal", "acquire_timeout": 90 },
 *   "manager": { "max_parallel_acquisitions": 8 },
 *   "sync":    { "default_strategy": "multipart",
 *                "strategies": { "local_dev": "signed-url" },
 *                "download_mode": "direct" },
 *   "names":   { "grouped": ["filesystem", "terminal", "git"],
 *                "response_keys": { "git": "git_server" } }
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandkeeper/core/resource_manager.hpp"
#include "sandkeeper/sync/workspace_sync.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace sandkeeper {
namespace core {

/**
 * @struct SandkeeperConfig
 * @brief Everything a session needs besides the credential
 */
struct SandkeeperConfig {
    ManagerConfig manager;      ///< Client, name tables and fan-out limits
    sync::SyncConfig sync;      ///< Workspace transfer strategies
};

/**
 * @brief Parse a configuration document
 *
 * Recognised sections: client, manager, sync, names. Unknown keys are
 * ignored, missing keys keep their defaults.
 *
 * @throws ConfigError if a known key has the wrong type or value
 */
SandkeeperConfig ParseConfig(const nlohmann::json& document);

/**
 * @brief Read and parse a JSON configuration file
 * @throws ConfigError if the file is unreadable or malformed
 */
SandkeeperConfig LoadConfigFile(const std::filesystem::path& path);

/**
 * @brief Read the bearer credential from an environment variable
 * @throws CredentialError if the variable is unset or empty
 */
std::string LoadCredentialFromEnvironment(const std::string& env_var);

/**
 * @brief "signed-url" / "signed" / "multipart"
 * @throws ConfigError on any other value
 */
sync::UploadStrategy ParseUploadStrategy(const std::string& value);

/**
 * @brief "signed-url" / "signed" / "direct"
 * @throws ConfigError on any other value
 */
sync::DownloadMode ParseDownloadMode(const std::string& value);

/**
 * @class ManagerBuilder
 * @brief Fluent API for constructing manager configurations
 *
 * **Usage Example**:
 * @code
 * auto config = ManagerBuilder()
 *     .WithApiBase("http://localhost:8080")
 *     .WithBenchmarkTag("MCP_Atlas")
 *     .WithAcquireTimeout(std::chrono::seconds(90))
 *     .WithMaxParallelAcquisitions(2)
 *     .Build();
 *
 * SandboxResourceManager manager(config, api_key);
 * @endcode
 */
class ManagerBuilder {
public:
    ManagerBuilder& WithApiBase(std::string api_base) {
        config_.client.api_base = std::move(api_base);
        return *this;
    }

    ManagerBuilder& WithBenchmarkTag(std::string tag) {
        config_.client.benchmark_tag = std::move(tag);
        return *this;
    }

    ManagerBuilder& WithCredentialEnv(std::string env_var) {
        config_.client.credential_env = std::move(env_var);
        return *this;
    }

    ManagerBuilder& WithAcquireTimeout(std::chrono::seconds timeout) {
        config_.client.acquire_timeout = timeout;
        return *this;
    }

    ManagerBuilder& WithReleaseTimeout(std::chrono::seconds timeout) {
        config_.client.release_timeout = timeout;
        return *this;
    }

    /**
     * @brief Replace the name grouping and remap tables
     */
    ManagerBuilder& WithNames(NameResolutionTable names) {
        config_.names = std::move(names);
        return *this;
    }

    ManagerBuilder& WithMaxParallelAcquisitions(std::size_t count) {
        config_.max_parallel_acquisitions = count;
        return *this;
    }

    ManagerBuilder& WithMaxParallelReleases(std::size_t count) {
        config_.max_parallel_releases = count;
        return *this;
    }

    ManagerConfig Build() const {
        return config_;
    }

private:
    ManagerConfig config_;
};

} // namespace core
} // namespace sandkeeper
