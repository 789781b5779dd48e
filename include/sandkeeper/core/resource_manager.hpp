/**
 * @file resource_manager.hpp
 * @brief Session-scoped manager of remote sandboxes
 *
 * Maps the logical service names a task needs to physical sandboxes,
 * issuing as few create calls as possible, and guarantees that every
 * sandbox acquired during the session is released exactly once.
 *
 * @date 2025
 */

#pragma once

#include "sandkeeper/core/name_resolution.hpp"
#include "sandkeeper/core/remote_client.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sandkeeper {
namespace core {

/// Logical name → reachable endpoint URL, for successfully acquired names only
using EndpointOverrideMap = std::map<std::string, std::string>;

/// Logical name → extra create parameters (JSON object)
using ParamsByName = std::map<std::string, nlohmann::json>;

/**
 * @struct ManagerConfig
 * @brief Resource manager configuration
 */
struct ManagerConfig {
    ClientConfig client;                       ///< Provisioning service settings
    NameResolutionTable names;                 ///< Grouping and remap tables
    std::size_t max_parallel_acquisitions{4};  ///< Concurrent ungrouped creates
    std::size_t max_parallel_releases{4};      ///< Concurrent deletes in ReleaseAll
};

/**
 * @class SandboxResourceManager
 * @brief One harness session worth of remote sandboxes
 *
 * Lifecycle:
 * ```
 * empty ──AcquireMany──► N descriptors ──ReleaseAll──► empty ──AcquireMany──► ...
 * ```
 *
 * - **Partitioning**: names in the grouped-name set share one create call
 *   against the grouped resource type; every other name gets its own call.
 * - **Partial success**: a failed create only removes that name from the
 *   result. Nothing acquired so far is rolled back.
 * - **Tracking**: a descriptor is recorded as soon as the service returns
 *   an id, before its endpoints are inspected, so a sandbox whose URLs are
 *   unusable is still released.
 * - **Release**: ReleaseAll deletes each tracked sandbox once, logs and
 *   ignores failures, and always leaves the session empty. The destructor
 *   calls it.
 *
 * **Thread Safety**: AcquireMany and ReleaseAll are meant to be called from
 * one thread; internally they fan out with bounded parallelism and
 * serialize all bookkeeping on a mutex. Accessors are safe at any time.
 *
 * **Usage Example**:
 * @code
 * ManagerConfig config;
 * SandboxResourceManager manager(config, api_key);
 *
 * auto overrides = manager.AcquireMany({"filesystem", "terminal", "emails"});
 * if (overrides.count("emails") == 0) {
 *     spdlog::warn("emails unavailable for this run");
 * }
 *
 * // ... run the task against overrides ...
 *
 * manager.ReleaseAll();
 * @endcode
 */
class SandboxResourceManager {
public:
    /**
     * @brief Construct manager
     * @param config Manager configuration
     * @param api_key Bearer credential
     * @param transport HTTP transport (libcurl when null)
     * @throws CredentialError if api_key is empty
     */
    SandboxResourceManager(ManagerConfig config,
                           std::string api_key,
                           std::shared_ptr<utils::HttpTransport> transport = nullptr);

    /**
     * @brief Construct manager with the credential read from the environment
     * @throws CredentialError if config.client.credential_env is unset or empty
     */
    static std::unique_ptr<SandboxResourceManager> FromEnvironment(
        ManagerConfig config,
        std::shared_ptr<utils::HttpTransport> transport = nullptr);

    /**
     * @brief Releases everything still tracked
     */
    ~SandboxResourceManager();

    SandboxResourceManager(const SandboxResourceManager&) = delete;
    SandboxResourceManager& operator=(const SandboxResourceManager&) = delete;

    /**
     * @brief Acquire sandboxes for a set of logical names
     *
     * 1. Partition names into grouped and ungrouped.
     * 2. One create call for the whole grouped subset, with the merged
     *    parameters of its names; each grouped name maps to the endpoint
     *    under its response key.
     * 3. One create call per ungrouped name against its resolved resource
     *    type; the name maps to the first endpoint of the response, keyed
     *    by the requested name when the endpoint key equals the resolved
     *    type and by the endpoint key otherwise.
     *
     * @param names Requested logical names
     * @param params Optional per-name create parameters
     * @return Endpoints of the names that were acquired
     */
    EndpointOverrideMap AcquireMany(const std::set<std::string>& names,
                                    const ParamsByName& params = {});

    /**
     * @brief Release every tracked sandbox and clear the session
     *
     * Never throws. A second call in a row makes no remote calls.
     */
    void ReleaseAll();

    /**
     * @brief Stop tracking every sandbox without releasing it
     *
     * The caller becomes responsible for deleting the returned sandboxes.
     */
    std::vector<ResourceDescriptor> Detach();

    /**
     * @brief Passthrough describe call; does not touch the session
     */
    std::optional<nlohmann::json> GetDetails(const std::string& resource_type,
                                             const std::string& id) const;

    /**
     * @brief Snapshot of tracked descriptors in acquisition order
     */
    std::vector<ResourceDescriptor> Descriptors() const;

    /**
     * @brief Number of tracked descriptors
     */
    std::size_t TrackedCount() const;

    /**
     * @brief Id of the first tracked sandbox of a resource type
     *
     * Matches the server name reported by the service, or the requested
     * resource type when the service reported none.
     */
    std::optional<std::string> FindSandboxId(const std::string& resource_type) const;

    const RemoteResourceClient& Client() const { return client_; }
    const ManagerConfig& GetConfig() const { return config_; }

private:
    ManagerConfig config_;
    RemoteResourceClient client_;

    mutable std::mutex mutex_;                   ///< Guards descriptors_ and in-flight results
    std::vector<ResourceDescriptor> descriptors_;

    void AcquireGrouped(const std::vector<std::string>& names,
                        const ParamsByName& params,
                        EndpointOverrideMap& overrides);
    void AcquireUngrouped(const std::string& name,
                          const ParamsByName& params,
                          EndpointOverrideMap& overrides);
};

} // namespace core
} // namespace sandkeeper
