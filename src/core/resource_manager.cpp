/**
 * @file resource_manager.cpp
 * @brief Implementation of the session-scoped sandbox manager
 *
 * **Acquisition Workflow**:
 * ```
 * names ─► Partition ─┬─ grouped   ─► 1 × POST /sandbox/local_dev ─► map by response key
 *                     └─ ungrouped ─► N × POST /sandbox/{type}     ─► map first endpoint
 *                                     (batches of max_parallel_acquisitions)
 * ```
 *
 * **Bookkeeping**: every successful create appends its descriptor under
 * mutex_ before the endpoint mapping step, and the mapping writes into the
 * shared override map under the same lock.
 *
 * **Release Workflow**: the tracked vector is swapped out under the lock,
 * so the session is empty from that moment on; duplicates by
 * (resource type, id) are dropped and the rest are deleted in batches of
 * max_parallel_releases.
 *
 * @date 2025
 */

#include "sandkeeper/core/resource_manager.hpp"
#include "sandkeeper/core/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <functional>
#include <future>
#include <utility>

using json = nlohmann::json;

namespace sandkeeper {
namespace core {

namespace {

// Runs jobs in consecutive batches of at most `width` concurrent tasks.
void RunBatched(const std::vector<std::function<void()>>& jobs, std::size_t width) {
    width = std::max<std::size_t>(width, 1);

    for (std::size_t start = 0; start < jobs.size(); start += width) {
        std::size_t end = std::min(jobs.size(), start + width);

        if (end - start == 1) {
            jobs[start]();
            continue;
        }

        std::vector<std::future<void>> batch;
        batch.reserve(end - start);
        for (std::size_t i = start; i < end; ++i) {
            batch.push_back(std::async(std::launch::async, jobs[i]));
        }
        for (auto& future : batch) {
            future.get();
        }
    }
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

SandboxResourceManager::SandboxResourceManager(ManagerConfig config,
                                               std::string api_key,
                                               std::shared_ptr<utils::HttpTransport> transport)
    : config_(std::move(config))
    , client_(config_.client, std::move(api_key), std::move(transport)) {

    spdlog::info("Sandbox Resource Manager initialized");
    spdlog::debug("API base: {}", client_.GetConfig().api_base);
    spdlog::debug("Grouped resource type: {} ({} names)",
                  config_.names.GroupedResourceType(), config_.names.GroupedNames().size());
}

std::unique_ptr<SandboxResourceManager> SandboxResourceManager::FromEnvironment(
    ManagerConfig config,
    std::shared_ptr<utils::HttpTransport> transport) {

    std::string api_key = LoadCredentialFromEnvironment(config.client.credential_env);
    return std::make_unique<SandboxResourceManager>(std::move(config), std::move(api_key),
                                                    std::move(transport));
}

SandboxResourceManager::~SandboxResourceManager() {
    try {
        ReleaseAll();
    } catch (const std::exception& e) {
        spdlog::error("Release during shutdown failed: {}", e.what());
    }
}

// ============================================================================
// ACQUISITION
// ============================================================================

EndpointOverrideMap SandboxResourceManager::AcquireMany(const std::set<std::string>& names,
                                                        const ParamsByName& params) {
    EndpointOverrideMap overrides;
    if (names.empty()) {
        return overrides;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("ACQUIRING SANDBOXES ({} names)", names.size());
    spdlog::info("═══════════════════════════════════════════════════════════════");

    auto partition = config_.names.Partition(names);

    if (!partition.grouped.empty()) {
        AcquireGrouped(partition.grouped, params, overrides);
    }

    std::vector<std::function<void()>> jobs;
    jobs.reserve(partition.ungrouped.size());
    for (const auto& name : partition.ungrouped) {
        jobs.emplace_back([this, &name, &params, &overrides]() {
            try {
                AcquireUngrouped(name, params, overrides);
            } catch (const std::exception& e) {
                spdlog::error("Acquisition for '{}' aborted: {}", name, e.what());
            }
        });
    }
    RunBatched(jobs, config_.max_parallel_acquisitions);

    spdlog::info("✓ Acquired {} of {} names ({} sandboxes tracked)",
                 overrides.size(), names.size(), TrackedCount());
    for (const auto& name : names) {
        if (overrides.count(name) == 0) {
            spdlog::warn("  '{}' unavailable", name);
        }
    }

    return overrides;
}

void SandboxResourceManager::AcquireGrouped(const std::vector<std::string>& names,
                                            const ParamsByName& params,
                                            EndpointOverrideMap& overrides) {
    json merged = json::object();
    for (const auto& name : names) {
        auto it = params.find(name);
        if (it != params.end() && it->second.is_object()) {
            merged.update(it->second);
        }
    }

    const auto& resource_type = config_.names.GroupedResourceType();
    auto descriptor = client_.Acquire(resource_type, merged);
    if (!descriptor) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    descriptors_.push_back(*descriptor);

    for (const auto& name : names) {
        auto key = config_.names.ResponseKeyFor(name);
        auto url = descriptor->FindEndpoint(key);
        if (!url) {
            spdlog::warn("Shared sandbox '{}' has no endpoint '{}' for '{}'",
                         descriptor->id, key, name);
            continue;
        }
        overrides[name] = *url;
        spdlog::info("  {} → {}", name, *url);
    }
}

void SandboxResourceManager::AcquireUngrouped(const std::string& name,
                                              const ParamsByName& params,
                                              EndpointOverrideMap& overrides) {
    auto resource_type = config_.names.ResourceTypeFor(name);

    auto it = params.find(name);
    auto descriptor = client_.Acquire(resource_type, it != params.end() ? it->second : json());
    if (!descriptor) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    descriptors_.push_back(*descriptor);

    if (descriptor->endpoints.empty()) {
        spdlog::warn("Sandbox '{}' for '{}' published no endpoints", descriptor->id, name);
        return;
    }

    const auto& [key, url] = descriptor->endpoints.front();
    const std::string& result_key = key == resource_type ? name : key;
    overrides[result_key] = url;
    spdlog::info("  {} → {}", result_key, url);
}

// ============================================================================
// RELEASE
// ============================================================================

void SandboxResourceManager::ReleaseAll() {
    std::vector<ResourceDescriptor> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(descriptors_);
    }

    if (pending.empty()) {
        spdlog::debug("No sandboxes to release");
        return;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("RELEASING {} SANDBOXES", pending.size());
    spdlog::info("═══════════════════════════════════════════════════════════════");

    std::set<std::pair<std::string, std::string>> seen;
    std::vector<std::function<void()>> jobs;
    std::atomic<std::size_t> failures{0};

    for (const auto& descriptor : pending) {
        if (!seen.emplace(descriptor.resource_type, descriptor.id).second) {
            spdlog::debug("Sandbox '{}' tracked twice, releasing once", descriptor.id);
            continue;
        }
        jobs.emplace_back([this, &descriptor, &failures]() {
            try {
                if (!client_.Release(descriptor.resource_type, descriptor.id)) {
                    failures++;
                }
            } catch (const std::exception& e) {
                spdlog::warn("Failed to release sandbox '{}': {}", descriptor.id, e.what());
                failures++;
            }
        });
    }
    RunBatched(jobs, config_.max_parallel_releases);

    if (failures > 0) {
        spdlog::warn("⚠ {} of {} releases failed; session cleared regardless",
                     failures.load(), jobs.size());
    } else {
        spdlog::info("✓ Released {} sandboxes", jobs.size());
    }
}

std::vector<ResourceDescriptor> SandboxResourceManager::Detach() {
    std::vector<ResourceDescriptor> detached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        detached.swap(descriptors_);
    }
    if (!detached.empty()) {
        spdlog::info("Detached {} sandboxes; they will not be released by this session",
                     detached.size());
    }
    return detached;
}

// ============================================================================
// QUERIES
// ============================================================================

std::optional<json> SandboxResourceManager::GetDetails(const std::string& resource_type,
                                                       const std::string& id) const {
    return client_.Describe(resource_type, id);
}

std::vector<ResourceDescriptor> SandboxResourceManager::Descriptors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return descriptors_;
}

std::size_t SandboxResourceManager::TrackedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return descriptors_.size();
}

std::optional<std::string> SandboxResourceManager::FindSandboxId(const std::string& resource_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& descriptor : descriptors_) {
        const auto& name = descriptor.server_name.empty() ? descriptor.resource_type
                                                          : descriptor.server_name;
        if (name == resource_type) {
            return descriptor.id;
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace sandkeeper
