/**
 * @file config.cpp
 * @brief Configuration file parsing
 *
 * @date 2025
 */

#include "sandkeeper/core/config.hpp"
#include "sandkeeper/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace sandkeeper {
namespace core {

namespace {

const json* Section(const json& document, const char* name) {
    if (!document.contains(name)) {
        return nullptr;
    }
    const auto& section = document.at(name);
    if (!section.is_object()) {
        throw ConfigError(std::string("Section '") + name + "' must be an object");
    }
    return &section;
}

template <typename T>
void ReadValue(const json& section, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }
    try {
        target = section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void ReadSeconds(const json& section, const char* key, std::chrono::seconds& target) {
    long long seconds = target.count();
    ReadValue(section, key, seconds);
    if (seconds <= 0) {
        throw ConfigError(std::string("'") + key + "' must be a positive number of seconds");
    }
    target = std::chrono::seconds(seconds);
}

void ParseClient(const json& section, ClientConfig& client) {
    ReadValue(section, "api_base", client.api_base);
    ReadValue(section, "benchmark_tag", client.benchmark_tag);
    ReadValue(section, "credential_env", client.credential_env);
    ReadSeconds(section, "acquire_timeout", client.acquire_timeout);
    ReadSeconds(section, "describe_timeout", client.describe_timeout);
    ReadSeconds(section, "release_timeout", client.release_timeout);

    if (client.api_base.empty()) {
        throw ConfigError("'api_base' must not be empty");
    }
}

void ReadLimit(const json& section, const char* key, std::size_t& target) {
    long long limit = static_cast<long long>(target);
    ReadValue(section, key, limit);
    if (limit <= 0) {
        throw ConfigError(std::string("'") + key + "' must be at least 1");
    }
    target = static_cast<std::size_t>(limit);
}

void ParseManager(const json& section, ManagerConfig& manager) {
    ReadLimit(section, "max_parallel_acquisitions", manager.max_parallel_acquisitions);
    ReadLimit(section, "max_parallel_releases", manager.max_parallel_releases);
}

void ParseSync(const json& section, sync::SyncConfig& config) {
    std::string value;
    if (section.contains("default_strategy")) {
        ReadValue(section, "default_strategy", value);
        config.default_strategy = ParseUploadStrategy(value);
    }

    if (section.contains("strategies")) {
        std::map<std::string, std::string> strategies;
        ReadValue(section, "strategies", strategies);
        for (const auto& [resource_type, strategy] : strategies) {
            config.strategy_by_resource_type[resource_type] = ParseUploadStrategy(strategy);
        }
    }

    if (section.contains("download_mode")) {
        ReadValue(section, "download_mode", value);
        config.download_mode = ParseDownloadMode(value);
    }

    ReadSeconds(section, "timeout", config.timeout);
}

NameResolutionTable ParseNames(const json& section, const NameResolutionTable& defaults) {
    std::set<std::string> grouped = defaults.GroupedNames();
    std::string grouped_type = defaults.GroupedResourceType();
    std::map<std::string, std::string> response_keys = defaults.ResponseKeys();
    std::map<std::string, std::string> resource_types = defaults.ResourceTypes();

    ReadValue(section, "grouped", grouped);
    ReadValue(section, "grouped_resource_type", grouped_type);
    ReadValue(section, "response_keys", response_keys);
    ReadValue(section, "resource_types", resource_types);

    if (grouped_type.empty()) {
        throw ConfigError("'grouped_resource_type' must not be empty");
    }

    return NameResolutionTable(std::move(grouped), std::move(grouped_type),
                               std::move(response_keys), std::move(resource_types));
}

} // anonymous namespace

// ============================================================================
// PARSING
// ============================================================================

SandkeeperConfig ParseConfig(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    SandkeeperConfig config;

    if (const auto* client = Section(document, "client")) {
        ParseClient(*client, config.manager.client);
    }
    if (const auto* manager = Section(document, "manager")) {
        ParseManager(*manager, config.manager);
    }
    if (const auto* sync_section = Section(document, "sync")) {
        ParseSync(*sync_section, config.sync);
    }
    if (const auto* names = Section(document, "names")) {
        config.manager.names = ParseNames(*names, config.manager.names);
    }

    return config;
}

SandkeeperConfig LoadConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path.string());
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed config file " + path.string() + ": " + e.what());
    }

    auto config = ParseConfig(document);
    spdlog::info("Loaded configuration from {}", path.string());
    return config;
}

std::string LoadCredentialFromEnvironment(const std::string& env_var) {
    const char* value = std::getenv(env_var.c_str());
    if (value == nullptr || *value == '\0') {
        throw CredentialError("Environment variable " + env_var + " is not set");
    }
    return value;
}

// ============================================================================
// ENUM PARSING
// ============================================================================

sync::UploadStrategy ParseUploadStrategy(const std::string& value) {
    if (value == "signed-url" || value == "signed") {
        return sync::UploadStrategy::SIGNED_URL;
    }
    if (value == "multipart") {
        return sync::UploadStrategy::DIRECT_MULTIPART;
    }
    throw ConfigError("Unknown upload strategy: " + value);
}

sync::DownloadMode ParseDownloadMode(const std::string& value) {
    if (value == "signed-url" || value == "signed") {
        return sync::DownloadMode::SIGNED_URL;
    }
    if (value == "direct") {
        return sync::DownloadMode::DIRECT_STREAM;
    }
    throw ConfigError("Unknown download mode: " + value);
}

} // namespace core
} // namespace sandkeeper
