/**
 * @file main.cpp
 * @brief Sandkeeper - Command-line interface
 *
 * Operator front-end for the sandbox resource manager and workspace sync:
 * acquire and release remote sandboxes, inspect them, and move workspace
 * trees in and out of them.
 *
 * @author Sandkeeper Development Team
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "sandkeeper/core/config.hpp"
#include "sandkeeper/core/errors.hpp"
#include "sandkeeper/core/resource_manager.hpp"
#include "sandkeeper/sync/workspace_sync.hpp"
#include "sandkeeper/utils/hash_utils.hpp"

#include <iostream>
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/


void PrintBanner() {
    std::cerr << R"(
╔═══════════════════════════════════════════════════════════════╗
║                                                               ║
║                  S A N D K E E P E R                          ║
║          Remote sandbox provisioning & workspace sync         ║
║                              v1.0.0                           ║
║                                                               ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}


std::string FormatFileSize(std::size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}


void PrintAcquisitionSummary(const std::set<std::string>& requested,
                             const sandkeeper::core::EndpointOverrideMap& overrides) {
    std::cerr << "\n";
    std::cerr << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cerr << "║                    ACQUISITION SUMMARY                        ║\n";
    std::cerr << "╚═══════════════════════════════════════════════════════════════╝\n";

    for (const auto& name : requested) {
        auto it = overrides.find(name);
        std::cerr << "  " << (it != overrides.end() ? "[OK]   " : "[FAIL] ") << name;
        if (it != overrides.end()) {
            std::cerr << " → " << it->second;
        }
        std::cerr << "\n";
    }
    // Ungrouped responses may publish under a key other than the requested name
    for (const auto& [key, url] : overrides) {
        if (requested.count(key) == 0) {
            std::cerr << "  [OK]   " << key << " → " << url << "\n";
        }
    }
    std::cerr << std::endl;
}


sandkeeper::core::ParamsByName LoadParamsFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw sandkeeper::ConfigError("Cannot open params file: " + path);
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw sandkeeper::ConfigError("Malformed params file " + path + ": " + e.what());
    }
    if (!document.is_object()) {
        throw sandkeeper::ConfigError("Params file must map names to objects: " + path);
    }

    sandkeeper::core::ParamsByName params;
    for (const auto& [name, value] : document.items()) {
        params[name] = value;
    }
    return params;
}


json DescriptorToJson(const sandkeeper::core::ResourceDescriptor& descriptor) {
    json endpoints = json::object();
    for (const auto& [key, url] : descriptor.endpoints) {
        endpoints[key] = url;
    }
    return {
        {"id", descriptor.id},
        {"resource_type", descriptor.resource_type},
        {"server_name", descriptor.server_name},
        {"server_urls", endpoints}
    };
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    // Configure CLI parser
    CLI::App app{"Sandkeeper - remote sandbox manager"};
    app.footer("\nCredential is read from $KLAVIS_API_KEY unless the config names another variable.");
    app.require_subcommand(1);

    std::string config_path;
    std::string api_base;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--api-base", api_base, "Override the provisioning service URL");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // acquire
    auto* acquire_cmd = app.add_subcommand("acquire", "Acquire sandboxes for logical service names");
    std::vector<std::string> names;
    std::string params_path;
    bool keep = false;
    acquire_cmd->add_option("names", names, "Logical service names")->required();
    acquire_cmd->add_option("-p,--params", params_path, "JSON file of per-name create parameters")
        ->check(CLI::ExistingFile);
    acquire_cmd->add_flag("--keep", keep, "Leave sandboxes running and print their descriptors");

    // release / details
    std::string resource_type;
    std::string sandbox_id;
    auto* release_cmd = app.add_subcommand("release", "Delete one sandbox");
    release_cmd->add_option("type", resource_type, "Resource type")->required();
    release_cmd->add_option("id", sandbox_id, "Sandbox id")->required();

    auto* details_cmd = app.add_subcommand("details", "Describe one sandbox");
    details_cmd->add_option("type", resource_type, "Resource type")->required();
    details_cmd->add_option("id", sandbox_id, "Sandbox id")->required();

    // upload / upload-tarball / download
    std::string local_path;
    std::string strategy;
    std::string mode;
    std::string sync_type = sandkeeper::core::kGroupedResourceType;

    auto* upload_cmd = app.add_subcommand("upload", "Upload a workspace directory into a sandbox");
    upload_cmd->add_option("id", sandbox_id, "Sandbox id")->required();
    upload_cmd->add_option("dir", local_path, "Workspace directory")
        ->required()
        ->check(CLI::ExistingDirectory);
    upload_cmd->add_option("-t,--resource-type", sync_type, "Resource type of the sandbox")
        ->default_val(sandkeeper::core::kGroupedResourceType);
    upload_cmd->add_option("-s,--strategy", strategy, "Upload strategy")
        ->check(CLI::IsMember({"signed", "signed-url", "multipart"}));

    auto* tarball_cmd = app.add_subcommand("upload-tarball", "Upload a pre-built tar.gz into a sandbox");
    tarball_cmd->add_option("id", sandbox_id, "Sandbox id")->required();
    tarball_cmd->add_option("file", local_path, "Tarball")
        ->required()
        ->check(CLI::ExistingFile);
    tarball_cmd->add_option("-t,--resource-type", sync_type, "Resource type of the sandbox")
        ->default_val(sandkeeper::core::kGroupedResourceType);

    auto* download_cmd = app.add_subcommand("download", "Download a sandbox workspace");
    download_cmd->add_option("id", sandbox_id, "Sandbox id")->required();
    download_cmd->add_option("dir", local_path, "Destination directory")->required();
    download_cmd->add_option("-t,--resource-type", sync_type, "Resource type of the sandbox")
        ->default_val(sandkeeper::core::kGroupedResourceType);
    download_cmd->add_option("-m,--mode", mode, "Download mode")
        ->check(CLI::IsMember({"signed", "signed-url", "direct"}));

    // manifest
    auto* manifest_cmd = app.add_subcommand("manifest", "Print SHA-256 digests of a directory tree");
    manifest_cmd->add_option("dir", local_path, "Directory")
        ->required()
        ->check(CLI::ExistingDirectory);

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        // Manifest needs neither configuration nor credential
        if (*manifest_cmd) {
            json manifest = json::array();
            for (const auto& digest : sandkeeper::utils::HashUtils::BuildManifest(local_path)) {
                manifest.push_back({
                    {"path", digest.relative_path},
                    {"size", digest.size},
                    {"sha256", digest.sha256}
                });
            }
            std::cout << manifest.dump(2) << std::endl;
            return 0;
        }

        PrintBanner();

        sandkeeper::core::SandkeeperConfig config;
        if (!config_path.empty()) {
            config = sandkeeper::core::LoadConfigFile(config_path);
        }
        if (!api_base.empty()) {
            config.manager.client.api_base = api_base;
        }

        const auto& client_config = config.manager.client;
        std::string api_key = sandkeeper::core::LoadCredentialFromEnvironment(client_config.credential_env);

        if (*acquire_cmd) {
            std::set<std::string> requested(names.begin(), names.end());
            sandkeeper::core::ParamsByName params;
            if (!params_path.empty()) {
                params = LoadParamsFile(params_path);
            }

            sandkeeper::core::SandboxResourceManager manager(config.manager, api_key);
            auto overrides = manager.AcquireMany(requested, params);

            PrintAcquisitionSummary(requested, overrides);

            json output = {{"endpoints", overrides}};
            if (keep) {
                json descriptors = json::array();
                for (const auto& descriptor : manager.Detach()) {
                    descriptors.push_back(DescriptorToJson(descriptor));
                }
                output["sandboxes"] = descriptors;
            } else {
                manager.ReleaseAll();
            }
            std::cout << output.dump(2) << std::endl;

            return overrides.size() >= requested.size() ? 0 : 2;
        }

        sandkeeper::core::RemoteResourceClient client(client_config, api_key);

        if (*release_cmd) {
            return client.Release(resource_type, sandbox_id) ? 0 : 1;
        }

        if (*details_cmd) {
            auto details = client.Describe(resource_type, sandbox_id);
            if (!details) {
                return 1;
            }
            std::cout << details->dump(2) << std::endl;
            return 0;
        }

        if (!strategy.empty()) {
            config.sync.strategy_by_resource_type[sync_type] = sandkeeper::core::ParseUploadStrategy(strategy);
        }
        if (!mode.empty()) {
            config.sync.download_mode = sandkeeper::core::ParseDownloadMode(mode);
        }
        sandkeeper::sync::WorkspaceSync sync(client, config.sync);

        if (*upload_cmd || *tarball_cmd) {
            auto result = *upload_cmd ? sync.Upload(sandbox_id, local_path, sync_type)
                                      : sync.UploadTarball(sandbox_id, local_path, sync_type);

            spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
            if (result.status == sandkeeper::sync::UploadStatus::NOTHING_TO_UPLOAD) {
                spdlog::info("[DONE] {}", result.message);
            } else {
                spdlog::info("[DONE] {} files, {} via {}", result.file_count,
                             FormatFileSize(result.payload_bytes),
                             sandkeeper::sync::UploadStrategyToString(result.strategy));
                if (!result.archive_sha256.empty()) {
                    spdlog::info("[DONE] Archive SHA-256: {}", result.archive_sha256);
                }
            }
            return 0;
        }

        if (*download_cmd) {
            auto result = sync.Download(sandbox_id, local_path, sync_type);

            spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
            spdlog::info("[DONE] Archive: {}", FormatFileSize(result.archive_bytes));
            spdlog::info("[DONE] Files: {}, directories: {}, links: {}",
                         result.extracted.files, result.extracted.directories, result.extracted.links);
            return 0;
        }

        return 0;

    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const sandkeeper::CredentialError& e) {
        spdlog::error("[ERROR] Credential error: {}", e.what());
        return 1;
    } catch (const sandkeeper::ConfigError& e) {
        spdlog::error("[ERROR] Configuration error: {}", e.what());
        return 1;
    } catch (const sandkeeper::SyncError& e) {
        spdlog::error("[ERROR] Sync failed: {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
