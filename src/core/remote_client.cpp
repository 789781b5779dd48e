/**
 * @file remote_client.cpp
 * @brief Implementation of the provisioning service client
 *
 * Responses are parsed with nlohmann::ordered_json so that server_urls
 * keeps the order the service sent it in; the resource manager relies on
 * "first endpoint" meaning the first one listed.
 *
 * @date 2025
 */

#include "sandkeeper/core/remote_client.hpp"
#include "sandkeeper/core/errors.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace sandkeeper {
namespace core {

std::string FailureKindToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::TRANSPORT:        return "transport failure";
        case FailureKind::REMOTE_REJECTION: return "remote rejection";
        case FailureKind::RESPONSE_SHAPE:   return "malformed response";
    }
    return "unknown failure";
}

std::optional<std::string> ResourceDescriptor::FindEndpoint(const std::string& key) const {
    for (const auto& [endpoint_key, url] : endpoints) {
        if (endpoint_key == key) {
            return url;
        }
    }
    return std::nullopt;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

RemoteResourceClient::RemoteResourceClient(ClientConfig config,
                                           std::string api_key,
                                           std::shared_ptr<utils::HttpTransport> transport)
    : config_(std::move(config))
    , api_key_(std::move(api_key))
    , transport_(std::move(transport)) {

    if (api_key_.empty()) {
        throw CredentialError("API key is required (set " + config_.credential_env + ")");
    }

    while (!config_.api_base.empty() && config_.api_base.back() == '/') {
        config_.api_base.pop_back();
    }

    if (!transport_) {
        transport_ = utils::MakeDefaultTransport();
    }

    spdlog::debug("Remote resource client for {}", config_.api_base);
}

// ============================================================================
// REQUEST HELPERS
// ============================================================================

std::string RemoteResourceClient::SandboxUrl(const std::string& resource_type,
                                             const std::string& id,
                                             const std::string& action) const {
    std::string url = config_.api_base + "/sandbox/" + resource_type;
    if (!id.empty()) {
        url += "/" + id;
    }
    if (!action.empty()) {
        url += "/" + action;
    }
    return url;
}

utils::HttpRequest RemoteResourceClient::AuthorizedRequest(utils::HttpMethod method,
                                                           const std::string& url,
                                                           std::chrono::seconds timeout) const {
    utils::HttpRequest request;
    request.method = method;
    request.url = url;
    request.timeout = timeout;
    request.headers["Authorization"] = "Bearer " + api_key_;
    return request;
}

std::optional<RemoteFailure> RemoteResourceClient::CheckResponse(const utils::HttpResponse& response) {
    if (!response.transport_ok) {
        return RemoteFailure{FailureKind::TRANSPORT, response.error_message};
    }
    if (!response.IsSuccess()) {
        std::string message = "HTTP " + std::to_string(response.status_code);
        if (!response.body.empty()) {
            message += ": " + response.body.substr(0, 200);
        }
        return RemoteFailure{FailureKind::REMOTE_REJECTION, message};
    }
    return std::nullopt;
}

std::optional<ResourceDescriptor> RemoteResourceClient::ParseDescriptor(const std::string& resource_type,
                                                                        const std::string& body,
                                                                        RemoteFailure& failure) {
    failure.kind = FailureKind::RESPONSE_SHAPE;

    ordered_json j;
    try {
        j = ordered_json::parse(body);
    } catch (const ordered_json::parse_error& e) {
        failure.message = std::string("invalid JSON: ") + e.what();
        return std::nullopt;
    }

    if (!j.is_object()) {
        failure.message = "response is not a JSON object";
        return std::nullopt;
    }

    ResourceDescriptor descriptor;
    descriptor.resource_type = resource_type;

    for (const char* id_key : {"id", "sandbox_id"}) {
        if (j.contains(id_key) && j[id_key].is_string() && !j[id_key].get<std::string>().empty()) {
            descriptor.id = j[id_key].get<std::string>();
            break;
        }
        if (j.contains(id_key) && j[id_key].is_number_integer()) {
            descriptor.id = std::to_string(j[id_key].get<long long>());
            break;
        }
    }
    if (descriptor.id.empty()) {
        failure.message = "response has no sandbox id";
        return std::nullopt;
    }

    if (j.contains("server_name") && j["server_name"].is_string()) {
        descriptor.server_name = j["server_name"].get<std::string>();
    }

    if (j.contains("server_urls") && !j["server_urls"].is_null()) {
        const auto& urls = j["server_urls"];
        if (!urls.is_object()) {
            spdlog::warn("Sandbox {} ({}): server_urls is not an object, ignoring",
                         descriptor.id, resource_type);
        } else {
            for (const auto& [key, value] : urls.items()) {
                if (value.is_string()) {
                    descriptor.endpoints.emplace_back(key, value.get<std::string>());
                } else {
                    spdlog::warn("Sandbox {} ({}): endpoint '{}' is not a string, ignoring",
                                 descriptor.id, resource_type, key);
                }
            }
        }
    }

    return descriptor;
}

// ============================================================================
// OPERATIONS
// ============================================================================

std::optional<ResourceDescriptor> RemoteResourceClient::Acquire(const std::string& resource_type,
                                                                const json& extra_params) const {
    json body = json::object();
    if (extra_params.is_object()) {
        body = extra_params;
    } else if (!extra_params.is_null()) {
        spdlog::warn("Ignoring non-object parameters for '{}'", resource_type);
    }
    body["benchmark"] = config_.benchmark_tag;

    auto request = AuthorizedRequest(utils::HttpMethod::POST, SandboxUrl(resource_type),
                                     config_.acquire_timeout);
    request.headers["Content-Type"] = "application/json";
    request.body = body.dump();

    auto response = transport_->Perform(request);

    if (auto failure = CheckResponse(response)) {
        spdlog::error("Failed to acquire sandbox for '{}': {} ({})",
                      resource_type, FailureKindToString(failure->kind), failure->message);
        return std::nullopt;
    }

    RemoteFailure failure;
    auto descriptor = ParseDescriptor(resource_type, response.body, failure);
    if (!descriptor) {
        spdlog::error("Failed to acquire sandbox for '{}': {} ({})",
                      resource_type, FailureKindToString(failure.kind), failure.message);
        return std::nullopt;
    }

    spdlog::info("Acquired sandbox '{}' for '{}' ({} endpoints)",
                 descriptor->id, resource_type, descriptor->endpoints.size());
    return descriptor;
}

std::optional<json> RemoteResourceClient::Describe(const std::string& resource_type,
                                                   const std::string& id) const {
    auto request = AuthorizedRequest(utils::HttpMethod::GET, SandboxUrl(resource_type, id),
                                     config_.describe_timeout);
    auto response = transport_->Perform(request);

    if (auto failure = CheckResponse(response)) {
        spdlog::error("Failed to describe sandbox '{}' ({}): {} ({})",
                      id, resource_type, FailureKindToString(failure->kind), failure->message);
        return std::nullopt;
    }

    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to describe sandbox '{}' ({}): {} ({})",
                      id, resource_type, FailureKindToString(FailureKind::RESPONSE_SHAPE), e.what());
        return std::nullopt;
    }
}

bool RemoteResourceClient::Release(const std::string& resource_type, const std::string& id) const {
    auto request = AuthorizedRequest(utils::HttpMethod::DELETE, SandboxUrl(resource_type, id),
                                     config_.release_timeout);
    auto response = transport_->Perform(request);

    if (auto failure = CheckResponse(response)) {
        spdlog::warn("Failed to release sandbox '{}' ({}): {} ({})",
                     id, resource_type, FailureKindToString(failure->kind), failure->message);
        return false;
    }

    spdlog::info("Released sandbox '{}' for '{}'", id, resource_type);
    return true;
}

} // namespace core
} // namespace sandkeeper
