/**
 * @file remote_client.hpp
 * @brief Stateless client for the sandbox provisioning service
 *
 * Issues authenticated create / describe / delete calls for one physical
 * sandbox at a time:
 * ```
 * POST   {api_base}/sandbox/{resource_type}       → {id, server_name, server_urls}
 * GET    {api_base}/sandbox/{resource_type}/{id}  → details
 * DELETE {api_base}/sandbox/{resource_type}/{id}  → ack
 * ```
 * Nothing is retried: creating a sandbox is not idempotent, and a retried
 * POST could allocate a second one.
 *
 * @date 2025
 */

#pragma once

#include "sandkeeper/utils/http_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sandkeeper {
namespace core {

/**
 * @enum FailureKind
 * @brief Why a remote call failed
 *
 * Used for diagnostics only. Callers of Acquire see every kind the same
 * way: the resource was not obtained.
 */
enum class FailureKind {
    TRANSPORT,          ///< Network error or timeout, no HTTP status
    REMOTE_REJECTION,   ///< Non-2xx status
    RESPONSE_SHAPE      ///< 2xx but body missing an expected field
};

std::string FailureKindToString(FailureKind kind);

/**
 * @struct RemoteFailure
 * @brief Classified failure of one remote call
 */
struct RemoteFailure {
    FailureKind kind{FailureKind::TRANSPORT};
    std::string message;
};

/**
 * @struct ClientConfig
 * @brief Provisioning service endpoint and per-call timeouts
 */
struct ClientConfig {
    std::string api_base{"https://api.klavis.ai"};     ///< Service root, no trailing slash
    std::string benchmark_tag{"MCP_Atlas"};            ///< Sent as "benchmark" on every create
    std::string credential_env{"KLAVIS_API_KEY"};      ///< Environment variable holding the key
    std::chrono::seconds acquire_timeout{60};
    std::chrono::seconds describe_timeout{30};
    std::chrono::seconds release_timeout{30};
};

/**
 * @struct ResourceDescriptor
 * @brief One physical sandbox obtained from the service
 *
 * endpoints keeps the order in which the service listed its server_urls.
 */
struct ResourceDescriptor {
    std::string id;                 ///< Opaque sandbox identifier
    std::string resource_type;      ///< Type used to create it (and to delete it)
    std::string server_name;        ///< Name reported by the service, may be empty
    std::vector<std::pair<std::string, std::string>> endpoints;  ///< response key → URL

    /**
     * @brief URL published under key, if any
     */
    std::optional<std::string> FindEndpoint(const std::string& key) const;
};

/**
 * @class RemoteResourceClient
 * @brief Thin request/response wrapper over HttpTransport
 *
 * Copyable and stateless apart from its configuration; copies share the
 * transport.
 *
 * **Usage Example**:
 * @code
 * RemoteResourceClient client(ClientConfig{}, api_key, utils::MakeDefaultTransport());
 *
 * auto sandbox = client.Acquire("local_dev");
 * if (sandbox) {
 *     for (const auto& [key, url] : sandbox->endpoints) {
 *         std::cout << key << " → " << url << std::endl;
 *     }
 *     client.Release(sandbox->resource_type, sandbox->id);
 * }
 * @endcode
 */
class RemoteResourceClient {
public:
    /**
     * @brief Construct client
     * @param config Endpoint and timeouts
     * @param api_key Bearer credential
     * @param transport HTTP transport (libcurl when null)
     * @throws CredentialError if api_key is empty
     */
    RemoteResourceClient(ClientConfig config,
                         std::string api_key,
                         std::shared_ptr<utils::HttpTransport> transport = nullptr);

    /**
     * @brief Create one sandbox
     *
     * The request body is extra_params with "benchmark" set to the
     * configured tag; the tag wins over an extra param of the same name.
     *
     * @param resource_type Remote resource type
     * @param extra_params JSON object merged into the body (null for none)
     * @return Descriptor, or nullopt on any failure (already logged)
     */
    std::optional<ResourceDescriptor> Acquire(const std::string& resource_type,
                                              const nlohmann::json& extra_params = nullptr) const;

    /**
     * @brief Fetch details of an existing sandbox
     * @return Parsed JSON body, or nullopt on any failure (already logged)
     */
    std::optional<nlohmann::json> Describe(const std::string& resource_type,
                                           const std::string& id) const;

    /**
     * @brief Delete a sandbox
     * @return true on a 2xx response; failures are logged, never thrown
     */
    bool Release(const std::string& resource_type, const std::string& id) const;

    /**
     * @brief URL of a sandbox collection, sandbox or sandbox sub-resource
     *
     * SandboxUrl("local_dev")                  → {api_base}/sandbox/local_dev
     * SandboxUrl("local_dev", "42")            → {api_base}/sandbox/local_dev/42
     * SandboxUrl("local_dev", "42", "dump")    → {api_base}/sandbox/local_dev/42/dump
     */
    std::string SandboxUrl(const std::string& resource_type,
                           const std::string& id = "",
                           const std::string& action = "") const;

    /**
     * @brief Request carrying the bearer credential
     */
    utils::HttpRequest AuthorizedRequest(utils::HttpMethod method,
                                         const std::string& url,
                                         std::chrono::seconds timeout) const;

    /**
     * @brief Classify a response that is not a success
     * @return nullopt for 2xx responses
     */
    static std::optional<RemoteFailure> CheckResponse(const utils::HttpResponse& response);

    /**
     * @brief Parse a create response body
     *
     * Accepts "id" or, failing that, "sandbox_id". A body with an id but a
     * malformed server_urls still yields a descriptor (with no endpoints)
     * because the sandbox exists remotely and must be released.
     *
     * @param failure Set when nullopt is returned
     */
    static std::optional<ResourceDescriptor> ParseDescriptor(const std::string& resource_type,
                                                             const std::string& body,
                                                             RemoteFailure& failure);

    const ClientConfig& GetConfig() const { return config_; }
    std::shared_ptr<utils::HttpTransport> Transport() const { return transport_; }

private:
    ClientConfig config_;
    std::string api_key_;
    std::shared_ptr<utils::HttpTransport> transport_;
};

} // namespace core
} // namespace sandkeeper
