/**
 * @file http_client.hpp
 * @brief Blocking HTTP transport used for every remote call
 *
 * Declares the request/response value types, the abstract HttpTransport
 * seam that the resource client and workspace sync talk to, and the
 * libcurl-backed implementation used in production. Tests substitute a
 * scripted transport behind the same interface.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sandkeeper {
namespace utils {

/**
 * @enum HttpMethod
 * @brief Request verbs used by the provisioning and transfer protocols
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE
};

/**
 * @struct MultipartPart
 * @brief One part of a multipart/form-data body
 *
 * A part is either backed by a file on disk (file_path set) or by
 * in-memory data.
 */
struct MultipartPart {
    std::string name;                   ///< Form field name
    std::string filename;               ///< Filename sent in Content-Disposition (may be empty)
    std::filesystem::path file_path;    ///< Source file, empty for data parts
    std::string data;                   ///< Inline content for data parts
    std::string content_type;           ///< Optional part Content-Type
};

/**
 * @struct HttpRequest
 * @brief Fully described HTTP request
 */
struct HttpRequest {
    HttpMethod method{HttpMethod::GET};
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;                           ///< Raw body (ignored when multipart is set)
    std::vector<MultipartPart> multipart;       ///< multipart/form-data parts
    std::chrono::seconds timeout{60};           ///< Whole-transfer timeout
};

/**
 * @struct HttpResponse
 * @brief Outcome of a single request
 *
 * transport_ok is false when no HTTP status was obtained at all (DNS,
 * connect, TLS or timeout failure); error_message then describes why.
 */
struct HttpResponse {
    bool transport_ok{false};
    long status_code{0};
    std::string content_type;
    std::string body;
    std::string error_message;

    bool IsSuccess() const {
        return transport_ok && status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Human readable verb
 */
std::string MethodToString(HttpMethod method);

/**
 * @class HttpTransport
 * @brief Abstract blocking HTTP transport
 *
 * Implementations must be safe to call from several threads at once; the
 * resource manager issues independent acquisitions in parallel.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform a request and wait for the complete response
     * @param request Request description
     * @return Response; never throws for network or HTTP level failures
     */
    virtual HttpResponse Perform(const HttpRequest& request) = 0;
};

/**
 * @class CurlTransport
 * @brief HttpTransport on top of the libcurl easy interface
 *
 * Every call uses its own easy handle, so a single CurlTransport may be
 * shared between threads. curl_global_init is performed once per process.
 *
 * **Usage Example**:
 * @code
 * CurlTransport transport;
 *
 * HttpRequest request;
 * request.method = HttpMethod::GET;
 * request.url = "https://api.klavis.ai/sandbox/local_dev/abc";
 * request.headers["Authorization"] = "Bearer " + api_key;
 * request.timeout = std::chrono::seconds(30);
 *
 * auto response = transport.Perform(request);
 * if (response.IsSuccess()) {
 *     std::cout << response.body << std::endl;
 * }
 * @endcode
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string user_agent = "sandkeeper/1.0");
    ~CurlTransport() override = default;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse Perform(const HttpRequest& request) override;

private:
    std::string user_agent_;
};

/**
 * @brief Default production transport
 */
std::shared_ptr<HttpTransport> MakeDefaultTransport();

} // namespace utils
} // namespace sandkeeper
