/**
 * @file http_client.cpp
 * @brief libcurl implementation of the HTTP transport
 *
 * Each request runs on a dedicated easy handle:
 * ```
 * curl_easy_init → setopt (url, verb, headers, body | mime, timeout)
 *               → curl_easy_perform → getinfo (status, content type)
 *               → curl_easy_cleanup
 * ```
 * CURLOPT_NOSIGNAL is set so that timeouts work from worker threads.
 * CURLOPT_FAILONERROR is left off: non-2xx responses are reported with
 * their status and body, and the caller decides what they mean.
 *
 * @date 2025
 */

#include "sandkeeper/utils/http_client.hpp"

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <mutex>
#include <stdexcept>

namespace sandkeeper {
namespace utils {

namespace {

std::once_flag g_curl_init_flag;

void EnsureCurlInitialized() {
    std::call_once(g_curl_init_flag, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

size_t BodyWriter(char* data, size_t size, size_t nmemb, void* user) {
    auto* body = static_cast<std::string*>(user);
    body->append(data, size * nmemb);
    return size * nmemb;
}

// Owns the handles allocated for one request.
struct EasyRequest {
    CURL* handle{nullptr};
    curl_slist* headers{nullptr};
    curl_mime* mime{nullptr};

    EasyRequest() : handle(curl_easy_init()) {}

    ~EasyRequest() {
        if (mime) curl_mime_free(mime);
        if (headers) curl_slist_free_all(headers);
        if (handle) curl_easy_cleanup(handle);
    }

    EasyRequest(const EasyRequest&) = delete;
    EasyRequest& operator=(const EasyRequest&) = delete;
};

#define SETOPT_OR_FAIL(handle, option, value)                              \
    do {                                                                   \
        CURLcode setopt_rc = curl_easy_setopt(handle, option, value);      \
        if (setopt_rc != CURLE_OK) {                                       \
            response.error_message = std::string("curl_easy_setopt(" #option \
                ") failed: ") + curl_easy_strerror(setopt_rc);             \
            return response;                                               \
        }                                                                  \
    } while (0)

} // anonymous namespace

std::string MethodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:    return "GET";
        case HttpMethod::POST:   return "POST";
        case HttpMethod::PUT:    return "PUT";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

CurlTransport::CurlTransport(std::string user_agent)
    : user_agent_(std::move(user_agent)) {
    EnsureCurlInitialized();
}

HttpResponse CurlTransport::Perform(const HttpRequest& request) {
    HttpResponse response;

    EasyRequest easy;
    if (!easy.handle) {
        response.error_message = "unable to initialize libcurl handle";
        return response;
    }

    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    SETOPT_OR_FAIL(easy.handle, CURLOPT_URL, request.url.c_str());
    SETOPT_OR_FAIL(easy.handle, CURLOPT_USERAGENT, user_agent_.c_str());
    SETOPT_OR_FAIL(easy.handle, CURLOPT_NOSIGNAL, 1L);
    SETOPT_OR_FAIL(easy.handle, CURLOPT_NOPROGRESS, 1L);
    SETOPT_OR_FAIL(easy.handle, CURLOPT_FOLLOWLOCATION, 1L);
    SETOPT_OR_FAIL(easy.handle, CURLOPT_ERRORBUFFER, error_buffer);
    SETOPT_OR_FAIL(easy.handle, CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
    SETOPT_OR_FAIL(easy.handle, CURLOPT_WRITEFUNCTION, &BodyWriter);
    SETOPT_OR_FAIL(easy.handle, CURLOPT_WRITEDATA, &response.body);

    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(easy.headers, line.c_str());
        if (!appended) {
            response.error_message = "failed to build request headers";
            return response;
        }
        easy.headers = appended;
    }

    switch (request.method) {
        case HttpMethod::GET:
            SETOPT_OR_FAIL(easy.handle, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::DELETE:
            SETOPT_OR_FAIL(easy.handle, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
        case HttpMethod::POST:
        case HttpMethod::PUT:
            if (request.method == HttpMethod::PUT) {
                SETOPT_OR_FAIL(easy.handle, CURLOPT_CUSTOMREQUEST, "PUT");
            }
            if (!request.multipart.empty()) {
                easy.mime = curl_mime_init(easy.handle);
                for (const auto& part : request.multipart) {
                    curl_mimepart* mime_part = curl_mime_addpart(easy.mime);
                    curl_mime_name(mime_part, part.name.c_str());
                    if (!part.file_path.empty()) {
                        CURLcode rc = curl_mime_filedata(mime_part, part.file_path.string().c_str());
                        if (rc != CURLE_OK) {
                            response.error_message = "cannot attach " + part.file_path.string() +
                                                     ": " + curl_easy_strerror(rc);
                            return response;
                        }
                    } else {
                        curl_mime_data(mime_part, part.data.data(), part.data.size());
                    }
                    // Set after filedata, which overwrites the filename with the basename.
                    if (!part.filename.empty()) {
                        curl_mime_filename(mime_part, part.filename.c_str());
                    }
                    if (!part.content_type.empty()) {
                        curl_mime_type(mime_part, part.content_type.c_str());
                    }
                }
                SETOPT_OR_FAIL(easy.handle, CURLOPT_MIMEPOST, easy.mime);
            } else {
                SETOPT_OR_FAIL(easy.handle, CURLOPT_POST, 1L);
                SETOPT_OR_FAIL(easy.handle, CURLOPT_POSTFIELDSIZE_LARGE,
                               static_cast<curl_off_t>(request.body.size()));
                SETOPT_OR_FAIL(easy.handle, CURLOPT_POSTFIELDS, request.body.data());
            }
            break;
    }

    if (easy.headers) {
        SETOPT_OR_FAIL(easy.handle, CURLOPT_HTTPHEADER, easy.headers);
    }

    spdlog::debug("{} {}", MethodToString(request.method), request.url);

    CURLcode rc = curl_easy_perform(easy.handle);
    if (rc != CURLE_OK) {
        response.error_message = error_buffer[0] != '\0' ? std::string(error_buffer)
                                                         : std::string(curl_easy_strerror(rc));
        spdlog::debug("curl_easy_perform returned CURLcode {}: {}",
                      static_cast<int>(rc), response.error_message);
        return response;
    }

    response.transport_ok = true;
    curl_easy_getinfo(easy.handle, CURLINFO_RESPONSE_CODE, &response.status_code);

    char* content_type = nullptr;
    if (curl_easy_getinfo(easy.handle, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK &&
        content_type) {
        response.content_type = content_type;
    }

    spdlog::debug("{} {} -> {} ({} bytes)", MethodToString(request.method), request.url,
                  response.status_code, response.body.size());
    return response;
}

std::shared_ptr<HttpTransport> MakeDefaultTransport() {
    return std::make_shared<CurlTransport>();
}

} // namespace utils
} // namespace sandkeeper
