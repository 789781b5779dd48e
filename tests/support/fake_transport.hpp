/**
 * @file fake_transport.hpp
 * @brief In-process HTTP transports for tests
 *
 * - ScriptedTransport: canned responses per (method, URL), records every
 *   request it sees.
 * - FakeProvisioningService: a small stateful imitation of the provisioning
 *   service, including signed storage URLs.
 */

#pragma once

#include "sandkeeper/utils/http_client.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace sandkeeper {
namespace fakes {

inline utils::HttpResponse JsonResponse(long status, const nlohmann::json& body) {
    utils::HttpResponse response;
    response.transport_ok = true;
    response.status_code = status;
    response.content_type = "application/json";
    response.body = body.dump();
    return response;
}

inline utils::HttpResponse RawResponse(long status, std::string body,
                                       std::string content_type = "application/octet-stream") {
    utils::HttpResponse response;
    response.transport_ok = true;
    response.status_code = status;
    response.content_type = std::move(content_type);
    response.body = std::move(body);
    return response;
}

inline utils::HttpResponse TransportFailure(std::string message = "Couldn't connect to server") {
    utils::HttpResponse response;
    response.transport_ok = false;
    response.error_message = std::move(message);
    return response;
}

/**
 * @class ScriptedTransport
 * @brief Routes requests to handlers by exact method and URL
 *
 * Unrouted requests get a 404. Safe to call from several threads.
 */
class ScriptedTransport : public utils::HttpTransport {
public:
    using Handler = std::function<utils::HttpResponse(const utils::HttpRequest&)>;

    void On(utils::HttpMethod method, const std::string& url, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[{method, url}] = std::move(handler);
    }

    void On(utils::HttpMethod method, const std::string& url, utils::HttpResponse response) {
        On(method, url, [response](const utils::HttpRequest&) { return response; });
    }

    utils::HttpResponse Perform(const utils::HttpRequest& request) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            auto it = routes_.find({request.method, request.url});
            if (it != routes_.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            return JsonResponse(404, {{"error", "no route for " + request.url}});
        }
        return handler(request);
    }

    std::vector<utils::HttpRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::size_t RequestCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::size_t CountRequests(utils::HttpMethod method, const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& request : requests_) {
            if (request.method == method && request.url == url) {
                count++;
            }
        }
        return count;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::pair<utils::HttpMethod, std::string>, Handler> routes_;
    std::vector<utils::HttpRequest> requests_;
};

/**
 * @class FakeProvisioningService
 * @brief Stateful stand-in for the provisioning service and its storage
 *
 * API paths live under kApiBase, signed storage URLs under kStorageBase.
 * Each sandbox keeps the last archive written to it; the dump endpoint
 * hands it back through a signed read URL. A multipart upload is repacked
 * into such an archive from its `files` parts.
 */
class FakeProvisioningService : public utils::HttpTransport {
public:
    static constexpr const char* kApiBase = "http://provisioning.test";
    static constexpr const char* kStorageBase = "http://storage.test";

    /// Endpoint keys published for the grouped resource type
    std::vector<std::string> grouped_endpoint_keys{"filesystem", "terminal"};

    utils::HttpResponse Perform(const utils::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_++;

        const std::string api = kApiBase;
        const std::string storage = kStorageBase;

        if (request.url.compare(0, storage.size(), storage) == 0) {
            return HandleStorage(request, request.url.substr(storage.size()));
        }
        if (request.url.compare(0, api.size(), api) != 0) {
            return TransportFailure("Could not resolve host");
        }
        if (request.headers.count("Authorization") == 0) {
            return JsonResponse(401, {{"error", "missing credential"}});
        }

        auto parts = Split(request.url.substr(api.size()));
        if (parts.size() < 2 || parts[0] != "sandbox") {
            return JsonResponse(404, {{"error", "not found"}});
        }
        const std::string& type = parts[1];

        if (parts.size() == 2 && request.method == utils::HttpMethod::POST) {
            return Create(type, request);
        }
        if (parts.size() < 3) {
            return JsonResponse(405, {{"error", "method not allowed"}});
        }

        const std::string& id = parts[2];
        if (live_.count(id) == 0) {
            return JsonResponse(404, {{"error", "unknown sandbox " + id}});
        }

        if (parts.size() == 3) {
            if (request.method == utils::HttpMethod::DELETE) {
                live_.erase(id);
                released_.push_back(id);
                return JsonResponse(200, {{"status", "deleted"}});
            }
            if (request.method == utils::HttpMethod::GET) {
                return JsonResponse(200, {{"id", id}, {"resource_type", types_[id]}, {"status", "running"}});
            }
            return JsonResponse(405, {{"error", "method not allowed"}});
        }

        const std::string& action = parts[3];
        if (action == "upload-url" && request.method == utils::HttpMethod::POST) {
            return JsonResponse(200, {{"upload_url", storage + "/upload/" + id}});
        }
        if (action == "initialize" && request.method == utils::HttpMethod::POST) {
            if (pending_.count(id) == 0) {
                return JsonResponse(409, {{"error", "nothing uploaded"}});
            }
            workspaces_[id] = pending_[id];
            pending_.erase(id);
            return JsonResponse(200, {{"status", "initialized"}});
        }
        if (action == "upload" && request.method == utils::HttpMethod::POST) {
            return AcceptMultipart(id, request);
        }
        if (action == "dump" && request.method == utils::HttpMethod::GET) {
            return JsonResponse(200, {{"download_url", storage + "/download/" + id}});
        }
        return JsonResponse(404, {{"error", "unknown action " + action}});
    }

    std::set<std::string> LiveIds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<std::string> ids;
        for (const auto& [id, type] : live_) {
            ids.insert(id);
        }
        return ids;
    }

    std::vector<std::string> ReleasedIds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return released_;
    }

    std::string WorkspaceOf(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workspaces_.find(id);
        return it != workspaces_.end() ? it->second : std::string();
    }

    std::size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::size_t calls_{0};
    int next_id_{1};
    std::map<std::string, std::string> live_;        ///< id → resource type
    std::map<std::string, std::string> types_;
    std::map<std::string, std::string> pending_;     ///< id → archive awaiting initialize
    std::map<std::string, std::string> workspaces_;  ///< id → current workspace archive
    std::vector<std::string> released_;

    static std::vector<std::string> Split(const std::string& path) {
        std::vector<std::string> parts;
        std::stringstream ss(path);
        std::string part;
        while (std::getline(ss, part, '/')) {
            if (!part.empty()) {
                parts.push_back(part);
            }
        }
        return parts;
    }

    utils::HttpResponse Create(const std::string& type, const utils::HttpRequest& request) {
        auto body = nlohmann::json::parse(request.body, nullptr, false);
        if (body.is_discarded() || !body.contains("benchmark")) {
            return JsonResponse(400, {{"error", "benchmark required"}});
        }

        std::string id = "sbx-" + std::to_string(next_id_++);
        live_[id] = type;
        types_[id] = type;

        nlohmann::ordered_json urls = nlohmann::ordered_json::object();
        if (type == "local_dev") {
            for (const auto& key : grouped_endpoint_keys) {
                urls[key] = "http://" + id + ".sandbox.test/" + key + "/mcp";
            }
        } else {
            urls[type] = "http://" + id + ".sandbox.test/mcp";
        }

        nlohmann::ordered_json response = {
            {"sandbox_id", id},
            {"server_name", type},
            {"server_urls", urls}
        };
        return RawResponse(200, response.dump(), "application/json");
    }

    static la_ssize_t AppendToString(archive*, void* client_data, const void* buffer, size_t length) {
        static_cast<std::string*>(client_data)->append(static_cast<const char*>(buffer), length);
        return static_cast<la_ssize_t>(length);
    }

    static std::string PackFiles(const std::map<std::string, std::string>& files) {
        std::string output;
        archive* a = archive_write_new();
        archive_write_add_filter_gzip(a);
        archive_write_set_format_pax_restricted(a);
        archive_write_open(a, &output, nullptr, &AppendToString, nullptr);

        for (const auto& [path, content] : files) {
            archive_entry* entry = archive_entry_new();
            archive_entry_set_pathname(entry, path.c_str());
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, 0644);
            archive_entry_set_size(entry, static_cast<la_int64_t>(content.size()));
            archive_write_header(a, entry);
            if (!content.empty()) {
                archive_write_data(a, content.data(), content.size());
            }
            archive_entry_free(entry);
        }

        archive_write_close(a);
        archive_write_free(a);
        return output;
    }

    utils::HttpResponse AcceptMultipart(const std::string& id, const utils::HttpRequest& request) {
        std::map<std::string, std::string> files;
        nlohmann::json listed = nlohmann::json::array();

        for (const auto& part : request.multipart) {
            if (part.name == "paths") {
                listed = nlohmann::json::parse(part.data, nullptr, false);
                continue;
            }
            if (part.name != "files" || part.filename.empty()) {
                return JsonResponse(400, {{"error", "unexpected part " + part.name}});
            }
            if (part.file_path.empty()) {
                files[part.filename] = part.data;
                continue;
            }
            std::ifstream file(part.file_path, std::ios::binary);
            if (!file.is_open()) {
                return JsonResponse(400, {{"error", "unreadable part " + part.filename}});
            }
            files[part.filename].assign(std::istreambuf_iterator<char>(file),
                                        std::istreambuf_iterator<char>());
        }

        if (files.empty() || !listed.is_array() || listed.size() != files.size()) {
            return JsonResponse(400, {{"error", "files and paths disagree"}});
        }

        workspaces_[id] = PackFiles(files);
        return JsonResponse(200, {{"status", "initialized"}, {"files", files.size()}});
    }

    utils::HttpResponse HandleStorage(const utils::HttpRequest& request, const std::string& path) {
        auto parts = Split(path);
        if (parts.size() != 2) {
            return RawResponse(404, "no such object");
        }
        const std::string& id = parts[1];

        if (parts[0] == "upload" && request.method == utils::HttpMethod::PUT) {
            pending_[id] = request.body;
            return RawResponse(200, "");
        }
        if (parts[0] == "download" && request.method == utils::HttpMethod::GET) {
            auto it = workspaces_.find(id);
            if (it == workspaces_.end()) {
                return RawResponse(404, "no such object");
            }
            return RawResponse(200, it->second, "application/gzip");
        }
        return RawResponse(405, "method not allowed");
    }
};

} // namespace fakes
} // namespace sandkeeper
