#include "call_relay/backend/client.hpp"

#include <utility>

#include "call_relay/logging.hpp"

namespace call_relay {

namespace {

std::string excerpt(const std::string& body) {
    constexpr size_t kMaxLength = 300;
    if (body.size() <= kMaxLength) {
        return body;
    }
    return body.substr(0, kMaxLength) + "...";
}

}

BackendClient::BackendClient(std::string base_url,
                             httplib::Headers default_headers,
                             BackendRequestOptions options)
    : base_url_(std::move(base_url)),
      url_(utils::parse_url(base_url_)),
      default_headers_(std::move(default_headers)),
      options_(options) {
    if (url_.scheme != "http" && url_.scheme != "https") {
        throw BackendError("Unsupported backend url scheme: " + url_.scheme);
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url_.scheme == "https") {
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }
#endif
}

nlohmann::json BackendClient::post_json(const std::string& path, const nlohmann::json& body) {
    auto client = make_client();
    const auto full_path = build_path(path);
    auto result = client->Post(full_path,
                               headers_with({{"Accept", "application/json"}}),
                               body.dump(),
                               "application/json");
    return nlohmann::json::parse(check(result, full_path).body);
}

nlohmann::json BackendClient::post_form(const std::string& path, const utils::QueryParams& form) {
    auto client = make_client();
    const auto full_path = build_path(path);
    auto result = client->Post(full_path,
                               headers_with({{"Accept", "application/json"}}),
                               utils::encode_query(form),
                               "application/x-www-form-urlencoded");
    return nlohmann::json::parse(check(result, full_path).body);
}

std::string BackendClient::post_json_for_binary(const std::string& path,
                                                const nlohmann::json& body,
                                                const std::string& accept) {
    auto client = make_client();
    const auto full_path = build_path(path);
    auto result = client->Post(full_path,
                               headers_with({{"Accept", accept}}),
                               body.dump(),
                               "application/json");
    return check(result, full_path).body;
}

std::unique_ptr<httplib::Client> BackendClient::make_client() const {
    auto client = std::make_unique<httplib::Client>(
        utils::build_url(url_.scheme, url_.host, url_.port, ""));
    client->set_connection_timeout(options_.connect_timeout.count(), 0);
    client->set_read_timeout(options_.sock_read_timeout.count(), 0);
    client->set_write_timeout(options_.request_timeout.count(), 0);
    return client;
}

std::string BackendClient::build_path(const std::string& path) const {
    return utils::join_path(url_.path, path);
}

httplib::Headers BackendClient::headers_with(httplib::Headers extra) const {
    for (const auto& header : default_headers_) {
        extra.emplace(header.first, header.second);
    }
    return extra;
}

const httplib::Response& BackendClient::check(const httplib::Result& result,
                                              const std::string& path) const {
    if (!result) {
        const auto reason = httplib::to_string(result.error());
        logging::warn(
            "Backend request failed",
            {kv("host", url_.host),
             kv("path", path),
             kv("error", reason)});
        throw BackendError("Backend request to " + url_.host + path + " failed: " + reason);
    }
    const auto& response = *result;
    if (response.status == 401 || response.status == 403) {
        throw BackendPermissionError(excerpt(response.body), response.status);
    }
    if (response.status < 200 || response.status >= 300) {
        logging::warn(
            "Backend returned error status",
            {kv("host", url_.host),
             kv("path", path),
             kv("status", response.status),
             kv("body", excerpt(response.body))});
        throw BackendError(excerpt(response.body), response.status);
    }
    return response;
}

}
