#pragma once

#include <chrono>
#include <httplib.h>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "call_relay/utils/http.hpp"

namespace call_relay {

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    // HTTP status of the failed response; 0 when no response arrived.
    int status() const { return status_; }

private:
    int status_;
};

class BackendPermissionError : public BackendError {
public:
    BackendPermissionError(const std::string& message, int status)
        : BackendError(message, status) {}
};

struct BackendRequestOptions {
    std::chrono::seconds request_timeout{30};
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds sock_read_timeout{30};
};

// Thin JSON/HTTP client for one upstream service. Every request opens its own
// connection, so concurrent calls from different sessions never wait on each
// other.
class BackendClient {
public:
    BackendClient(std::string base_url,
                  httplib::Headers default_headers,
                  BackendRequestOptions options);

    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json post_form(const std::string& path, const utils::QueryParams& form);
    // Posts a JSON body and returns the raw response body.
    std::string post_json_for_binary(const std::string& path,
                                     const nlohmann::json& body,
                                     const std::string& accept);

    const std::string& base_url() const { return base_url_; }

private:
    std::unique_ptr<httplib::Client> make_client() const;
    std::string build_path(const std::string& path) const;
    httplib::Headers headers_with(httplib::Headers extra) const;
    const httplib::Response& check(const httplib::Result& result, const std::string& path) const;

    std::string base_url_;
    utils::ParsedUrl url_;
    httplib::Headers default_headers_;
    BackendRequestOptions options_;
};

}
