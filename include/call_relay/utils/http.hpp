#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace call_relay::utils {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

ParsedUrl parse_url(const std::string& url);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

std::string join_path(const std::string& base_path, const std::string& path);

std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);

// Encodes params as application/x-www-form-urlencoded, preserving their order.
std::string encode_query(const QueryParams& params);

std::map<std::string, std::string> parse_query(const std::string& query);

}
