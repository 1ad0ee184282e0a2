#include "call_relay/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace call_relay::utils {

namespace {

int default_port(const std::string& scheme) {
    if (scheme == "https" || scheme == "wss") {
        return 443;
    }
    return 80;
}

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

}

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl parsed;
    std::string working = url;
    parsed.scheme = "http";

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        parsed.scheme = working.substr(0, scheme_pos);
        std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        working = working.substr(scheme_pos + 3);
    }

    const auto path_pos = working.find('/');
    if (path_pos != std::string::npos) {
        parsed.path = working.substr(path_pos);
        working = working.substr(0, path_pos);
    } else {
        parsed.path = "/";
    }

    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        parsed.host = working.substr(0, port_pos);
        try {
            parsed.port = std::stoi(working.substr(port_pos + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid port in url: " + url);
        }
    } else {
        parsed.host = working;
        parsed.port = default_port(parsed.scheme);
    }
    return parsed;
}

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path) {
    std::ostringstream out;
    out << scheme << "://" << host;
    if (port > 0 && port != default_port(scheme)) {
        out << ":" << port;
    }
    if (!path.empty() && path.front() != '/') {
        out << '/';
    }
    out << path;
    return out.str();
}

std::string join_path(const std::string& base_path, const std::string& path) {
    if (base_path.empty() || base_path == "/") {
        return path.empty() ? "/" : (path.front() == '/' ? path : "/" + path);
    }
    if (path.empty()) {
        return base_path;
    }
    if (base_path.back() == '/' && path.front() == '/') {
        return base_path + path.substr(1);
    }
    if (base_path.back() != '/' && path.front() != '/') {
        return base_path + "/" + path;
    }
    return base_path + path;
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

std::string url_decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '+') {
            decoded.push_back(' ');
        } else if (ch == '%' && i + 2 < value.size()) {
            const int high = hex_value(value[i + 1]);
            const int low = hex_value(value[i + 2]);
            if (high < 0 || low < 0) {
                decoded.push_back(ch);
                continue;
            }
            decoded.push_back(static_cast<char>((high << 4) | low));
            i += 2;
        } else {
            decoded.push_back(ch);
        }
    }
    return decoded;
}

std::string encode_query(const QueryParams& params) {
    std::string result;
    for (const auto& param : params) {
        if (!result.empty()) {
            result += '&';
        }
        result += url_encode(param.first);
        result += '=';
        result += url_encode(param.second);
    }
    return result;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    std::string working = query;
    const auto question = working.find('?');
    if (question != std::string::npos) {
        working = working.substr(question + 1);
    }
    std::stringstream stream(working);
    std::string item;
    while (std::getline(stream, item, '&')) {
        if (item.empty()) {
            continue;
        }
        const auto eq_pos = item.find('=');
        if (eq_pos == std::string::npos) {
            params[url_decode(item)] = "";
        } else {
            params[url_decode(item.substr(0, eq_pos))] = url_decode(item.substr(eq_pos + 1));
        }
    }
    return params;
}

}
