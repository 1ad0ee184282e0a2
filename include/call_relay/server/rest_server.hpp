#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "call_relay/config.hpp"

namespace call_relay {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

class RestServer {
public:
    using StartCallHandler = std::function<RestResponse(const nlohmann::json&)>;
    using VoiceHandler = std::function<std::string(const std::string& lead_id)>;

    RestServer(const Config& config, StartCallHandler on_start_call, VoiceHandler on_voice);

    void start();
    void stop();

private:
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    StartCallHandler on_start_call_;
    VoiceHandler on_voice_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

// Reads a JSON or form-encoded request body into a JSON object. Returns
// nullopt when the body cannot be parsed.
std::optional<nlohmann::json> parse_request_fields(const std::string& content_type,
                                                   const std::string& body);

// Answers the carrier's voice webhook: optional spoken greeting, then a
// bidirectional media stream carrying the lead id as a custom parameter.
std::string build_stream_twiml(const std::string& stream_url,
                               const std::string& lead_id,
                               const std::optional<std::string>& greeting);

}
