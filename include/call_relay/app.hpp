#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "call_relay/backend/elevenlabs_synthesizer.hpp"
#include "call_relay/backend/openai_generator.hpp"
#include "call_relay/backend/twilio_client.hpp"
#include "call_relay/config.hpp"
#include "call_relay/server/media_stream_server.hpp"
#include "call_relay/server/rest_server.hpp"
#include "call_relay/session/session_registry.hpp"

namespace call_relay {

class RelayApp {
public:
    explicit RelayApp(Config config);
    ~RelayApp();

    void init();
    // Blocks until stop_requested becomes true, then stops both servers.
    void run(const std::atomic<bool>& stop_requested);
    void stop();
    const Config& config() const;

    RestResponse handle_start_call(const nlohmann::json& body);
    std::string handle_voice(const std::string& lead_id) const;

private:
    std::shared_ptr<CallSession> create_session(std::shared_ptr<CarrierChannel> carrier,
                                                std::map<std::string, std::string> params);
    ReplyCapabilities make_capabilities() const;
    std::string voice_webhook_url(const std::string& lead_id) const;

    Config config_;
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<TwilioClient> twilio_;
    std::shared_ptr<OpenAiReplyGenerator> generator_;
    std::shared_ptr<ElevenLabsSynthesizer> synthesizer_;
    std::unique_ptr<RestServer> rest_server_;
    std::unique_ptr<MediaStreamServer> media_server_;
    std::atomic<bool> stopped_{false};
};

}
