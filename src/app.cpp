#include "call_relay/app.hpp"

#include <chrono>
#include <thread>

#include "call_relay/audio/codec.hpp"
#include "call_relay/backend/deepgram_connection.hpp"
#include "call_relay/logging.hpp"
#include "call_relay/metrics.hpp"
#include "call_relay/utils/async.hpp"
#include "call_relay/utils/http.hpp"
#include "call_relay/utils/text.hpp"

namespace call_relay {

namespace {

constexpr auto kRegistryPurgeInterval = std::chrono::seconds(30);
constexpr auto kShutdownGrace = std::chrono::milliseconds(5000);

std::string string_field(const nlohmann::json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return utils::trim(it->get<std::string>());
    }
    if (it->is_number()) {
        return it->dump();
    }
    return "";
}

}

RelayApp::RelayApp(Config config)
    : config_(std::move(config)),
      registry_(std::make_shared<SessionRegistry>(std::chrono::seconds(config_.registry_ttl_sec))) {}

RelayApp::~RelayApp() {
    stop();
}

void RelayApp::init() {
    generator_ = OpenAiReplyGenerator::from_config(config_);
    synthesizer_ = ElevenLabsSynthesizer::from_config(config_);
    if (!config_.twilio_account_sid.empty() && !config_.twilio_auth_token.empty() &&
        !config_.twilio_from_number.empty()) {
        twilio_ = TwilioClient::from_config(config_);
    } else {
        logging::warn("Carrier credentials missing; /start-call is disabled");
    }

    media_server_ = std::make_unique<MediaStreamServer>(
        config_.media_stream_port,
        "/stream",
        [this](std::shared_ptr<CarrierChannel> carrier,
               std::map<std::string, std::string> params) {
            return create_session(std::move(carrier), std::move(params));
        });
    media_server_->start();

    rest_server_ = std::make_unique<RestServer>(
        config_,
        [this](const nlohmann::json& body) { return handle_start_call(body); },
        [this](const std::string& lead_id) { return handle_voice(lead_id); });
    rest_server_->start();
}

void RelayApp::run(const std::atomic<bool>& stop_requested) {
    auto last_purge = Clock::now();
    while (!stop_requested && !stopped_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (Clock::now() - last_purge >= kRegistryPurgeInterval) {
            last_purge = Clock::now();
            const auto purged = registry_->purge_expired();
            if (purged > 0) {
                logging::debug("Expired call registrations purged", {kv("count", purged)});
            }
        }
    }
    logging::info("Shutdown requested");
    stop();
}

void RelayApp::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    if (rest_server_) {
        rest_server_->stop();
    }
    size_t open_sessions = 0;
    if (media_server_) {
        open_sessions = media_server_->session_count();
        media_server_->stop();
    }
    if (!utils::wait_for_async_tasks(kShutdownGrace)) {
        logging::warn(
            "Reply workers still running at shutdown",
            {kv("pending", utils::pending_async_tasks())});
    }
    logging::info(
        "Relay stopped",
        {kv("open_sessions", open_sessions),
         kv("sessions", Metrics::instance().counter_value("sessions"))});
}

const Config& RelayApp::config() const {
    return config_;
}

RestResponse RelayApp::handle_start_call(const nlohmann::json& body) {
    const auto phone = string_field(body, "phone");
    if (phone.empty()) {
        return {400, {{"error", "phone required"}}};
    }
    if (!twilio_) {
        return {503, {{"error", "carrier credentials not configured"}}};
    }
    const auto lead_id = string_field(body, "leadId");

    const auto call_sid = twilio_->create_call(phone, voice_webhook_url(lead_id));
    const bool registered = registry_->put(call_sid, LeadInfo{lead_id, phone});
    Metrics::instance().increment("calls_started");
    logging::info(
        "Call started",
        {kv("call_sid", call_sid),
         kv("lead_id", lead_id),
         kv("registered", registered)});
    return {200, {{"success", true}, {"callSid", call_sid}}};
}

std::string RelayApp::handle_voice(const std::string& lead_id) const {
    logging::info("Voice webhook answered", {kv("lead_id", lead_id)});
    return build_stream_twiml(config_.media_stream_url, lead_id, config_.greeting_text);
}

std::shared_ptr<CallSession> RelayApp::create_session(
    std::shared_ptr<CarrierChannel> carrier,
    std::map<std::string, std::string> params) {
    auto transcription =
        std::make_unique<DeepgramConnection>(DeepgramOptions::from_config(config_));
    return CallSession::create(SessionOptions::from_config(config_),
                               make_capabilities(),
                               std::move(carrier),
                               std::move(transcription),
                               registry_,
                               std::move(params));
}

ReplyCapabilities RelayApp::make_capabilities() const {
    ReplyCapabilities capabilities;
    auto generator = generator_;
    auto synthesizer = synthesizer_;
    capabilities.generate = [generator](const GenerationRequest& request) {
        return generator->generate(request);
    };
    capabilities.synthesize = [synthesizer](const std::string& text) {
        return synthesizer->synthesize(text);
    };
    capabilities.convert = [format = synthesizer_->output_format()](const std::string& audio) {
        return audio::convert_to_carrier(audio, format);
    };
    return capabilities;
}

std::string RelayApp::voice_webhook_url(const std::string& lead_id) const {
    auto base = config_.base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/twilio/voice?" + utils::encode_query({{"leadId", lead_id}});
}

}
