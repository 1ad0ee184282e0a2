#include "call_relay/backend/elevenlabs_synthesizer.hpp"

#include <utility>

#include "call_relay/logging.hpp"
#include "call_relay/utils/http.hpp"

namespace call_relay {

ElevenLabsSynthesizer::ElevenLabsSynthesizer(std::shared_ptr<BackendClient> client,
                                             std::string voice_id,
                                             std::string model_id,
                                             std::string output_format)
    : client_(std::move(client)),
      voice_id_(std::move(voice_id)),
      model_id_(std::move(model_id)),
      output_format_(std::move(output_format)) {}

std::shared_ptr<ElevenLabsSynthesizer> ElevenLabsSynthesizer::from_config(const Config& config) {
    BackendRequestOptions options;
    options.request_timeout = std::chrono::seconds(static_cast<int>(config.backend_request_timeout));
    options.connect_timeout = std::chrono::seconds(static_cast<int>(config.backend_connect_timeout));
    options.sock_read_timeout = options.request_timeout;
    auto client = std::make_shared<BackendClient>(
        config.elevenlabs_url,
        httplib::Headers{{"xi-api-key", config.elevenlabs_api_key}},
        options);
    return std::make_shared<ElevenLabsSynthesizer>(std::move(client),
                                                   config.elevenlabs_voice_id,
                                                   config.elevenlabs_model_id,
                                                   config.tts_output_format);
}

std::string ElevenLabsSynthesizer::synthesize(const std::string& text) {
    auto audio = client_->post_json_for_binary(request_path(), build_payload(text), "audio/*");
    logging::debug(
        "Speech synthesized",
        {kv("voice_id", voice_id_),
         kv("format", output_format_),
         kv("bytes", audio.size())});
    return audio;
}

std::string ElevenLabsSynthesizer::request_path() const {
    return "/v1/text-to-speech/" + utils::url_encode(voice_id_) + "?" +
           utils::encode_query({{"output_format", output_format_}});
}

nlohmann::json ElevenLabsSynthesizer::build_payload(const std::string& text) const {
    return {
        {"text", text},
        {"model_id", model_id_},
    };
}

}
