#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace call_relay {

// What happens to caller audio that arrives while the agent is speaking.
enum class BargeInPolicy {
    Discard,
    Forward
};

BargeInPolicy parse_barge_in_policy(const std::string& value);
const char* to_string(BargeInPolicy policy);

struct Config {
    int rest_port = 10000;
    int media_stream_port = 10001;
    std::string base_url;
    std::string media_stream_url;

    std::string twilio_account_sid;
    std::string twilio_auth_token;
    std::string twilio_from_number;
    std::string twilio_api_url = "https://api.twilio.com";

    std::string deepgram_api_key;
    std::string deepgram_url = "wss://api.deepgram.com/v1/listen";
    std::string deepgram_model = "nova-2-phonecall";

    std::string openai_api_key;
    std::string openai_url = "https://api.openai.com";
    std::string openai_model = "gpt-4o-mini";
    std::string system_prompt =
        "You are a friendly phone assistant. Keep every answer to one or two short sentences.";

    std::string elevenlabs_api_key;
    std::string elevenlabs_url = "https://api.elevenlabs.io";
    std::string elevenlabs_voice_id = "21m00Tcm4TlvDq8ikWAM";
    std::string elevenlabs_model_id = "eleven_turbo_v2_5";
    std::string tts_output_format = "pcm_16000";

    std::optional<std::string> greeting_text;
    BargeInPolicy barge_in_policy = BargeInPolicy::Discard;
    bool memory_enabled = true;
    int memory_max_turns = 20;
    int debounce_ms = 900;
    int min_utterance_chars = 1;
    int frame_size_bytes = 160;
    int frame_duration_ms = 20;
    int transcription_max_reconnects = 2;
    int registry_ttl_sec = 600;

    double backend_request_timeout = 30.0;
    double backend_connect_timeout = 10.0;

    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "call_relay";

    static Config load();
    void validate() const;
};

}
