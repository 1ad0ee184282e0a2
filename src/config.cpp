#include "call_relay/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace call_relay {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    const auto normalized = to_lower(value);
    return normalized == "true" || normalized == "1" || normalized == "yes";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be a number");
    }
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Variables already present in the environment win over the .env file.
void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = strip_quotes(trim(line.substr(eq_pos + 1)));
        if (key.empty()) {
            continue;
        }
        setenv(key.c_str(), value.c_str(), 0);
    }
}

std::string default_media_stream_url(const std::string& base_url) {
    std::string url = base_url;
    if (url.rfind("https://", 0) == 0) {
        url = "wss://" + url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        url = "ws://" + url.substr(7);
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + "/stream";
}

}

BargeInPolicy parse_barge_in_policy(const std::string& value) {
    const auto normalized = to_lower(trim(value));
    if (normalized == "forward") {
        return BargeInPolicy::Forward;
    }
    if (normalized == "discard") {
        return BargeInPolicy::Discard;
    }
    throw std::runtime_error("BARGE_IN_POLICY must be 'forward' or 'discard'");
}

const char* to_string(BargeInPolicy policy) {
    switch (policy) {
        case BargeInPolicy::Forward:
            return "forward";
        case BargeInPolicy::Discard:
            return "discard";
    }
    return "unknown";
}

Config Config::load() {
    load_dotenv();
    Config config;

    config.rest_port = get_env_int("PORT", 10000);
    config.media_stream_port = get_env_int("MEDIA_STREAM_PORT", 10001);
    config.base_url = get_env_str("BASE_URL", "");
    config.media_stream_url =
        get_env_str("MEDIA_STREAM_URL", default_media_stream_url(config.base_url));

    config.twilio_account_sid = get_env_str("TWILIO_ACCOUNT_SID", "");
    config.twilio_auth_token = get_env_str("TWILIO_AUTH_TOKEN", "");
    config.twilio_from_number = get_env_str("TWILIO_FROM_NUMBER", "");
    config.twilio_api_url = get_env_str("TWILIO_API_URL", config.twilio_api_url);

    config.deepgram_api_key = get_env_str("DEEPGRAM_API_KEY", "");
    config.deepgram_url = get_env_str("DEEPGRAM_URL", config.deepgram_url);
    config.deepgram_model = get_env_str("DEEPGRAM_MODEL", config.deepgram_model);

    config.openai_api_key = get_env_str("OPENAI_API_KEY", "");
    config.openai_url = get_env_str("OPENAI_URL", config.openai_url);
    config.openai_model = get_env_str("OPENAI_MODEL", config.openai_model);
    config.system_prompt = get_env_str("SYSTEM_PROMPT", config.system_prompt);

    config.elevenlabs_api_key = get_env_str("ELEVENLABS_API_KEY", "");
    config.elevenlabs_url = get_env_str("ELEVENLABS_URL", config.elevenlabs_url);
    config.elevenlabs_voice_id = get_env_str("ELEVENLABS_VOICE_ID", config.elevenlabs_voice_id);
    config.elevenlabs_model_id = get_env_str("ELEVENLABS_MODEL_ID", config.elevenlabs_model_id);
    config.tts_output_format = get_env_str("TTS_OUTPUT_FORMAT", config.tts_output_format);

    config.greeting_text = get_env_optional("GREETING_TEXT");
    config.barge_in_policy = parse_barge_in_policy(get_env_str("BARGE_IN_POLICY", "discard"));
    config.memory_enabled = get_env_bool("MEMORY_ENABLED", true);
    config.memory_max_turns = get_env_int("MEMORY_MAX_TURNS", 20);
    config.debounce_ms = get_env_int("DEBOUNCE_MS", 900);
    config.min_utterance_chars = get_env_int("MIN_UTTERANCE_CHARS", 1);
    config.frame_size_bytes = get_env_int("FRAME_SIZE_BYTES", 160);
    config.frame_duration_ms = get_env_int("FRAME_DURATION_MS", 20);
    config.transcription_max_reconnects = get_env_int("TRANSCRIPTION_MAX_RECONNECTS", 2);
    config.registry_ttl_sec = get_env_int("REGISTRY_TTL_SEC", 600);

    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 30.0);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 10.0);

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "call_relay");

    return config;
}

void Config::validate() const {
    if (base_url.empty()) {
        throw std::runtime_error("BASE_URL is required");
    }
    if (media_stream_url.rfind("ws://", 0) != 0 && media_stream_url.rfind("wss://", 0) != 0) {
        throw std::runtime_error("MEDIA_STREAM_URL must be a ws:// or wss:// URL");
    }
    if (rest_port <= 0) {
        throw std::runtime_error("PORT must be positive");
    }
    if (media_stream_port <= 0 || media_stream_port == rest_port) {
        throw std::runtime_error("MEDIA_STREAM_PORT must be positive and differ from PORT");
    }
    if (deepgram_api_key.empty()) {
        throw std::runtime_error("DEEPGRAM_API_KEY is required");
    }
    if (openai_api_key.empty()) {
        throw std::runtime_error("OPENAI_API_KEY is required");
    }
    if (elevenlabs_api_key.empty()) {
        throw std::runtime_error("ELEVENLABS_API_KEY is required");
    }
    if (frame_size_bytes <= 0) {
        throw std::runtime_error("FRAME_SIZE_BYTES must be positive");
    }
    if (frame_duration_ms < 0) {
        throw std::runtime_error("FRAME_DURATION_MS must be zero or positive");
    }
    if (debounce_ms < 0) {
        throw std::runtime_error("DEBOUNCE_MS must be zero or positive");
    }
    if (memory_max_turns < 0) {
        throw std::runtime_error("MEMORY_MAX_TURNS must be zero or positive");
    }
    if (transcription_max_reconnects < 0) {
        throw std::runtime_error("TRANSCRIPTION_MAX_RECONNECTS must be zero or positive");
    }
    if (registry_ttl_sec <= 0) {
        throw std::runtime_error("REGISTRY_TTL_SEC must be positive");
    }
}

}
