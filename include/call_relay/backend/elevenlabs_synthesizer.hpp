#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "call_relay/backend/client.hpp"
#include "call_relay/config.hpp"

namespace call_relay {

// Text-to-speech. Returns raw audio in the configured output format.
class ElevenLabsSynthesizer {
public:
    ElevenLabsSynthesizer(std::shared_ptr<BackendClient> client,
                          std::string voice_id,
                          std::string model_id,
                          std::string output_format);

    static std::shared_ptr<ElevenLabsSynthesizer> from_config(const Config& config);

    std::string synthesize(const std::string& text);

    std::string request_path() const;
    nlohmann::json build_payload(const std::string& text) const;
    const std::string& output_format() const { return output_format_; }

private:
    std::shared_ptr<BackendClient> client_;
    std::string voice_id_;
    std::string model_id_;
    std::string output_format_;
};

}
