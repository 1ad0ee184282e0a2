#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "call_relay/backend/client.hpp"
#include "call_relay/config.hpp"
#include "call_relay/session/types.hpp"

namespace call_relay {

// Reply generation over the chat completions API.
class OpenAiReplyGenerator {
public:
    OpenAiReplyGenerator(std::shared_ptr<BackendClient> client,
                         std::string model,
                         std::string system_prompt);

    static std::shared_ptr<OpenAiReplyGenerator> from_config(const Config& config);

    std::string generate(const GenerationRequest& request);

    nlohmann::json build_payload(const GenerationRequest& request) const;
    static std::string extract_reply(const nlohmann::json& response);

private:
    std::shared_ptr<BackendClient> client_;
    std::string model_;
    std::string system_prompt_;
};

}
