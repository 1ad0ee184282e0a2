#include "call_relay/backend/openai_generator.hpp"

#include <utility>

#include "call_relay/logging.hpp"

namespace call_relay {

OpenAiReplyGenerator::OpenAiReplyGenerator(std::shared_ptr<BackendClient> client,
                                           std::string model,
                                           std::string system_prompt)
    : client_(std::move(client)),
      model_(std::move(model)),
      system_prompt_(std::move(system_prompt)) {}

std::shared_ptr<OpenAiReplyGenerator> OpenAiReplyGenerator::from_config(const Config& config) {
    BackendRequestOptions options;
    options.request_timeout = std::chrono::seconds(static_cast<int>(config.backend_request_timeout));
    options.connect_timeout = std::chrono::seconds(static_cast<int>(config.backend_connect_timeout));
    options.sock_read_timeout = options.request_timeout;
    auto client = std::make_shared<BackendClient>(
        config.openai_url,
        httplib::Headers{{"Authorization", "Bearer " + config.openai_api_key}},
        options);
    return std::make_shared<OpenAiReplyGenerator>(std::move(client), config.openai_model,
                                                  config.system_prompt);
}

std::string OpenAiReplyGenerator::generate(const GenerationRequest& request) {
    const auto response = client_->post_json("/v1/chat/completions", build_payload(request));
    auto reply = extract_reply(response);
    logging::debug(
        "Chat completion received",
        {kv("model", model_),
         kv("memory_turns", request.memory.size()),
         kv("chars", reply.size())});
    return reply;
}

nlohmann::json OpenAiReplyGenerator::build_payload(const GenerationRequest& request) const {
    auto messages = nlohmann::json::array();
    if (!system_prompt_.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt_}});
    }
    for (const auto& turn : request.memory) {
        messages.push_back({{"role", "user"}, {"content", turn.utterance}});
        messages.push_back({{"role", "assistant"}, {"content", turn.reply}});
    }
    messages.push_back({{"role", "user"}, {"content", request.text}});

    nlohmann::json payload = {
        {"model", model_},
        {"messages", messages},
    };
    if (request.lead_id) {
        payload["user"] = *request.lead_id;
    }
    return payload;
}

std::string OpenAiReplyGenerator::extract_reply(const nlohmann::json& response) {
    const auto choices = response.find("choices");
    if (choices == response.end() || !choices->is_array() || choices->empty()) {
        throw BackendError("Chat completion response has no choices");
    }
    const auto& message = (*choices)[0].value("message", nlohmann::json::object());
    const auto content = message.find("content");
    if (content == message.end() || content->is_null()) {
        return "";
    }
    if (!content->is_string()) {
        throw BackendError("Chat completion content is not text");
    }
    return content->get<std::string>();
}

}
