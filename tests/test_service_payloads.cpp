#include <catch2/catch_test_macros.hpp>

#include "call_relay/backend/elevenlabs_synthesizer.hpp"
#include "call_relay/backend/openai_generator.hpp"
#include "call_relay/backend/twilio_client.hpp"

#include <memory>
#include <string>

namespace {

std::shared_ptr<call_relay::BackendClient> make_client(const std::string& url) {
    return std::make_shared<call_relay::BackendClient>(url, httplib::Headers{},
                                                       call_relay::BackendRequestOptions{});
}

}

TEST_CASE("chat payload lists system prompt, memory and the new utterance in order") {
    call_relay::OpenAiReplyGenerator generator(make_client("http://localhost:9"), "gpt-4o-mini",
                                               "Be brief.");
    call_relay::GenerationRequest request;
    request.text = "what time is it";
    request.memory = {{"hello", "Hi there"}};
    request.lead_id = "lead-7";

    const auto payload = generator.build_payload(request);
    REQUIRE(payload["model"] == "gpt-4o-mini");
    REQUIRE(payload["user"] == "lead-7");
    const auto& messages = payload["messages"];
    REQUIRE(messages.size() == 4);
    REQUIRE(messages[0]["role"] == "system");
    REQUIRE(messages[1]["content"] == "hello");
    REQUIRE(messages[2]["role"] == "assistant");
    REQUIRE(messages[2]["content"] == "Hi there");
    REQUIRE(messages[3]["role"] == "user");
    REQUIRE(messages[3]["content"] == "what time is it");
}

TEST_CASE("chat reply is read from the first choice") {
    const auto response = nlohmann::json::parse(
        R"({"choices":[{"index":0,"message":{"role":"assistant","content":"Hi there"}}]})");
    REQUIRE(call_relay::OpenAiReplyGenerator::extract_reply(response) == "Hi there");

    const auto empty = nlohmann::json::parse(R"({"choices":[{"message":{"content":null}}]})");
    REQUIRE(call_relay::OpenAiReplyGenerator::extract_reply(empty).empty());

    REQUIRE_THROWS_AS(call_relay::OpenAiReplyGenerator::extract_reply(nlohmann::json::object()),
                      call_relay::BackendError);
}

TEST_CASE("synthesis request names voice and output format") {
    call_relay::ElevenLabsSynthesizer synthesizer(make_client("http://localhost:9"), "voice-1",
                                                  "eleven_turbo_v2_5", "pcm_16000");
    REQUIRE(synthesizer.request_path() == "/v1/text-to-speech/voice-1?output_format=pcm_16000");
    const auto payload = synthesizer.build_payload("Hi there");
    REQUIRE(payload["text"] == "Hi there");
    REQUIRE(payload["model_id"] == "eleven_turbo_v2_5");
}

TEST_CASE("outbound call form points the carrier at the voice webhook") {
    call_relay::TwilioClient client(make_client("http://localhost:9"), "AC1", "+15550000000");
    const auto form = client.build_call_form("+15551234567",
                                             "https://relay.example.com/twilio/voice?leadId=7");
    REQUIRE(form.size() == 4);
    REQUIRE(form[0] == std::make_pair(std::string("To"), std::string("+15551234567")));
    REQUIRE(form[1].second == "+15550000000");
    REQUIRE(form[2].second == "https://relay.example.com/twilio/voice?leadId=7");
}

TEST_CASE("backend client rejects unsupported schemes") {
    REQUIRE_THROWS_AS(make_client("ftp://example.com"), call_relay::BackendError);
}

TEST_CASE("unreachable backend raises BackendError") {
    call_relay::BackendRequestOptions options;
    options.connect_timeout = std::chrono::seconds(1);
    call_relay::BackendClient client("http://127.0.0.1:9", httplib::Headers{}, options);
    REQUIRE_THROWS_AS(client.post_json("/v1/chat/completions", nlohmann::json::object()),
                      call_relay::BackendError);
}
