#include <catch2/catch_test_macros.hpp>

#include "call_relay/app.hpp"
#include "call_relay/server/rest_server.hpp"

#include <string>

TEST_CASE("stream TwiML connects the call to the media stream with the lead id") {
    const auto twiml =
        call_relay::build_stream_twiml("wss://relay.example.com/stream", "lead-7", std::nullopt);
    REQUIRE(twiml.find("<Connect>") != std::string::npos);
    REQUIRE(twiml.find(R"(<Stream url="wss://relay.example.com/stream">)") != std::string::npos);
    REQUIRE(twiml.find(R"(<Parameter name="leadId" value="lead-7"/>)") != std::string::npos);
    REQUIRE(twiml.find("<Say>") == std::string::npos);
}

TEST_CASE("stream TwiML speaks an escaped greeting first") {
    const auto twiml = call_relay::build_stream_twiml("wss://relay.example.com/stream", "a&b",
                                                      std::string("Hi <there>"));
    const auto say = twiml.find("<Say>Hi &lt;there&gt;</Say>");
    REQUIRE(say != std::string::npos);
    REQUIRE(say < twiml.find("<Connect>"));
    REQUIRE(twiml.find(R"(value="a&amp;b")") != std::string::npos);
}

TEST_CASE("request fields are read from JSON and form bodies") {
    const auto json = call_relay::parse_request_fields(
        "application/json", R"({"phone":"+15551234567","leadId":"7"})");
    REQUIRE(json);
    REQUIRE((*json)["phone"] == "+15551234567");

    const auto form = call_relay::parse_request_fields(
        "application/x-www-form-urlencoded; charset=utf-8", "phone=%2B15551234567&leadId=7");
    REQUIRE(form);
    REQUIRE((*form)["phone"] == "+15551234567");
    REQUIRE((*form)["leadId"] == "7");

    REQUIRE_FALSE(call_relay::parse_request_fields("application/json", "{broken"));
    REQUIRE(call_relay::parse_request_fields("application/json", "")->empty());
}

TEST_CASE("start-call requires a phone number") {
    call_relay::Config config;
    config.base_url = "https://relay.example.com";
    config.media_stream_url = "wss://relay.example.com/stream";
    call_relay::RelayApp app(config);

    const auto missing = app.handle_start_call(nlohmann::json{{"leadId", "7"}});
    REQUIRE(missing.status == 400);
    REQUIRE(missing.body["error"] == "phone required");

    const auto blank = app.handle_start_call(nlohmann::json{{"phone", "  "}});
    REQUIRE(blank.status == 400);
}

TEST_CASE("start-call without carrier credentials is unavailable") {
    call_relay::Config config;
    config.base_url = "https://relay.example.com";
    call_relay::RelayApp app(config);
    const auto response = app.handle_start_call(nlohmann::json{{"phone", "+15551234567"}});
    REQUIRE(response.status == 503);
}

TEST_CASE("voice webhook answers with the configured stream url") {
    call_relay::Config config;
    config.media_stream_url = "wss://relay.example.com/stream";
    config.greeting_text = "Connecting you now.";
    call_relay::RelayApp app(config);
    const auto twiml = app.handle_voice("lead-7");
    REQUIRE(twiml.find("wss://relay.example.com/stream") != std::string::npos);
    REQUIRE(twiml.find("Connecting you now.") != std::string::npos);
}
