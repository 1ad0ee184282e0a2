#include <catch2/catch_test_macros.hpp>

#include "call_relay/session/call_session.hpp"

#include "fakes.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <websocketpp/base64/base64.hpp>

using call_relay::BargeInPolicy;
using call_relay::CallSession;
using call_relay::ReplyCapabilities;
using call_relay::SessionOptions;
using call_relay::TurnState;
using call_relay::testing::FakeCarrier;
using call_relay::testing::FakeTranscription;
using call_relay::testing::ScopedLogGate;
using call_relay::testing::media_message;
using call_relay::testing::start_message;
using call_relay::testing::stop_message;
using call_relay::testing::wait_until;
using namespace std::chrono_literals;

namespace {

struct Harness {
    std::shared_ptr<FakeCarrier> carrier = std::make_shared<FakeCarrier>();
    FakeTranscription* transcription = nullptr;
    std::shared_ptr<call_relay::SessionRegistry> registry =
        std::make_shared<call_relay::SessionRegistry>(600s);
    std::atomic<int> generate_calls{0};
    std::mutex calls_mutex;
    std::vector<std::string> generated_for;
    std::vector<std::string> synthesized;
    std::shared_ptr<CallSession> session;

    void create(ReplyCapabilities capabilities, SessionOptions options = fast_options()) {
        auto connection = std::make_unique<FakeTranscription>();
        transcription = connection.get();
        session = CallSession::create(options, std::move(capabilities), carrier,
                                      std::move(connection), registry);
    }

    static SessionOptions fast_options() {
        SessionOptions options;
        options.frame_duration = 0ms;
        return options;
    }

    ReplyCapabilities capabilities(std::string reply_text, size_t audio_bytes) {
        ReplyCapabilities capabilities;
        capabilities.generate = [this, reply_text](const call_relay::GenerationRequest& request) {
            {
                std::lock_guard<std::mutex> lock(calls_mutex);
                generated_for.push_back(request.text);
            }
            ++generate_calls;
            return reply_text;
        };
        capabilities.synthesize = [this, audio_bytes](const std::string& text) {
            std::lock_guard<std::mutex> lock(calls_mutex);
            synthesized.push_back(text);
            return std::string(audio_bytes, 'x');
        };
        capabilities.convert = [](const std::string& audio) { return audio; };
        return capabilities;
    }

    std::vector<std::string> generation_inputs() {
        std::lock_guard<std::mutex> lock(calls_mutex);
        return generated_for;
    }

    std::vector<std::string> synthesis_inputs() {
        std::lock_guard<std::mutex> lock(calls_mutex);
        return synthesized;
    }

    void start(const std::string& lead_id = "") {
        session->handle_carrier_message(start_message("SID1", "CA1", lead_id));
        REQUIRE(session->drain());
    }
};

std::string decode_payload(const nlohmann::json& message) {
    return websocketpp::base64_decode(message["media"]["payload"].get<std::string>());
}

}

TEST_CASE("utterance is answered with paced frames tagged with the stream sid") {
    Harness harness;
    harness.create(harness.capabilities("Hi there", 400));
    harness.start();
    REQUIRE(harness.session->state() == CallSession::State::Active);
    REQUIRE(harness.session->turn_state() == TurnState::Listening);

    harness.session->handle_carrier_message(media_message("SID1"));
    REQUIRE(harness.session->drain());
    REQUIRE(harness.transcription->audio_chunks() == 1);

    harness.transcription->emit("hello", false);
    harness.transcription->emit("hello", true);

    REQUIRE(wait_until([&] { return harness.session->memory().size() == 1; }));
    REQUIRE(harness.generation_inputs() == std::vector<std::string>{"hello"});
    REQUIRE(harness.synthesis_inputs() == std::vector<std::string>{"Hi there"});
    const auto frames = harness.carrier->events("media");
    REQUIRE(frames.size() == 3);
    for (const auto& frame : frames) {
        REQUIRE(frame["streamSid"] == "SID1");
        REQUIRE(decode_payload(frame).size() == 160);
    }
    REQUIRE(decode_payload(frames[2]) == std::string(80, 'x') + std::string(80, '\xFF'));

    const auto memory = harness.session->memory();
    REQUIRE(memory[0].utterance == "hello");
    REQUIRE(memory[0].reply == "Hi there");
    REQUIRE(harness.session->turn_state() == TurnState::Listening);
    REQUIRE(harness.carrier->events("mark").size() == 1);
}

TEST_CASE("duplicate final transcripts produce a single reply") {
    Harness harness;
    harness.create(harness.capabilities("Hi there", 160));
    harness.start();

    harness.transcription->emit("hello", true);
    std::this_thread::sleep_for(200ms);
    harness.transcription->emit("hello", true);

    REQUIRE(wait_until([&] { return harness.session->memory().size() == 1; }));
    std::this_thread::sleep_for(100ms);
    REQUIRE(harness.generate_calls == 1);
    REQUIRE(harness.synthesis_inputs().size() == 1);
    REQUIRE(harness.carrier->media_count() == 1);
}

TEST_CASE("a newer utterance preempts a reply still being synthesized") {
    Harness harness;
    std::promise<void> gate;
    auto released = gate.get_future().share();

    ReplyCapabilities capabilities;
    capabilities.generate = [](const call_relay::GenerationRequest& request) {
        return "reply " + request.text;
    };
    capabilities.synthesize = [released](const std::string& text) {
        if (text == "reply A") {
            released.wait();
            return std::string(320, 'a');
        }
        return std::string(320, 'b');
    };
    capabilities.convert = [](const std::string& audio) { return audio; };
    harness.create(capabilities);
    harness.start();

    harness.transcription->emit("A", true);
    REQUIRE(harness.session->drain());
    harness.transcription->emit("B", true);

    REQUIRE(wait_until([&] { return harness.session->memory().size() == 1; }));
    gate.set_value();
    std::this_thread::sleep_for(100ms);
    REQUIRE(harness.session->drain());

    const auto frames = harness.carrier->events("media");
    REQUIRE(frames.size() == 2);
    for (const auto& frame : frames) {
        REQUIRE(decode_payload(frame) == std::string(160, 'b'));
    }
    const auto memory = harness.session->memory();
    REQUIRE(memory.size() == 1);
    REQUIRE(memory[0].utterance == "B");
}

TEST_CASE("carrier disconnect mid-reply stops sending and releases the session") {
    Harness harness;
    SessionOptions options;
    options.frame_duration = 20ms;
    harness.create(harness.capabilities("A long answer", 160 * 100), options);
    harness.start();

    harness.transcription->emit("tell me everything", true);
    REQUIRE(wait_until([&] { return harness.carrier->media_count() >= 2; }));

    harness.session->handle_carrier_disconnect();
    const auto sent_at_close = harness.carrier->media_count();
    std::this_thread::sleep_for(150ms);

    REQUIRE(harness.carrier->media_count() == sent_at_close);
    REQUIRE(sent_at_close < 100);
    REQUIRE(harness.session->state() == CallSession::State::Closed);
    REQUIRE(harness.session->turn_state() == TurnState::Idle);
    REQUIRE_FALSE(harness.session->reply_in_flight());
    REQUIRE(harness.transcription->close_calls == 1);
    REQUIRE(harness.session->memory().empty());

    harness.session->handle_carrier_disconnect();
    REQUIRE(harness.transcription->close_calls == 1);
}

TEST_CASE("empty generation sends nothing and keeps listening") {
    Harness harness;
    harness.create(harness.capabilities("", 160));
    harness.start();

    harness.transcription->emit("hello", true);
    REQUIRE(wait_until([&] { return harness.generate_calls == 1; }));
    REQUIRE(wait_until([&] { return !harness.session->reply_in_flight(); }));
    REQUIRE(harness.session->drain());

    REQUIRE(harness.carrier->media_count() == 0);
    REQUIRE(harness.synthesis_inputs().empty());
    REQUIRE(harness.session->turn_state() == TurnState::Listening);
    REQUIRE(harness.session->memory().empty());
}

TEST_CASE("caller speech during agent playback interrupts it") {
    Harness harness;
    SessionOptions options;
    options.frame_duration = 20ms;
    harness.create(harness.capabilities("Reply", 160 * 50), options);
    harness.start();

    harness.transcription->emit("first question", true);
    REQUIRE(wait_until([&] { return harness.carrier->media_count() >= 2; }));
    REQUIRE(harness.session->turn_state() == TurnState::AgentSpeaking);

    harness.transcription->emit("wait, another thing", true);
    REQUIRE(wait_until([&] { return harness.carrier->events("clear").size() == 1; }));
    REQUIRE(harness.carrier->events("clear")[0]["streamSid"] == "SID1");

    REQUIRE(wait_until([&] { return harness.session->memory().size() == 1; }, 5000ms));
    REQUIRE(harness.session->memory()[0].utterance == "wait, another thing");
    REQUIRE(harness.generate_calls == 2);
}

TEST_CASE("inbound audio is forwarded while listening and gated during playback") {
    Harness harness;
    SessionOptions options;
    options.frame_duration = 20ms;
    options.barge_in_policy = BargeInPolicy::Discard;
    harness.create(harness.capabilities("Reply", 160 * 50), options);
    harness.start();

    harness.session->handle_carrier_message(media_message("SID1"));
    REQUIRE(harness.session->drain());
    REQUIRE(harness.transcription->audio_chunks() == 1);

    harness.transcription->emit("question", true);
    REQUIRE(wait_until([&] { return harness.session->turn_state() == TurnState::AgentSpeaking; }));
    harness.session->handle_carrier_message(media_message("SID1"));
    REQUIRE(harness.session->drain());
    REQUIRE(harness.transcription->audio_chunks() == 1);
    harness.session->close("test done");
}

TEST_CASE("forward policy keeps transcribing during playback") {
    Harness harness;
    SessionOptions options;
    options.frame_duration = 20ms;
    options.barge_in_policy = BargeInPolicy::Forward;
    harness.create(harness.capabilities("Reply", 160 * 50), options);
    harness.start();

    harness.transcription->emit("question", true);
    REQUIRE(wait_until([&] { return harness.session->turn_state() == TurnState::AgentSpeaking; }));
    harness.session->handle_carrier_message(media_message("SID1"));
    REQUIRE(harness.session->drain());
    REQUIRE(harness.transcription->audio_chunks() == 1);
    harness.session->close("test done");
}

TEST_CASE("audio and transcripts before the stream starts are ignored") {
    Harness harness;
    harness.create(harness.capabilities("Hi", 160));

    harness.session->handle_carrier_message(media_message("SID1"));
    harness.transcription->emit("hello", true);
    REQUIRE(harness.session->drain());
    std::this_thread::sleep_for(50ms);

    REQUIRE(harness.session->state() == CallSession::State::Connecting);
    REQUIRE(harness.transcription->audio_chunks() == 0);
    REQUIRE(harness.generate_calls == 0);
}

TEST_CASE("stop message ends turn taking but keeps the session until disconnect") {
    Harness harness;
    harness.create(harness.capabilities("Hi", 160));
    harness.start();

    harness.session->handle_carrier_message(stop_message("SID1"));
    REQUIRE(harness.session->drain());
    REQUIRE(harness.session->turn_state() == TurnState::Idle);
    REQUIRE(harness.session->state() == CallSession::State::Active);

    harness.transcription->emit("hello", true);
    REQUIRE(harness.session->drain());
    REQUIRE(harness.generate_calls == 0);
}

TEST_CASE("malformed carrier messages are dropped without ending the session") {
    Harness harness;
    harness.create(harness.capabilities("Hi", 160));
    harness.session->handle_carrier_message("{not json");
    harness.session->handle_carrier_message(R"({"event":"media"})");
    harness.start();
    REQUIRE(harness.session->state() == CallSession::State::Active);
    REQUIRE(harness.session->stream_sid() == "SID1");
}

TEST_CASE("lead id comes from the registry, then from stream parameters") {
    {
        Harness harness;
        harness.registry->put("CA1", call_relay::LeadInfo{"lead-registry", "+1555"});
        harness.create(harness.capabilities("Hi", 160));
        harness.start("lead-param");
        REQUIRE(harness.session->lead()->lead_id == "lead-registry");
        REQUIRE(harness.session->lead()->phone == "+1555");
        REQUIRE(harness.registry->size() == 0);
    }
    {
        Harness harness;
        harness.create(harness.capabilities("Hi", 160));
        harness.start("lead-param");
        REQUIRE(harness.session->lead()->lead_id == "lead-param");
        REQUIRE(harness.session->call_sid() == "CA1");
    }
}

TEST_CASE("lost transcription closes the session and the carrier connection") {
    Harness harness;
    harness.create(harness.capabilities("Hi", 160));
    harness.start();

    harness.transcription->fail("reconnects exhausted");
    REQUIRE(wait_until([&] { return harness.session->state() == CallSession::State::Closed; }));
    REQUIRE(wait_until([&] { return harness.carrier->close_reasons().size() == 1; }));
    REQUIRE(harness.transcription->close_calls == 1);
}

TEST_CASE("memory is bounded and can be disabled") {
    SECTION("bounded") {
        Harness harness;
        SessionOptions options = Harness::fast_options();
        options.memory_max_turns = 2;
        harness.create(harness.capabilities("ok", 160), options);
        harness.start();
        for (const auto* text : {"one", "two", "three"}) {
            const auto before = harness.carrier->media_count();
            harness.transcription->emit(text, true);
            REQUIRE(wait_until([&] { return harness.carrier->media_count() == before + 1; }));
            REQUIRE(wait_until([&] { return !harness.session->reply_in_flight(); }));
        }
        REQUIRE(wait_until([&] {
            const auto memory = harness.session->memory();
            return memory.size() == 2 && memory.back().utterance == "three";
        }));
        REQUIRE(harness.session->memory().front().utterance == "two");
    }
    SECTION("disabled") {
        Harness harness;
        SessionOptions options = Harness::fast_options();
        options.memory_enabled = false;
        harness.create(harness.capabilities("ok", 160), options);
        harness.start();
        harness.transcription->emit("one", true);
        REQUIRE(wait_until([&] { return harness.carrier->media_count() == 1; }));
        REQUIRE(wait_until([&] { return !harness.session->reply_in_flight(); }));
        REQUIRE(harness.session->drain());
        REQUIRE(harness.session->memory().empty());
    }
}

TEST_CASE("stream stop mid-reply halts outbound frames") {
    Harness harness;
    SessionOptions options;
    options.frame_duration = 20ms;
    harness.create(harness.capabilities("A long answer", 160 * 100), options);
    harness.start();

    harness.transcription->emit("tell me everything", true);
    REQUIRE(wait_until([&] { return harness.carrier->media_count() >= 2; }));

    harness.session->handle_carrier_message(stop_message("SID1"));
    REQUIRE(harness.session->drain());
    std::this_thread::sleep_for(60ms);
    const auto sent_after_stop = harness.carrier->media_count();
    std::this_thread::sleep_for(150ms);

    REQUIRE(harness.carrier->media_count() == sent_after_stop);
    REQUIRE(sent_after_stop < 100);
    REQUIRE(harness.carrier->events("mark").empty());
    REQUIRE(harness.session->turn_state() == TurnState::Idle);
    REQUIRE(harness.session->memory().empty());
}

TEST_CASE("disconnect during stream start leaves the session closed") {
    ScopedLogGate log_gate("Lead resolved");
    Harness harness;
    harness.create(harness.capabilities("Hi", 160));

    harness.session->handle_carrier_message(start_message("SID1", "CA1", "lead-param"));
    REQUIRE(log_gate.gate().wait_reached());

    harness.session->handle_carrier_disconnect();
    REQUIRE(harness.session->state() == CallSession::State::Closed);

    log_gate.gate().release();
    REQUIRE(harness.session->drain());

    REQUIRE(harness.session->state() == CallSession::State::Closed);
    REQUIRE(harness.session->turn_state() == TurnState::Idle);
    REQUIRE(harness.session->stream_sid().empty());

    harness.transcription->emit("hello", true);
    REQUIRE(harness.session->drain());
    REQUIRE(harness.generate_calls == 0);
}

TEST_CASE("disconnect during utterance handling starts no reply") {
    Harness harness;
    harness.create(harness.capabilities("Hi", 160));
    harness.start();

    ScopedLogGate log_gate("Utterance received");
    harness.transcription->emit("hello", true);
    REQUIRE(log_gate.gate().wait_reached());

    harness.session->handle_carrier_disconnect();
    log_gate.gate().release();
    REQUIRE(harness.session->drain());
    std::this_thread::sleep_for(50ms);

    REQUIRE(harness.session->state() == CallSession::State::Closed);
    REQUIRE_FALSE(harness.session->reply_in_flight());
    REQUIRE(harness.generate_calls == 0);
    REQUIRE(harness.synthesis_inputs().empty());
    REQUIRE(harness.carrier->media_count() == 0);
}
