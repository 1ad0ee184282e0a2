#include <catch2/catch_test_macros.hpp>

#include "call_relay/session/reply_pipeline.hpp"

#include "fakes.hpp"

#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using call_relay::ConversationTurn;
using call_relay::Reply;
using call_relay::ReplyCapabilities;
using call_relay::ReplyPipeline;
using call_relay::Utterance;
using call_relay::testing::wait_until;

namespace {

struct Outcomes {
    std::mutex mutex;
    std::vector<std::shared_ptr<Reply>> ready;
    std::vector<std::pair<uint64_t, std::string>> dropped;

    size_t total() {
        std::lock_guard<std::mutex> lock(mutex);
        return ready.size() + dropped.size();
    }
};

ReplyPipeline make_pipeline(ReplyCapabilities capabilities, Outcomes& outcomes,
                            size_t min_chars = 1) {
    ReplyPipeline::Options options;
    options.frame_size = 160;
    options.min_utterance_chars = min_chars;
    return ReplyPipeline(
        options,
        std::move(capabilities),
        [&outcomes](const std::shared_ptr<Reply>& reply) {
            std::lock_guard<std::mutex> lock(outcomes.mutex);
            outcomes.ready.push_back(reply);
        },
        [&outcomes](uint64_t id, const std::string& reason) {
            std::lock_guard<std::mutex> lock(outcomes.mutex);
            outcomes.dropped.emplace_back(id, reason);
        });
}

Utterance utterance(const std::string& text) {
    return Utterance{text, true, call_relay::Clock::now()};
}

ReplyCapabilities echo_capabilities() {
    ReplyCapabilities capabilities;
    capabilities.generate = [](const call_relay::GenerationRequest& request) {
        return "reply to " + request.text;
    };
    capabilities.synthesize = [](const std::string&) { return std::string(400, 'x'); };
    capabilities.convert = [](const std::string& audio) { return audio; };
    return capabilities;
}

}

TEST_CASE("accepted utterance produces a framed reply") {
    Outcomes outcomes;
    auto pipeline = make_pipeline(echo_capabilities(), outcomes);

    const auto id = pipeline.on_utterance(utterance("hello"), {});
    REQUIRE(id);
    REQUIRE(wait_until([&] { return outcomes.total() == 1; }));

    std::lock_guard<std::mutex> lock(outcomes.mutex);
    REQUIRE(outcomes.ready.size() == 1);
    const auto& reply = outcomes.ready.front();
    REQUIRE(reply->id == *id);
    REQUIRE(reply->text == "reply to hello");
    REQUIRE(reply->utterance.text == "hello");
    REQUIRE(reply->frames.size() == 3);
    REQUIRE(reply->frames.padding() == 80);
}

TEST_CASE("generation receives memory and lead id") {
    Outcomes outcomes;
    std::promise<call_relay::GenerationRequest> seen;
    auto capabilities = echo_capabilities();
    capabilities.generate = [&seen](const call_relay::GenerationRequest& request) {
        seen.set_value(request);
        return std::string("ok");
    };
    auto pipeline = make_pipeline(capabilities, outcomes);

    std::vector<ConversationTurn> memory{{"hello", "Hi there"}};
    pipeline.on_utterance(utterance("how are you"), memory, std::string("lead-7"));
    auto future = seen.get_future();
    REQUIRE(future.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
    const auto request = future.get();
    REQUIRE(request.text == "how are you");
    REQUIRE(request.memory.size() == 1);
    REQUIRE(request.memory[0].reply == "Hi there");
    REQUIRE(request.lead_id == std::optional<std::string>("lead-7"));
    REQUIRE(wait_until([&] { return outcomes.total() == 1; }));
}

TEST_CASE("too short utterance is ignored and leaves the current reply alone") {
    Outcomes outcomes;
    std::promise<void> gate;
    auto released = gate.get_future().share();
    auto capabilities = echo_capabilities();
    capabilities.synthesize = [released](const std::string&) {
        released.wait();
        return std::string(160, 'x');
    };
    auto pipeline = make_pipeline(capabilities, outcomes, 3);

    const auto first = pipeline.on_utterance(utterance("hello"), {});
    REQUIRE(first);
    REQUIRE_FALSE(pipeline.on_utterance(utterance(" ok "), {}));
    REQUIRE(pipeline.is_current(*first));

    gate.set_value();
    REQUIRE(wait_until([&] { return outcomes.total() == 1; }));
    std::lock_guard<std::mutex> lock(outcomes.mutex);
    REQUIRE(outcomes.ready.size() == 1);
}

TEST_CASE("newer utterance supersedes a reply still being synthesized") {
    Outcomes outcomes;
    std::promise<void> gate;
    auto released = gate.get_future().share();
    auto capabilities = echo_capabilities();
    capabilities.synthesize = [released](const std::string& text) {
        if (text == "reply to A") {
            released.wait();
        }
        return std::string(160, text.back());
    };
    auto pipeline = make_pipeline(capabilities, outcomes);

    const auto first = pipeline.on_utterance(utterance("A"), {});
    const auto second = pipeline.on_utterance(utterance("B"), {});
    REQUIRE(first);
    REQUIRE(second);
    REQUIRE_FALSE(pipeline.is_current(*first));
    REQUIRE(pipeline.is_current(*second));

    REQUIRE(wait_until([&] { return outcomes.total() == 1; }));
    gate.set_value();
    REQUIRE(wait_until([&] { return outcomes.total() == 2; }));

    std::lock_guard<std::mutex> lock(outcomes.mutex);
    REQUIRE(outcomes.ready.size() == 1);
    REQUIRE(outcomes.ready.front()->id == *second);
    REQUIRE(outcomes.dropped.size() == 1);
    REQUIRE(outcomes.dropped.front().first == *first);
    REQUIRE(outcomes.dropped.front().second == "superseded");
}

TEST_CASE("empty or emoji-only generation is dropped") {
    Outcomes outcomes;
    auto capabilities = echo_capabilities();
    capabilities.generate = [](const call_relay::GenerationRequest& request) {
        return request.text == "one" ? std::string("   ") : std::string("\xF0\x9F\x98\x80");
    };
    auto pipeline = make_pipeline(capabilities, outcomes);

    pipeline.on_utterance(utterance("one"), {});
    REQUIRE(wait_until([&] { return outcomes.total() == 1; }));
    pipeline.on_utterance(utterance("two"), {});
    REQUIRE(wait_until([&] { return outcomes.total() == 2; }));

    std::lock_guard<std::mutex> lock(outcomes.mutex);
    REQUIRE(outcomes.ready.empty());
    REQUIRE(outcomes.dropped[0].second == "empty generation");
    REQUIRE(outcomes.dropped[1].second == "empty generation");
}

TEST_CASE("capability failures drop the reply") {
    Outcomes outcomes;
    auto capabilities = echo_capabilities();
    capabilities.generate = [](const call_relay::GenerationRequest& request) -> std::string {
        if (request.text == "boom") {
            throw std::runtime_error("upstream down");
        }
        return "fine";
    };
    capabilities.convert = [](const std::string&) -> std::string {
        throw std::runtime_error("bad audio");
    };
    auto pipeline = make_pipeline(capabilities, outcomes);

    pipeline.on_utterance(utterance("boom"), {});
    REQUIRE(wait_until([&] { return outcomes.total() == 1; }));
    pipeline.on_utterance(utterance("hello"), {});
    REQUIRE(wait_until([&] { return outcomes.total() == 2; }));

    std::lock_guard<std::mutex> lock(outcomes.mutex);
    REQUIRE(outcomes.dropped[0].second == "generation failed");
    REQUIRE(outcomes.dropped[1].second == "conversion failed");
}

TEST_CASE("cancel clears the in-flight reply") {
    Outcomes outcomes;
    std::promise<void> gate;
    auto released = gate.get_future().share();
    auto capabilities = echo_capabilities();
    capabilities.generate = [released](const call_relay::GenerationRequest&) {
        released.wait();
        return std::string("late");
    };
    auto pipeline = make_pipeline(capabilities, outcomes);

    const auto id = pipeline.on_utterance(utterance("hello"), {});
    REQUIRE(pipeline.in_flight());
    REQUIRE(pipeline.cancel());
    REQUIRE_FALSE(pipeline.in_flight());
    REQUIRE_FALSE(pipeline.is_current(*id));
    REQUIRE_FALSE(pipeline.cancel());

    gate.set_value();
    REQUIRE(wait_until([&] { return outcomes.total() == 1; }));
    std::lock_guard<std::mutex> lock(outcomes.mutex);
    REQUIRE(outcomes.dropped.front().second == "superseded");
}
