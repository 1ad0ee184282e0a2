#include <catch2/catch_test_macros.hpp>

#include "call_relay/audio/reframer.hpp"

#include <string>
#include <vector>

namespace {

std::vector<std::string> collect(const call_relay::audio::FrameSequence& frames) {
    std::vector<std::string> result;
    for (const auto& frame : frames) {
        result.push_back(frame);
    }
    return result;
}

}

TEST_CASE("reframe pads the final frame") {
    const auto frames = call_relay::audio::reframe(std::string(400, 'a'), 160, 0xFF);
    REQUIRE(frames.size() == 3);
    REQUIRE(frames.padding() == 80);

    const auto collected = collect(frames);
    REQUIRE(collected.size() == 3);
    REQUIRE(collected[0] == std::string(160, 'a'));
    REQUIRE(collected[1] == std::string(160, 'a'));
    REQUIRE(collected[2] == std::string(80, 'a') + std::string(80, '\xFF'));
}

TEST_CASE("reframe of an exact multiple adds no padding") {
    const auto frames = call_relay::audio::reframe(std::string(320, 'b'), 160, 0xFF);
    REQUIRE(frames.size() == 2);
    REQUIRE(frames.padding() == 0);
    for (const auto& frame : frames) {
        REQUIRE(frame.size() == 160);
    }
}

TEST_CASE("reframe keeps byte order across frames") {
    std::string audio;
    for (int i = 0; i < 10; ++i) {
        audio.push_back(static_cast<char>('0' + i));
    }
    const auto frames = call_relay::audio::reframe(audio, 4, 0x00);
    const auto collected = collect(frames);
    REQUIRE(collected.size() == 3);
    REQUIRE(collected[0] == "0123");
    REQUIRE(collected[1] == "4567");
    REQUIRE(collected[2] == std::string("89") + std::string(2, '\0'));
}

TEST_CASE("reframe of empty audio yields no frames") {
    const auto frames = call_relay::audio::reframe("", 160, 0xFF);
    REQUIRE(frames.empty());
    REQUIRE(frames.begin() == frames.end());
}

TEST_CASE("frame sequence can be iterated more than once") {
    const auto frames = call_relay::audio::reframe(std::string(200, 'c'), 160, 0xFF);
    REQUIRE(collect(frames) == collect(frames));
}

TEST_CASE("reframe reconstructs every input length up to three frames") {
    constexpr size_t kFrameSize = 160;
    for (size_t length = 0; length <= 3 * kFrameSize + 1; ++length) {
        std::string audio;
        for (size_t i = 0; i < length; ++i) {
            audio.push_back(static_cast<char>(i % 251));
        }
        const auto frames = call_relay::audio::reframe(audio, kFrameSize, 0xFF);

        REQUIRE(frames.size() == (length + kFrameSize - 1) / kFrameSize);
        std::string joined;
        for (const auto& frame : frames) {
            REQUIRE(frame.size() == kFrameSize);
            joined += frame;
        }
        REQUIRE(frames.padding() == joined.size() - length);
        REQUIRE(joined.substr(length) == std::string(frames.padding(), '\xFF'));
        REQUIRE(joined.substr(0, length) == audio);
    }
}
