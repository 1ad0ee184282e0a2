#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "call_relay/session/types.hpp"

namespace call_relay {

// Turns streaming transcription results into utterances. A final result whose
// normalized text equals the utterance emitted less than one debounce window
// earlier is treated as a repeat and dropped.
class TranscriptAggregator {
public:
    explicit TranscriptAggregator(std::chrono::milliseconds debounce_window);

    std::optional<Utterance> on_transcript_event(const std::string& text,
                                                 bool is_final,
                                                 Clock::time_point now = Clock::now());

    const std::string& latest_partial() const { return latest_partial_; }
    void reset();

private:
    std::chrono::milliseconds debounce_window_;
    std::string latest_partial_;
    std::string last_emitted_;
    std::optional<Clock::time_point> last_emitted_at_;
};

}
