#include "call_relay/session/transcript_aggregator.hpp"

#include "call_relay/utils/text.hpp"

namespace call_relay {

TranscriptAggregator::TranscriptAggregator(std::chrono::milliseconds debounce_window)
    : debounce_window_(debounce_window) {}

std::optional<Utterance> TranscriptAggregator::on_transcript_event(const std::string& text,
                                                                   bool is_final,
                                                                   Clock::time_point now) {
    if (utils::is_blank(text)) {
        return std::nullopt;
    }
    if (!is_final) {
        latest_partial_ = text;
        return std::nullopt;
    }
    latest_partial_.clear();

    const auto normalized = utils::normalize_text(text);
    if (last_emitted_at_ && normalized == last_emitted_ &&
        now - *last_emitted_at_ < debounce_window_) {
        return std::nullopt;
    }
    last_emitted_ = normalized;
    last_emitted_at_ = now;
    return Utterance{utils::trim(text), true, now};
}

void TranscriptAggregator::reset() {
    latest_partial_.clear();
    last_emitted_.clear();
    last_emitted_at_.reset();
}

}
