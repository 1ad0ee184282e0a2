#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "call_relay/audio/reframer.hpp"

namespace call_relay {

using Clock = std::chrono::steady_clock;

struct TranscriptEvent {
    std::string text;
    bool is_final = false;
};

// One caller speech turn.
struct Utterance {
    std::string text;
    bool is_final = false;
    Clock::time_point arrived_at;
};

struct ConversationTurn {
    std::string utterance;
    std::string reply;
};

struct GenerationRequest {
    std::string text;
    std::vector<ConversationTurn> memory;
    std::optional<std::string> lead_id;
};

using GenerateFn = std::function<std::string(const GenerationRequest& request)>;
using SynthesizeFn = std::function<std::string(const std::string& text)>;
using ConvertFn = std::function<std::string(const std::string& audio)>;

// The three stateless capabilities a reply is built from.
struct ReplyCapabilities {
    GenerateFn generate;
    SynthesizeFn synthesize;
    ConvertFn convert;
};

// Cancellation flag shared by a reply's producer and its frame sender.
// cancel() waits for a send in progress, so no frame goes out after it returns.
class CancelToken {
public:
    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        canceled_ = true;
    }

    bool canceled() const {
        return canceled_.load();
    }

    template <typename Fn>
    bool run_unless_canceled(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (canceled_) {
            return false;
        }
        fn();
        return true;
    }

private:
    std::mutex mutex_;
    std::atomic<bool> canceled_{false};
};

// One agent speech turn.
struct Reply {
    uint64_t id = 0;
    Utterance utterance;
    std::string text;
    audio::FrameSequence frames;
    std::shared_ptr<CancelToken> token = std::make_shared<CancelToken>();
};

}
