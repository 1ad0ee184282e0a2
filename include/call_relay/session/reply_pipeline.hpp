#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "call_relay/audio/codec.hpp"
#include "call_relay/session/types.hpp"

namespace call_relay {

// Builds at most one reply at a time: generation, synthesis, conversion and
// framing run on a worker thread; the result is handed to ReadyFn unless a
// newer utterance cancelled it first. Either ReadyFn or DroppedFn is called
// exactly once per accepted utterance, from the worker thread.
class ReplyPipeline {
public:
    struct Options {
        size_t frame_size = 160;
        unsigned char padding_byte = audio::kMulawSilence;
        size_t min_utterance_chars = 1;
        std::string log_context;
    };

    using ReadyFn = std::function<void(const std::shared_ptr<Reply>& reply)>;
    using DroppedFn = std::function<void(uint64_t reply_id, const std::string& reason)>;

    ReplyPipeline(Options options,
                  ReplyCapabilities capabilities,
                  ReadyFn ready_fn,
                  DroppedFn dropped_fn);
    ~ReplyPipeline();

    // Cancels the in-flight reply and starts a new one. Returns nullopt when
    // the utterance is ignored; the in-flight reply is then left alone.
    std::optional<uint64_t> on_utterance(const Utterance& utterance,
                                         std::vector<ConversationTurn> memory,
                                         std::optional<std::string> lead_id = std::nullopt);

    // Returns true when a reply was in flight.
    bool cancel();
    bool is_current(uint64_t reply_id) const;
    // Releases the in-flight slot if reply_id still holds it.
    void complete(uint64_t reply_id);
    bool in_flight() const;
    std::shared_ptr<Reply> current() const;

    void set_log_context(std::string context);

private:
    static void build_reply(const std::shared_ptr<Reply>& reply,
                            const GenerationRequest& request,
                            const ReplyCapabilities& capabilities,
                            const Options& options,
                            const ReadyFn& ready_fn,
                            const DroppedFn& dropped_fn);

    Options options_;
    ReplyCapabilities capabilities_;
    ReadyFn ready_fn_;
    DroppedFn dropped_fn_;

    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::shared_ptr<Reply> current_;
};

}
