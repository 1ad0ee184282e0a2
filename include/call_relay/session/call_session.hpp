#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "call_relay/config.hpp"
#include "call_relay/session/carrier_protocol.hpp"
#include "call_relay/session/channels.hpp"
#include "call_relay/session/reply_pipeline.hpp"
#include "call_relay/session/session_registry.hpp"
#include "call_relay/session/transcript_aggregator.hpp"
#include "call_relay/session/turn_taking.hpp"
#include "call_relay/utils/serial_queue.hpp"

namespace call_relay {

struct SessionOptions {
    BargeInPolicy barge_in_policy = BargeInPolicy::Discard;
    bool memory_enabled = true;
    size_t memory_max_turns = 20;
    std::chrono::milliseconds debounce_window{900};
    size_t min_utterance_chars = 1;
    size_t frame_size = 160;
    std::chrono::milliseconds frame_duration{20};

    static SessionOptions from_config(const Config& config);
};

// One phone call. Carrier messages, transcription events and reply progress
// are funnelled through a single serial queue, so turn state, the in-flight
// reply and conversation memory only change in event order.
class CallSession : public std::enable_shared_from_this<CallSession> {
public:
    enum class State {
        Connecting,
        Active,
        Closed
    };

    // Creates the session and opens its transcription connection.
    static std::shared_ptr<CallSession> create(
        SessionOptions options,
        ReplyCapabilities capabilities,
        std::shared_ptr<CarrierChannel> carrier,
        std::unique_ptr<TranscriptionConnection> transcription,
        std::shared_ptr<SessionRegistry> registry = nullptr,
        std::map<std::string, std::string> connection_params = {});

    ~CallSession();

    CallSession(const CallSession&) = delete;
    CallSession& operator=(const CallSession&) = delete;

    void handle_carrier_message(const std::string& raw);
    void handle_carrier_disconnect();

    // Cancels the in-flight reply and closes the transcription connection.
    // Runs once; later calls are no-ops.
    void close(const std::string& reason);

    // Blocks until every event posted before the call has been handled.
    bool drain(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    State state() const;
    TurnState turn_state() const;
    std::string stream_sid() const;
    std::string call_sid() const;
    std::optional<LeadInfo> lead() const;
    std::vector<ConversationTurn> memory() const;
    bool reply_in_flight() const;
    Clock::time_point created_at() const { return created_at_; }

private:
    CallSession(SessionOptions options,
                ReplyCapabilities capabilities,
                std::shared_ptr<CarrierChannel> carrier,
                std::unique_ptr<TranscriptionConnection> transcription,
                std::shared_ptr<SessionRegistry> registry,
                std::map<std::string, std::string> connection_params);

    void open_transcription();
    bool post(std::function<void()> task);

    void on_carrier_message(const std::string& raw);
    void on_stream_start(const CarrierMessage& message);
    void on_media(const CarrierMessage& message);
    void on_stream_stop(const CarrierMessage& message);
    void on_transcript(const TranscriptEvent& event, Clock::time_point arrived_at);
    void on_transcription_failure(const std::string& reason);
    void on_reply_ready(const std::shared_ptr<Reply>& reply);
    void on_reply_dropped(uint64_t reply_id, const std::string& reason);
    void on_reply_sent(const std::shared_ptr<Reply>& reply, bool completed, size_t frames_sent);

    void interrupt_agent(const char* reason);
    void start_sending(const std::shared_ptr<Reply>& reply, const std::string& stream_sid);
    void send_to_carrier(const std::string& payload);
    // Checked by the sender before each frame; takes state_mutex_.
    bool may_send_outbound() const;
    std::string log_context() const;

    SessionOptions options_;
    // Moved into pipeline_ by create().
    ReplyCapabilities capabilities_;
    std::shared_ptr<CarrierChannel> carrier_;
    std::shared_ptr<SessionRegistry> registry_;
    std::map<std::string, std::string> connection_params_;
    const Clock::time_point created_at_;

    std::unique_ptr<ReplyPipeline> pipeline_;
    TranscriptAggregator aggregator_;

    mutable std::mutex state_mutex_;
    State state_ = State::Connecting;
    TurnTaking turn_;
    std::string stream_sid_;
    std::string call_sid_;
    std::optional<LeadInfo> lead_;
    std::deque<ConversationTurn> memory_;

    std::atomic<bool> closed_{false};
    size_t media_frames_forwarded_ = 0;
    size_t media_frames_discarded_ = 0;

    utils::SerialQueue queue_;
    std::unique_ptr<TranscriptionConnection> transcription_;
};

const char* to_string(CallSession::State state);

}
