#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "call_relay/config.hpp"
#include "call_relay/session/channels.hpp"

namespace call_relay {

struct DeepgramOptions {
    std::string url = "wss://api.deepgram.com/v1/listen";
    std::string api_key;
    std::string model = "nova-2-phonecall";
    int max_reconnects = 2;
    std::chrono::milliseconds reconnect_delay{1000};
    std::chrono::milliseconds keepalive_interval{8000};

    static DeepgramOptions from_config(const Config& config);
};

// Streaming transcription over a websocket. Carrier audio (mu-law, 8 kHz) is
// sent as binary frames; "Results" messages are turned into TranscriptEvents.
// A dropped connection is reopened up to max_reconnects times in a row before
// the failure handler fires.
class DeepgramConnection : public TranscriptionConnection {
public:
    explicit DeepgramConnection(DeepgramOptions options);
    ~DeepgramConnection() override;

    void open(EventHandler on_event, FailureHandler on_failure) override;
    void send_audio(const std::string& audio) override;
    void close() override;

    std::string listen_url() const;

private:
    struct WsState;

    void run_loop();
    std::string run_once(bool& opened);
    bool wait_before_reconnect();

    DeepgramOptions options_;
    EventHandler on_event_;
    FailureHandler on_failure_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    std::mutex ws_mutex_;
    std::shared_ptr<WsState> ws_state_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    size_t audio_dropped_ = 0;
};

// Parses one transcription service message. Non-result and malformed messages
// are logged and yield nullopt.
std::optional<TranscriptEvent> parse_deepgram_message(const std::string& raw);

}
