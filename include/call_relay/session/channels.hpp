#pragma once

#include <functional>
#include <memory>
#include <string>

#include "call_relay/session/types.hpp"

namespace call_relay {

// Outbound side of the carrier media-stream connection.
class CarrierChannel {
public:
    virtual ~CarrierChannel() = default;

    virtual void send_text(const std::string& payload) = 0;
    virtual void close(const std::string& reason) = 0;
};

// Streaming speech-to-text connection owned by one call session.
class TranscriptionConnection {
public:
    using EventHandler = std::function<void(const TranscriptEvent&)>;
    // Called once, from the connection's own thread, when the connection is
    // lost for good.
    using FailureHandler = std::function<void(const std::string& reason)>;

    virtual ~TranscriptionConnection() = default;

    virtual void open(EventHandler on_event, FailureHandler on_failure) = 0;
    virtual void send_audio(const std::string& audio) = 0;
    // Idempotent; must not be called from the failure handler.
    virtual void close() = 0;
};

}
