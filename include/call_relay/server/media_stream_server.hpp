#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include "call_relay/session/call_session.hpp"
#include "call_relay/session/channels.hpp"

namespace call_relay {

// Accepts carrier media-stream websocket connections. Each connection gets its
// own CallSession, fed with every text message and disconnected when the
// socket closes or fails.
class MediaStreamServer {
public:
    using SessionFactory = std::function<std::shared_ptr<CallSession>(
        std::shared_ptr<CarrierChannel> carrier,
        std::map<std::string, std::string> connection_params)>;

    MediaStreamServer(int port, std::string path, SessionFactory factory);
    ~MediaStreamServer();

    MediaStreamServer(const MediaStreamServer&) = delete;
    MediaStreamServer& operator=(const MediaStreamServer&) = delete;

    void start();
    void stop();

    size_t session_count() const;

private:
    struct State;

    int port_;
    std::string path_;
    SessionFactory factory_;
    std::unique_ptr<State> state_;
    std::thread server_thread_;
};

}
