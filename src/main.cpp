#include "call_relay/app.hpp"
#include "call_relay/config.hpp"
#include "call_relay/logging.hpp"

#include <atomic>
#include <csignal>
#include <string>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested = true;
}

}

int main() {
    try {
        const auto config = call_relay::Config::load();
        config.validate();
        call_relay::logging::init(config);
        call_relay::info(
            "Starting call-relay",
            {call_relay::kv("rest_port", config.rest_port),
             call_relay::kv("media_stream_port", config.media_stream_port),
             call_relay::kv("media_stream_url", config.media_stream_url),
             call_relay::kv("barge_in", call_relay::to_string(config.barge_in_policy)),
             call_relay::kv("memory", config.memory_enabled)});

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        call_relay::RelayApp app(config);
        app.init();
        app.run(g_stop_requested);
    } catch (const std::exception& ex) {
        call_relay::error(
            "Startup failed",
            {call_relay::kv("error", ex.what())});
        call_relay::logging::shutdown();
        return 1;
    }
    call_relay::logging::shutdown();
    return 0;
}
