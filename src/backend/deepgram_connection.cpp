#include "call_relay/backend/deepgram_connection.hpp"

#include <utility>

#include <nlohmann/json.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "call_relay/logging.hpp"
#include "call_relay/metrics.hpp"
#include "call_relay/utils/http.hpp"
#include "call_relay/utils/text.hpp"

namespace call_relay {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = websocketpp::lib::asio::ssl::context;

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               Clock::now().time_since_epoch())
        .count();
}

}

struct DeepgramConnection::WsState {
    std::shared_ptr<WsClient> client;
    websocketpp::connection_hdl connection;
    WsClient::timer_ptr keepalive_timer;
    std::atomic<bool> open{false};
    std::atomic<int64_t> last_audio_ms{0};
};

DeepgramOptions DeepgramOptions::from_config(const Config& config) {
    DeepgramOptions options;
    options.url = config.deepgram_url;
    options.api_key = config.deepgram_api_key;
    options.model = config.deepgram_model;
    options.max_reconnects = config.transcription_max_reconnects;
    return options;
}

DeepgramConnection::DeepgramConnection(DeepgramOptions options)
    : options_(std::move(options)) {}

DeepgramConnection::~DeepgramConnection() {
    close();
}

void DeepgramConnection::open(EventHandler on_event, FailureHandler on_failure) {
    if (running_ || worker_.joinable()) {
        return;
    }
    on_event_ = std::move(on_event);
    on_failure_ = std::move(on_failure);
    running_ = true;
    worker_ = std::thread([this]() { run_loop(); });
}

void DeepgramConnection::send_audio(const std::string& audio) {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!ws_state_ || !ws_state_->open || ws_state_->connection.expired()) {
        ++audio_dropped_;
        return;
    }
    websocketpp::lib::error_code ec;
    ws_state_->client->send(ws_state_->connection, audio.data(), audio.size(),
                            websocketpp::frame::opcode::binary, ec);
    if (ec) {
        ++audio_dropped_;
        logging::trace("Transcription audio send failed", {kv("error", ec.message())});
        return;
    }
    ws_state_->last_audio_ms = now_ms();
}

void DeepgramConnection::close() {
    const bool was_running = running_.exchange(false);
    if (was_running) {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
        }
        wait_cv_.notify_all();

        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_ && ws_state_->client) {
            websocketpp::lib::error_code ec;
            if (ws_state_->open && !ws_state_->connection.expired()) {
                ws_state_->client->send(ws_state_->connection, R"({"type":"CloseStream"})",
                                        websocketpp::frame::opcode::text, ec);
                ws_state_->client->close(ws_state_->connection,
                                         websocketpp::close::status::normal,
                                         "call ended", ec);
            }
            if (!ws_state_->open || ec) {
                ws_state_->client->stop();
            }
        }
    }
    if (!worker_.joinable()) {
        return;
    }
    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
        return;
    }
    worker_.join();
    if (audio_dropped_ > 0) {
        logging::debug(
            "Transcription audio dropped while disconnected",
            {kv("chunks", audio_dropped_)});
    }
}

std::string DeepgramConnection::listen_url() const {
    const utils::QueryParams params = {
        {"model", options_.model},
        {"encoding", "mulaw"},
        {"sample_rate", "8000"},
        {"channels", "1"},
        {"interim_results", "true"},
        {"punctuate", "true"},
    };
    const auto separator = options_.url.find('?') == std::string::npos ? "?" : "&";
    return options_.url + separator + utils::encode_query(params);
}

void DeepgramConnection::run_loop() {
    int failures = 0;
    while (running_) {
        bool opened = false;
        const auto reason = run_once(opened);
        if (!running_) {
            break;
        }
        if (opened) {
            failures = 0;
        }
        if (failures >= options_.max_reconnects) {
            running_ = false;
            logging::error(
                "Transcription connection failed permanently",
                {kv("reason", reason),
                 kv("attempts", failures + 1)});
            if (on_failure_) {
                on_failure_(reason);
            }
            break;
        }
        ++failures;
        Metrics::instance().increment("transcription_reconnects");
        logging::warn(
            "Transcription connection lost, reconnecting",
            {kv("reason", reason),
             kv("attempt", failures),
             kv("max_attempts", options_.max_reconnects)});
        if (!wait_before_reconnect()) {
            break;
        }
    }
}

bool DeepgramConnection::wait_before_reconnect() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, options_.reconnect_delay, [this]() { return !running_; });
    return running_;
}

std::string DeepgramConnection::run_once(bool& opened) {
    auto state = std::make_shared<WsState>();
    state->client = std::make_shared<WsClient>();
    auto& client = *state->client;
    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);
    client.init_asio();

    std::string reason = "connection closed";
    std::weak_ptr<WsState> weak_state = state;

    client.set_tls_init_handler([](websocketpp::connection_hdl) {
        auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tlsv12_client);
        context->set_default_verify_paths();
        context->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
        return context;
    });

    std::function<void()> schedule_keepalive;
    schedule_keepalive = [this, weak_state, &schedule_keepalive]() {
        auto current = weak_state.lock();
        if (!current) {
            return;
        }
        current->keepalive_timer = current->client->set_timer(
            static_cast<long>(options_.keepalive_interval.count()),
            [this, weak_state, &schedule_keepalive](const websocketpp::lib::error_code& ec) {
                auto timer_state = weak_state.lock();
                if (ec || !timer_state || !timer_state->open || !running_) {
                    return;
                }
                const auto idle_ms = now_ms() - timer_state->last_audio_ms.load();
                if (idle_ms >= options_.keepalive_interval.count()) {
                    websocketpp::lib::error_code send_ec;
                    timer_state->client->send(timer_state->connection, R"({"type":"KeepAlive"})",
                                              websocketpp::frame::opcode::text, send_ec);
                }
                schedule_keepalive();
            });
    };

    client.set_open_handler([&, weak_state](websocketpp::connection_hdl) {
        if (auto current = weak_state.lock()) {
            current->open = true;
            current->last_audio_ms = now_ms();
        }
        opened = true;
        logging::info("Transcription connection opened", {kv("model", options_.model)});
        schedule_keepalive();
    });

    client.set_message_handler([this](websocketpp::connection_hdl, WsClient::message_ptr msg) {
        if (msg->get_opcode() != websocketpp::frame::opcode::text) {
            return;
        }
        const auto event = parse_deepgram_message(msg->get_payload());
        if (event && on_event_) {
            on_event_(*event);
        }
    });

    auto stop_keepalive = [weak_state]() {
        if (auto current = weak_state.lock()) {
            current->open = false;
            if (current->keepalive_timer) {
                current->keepalive_timer->cancel();
            }
        }
    };

    client.set_close_handler([&, stop_keepalive](websocketpp::connection_hdl hdl) {
        stop_keepalive();
        websocketpp::lib::error_code ec;
        auto connection = client.get_con_from_hdl(hdl, ec);
        if (!ec && connection) {
            reason = "closed by remote: " + std::to_string(connection->get_remote_close_code()) +
                     " " + connection->get_remote_close_reason();
        }
    });

    client.set_fail_handler([&, stop_keepalive](websocketpp::connection_hdl hdl) {
        stop_keepalive();
        websocketpp::lib::error_code ec;
        auto connection = client.get_con_from_hdl(hdl, ec);
        reason = (!ec && connection) ? "connect failed: " + connection->get_ec().message()
                                     : std::string("connect failed");
    });

    websocketpp::lib::error_code ec;
    auto connection = client.get_connection(listen_url(), ec);
    if (ec) {
        return "invalid transcription url: " + ec.message();
    }
    connection->append_header("Authorization", "Token " + options_.api_key);
    state->connection = connection->get_handle();

    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (!running_) {
            return "closed";
        }
        ws_state_ = state;
    }
    client.connect(connection);
    try {
        client.run();
    } catch (const std::exception& ex) {
        reason = std::string("transcription loop error: ") + ex.what();
    }

    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        ws_state_.reset();
    }
    return reason;
}

std::optional<TranscriptEvent> parse_deepgram_message(const std::string& raw) {
    const auto payload = nlohmann::json::parse(raw, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        logging::warn("Malformed transcription message dropped", {kv("bytes", raw.size())});
        return std::nullopt;
    }

    try {
        const auto type = payload.value("type", std::string("Results"));
        if (type != "Results") {
            logging::debug("Transcription message ignored", {kv("type", type)});
            return std::nullopt;
        }
        const auto& alternatives = payload.at("channel").at("alternatives");
        if (!alternatives.is_array() || alternatives.empty()) {
            return std::nullopt;
        }
        TranscriptEvent event;
        event.text = alternatives.at(0).value("transcript", std::string());
        event.is_final = payload.value("is_final", false);
        if (utils::is_blank(event.text)) {
            return std::nullopt;
        }
        return event;
    } catch (const nlohmann::json::exception& ex) {
        logging::warn("Malformed transcription message dropped", {kv("error", ex.what())});
        return std::nullopt;
    }
}

}
