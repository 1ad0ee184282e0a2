#include "call_relay/server/media_stream_server.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "call_relay/logging.hpp"
#include "call_relay/metrics.hpp"
#include "call_relay/utils/async.hpp"
#include "call_relay/utils/http.hpp"

namespace call_relay {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;

std::string resource_path(const std::string& resource) {
    const auto query = resource.find('?');
    return query == std::string::npos ? resource : resource.substr(0, query);
}

class WsCarrierChannel : public CarrierChannel {
public:
    WsCarrierChannel(WsServer& server, websocketpp::connection_hdl connection)
        : server_(server), connection_(std::move(connection)) {}

    void send_text(const std::string& payload) override {
        websocketpp::lib::error_code ec;
        server_.send(connection_, payload, websocketpp::frame::opcode::text, ec);
        if (ec) {
            throw std::runtime_error("carrier send failed: " + ec.message());
        }
    }

    void close(const std::string& reason) override {
        websocketpp::lib::error_code ec;
        server_.close(connection_, websocketpp::close::status::going_away, reason, ec);
        if (ec) {
            logging::debug("Carrier connection already closed", {kv("error", ec.message())});
        }
    }

private:
    WsServer& server_;
    websocketpp::connection_hdl connection_;
};

}

struct MediaStreamServer::State {
    WsServer server;
    mutable std::mutex sessions_mutex;
    std::map<websocketpp::connection_hdl,
             std::shared_ptr<CallSession>,
             std::owner_less<websocketpp::connection_hdl>> sessions;

    std::shared_ptr<CallSession> find(websocketpp::connection_hdl hdl) const {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        const auto it = sessions.find(hdl);
        return it == sessions.end() ? nullptr : it->second;
    }

    std::shared_ptr<CallSession> release(websocketpp::connection_hdl hdl) {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        const auto it = sessions.find(hdl);
        if (it == sessions.end()) {
            return nullptr;
        }
        auto session = std::move(it->second);
        sessions.erase(it);
        return session;
    }
};

MediaStreamServer::MediaStreamServer(int port, std::string path, SessionFactory factory)
    : port_(port),
      path_(std::move(path)),
      factory_(std::move(factory)),
      state_(std::make_unique<State>()) {}

MediaStreamServer::~MediaStreamServer() {
    stop();
}

void MediaStreamServer::start() {
    auto& server = state_->server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([this](websocketpp::connection_hdl hdl) {
        auto connection = state_->server.get_con_from_hdl(hdl);
        const auto path = resource_path(connection->get_resource());
        if (path != path_) {
            logging::warn("Media stream connection rejected", {kv("path", path)});
            connection->set_status(websocketpp::http::status_code::not_found);
            return false;
        }
        return true;
    });

    server.set_open_handler([this](websocketpp::connection_hdl hdl) {
        auto connection = state_->server.get_con_from_hdl(hdl);
        const auto resource = connection->get_resource();
        const auto query = resource.find('?');
        auto params = query == std::string::npos
                          ? std::map<std::string, std::string>{}
                          : utils::parse_query(resource.substr(query + 1));

        auto carrier = std::make_shared<WsCarrierChannel>(state_->server, hdl);
        std::shared_ptr<CallSession> session;
        try {
            session = factory_(carrier, std::move(params));
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to create call session",
                {kv("error", ex.what())});
            carrier->close("session unavailable");
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_->sessions_mutex);
            state_->sessions[hdl] = session;
        }
        Metrics::instance().increment("media_connections");
        logging::info(
            "Media stream connection accepted",
            {kv("remote", connection->get_remote_endpoint())});
    });

    server.set_message_handler([this](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
        if (msg->get_opcode() != websocketpp::frame::opcode::text) {
            return;
        }
        if (auto session = state_->find(hdl)) {
            session->handle_carrier_message(msg->get_payload());
        }
    });

    auto disconnect = [this](websocketpp::connection_hdl hdl) {
        auto session = state_->release(hdl);
        if (!session) {
            return;
        }
        logging::info("Media stream connection closed", {kv("call", session->call_sid())});
        utils::run_async([session]() { session->handle_carrier_disconnect(); },
                         "session_close");
    };
    server.set_close_handler(disconnect);
    server.set_fail_handler(disconnect);

    server.listen(static_cast<uint16_t>(port_));
    server.start_accept();

    server_thread_ = std::thread([this]() {
        logging::info(
            "Media stream server listening",
            {kv("port", port_),
             kv("path", path_)});
        try {
            state_->server.run();
        } catch (const std::exception& ex) {
            logging::error("Media stream server stopped", {kv("error", ex.what())});
        }
    });
}

void MediaStreamServer::stop() {
    if (!server_thread_.joinable()) {
        return;
    }
    websocketpp::lib::error_code ec;
    state_->server.stop_listening(ec);

    std::vector<std::shared_ptr<CallSession>> remaining;
    {
        std::lock_guard<std::mutex> lock(state_->sessions_mutex);
        for (auto& item : state_->sessions) {
            remaining.push_back(item.second);
        }
        state_->sessions.clear();
    }
    for (auto& session : remaining) {
        session->close("server shutdown");
    }
    state_->server.stop();
    server_thread_.join();
}

size_t MediaStreamServer::session_count() const {
    std::lock_guard<std::mutex> lock(state_->sessions_mutex);
    return state_->sessions.size();
}

}
