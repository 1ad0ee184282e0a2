#include "call_relay/server/rest_server.hpp"

#include <sstream>

#include "call_relay/logging.hpp"
#include "call_relay/metrics.hpp"
#include "call_relay/utils/http.hpp"
#include "call_relay/utils/text.hpp"

namespace call_relay {

RestServer::RestServer(const Config& config, StartCallHandler on_start_call, VoiceHandler on_voice)
    : config_(config),
      on_start_call_(std::move(on_start_call)),
      on_voice_(std::move(on_voice)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"},
                               {"active_sessions", Metrics::instance().active_sessions()}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/start-call", [this](const httplib::Request& req, httplib::Response& res) {
        const auto body = parse_request_fields(req.get_header_value("Content-Type"), req.body);
        if (!body) {
            logging::warn("Failed to parse /start-call request");
            res.status = 400;
            res.set_content(R"({"error":"invalid request body"})", "application/json");
            return;
        }
        try {
            write_json(res, on_start_call_(*body));
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to handle /start-call request",
                {kv("error", ex.what())});
            write_json(res, RestResponse{500, nlohmann::json{{"error", ex.what()}}});
        }
    });

    auto voice = [this](const httplib::Request& req, httplib::Response& res) {
        std::string lead_id = req.get_param_value("leadId");
        if (lead_id.empty() && req.method == "POST") {
            const auto body = parse_request_fields(req.get_header_value("Content-Type"), req.body);
            if (body && body->contains("leadId") && (*body)["leadId"].is_string()) {
                lead_id = (*body)["leadId"].get<std::string>();
            }
        }
        try {
            res.set_content(on_voice_(lead_id), "text/xml");
            Metrics::instance().increment("voice_webhooks");
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to build voice webhook response",
                {kv("error", ex.what())});
            res.status = 500;
            res.set_content("<Response><Hangup/></Response>", "text/xml");
        }
    };
    server_->Post("/twilio/voice", voice);
    server_->Get("/twilio/voice", voice);

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.rest_port)});
        if (!server_->listen("0.0.0.0", config_.rest_port)) {
            logging::error(
                "REST server failed to listen",
                {kv("port", config_.rest_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

std::optional<nlohmann::json> parse_request_fields(const std::string& content_type,
                                                   const std::string& body) {
    if (content_type.find("application/x-www-form-urlencoded") != std::string::npos) {
        nlohmann::json fields = nlohmann::json::object();
        for (const auto& item : utils::parse_query(body)) {
            fields[item.first] = item.second;
        }
        return fields;
    }
    if (utils::is_blank(body)) {
        return nlohmann::json::object();
    }
    auto fields = nlohmann::json::parse(body, nullptr, false);
    if (fields.is_discarded() || !fields.is_object()) {
        return std::nullopt;
    }
    return fields;
}

std::string build_stream_twiml(const std::string& stream_url,
                               const std::string& lead_id,
                               const std::optional<std::string>& greeting) {
    std::ostringstream out;
    out << R"(<?xml version="1.0" encoding="UTF-8"?>)" << "\n";
    out << "<Response>\n";
    if (greeting && !utils::is_blank(*greeting)) {
        out << "  <Say>" << utils::xml_escape(*greeting) << "</Say>\n";
    }
    out << "  <Connect>\n";
    out << "    <Stream url=\"" << utils::xml_escape(stream_url) << "\">\n";
    out << "      <Parameter name=\"leadId\" value=\"" << utils::xml_escape(lead_id) << "\"/>\n";
    out << "    </Stream>\n";
    out << "  </Connect>\n";
    out << "</Response>\n";
    return out.str();
}

}
