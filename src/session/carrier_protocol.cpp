#include "call_relay/session/carrier_protocol.hpp"

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

namespace call_relay {

namespace {

CarrierEvent event_from_name(const std::string& name) {
    if (name == "connected") return CarrierEvent::Connected;
    if (name == "start") return CarrierEvent::Start;
    if (name == "media") return CarrierEvent::Media;
    if (name == "mark") return CarrierEvent::Mark;
    if (name == "stop") return CarrierEvent::Stop;
    return CarrierEvent::Unknown;
}

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}

const char* to_string(CarrierEvent event) {
    switch (event) {
        case CarrierEvent::Connected:
            return "connected";
        case CarrierEvent::Start:
            return "start";
        case CarrierEvent::Media:
            return "media";
        case CarrierEvent::Mark:
            return "mark";
        case CarrierEvent::Stop:
            return "stop";
        case CarrierEvent::Unknown:
            break;
    }
    return "unknown";
}

std::optional<CarrierMessage> parse_carrier_message(const std::string& raw, std::string* error) {
    auto fail = [error](const std::string& reason) -> std::optional<CarrierMessage> {
        if (error) {
            *error = reason;
        }
        return std::nullopt;
    };

    const auto payload = nlohmann::json::parse(raw, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return fail("not a JSON object");
    }
    CarrierMessage message;
    message.event_name = string_field(payload, "event");
    if (message.event_name.empty()) {
        return fail("missing event");
    }
    message.event = event_from_name(message.event_name);
    message.stream_sid = string_field(payload, "streamSid");

    switch (message.event) {
        case CarrierEvent::Start: {
            const auto it = payload.find("start");
            if (it == payload.end() || !it->is_object()) {
                return fail("start message without start block");
            }
            const auto& start = *it;
            if (message.stream_sid.empty()) {
                message.stream_sid = string_field(start, "streamSid");
            }
            if (message.stream_sid.empty()) {
                return fail("start message without streamSid");
            }
            message.call_sid = string_field(start, "callSid");
            const auto params = start.find("customParameters");
            if (params != start.end() && params->is_object()) {
                for (auto param = params->begin(); param != params->end(); ++param) {
                    if (param.value().is_string()) {
                        message.custom_parameters[param.key()] = param.value().get<std::string>();
                    }
                }
            }
            break;
        }
        case CarrierEvent::Media: {
            const auto it = payload.find("media");
            if (it == payload.end() || !it->is_object()) {
                return fail("media message without media block");
            }
            const auto encoded = string_field(*it, "payload");
            if (encoded.empty()) {
                return fail("media message without payload");
            }
            message.track = string_field(*it, "track");
            message.audio = websocketpp::base64_decode(encoded);
            break;
        }
        case CarrierEvent::Mark: {
            const auto it = payload.find("mark");
            if (it != payload.end()) {
                message.mark_name = string_field(*it, "name");
            }
            break;
        }
        case CarrierEvent::Stop: {
            const auto it = payload.find("stop");
            if (it != payload.end()) {
                message.call_sid = string_field(*it, "callSid");
            }
            break;
        }
        case CarrierEvent::Connected:
        case CarrierEvent::Unknown:
            break;
    }
    return message;
}

std::string make_media_message(const std::string& stream_sid, const std::string& frame) {
    nlohmann::json message{
        {"event", "media"},
        {"streamSid", stream_sid},
        {"media", {{"track", "outbound"}, {"payload", websocketpp::base64_encode(frame)}}}};
    return message.dump();
}

std::string make_clear_message(const std::string& stream_sid) {
    nlohmann::json message{{"event", "clear"}, {"streamSid", stream_sid}};
    return message.dump();
}

std::string make_mark_message(const std::string& stream_sid, const std::string& name) {
    nlohmann::json message{
        {"event", "mark"},
        {"streamSid", stream_sid},
        {"mark", {{"name", name}}}};
    return message.dump();
}

}
