#pragma once

#include <map>
#include <optional>
#include <string>

namespace call_relay {

enum class CarrierEvent {
    Connected,
    Start,
    Media,
    Mark,
    Stop,
    Unknown
};

const char* to_string(CarrierEvent event);

struct CarrierMessage {
    CarrierEvent event = CarrierEvent::Unknown;
    std::string event_name;
    std::string stream_sid;
    std::string call_sid;
    std::map<std::string, std::string> custom_parameters;
    // Decoded media payload.
    std::string audio;
    std::string track;
    std::string mark_name;
};

// Parses one carrier media-stream message. Malformed input yields nullopt.
std::optional<CarrierMessage> parse_carrier_message(const std::string& raw,
                                                    std::string* error = nullptr);

std::string make_media_message(const std::string& stream_sid, const std::string& frame);
std::string make_clear_message(const std::string& stream_sid);
std::string make_mark_message(const std::string& stream_sid, const std::string& name);

}
