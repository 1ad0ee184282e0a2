#pragma once

#include <string>

namespace call_relay::utils {

std::string remove_emojis(const std::string& text);
std::string normalize_text(const std::string& text);
std::string trim(const std::string& text);
bool is_blank(const std::string& text);
std::string xml_escape(const std::string& text);

}
