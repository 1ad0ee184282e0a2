#include "call_relay/utils/text.hpp"

#include <cctype>
#include <cstdint>

namespace call_relay::utils {

namespace {

struct CodePoint {
    uint32_t value = 0;
    size_t length = 1;
    bool valid = false;
};

bool is_emoji_codepoint(uint32_t codepoint) {
    return (codepoint >= 0x1F300 && codepoint <= 0x1FAFF) ||
           (codepoint >= 0x2600 && codepoint <= 0x27BF) ||
           (codepoint >= 0xFE00 && codepoint <= 0xFE0F) ||
           codepoint == 0x200D;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

CodePoint decode_utf8(const std::string& text, size_t index) {
    CodePoint result;
    const auto lead = static_cast<unsigned char>(text[index]);
    size_t length = 0;
    uint32_t value = 0;
    uint32_t minimum = 0;
    if (lead < 0x80) {
        result.value = lead;
        result.valid = true;
        return result;
    }
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        value = lead & 0x1F;
        minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        value = lead & 0x0F;
        minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        value = lead & 0x07;
        minimum = 0x10000;
    } else {
        return result;
    }
    if (index + length > text.size()) {
        return result;
    }
    for (size_t i = 1; i < length; ++i) {
        const auto byte = static_cast<unsigned char>(text[index + i]);
        if (!is_continuation(byte)) {
            return result;
        }
        value = (value << 6) | (byte & 0x3F);
    }
    if (value < minimum || value > 0x10FFFF) {
        return result;
    }
    result.value = value;
    result.length = length;
    result.valid = true;
    return result;
}

}

std::string remove_emojis(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        const auto codepoint = decode_utf8(text, i);
        if (!codepoint.valid) {
            result.push_back(text[i]);
            ++i;
            continue;
        }
        if (!is_emoji_codepoint(codepoint.value)) {
            result.append(text, i, codepoint.length);
        }
        i += codepoint.length;
    }
    return result;
}

std::string normalize_text(const std::string& text) {
    std::string normalized;
    normalized.reserve(text.size());
    bool in_space = false;
    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            if (!in_space) {
                normalized.push_back(' ');
                in_space = true;
            }
        } else {
            normalized.push_back(static_cast<char>(std::tolower(ch)));
            in_space = false;
        }
    }
    if (!normalized.empty() && normalized.front() == ' ') {
        normalized.erase(normalized.begin());
    }
    if (!normalized.empty() && normalized.back() == ' ') {
        normalized.pop_back();
    }
    return normalized;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool is_blank(const std::string& text) {
    for (unsigned char ch : text) {
        if (!std::isspace(ch)) {
            return false;
        }
    }
    return true;
}

std::string xml_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '\'':
                escaped += "&apos;";
                break;
            default:
                escaped.push_back(ch);
        }
    }
    return escaped;
}

}
