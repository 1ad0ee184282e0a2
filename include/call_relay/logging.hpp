#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "call_relay/config.hpp"
#include "spdlog/logger.h"

namespace call_relay {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << std::boolalpha << value;
    return {key, oss.str()};
}

inline KeyValue kv(const std::string& key, const std::optional<std::string>& value) {
    return {key, value.value_or("")};
}

// Renders items as `k=v, k2="v 2"`. Values that are empty or contain spaces,
// commas, '=' or quotes are quoted; quotes and line breaks inside are escaped.
std::string format_kv(std::initializer_list<KeyValue> items);

// `message [k=v, ...]`, or the bare message when there are no items.
std::string with_kv(const std::string& message, std::initializer_list<KeyValue> items);

void init(const Config& config);
// Flushes the file sink; call once on the way out of main().
void shutdown();
std::shared_ptr<spdlog::logger> get_logger();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, items));
    }
}

inline void trace(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

}

using logging::kv;
using logging::with_kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::trace;
using logging::warn;

}
