#include "call_relay/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <string>
#include <vector>

#include "spdlog/fmt/fmt.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace call_relay::logging {

namespace {

std::string& logger_name() {
    static std::string name = "call_relay";
    return name;
}

bool needs_quotes(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return value.find_first_of(" ,=\"\n\r\t") != std::string::npos;
}

void append_quoted(fmt::memory_buffer& out, const std::string& value) {
    out.push_back('"');
    for (const char ch : value) {
        switch (ch) {
            case '"':
                fmt::format_to(std::back_inserter(out), "\\\"");
                break;
            case '\n':
                fmt::format_to(std::back_inserter(out), "\\n");
                break;
            case '\r':
                fmt::format_to(std::back_inserter(out), "\\r");
                break;
            default:
                out.push_back(ch);
        }
    }
    out.push_back('"');
}

spdlog::level::level_enum parse_level(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

}

std::string format_kv(std::initializer_list<KeyValue> items) {
    fmt::memory_buffer out;
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            fmt::format_to(std::back_inserter(out), ", ");
        }
        first = false;
        fmt::format_to(std::back_inserter(out), "{}=", item.key);
        if (needs_quotes(item.value)) {
            append_quoted(out, item.value);
        } else {
            fmt::format_to(std::back_inserter(out), "{}", item.value);
        }
    }
    return fmt::to_string(out);
}

std::string with_kv(const std::string& message, std::initializer_list<KeyValue> items) {
    if (items.size() == 0) {
        return message;
    }
    return fmt::format("{} [{}]", message, format_kv(items));
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(),
                                                                            true));
    }

    logger_name() = config.log_name;
    spdlog::drop(config.log_name);
    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_level(config.log_level));
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (auto logger = spdlog::get(logger_name())) {
        return logger;
    }
    return spdlog::default_logger();
}

void shutdown() {
    if (auto logger = spdlog::get(logger_name())) {
        logger->flush();
    }
    spdlog::shutdown();
}

}
