#include "call_relay/session/session_registry.hpp"

#include "call_relay/logging.hpp"

namespace call_relay {

SessionRegistry::SessionRegistry(std::chrono::seconds ttl) : ttl_(ttl) {}

bool SessionRegistry::put(const std::string& call_sid, LeadInfo lead, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_locked(now);
    const auto inserted = entries_.emplace(call_sid, Entry{std::move(lead), now + ttl_}).second;
    if (!inserted) {
        logging::warn(
            "Call already registered",
            {kv("call_sid", call_sid)});
    }
    return inserted;
}

std::optional<LeadInfo> SessionRegistry::take(const std::string& call_sid, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_locked(now);
    auto it = entries_.find(call_sid);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    auto lead = std::move(it->second.lead);
    entries_.erase(it);
    return lead;
}

void SessionRegistry::erase(const std::string& call_sid) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(call_sid);
}

size_t SessionRegistry::purge_expired(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return purge_locked(now);
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t SessionRegistry::purge_locked(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now) {
            logging::debug(
                "Registered call expired before its stream attached",
                {kv("call_sid", it->first)});
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}
