#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "call_relay/session/types.hpp"

namespace call_relay {

struct LeadInfo {
    std::string lead_id;
    std::string phone;
};

// Carries per-call metadata from the moment a call is placed to the moment its
// media stream attaches. Entries are keyed by the carrier call SID, written
// once, consumed once and expire after the configured time to live.
class SessionRegistry {
public:
    explicit SessionRegistry(std::chrono::seconds ttl);

    // Returns false when the call SID is already registered.
    bool put(const std::string& call_sid, LeadInfo lead, Clock::time_point now = Clock::now());
    std::optional<LeadInfo> take(const std::string& call_sid, Clock::time_point now = Clock::now());
    void erase(const std::string& call_sid);
    size_t purge_expired(Clock::time_point now = Clock::now());
    size_t size() const;

private:
    struct Entry {
        LeadInfo lead;
        Clock::time_point expires_at;
    };

    size_t purge_locked(Clock::time_point now);

    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}
