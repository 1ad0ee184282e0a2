#pragma once

#include "call_relay/config.hpp"

namespace call_relay {

enum class TurnState {
    Idle,
    Listening,
    AgentSpeaking,
    CancelledListening
};

const char* to_string(TurnState state);

// Whose turn it is to speak on one call. Rejected transitions return false
// and leave the state unchanged. Not synchronized; the owning session
// serializes access.
class TurnTaking {
public:
    explicit TurnTaking(BargeInPolicy policy);

    TurnState state() const { return state_; }
    BargeInPolicy policy() const { return policy_; }

    bool stream_started();
    bool reply_started();
    bool reply_finished();
    bool reply_cancelled();
    // Terminal. Returns false if already stopped.
    bool stream_stopped();

    bool is_listening() const;
    bool should_forward_inbound() const;
    bool may_send_outbound() const;

private:
    bool transition(TurnState to, const char* trigger);

    BargeInPolicy policy_;
    TurnState state_ = TurnState::Idle;
    bool stopped_ = false;
};

}
