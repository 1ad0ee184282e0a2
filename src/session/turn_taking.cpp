#include "call_relay/session/turn_taking.hpp"

#include "call_relay/logging.hpp"

namespace call_relay {

const char* to_string(TurnState state) {
    switch (state) {
        case TurnState::Idle:
            return "IDLE";
        case TurnState::Listening:
            return "LISTENING";
        case TurnState::AgentSpeaking:
            return "AGENT_SPEAKING";
        case TurnState::CancelledListening:
            return "CANCELLED_LISTENING";
    }
    return "UNKNOWN";
}

TurnTaking::TurnTaking(BargeInPolicy policy) : policy_(policy) {}

bool TurnTaking::stream_started() {
    if (stopped_ || state_ != TurnState::Idle) {
        logging::debug(
            "Turn transition rejected",
            {kv("trigger", "stream_started"),
             kv("state", to_string(state_))});
        return false;
    }
    return transition(TurnState::Listening, "stream_started");
}

bool TurnTaking::reply_started() {
    if (!is_listening()) {
        logging::debug(
            "Turn transition rejected",
            {kv("trigger", "reply_started"),
             kv("state", to_string(state_))});
        return false;
    }
    return transition(TurnState::AgentSpeaking, "reply_started");
}

bool TurnTaking::reply_finished() {
    if (state_ != TurnState::AgentSpeaking) {
        return false;
    }
    return transition(TurnState::Listening, "reply_finished");
}

bool TurnTaking::reply_cancelled() {
    if (state_ != TurnState::AgentSpeaking) {
        return false;
    }
    return transition(TurnState::CancelledListening, "reply_cancelled");
}

bool TurnTaking::stream_stopped() {
    if (stopped_) {
        return false;
    }
    stopped_ = true;
    return transition(TurnState::Idle, "stream_stopped");
}

bool TurnTaking::is_listening() const {
    return state_ == TurnState::Listening || state_ == TurnState::CancelledListening;
}

bool TurnTaking::should_forward_inbound() const {
    if (is_listening()) {
        return true;
    }
    return state_ == TurnState::AgentSpeaking && policy_ == BargeInPolicy::Forward;
}

bool TurnTaking::may_send_outbound() const {
    return state_ == TurnState::AgentSpeaking;
}

bool TurnTaking::transition(TurnState to, const char* trigger) {
    const auto from = state_;
    state_ = to;
    logging::trace(
        "Turn state change",
        {kv("trigger", trigger),
         kv("from", to_string(from)),
         kv("to", to_string(to))});
    return true;
}

}
