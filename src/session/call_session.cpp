#include "call_relay/session/call_session.hpp"

#include <exception>
#include <future>
#include <stdexcept>
#include <thread>

#include "call_relay/logging.hpp"
#include "call_relay/metrics.hpp"
#include "call_relay/utils/async.hpp"
#include "call_relay/utils/text.hpp"

namespace call_relay {

namespace {

std::optional<std::string> find_lead_param(const std::map<std::string, std::string>& params) {
    for (const char* key : {"leadId", "lead_id"}) {
        const auto it = params.find(key);
        if (it != params.end() && !utils::is_blank(it->second)) {
            return it->second;
        }
    }
    return std::nullopt;
}

}

SessionOptions SessionOptions::from_config(const Config& config) {
    SessionOptions options;
    options.barge_in_policy = config.barge_in_policy;
    options.memory_enabled = config.memory_enabled;
    options.memory_max_turns = static_cast<size_t>(config.memory_max_turns);
    options.debounce_window = std::chrono::milliseconds(config.debounce_ms);
    options.min_utterance_chars = static_cast<size_t>(config.min_utterance_chars);
    options.frame_size = static_cast<size_t>(config.frame_size_bytes);
    options.frame_duration = std::chrono::milliseconds(config.frame_duration_ms);
    return options;
}

const char* to_string(CallSession::State state) {
    switch (state) {
        case CallSession::State::Connecting:
            return "connecting";
        case CallSession::State::Active:
            return "active";
        case CallSession::State::Closed:
            return "closed";
    }
    return "unknown";
}

std::shared_ptr<CallSession> CallSession::create(
    SessionOptions options,
    ReplyCapabilities capabilities,
    std::shared_ptr<CarrierChannel> carrier,
    std::unique_ptr<TranscriptionConnection> transcription,
    std::shared_ptr<SessionRegistry> registry,
    std::map<std::string, std::string> connection_params) {
    std::shared_ptr<CallSession> session(new CallSession(std::move(options),
                                                         std::move(capabilities),
                                                         std::move(carrier),
                                                         std::move(transcription),
                                                         std::move(registry),
                                                         std::move(connection_params)));

    std::weak_ptr<CallSession> weak = session;
    ReplyPipeline::Options pipeline_options;
    pipeline_options.frame_size = session->options_.frame_size;
    pipeline_options.padding_byte = audio::kMulawSilence;
    pipeline_options.min_utterance_chars = session->options_.min_utterance_chars;
    pipeline_options.log_context = "pending";
    session->pipeline_ = std::make_unique<ReplyPipeline>(
        std::move(pipeline_options),
        std::move(session->capabilities_),
        [weak](const std::shared_ptr<Reply>& reply) {
            if (auto self = weak.lock()) {
                auto* raw = self.get();
                self->post([raw, reply]() { raw->on_reply_ready(reply); });
            }
        },
        [weak](uint64_t reply_id, const std::string& reason) {
            if (auto self = weak.lock()) {
                auto* raw = self.get();
                self->post([raw, reply_id, reason]() { raw->on_reply_dropped(reply_id, reason); });
            }
        });

    Metrics::instance().session_opened();
    session->open_transcription();
    return session;
}

CallSession::CallSession(SessionOptions options,
                         ReplyCapabilities capabilities,
                         std::shared_ptr<CarrierChannel> carrier,
                         std::unique_ptr<TranscriptionConnection> transcription,
                         std::shared_ptr<SessionRegistry> registry,
                         std::map<std::string, std::string> connection_params)
    : options_(std::move(options)),
      capabilities_(std::move(capabilities)),
      carrier_(std::move(carrier)),
      registry_(std::move(registry)),
      connection_params_(std::move(connection_params)),
      created_at_(Clock::now()),
      aggregator_(options_.debounce_window),
      turn_(options_.barge_in_policy),
      queue_("call_session"),
      transcription_(std::move(transcription)) {}

CallSession::~CallSession() {
    close("session destroyed");
    queue_.stop();
}

void CallSession::open_transcription() {
    if (!transcription_) {
        throw std::invalid_argument("CallSession requires a transcription connection");
    }
    transcription_->open(
        [this](const TranscriptEvent& event) {
            const auto arrived_at = Clock::now();
            post([this, event, arrived_at]() { on_transcript(event, arrived_at); });
        },
        [this](const std::string& reason) {
            post([this, reason]() { on_transcription_failure(reason); });
        });
}

bool CallSession::post(std::function<void()> task) {
    return queue_.post(std::move(task));
}

void CallSession::handle_carrier_message(const std::string& raw) {
    if (closed_) {
        return;
    }
    post([this, raw]() { on_carrier_message(raw); });
}

void CallSession::handle_carrier_disconnect() {
    close("carrier disconnected");
}

void CallSession::on_carrier_message(const std::string& raw) {
    if (closed_) {
        return;
    }
    std::string error;
    const auto message = parse_carrier_message(raw, &error);
    if (!message) {
        logging::warn(
            "Malformed carrier message dropped",
            {kv("error", error),
             kv("call", log_context())});
        Metrics::instance().increment("carrier_malformed");
        return;
    }

    switch (message->event) {
        case CarrierEvent::Connected:
            logging::debug("Carrier stream connected", {kv("call", log_context())});
            break;
        case CarrierEvent::Start:
            on_stream_start(*message);
            break;
        case CarrierEvent::Media:
            on_media(*message);
            break;
        case CarrierEvent::Mark:
            logging::debug(
                "Carrier acknowledged mark",
                {kv("mark", message->mark_name),
                 kv("call", log_context())});
            break;
        case CarrierEvent::Stop:
            on_stream_stop(*message);
            break;
        case CarrierEvent::Unknown:
            logging::debug(
                "Carrier event ignored",
                {kv("event", message->event_name),
                 kv("call", log_context())});
            break;
    }
}

void CallSession::on_stream_start(const CarrierMessage& message) {
    std::optional<LeadInfo> lead;
    const char* lead_source = "none";
    if (registry_ && !message.call_sid.empty()) {
        lead = registry_->take(message.call_sid);
        if (lead) {
            lead_source = "registry";
        }
    }
    if (!lead) {
        auto lead_id = find_lead_param(message.custom_parameters);
        lead_source = "stream parameters";
        if (!lead_id) {
            lead_id = find_lead_param(connection_params_);
            lead_source = "connection query";
        }
        if (lead_id) {
            lead = LeadInfo{*lead_id, ""};
        } else {
            lead_source = "none";
        }
    }
    logging::debug(
        "Lead resolved",
        {kv("source", lead_source),
         kv("lead_id", lead ? lead->lead_id : std::string()),
         kv("stream_sid", message.stream_sid)});

    State previous = State::Connecting;
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_;
        if (state_ == State::Connecting) {
            stream_sid_ = message.stream_sid;
            call_sid_ = message.call_sid;
            lead_ = lead;
            state_ = State::Active;
            turn_.stream_started();
            started = true;
        }
    }
    if (!started) {
        logging::warn(
            "Stream start ignored",
            {kv("stream_sid", message.stream_sid),
             kv("state", to_string(previous)),
             kv("call", log_context())});
        return;
    }
    pipeline_->set_log_context(message.call_sid.empty() ? message.stream_sid : message.call_sid);

    logging::info(
        "Media stream started",
        {kv("stream_sid", message.stream_sid),
         kv("call_sid", message.call_sid),
         kv("lead_id", lead ? lead->lead_id : std::string()),
         kv("barge_in", to_string(options_.barge_in_policy))});
}

void CallSession::on_media(const CarrierMessage& message) {
    bool forward = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != State::Active) {
            return;
        }
        if (!message.track.empty() && message.track != "inbound") {
            return;
        }
        forward = turn_.should_forward_inbound();
    }
    if (!forward) {
        ++media_frames_discarded_;
        return;
    }
    ++media_frames_forwarded_;
    try {
        transcription_->send_audio(message.audio);
    } catch (const std::exception& ex) {
        logging::warn(
            "Failed to forward caller audio",
            {kv("error", ex.what()),
             kv("call", log_context())});
    }
}

void CallSession::on_stream_stop(const CarrierMessage&) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        turn_.stream_stopped();
    }
    if (!aggregator_.latest_partial().empty()) {
        logging::debug(
            "Partial transcript discarded",
            {kv("text", aggregator_.latest_partial()),
             kv("call", log_context())});
    }
    aggregator_.reset();
    if (pipeline_->cancel()) {
        logging::debug("In-flight reply cancelled by stream stop", {kv("call", log_context())});
    }
    logging::info(
        "Media stream stopped",
        {kv("call", log_context()),
         kv("frames_forwarded", media_frames_forwarded_),
         kv("frames_discarded", media_frames_discarded_)});
}

void CallSession::on_transcript(const TranscriptEvent& event, Clock::time_point arrived_at) {
    if (closed_) {
        return;
    }
    const auto utterance = aggregator_.on_transcript_event(event.text, event.is_final, arrived_at);
    if (!utterance) {
        return;
    }

    logging::info(
        "Utterance received",
        {kv("text", utterance->text),
         kv("call", log_context())});

    // Checked and handed off under the lock close() takes before cancelling the
    // pipeline.
    std::optional<uint64_t> reply_id;
    bool accepted = false;
    bool agent_speaking = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        accepted = !closed_ && state_ == State::Active && turn_.state() != TurnState::Idle;
        if (accepted) {
            std::vector<ConversationTurn> memory;
            if (options_.memory_enabled) {
                memory.assign(memory_.begin(), memory_.end());
            }
            std::optional<std::string> lead_id;
            if (lead_) {
                lead_id = lead_->lead_id;
            }
            agent_speaking = turn_.state() == TurnState::AgentSpeaking;
            reply_id = pipeline_->on_utterance(*utterance, std::move(memory), lead_id);
        }
    }
    if (!accepted) {
        logging::debug(
            "Utterance ignored (stream not active)",
            {kv("text", utterance->text),
             kv("call", log_context())});
        return;
    }

    Metrics::instance().increment("utterances");
    if (reply_id && agent_speaking) {
        interrupt_agent("new utterance");
    }
}

void CallSession::on_transcription_failure(const std::string& reason) {
    logging::error(
        "Transcription connection lost",
        {kv("reason", reason),
         kv("call", log_context())});
    Metrics::instance().increment("transcription_failures");
    close("transcription unavailable");
    try {
        carrier_->close("transcription unavailable");
    } catch (const std::exception& ex) {
        logging::warn(
            "Failed to close carrier connection",
            {kv("error", ex.what()),
             kv("call", log_context())});
    }
}

void CallSession::on_reply_ready(const std::shared_ptr<Reply>& reply) {
    if (closed_ || !pipeline_->is_current(reply->id)) {
        logging::debug(
            "Stale reply discarded",
            {kv("reply_id", reply->id),
             kv("call", log_context())});
        pipeline_->complete(reply->id);
        return;
    }

    std::string stream_sid;
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stream_sid = stream_sid_;
        if (state_ == State::Active && !stream_sid.empty()) {
            started = turn_.reply_started();
        }
    }
    if (stream_sid.empty()) {
        logging::warn(
            "Reply dropped: stream id not known yet",
            {kv("reply_id", reply->id),
             kv("call", log_context())});
        Metrics::instance().increment("replies_dropped");
        pipeline_->complete(reply->id);
        return;
    }
    if (!started) {
        logging::debug(
            "Reply dropped: not listening",
            {kv("reply_id", reply->id),
             kv("turn", to_string(turn_state())),
             kv("call", log_context())});
        Metrics::instance().increment("replies_dropped");
        pipeline_->complete(reply->id);
        return;
    }

    logging::info(
        "Reply playback started",
        {kv("reply_id", reply->id),
         kv("text", reply->text),
         kv("frames", reply->frames.size()),
         kv("call", log_context())});
    start_sending(reply, stream_sid);
}

void CallSession::on_reply_dropped(uint64_t reply_id, const std::string& reason) {
    pipeline_->complete(reply_id);
    Metrics::instance().increment("replies_dropped");
    logging::info(
        "Reply dropped",
        {kv("reply_id", reply_id),
         kv("reason", reason),
         kv("call", log_context())});
}

void CallSession::on_reply_sent(const std::shared_ptr<Reply>& reply,
                                bool completed,
                                size_t frames_sent) {
    Metrics::instance().increment("frames_sent", frames_sent);
    pipeline_->complete(reply->id);
    if (closed_ || reply->token->canceled()) {
        logging::debug(
            "Reply playback cancelled",
            {kv("reply_id", reply->id),
             kv("frames_sent", frames_sent),
             kv("call", log_context())});
        return;
    }

    bool remembered = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (turn_.reply_finished() && completed && options_.memory_enabled) {
            memory_.push_back(ConversationTurn{reply->utterance.text, reply->text});
            while (memory_.size() > options_.memory_max_turns) {
                memory_.pop_front();
            }
            remembered = true;
        }
    }
    if (completed) {
        Metrics::instance().increment("replies_sent");
    }
    logging::info(
        completed ? "Reply playback finished" : "Reply playback failed",
        {kv("reply_id", reply->id),
         kv("frames_sent", frames_sent),
         kv("remembered", remembered),
         kv("call", log_context())});
}

void CallSession::interrupt_agent(const char* reason) {
    std::string stream_sid;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!turn_.reply_cancelled()) {
            return;
        }
        stream_sid = stream_sid_;
    }
    send_to_carrier(make_clear_message(stream_sid));
    Metrics::instance().increment("barge_ins");
    logging::info(
        "Agent speech interrupted",
        {kv("reason", reason),
         kv("call", log_context())});
}

void CallSession::start_sending(const std::shared_ptr<Reply>& reply,
                                const std::string& stream_sid) {
    std::weak_ptr<CallSession> weak = weak_from_this();
    auto carrier = carrier_;
    const auto frame_duration = options_.frame_duration;
    const auto context = log_context();

    utils::run_async(
        [weak, carrier, reply, stream_sid, frame_duration, context]() {
            size_t frames_sent = 0;
            bool completed = true;
            for (const auto& frame : reply->frames) {
                {
                    auto self = weak.lock();
                    if (!self || !self->may_send_outbound()) {
                        completed = false;
                        break;
                    }
                }
                bool delivered = false;
                try {
                    delivered = reply->token->run_unless_canceled([&]() {
                        carrier->send_text(make_media_message(stream_sid, frame));
                    });
                } catch (const std::exception& ex) {
                    logging::warn(
                        "Failed to send reply frame",
                        {kv("error", ex.what()),
                         kv("reply_id", reply->id),
                         kv("call", context)});
                }
                if (!delivered) {
                    completed = false;
                    break;
                }
                ++frames_sent;
                if (frame_duration.count() > 0) {
                    std::this_thread::sleep_for(frame_duration);
                }
            }

            if (completed) {
                try {
                    reply->token->run_unless_canceled([&]() {
                        carrier->send_text(make_mark_message(
                            stream_sid, "reply-" + std::to_string(reply->id)));
                    });
                } catch (const std::exception& ex) {
                    logging::debug(
                        "Failed to send reply mark",
                        {kv("error", ex.what()),
                         kv("call", context)});
                }
            }

            if (auto self = weak.lock()) {
                auto* raw = self.get();
                self->post([raw, reply, completed, frames_sent]() {
                    raw->on_reply_sent(reply, completed, frames_sent);
                });
            }
        },
        "reply_sender");
}

void CallSession::send_to_carrier(const std::string& payload) {
    try {
        carrier_->send_text(payload);
    } catch (const std::exception& ex) {
        logging::warn(
            "Failed to send carrier message",
            {kv("error", ex.what()),
             kv("call", log_context())});
    }
}

void CallSession::close(const std::string& reason) {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return;
    }

    std::string call_sid;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = State::Closed;
        turn_.stream_stopped();
        call_sid = call_sid_;
    }
    const auto context = call_sid.empty() ? std::string("pending") : call_sid;

    try {
        if (pipeline_ && pipeline_->cancel()) {
            logging::debug("In-flight reply cancelled on close", {kv("call", context)});
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Failed to cancel in-flight reply",
            {kv("error", ex.what()),
             kv("call", context)});
    }

    try {
        if (transcription_) {
            transcription_->close();
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Failed to close transcription connection",
            {kv("error", ex.what()),
             kv("call", context)});
    }

    if (registry_ && !call_sid.empty()) {
        registry_->erase(call_sid);
    }
    Metrics::instance().session_closed();

    const auto duration = std::chrono::duration<double>(Clock::now() - created_at_).count();
    logging::info(
        "Call session closed",
        {kv("reason", reason),
         kv("call", context),
         kv("duration_sec", duration)});
}

bool CallSession::drain(std::chrono::milliseconds timeout) {
    if (queue_.on_worker_thread()) {
        return true;
    }
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    if (!post([done]() { done->set_value(); })) {
        return false;
    }
    return future.wait_for(timeout) == std::future_status::ready;
}

CallSession::State CallSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

TurnState CallSession::turn_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return turn_.state();
}

std::string CallSession::stream_sid() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stream_sid_;
}

std::string CallSession::call_sid() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return call_sid_;
}

std::optional<LeadInfo> CallSession::lead() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return lead_;
}

std::vector<ConversationTurn> CallSession::memory() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return std::vector<ConversationTurn>(memory_.begin(), memory_.end());
}

bool CallSession::may_send_outbound() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == State::Active && turn_.may_send_outbound();
}

bool CallSession::reply_in_flight() const {
    return pipeline_ && pipeline_->in_flight();
}

std::string CallSession::log_context() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!call_sid_.empty()) {
        return call_sid_;
    }
    if (!stream_sid_.empty()) {
        return stream_sid_;
    }
    return "pending";
}

}
