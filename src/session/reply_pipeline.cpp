#include "call_relay/session/reply_pipeline.hpp"

#include <chrono>
#include <exception>

#include "call_relay/logging.hpp"
#include "call_relay/metrics.hpp"
#include "call_relay/utils/async.hpp"
#include "call_relay/utils/text.hpp"

namespace call_relay {

namespace {

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

}

ReplyPipeline::ReplyPipeline(Options options,
                             ReplyCapabilities capabilities,
                             ReadyFn ready_fn,
                             DroppedFn dropped_fn)
    : options_(std::move(options)),
      capabilities_(std::move(capabilities)),
      ready_fn_(std::move(ready_fn)),
      dropped_fn_(std::move(dropped_fn)) {}

ReplyPipeline::~ReplyPipeline() {
    cancel();
}

std::optional<uint64_t> ReplyPipeline::on_utterance(const Utterance& utterance,
                                                    std::vector<ConversationTurn> memory,
                                                    std::optional<std::string> lead_id) {
    Options options;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        options = options_;
    }

    const auto text = utils::trim(utterance.text);
    if (text.size() < options.min_utterance_chars) {
        logging::debug(
            "Utterance ignored (too short)",
            {kv("text", text),
             kv("min_chars", options.min_utterance_chars),
             kv("call", options.log_context)});
        return std::nullopt;
    }

    auto reply = std::make_shared<Reply>();
    reply->utterance = utterance;
    reply->utterance.text = text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_) {
            current_->token->cancel();
            logging::debug(
                "Reply superseded by new utterance",
                {kv("reply_id", current_->id),
                 kv("call", options.log_context)});
            Metrics::instance().increment("replies_cancelled");
        }
        reply->id = next_id_++;
        current_ = reply;
    }

    GenerationRequest request{text, std::move(memory), std::move(lead_id)};
    utils::run_async(
        [reply,
         request = std::move(request),
         capabilities = capabilities_,
         options = std::move(options),
         ready_fn = ready_fn_,
         dropped_fn = dropped_fn_]() {
            build_reply(reply, request, capabilities, options, ready_fn, dropped_fn);
        },
        "reply_builder");
    return reply->id;
}

bool ReplyPipeline::cancel() {
    std::shared_ptr<Reply> reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reply = std::move(current_);
        current_.reset();
    }
    if (!reply) {
        return false;
    }
    reply->token->cancel();
    return true;
}

bool ReplyPipeline::is_current(uint64_t reply_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ && current_->id == reply_id && !current_->token->canceled();
}

void ReplyPipeline::complete(uint64_t reply_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ && current_->id == reply_id) {
        current_.reset();
    }
}

bool ReplyPipeline::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(current_);
}

std::shared_ptr<Reply> ReplyPipeline::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void ReplyPipeline::set_log_context(std::string context) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.log_context = std::move(context);
}

void ReplyPipeline::build_reply(const std::shared_ptr<Reply>& reply,
                                const GenerationRequest& request,
                                const ReplyCapabilities& capabilities,
                                const Options& options,
                                const ReadyFn& ready_fn,
                                const DroppedFn& dropped_fn) {
    auto drop = [&](const std::string& reason) {
        if (dropped_fn) {
            dropped_fn(reply->id, reason);
        }
    };

    std::string text;
    const auto generate_start = Clock::now();
    try {
        text = capabilities.generate(request);
    } catch (const std::exception& ex) {
        logging::error(
            "Reply generation failed",
            {kv("error", ex.what()),
             kv("reply_id", reply->id),
             kv("call", options.log_context)});
        drop("generation failed");
        return;
    }
    Metrics::instance().observe_latency("generate", seconds_since(generate_start));
    if (reply->token->canceled()) {
        drop("superseded");
        return;
    }
    text = utils::trim(utils::remove_emojis(text));
    if (text.empty()) {
        logging::info(
            "Reply generation returned no text",
            {kv("reply_id", reply->id),
             kv("call", options.log_context)});
        drop("empty generation");
        return;
    }
    reply->text = text;
    logging::debug(
        "Reply generated",
        {kv("reply_id", reply->id),
         kv("text", text),
         kv("call", options.log_context)});

    std::string synthesized;
    const auto synthesize_start = Clock::now();
    try {
        synthesized = capabilities.synthesize(text);
    } catch (const std::exception& ex) {
        logging::error(
            "Speech synthesis failed",
            {kv("error", ex.what()),
             kv("reply_id", reply->id),
             kv("call", options.log_context)});
        drop("synthesis failed");
        return;
    }
    Metrics::instance().observe_latency("synthesize", seconds_since(synthesize_start));
    if (reply->token->canceled()) {
        drop("superseded");
        return;
    }
    if (synthesized.empty()) {
        logging::info(
            "Speech synthesis returned no audio",
            {kv("reply_id", reply->id),
             kv("call", options.log_context)});
        drop("empty synthesis");
        return;
    }

    std::string carrier_audio;
    try {
        carrier_audio = capabilities.convert ? capabilities.convert(synthesized) : synthesized;
    } catch (const std::exception& ex) {
        logging::error(
            "Audio conversion failed",
            {kv("error", ex.what()),
             kv("reply_id", reply->id),
             kv("call", options.log_context)});
        drop("conversion failed");
        return;
    }
    reply->frames = audio::reframe(std::move(carrier_audio), options.frame_size,
                                   options.padding_byte);
    if (reply->token->canceled()) {
        drop("superseded");
        return;
    }
    if (reply->frames.empty()) {
        drop("no audio frames");
        return;
    }
    Metrics::instance().observe_latency("reply", seconds_since(reply->utterance.arrived_at));
    if (ready_fn) {
        ready_fn(reply);
    }
}

}
