#include "turn_pipeline.h"
#include "worker_pool.h"
#include "logger.h"
#include "utils.h"
#include <sstream>

namespace call_relay {

const char* disposition_name(TurnDisposition disposition) {
    switch (disposition) {
        case TurnDisposition::Pending: return "Pending";
        case TurnDisposition::Delivered: return "Delivered";
        case TurnDisposition::SkippedEmpty: return "SkippedEmpty";
        case TurnDisposition::FailedDecode: return "FailedDecode";
        case TurnDisposition::FailedTranscribe: return "FailedTranscribe";
        case TurnDisposition::FailedChat: return "FailedChat";
        case TurnDisposition::FailedSynthesize: return "FailedSynthesize";
        case TurnDisposition::Dropped: return "Dropped";
    }
    return "Unknown";
}

TurnPipeline::TurnPipeline(ITranscriber& transcriber,
                           IChatBackend& chat,
                           ISynthesizer& synthesizer,
                           const PipelineConfig& config,
                           const AudioFormat& format)
    : transcriber_(transcriber),
      chat_(chat),
      synthesizer_(synthesizer),
      config_(config),
      format_(format),
      workers_(std::make_unique<WorkerPool>("turns",
                                            config.max_concurrent_turns > 0 ? config.max_concurrent_turns : 1,
                                            config.max_queued_turns)),
      next_turn_id_(1),
      dispatched_(0) {
    for (auto& counter : outcomes_) {
        counter.store(0);
    }
}

TurnPipeline::~TurnPipeline() {
    shutdown();
    // Join before the counters and hooks the jobs use go away
    workers_.reset();
}

void TurnPipeline::set_reply_sink(ReplySink sink) {
    reply_sink_ = std::move(sink);
}

void TurnPipeline::set_session_probe(SessionProbe probe) {
    session_probe_ = std::move(probe);
}

void TurnPipeline::set_turn_observer(TurnObserver observer) {
    observer_ = std::move(observer);
}

void TurnPipeline::record(TurnDisposition disposition) {
    outcomes_[static_cast<size_t>(disposition)].fetch_add(1);
}

void TurnPipeline::finish(TurnContext& turn) {
    record(turn.disposition);
    LOG_TRACE(turn.turn_id, "done", disposition_name(turn.disposition));
    if (observer_) {
        observer_(turn);
    }
}

bool TurnPipeline::deliver(TurnContext& turn, const std::string& text) {
    Result<SynthesizedAudio> audio = make_error(ErrorType::PipelineError, "synthesizer not called");
    try {
        audio = synthesizer_.synthesize(text);
    } catch (const std::exception& e) {
        audio = make_error(ErrorType::PipelineError, std::string("synthesizer threw: ") + e.what());
    }
    if (!audio) {
        LOG_WARN("[Turn] #" + std::to_string(turn.turn_id) + " synthesis failed: " + audio.error().describe());
        turn.disposition = TurnDisposition::FailedSynthesize;
        return false;
    }

    turn.reply_audio = strip_wav_header(audio.value().bytes);
    LOG_TRACE(turn.turn_id, "synthesize", std::to_string(turn.reply_audio.size()) + " bytes " +
                                          audio.value().content_type);

    bool sent = false;
    if (reply_sink_) {
        try {
            sent = reply_sink_(turn.reply_audio);
        } catch (const std::exception& e) {
            LOG_ERROR("[Turn] #" + std::to_string(turn.turn_id) + " reply sink threw: " + e.what());
        }
    }
    if (!sent) {
        LOG_WARN("[Turn] #" + std::to_string(turn.turn_id) + " transport closed, reply dropped");
        turn.disposition = TurnDisposition::Dropped;
        return false;
    }
    return true;
}

TurnContext TurnPipeline::process(const std::string& base64_audio) {
    TurnContext turn;
    turn.turn_id = next_turn_id_.fetch_add(1);

    // 1. decode
    auto decoded = utils::base64_decode(base64_audio);
    if (!decoded || decoded.value().empty()) {
        LOG_WARN("[Turn] #" + std::to_string(turn.turn_id) + " dropping frame: " +
                 (decoded ? std::string("empty audio") : decoded.error().describe()));
        turn.disposition = TurnDisposition::FailedDecode;
        finish(turn);
        return turn;
    }
    turn.audio = std::move(decoded.value());

    // 2. transcribe
    Result<std::string> transcript = make_error(ErrorType::PipelineError, "transcriber not called");
    try {
        transcript = transcriber_.transcribe(turn.audio, format_);
    } catch (const std::exception& e) {
        transcript = make_error(ErrorType::PipelineError, std::string("transcriber threw: ") + e.what());
    }
    if (!transcript) {
        LOG_WARN("[Turn] #" + std::to_string(turn.turn_id) + " transcription failed: " + transcript.error().describe());
        turn.disposition = TurnDisposition::FailedTranscribe;
        finish(turn);
        return turn;
    }
    turn.transcript = utils::trim_copy(transcript.value());

    // 3. skip silence
    if (turn.transcript.empty()) {
        LOG_DEBUG("[Turn] #" + std::to_string(turn.turn_id) + " empty transcript, skipped");
        turn.disposition = TurnDisposition::SkippedEmpty;
        finish(turn);
        return turn;
    }
    LOG_TURN("#" + std::to_string(turn.turn_id) + " heard: \"" + utils::preview(turn.transcript) + "\"");

    // 4. chat, with fallback
    ChatMetadata metadata;
    if (session_probe_) {
        metadata = session_probe_();
    }
    metadata.audio_bytes = turn.audio.size();
    metadata.sample_rate = format_.sample_rate;
    metadata.channels = format_.channels;
    metadata.turn_id = turn.turn_id;

    Result<std::string> reply = make_error(ErrorType::PipelineError, "chat not called");
    try {
        reply = chat_.reply(turn.transcript, metadata);
    } catch (const std::exception& e) {
        reply = make_error(ErrorType::PipelineError, std::string("chat threw: ") + e.what());
    }
    if (reply) {
        turn.reply_text = reply.value();
    } else {
        LOG_WARN("[Turn] #" + std::to_string(turn.turn_id) + " chat failed, using fallback: " + reply.error().describe());
        turn.reply_text = config_.fallback_utterance;
        turn.used_fallback = true;
    }
    LOG_TRACE(turn.turn_id, "chat", utils::preview(turn.reply_text));

    // 5-6. synthesize and deliver
    if (deliver(turn, turn.reply_text)) {
        turn.disposition = turn.used_fallback ? TurnDisposition::FailedChat : TurnDisposition::Delivered;
        std::ostringstream oss;
        oss << "#" << turn.turn_id << " replied (" << turn.reply_audio.size() << " bytes, "
            << format_.duration_ms(turn.reply_audio.size()) << " ms)" << (turn.used_fallback ? " [fallback]" : "");
        LOG_TURN(oss.str());
    }
    finish(turn);
    return turn;
}

bool TurnPipeline::dispatch(std::string base64_audio) {
    auto payload = std::make_shared<std::string>(std::move(base64_audio));
    bool queued = workers_->submit(
        [this, payload]() { process(*payload); },
        [this]() {
            LOG_WARN("[Turn] queue full, oldest pending turn dropped");
            record(TurnDisposition::Dropped);
        });
    if (queued) {
        dispatched_.fetch_add(1);
    }
    return queued;
}

size_t TurnPipeline::pending() const {
    return workers_->pending_count();
}

bool TurnPipeline::wait_idle(int timeout_ms) {
    return workers_->wait_for_completion(timeout_ms);
}

void TurnPipeline::shutdown() {
    workers_->shutdown();
    workers_->wait_for_completion(0);
}

uint64_t TurnPipeline::turns_dispatched() const {
    return dispatched_.load();
}

uint64_t TurnPipeline::count(TurnDisposition disposition) const {
    return outcomes_[static_cast<size_t>(disposition)].load();
}

} // namespace call_relay
