#pragma once

#include "common.h"
#include "config.h"
#include "chat_client.h"
#include "speech_client.h"
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace call_relay {

class WorkerPool;

/**
 * @brief Terminal outcome of one turn
 */
enum class TurnDisposition {
    Pending,
    Delivered,
    SkippedEmpty,
    FailedDecode,
    FailedTranscribe,
    FailedChat,        ///< Chat failed; the fallback reply was still delivered
    FailedSynthesize,
    Dropped            ///< Transport closed (or queue overflowed) before delivery
};

constexpr size_t kTurnDispositionCount = 8;

const char* disposition_name(TurnDisposition disposition);

/**
 * @brief Ephemeral per-frame record
 */
struct TurnContext {
    uint64_t turn_id = 0;
    ByteBuffer audio;
    std::string transcript;
    std::string reply_text;
    ByteBuffer reply_audio;
    bool used_fallback = false;
    TurnDisposition disposition = TurnDisposition::Pending;
};

/**
 * @brief transcribe -> chat -> synthesize -> deliver, one inbound frame at a time
 *
 * process() runs a turn synchronously and never throws. dispatch() queues the
 * turn on a bounded worker pool so the relay receive loop never blocks; when
 * the queue is full the oldest pending turn is dropped.
 */
class TurnPipeline {
public:
    /// Push reply PCM back over the relay; false when the transport has closed
    using ReplySink = std::function<bool(const ByteBuffer& pcm)>;

    /// Session fields for chat metadata (source, call_active, call_id)
    using SessionProbe = std::function<ChatMetadata()>;

    using TurnObserver = std::function<void(const TurnContext&)>;

    TurnPipeline(ITranscriber& transcriber,
                 IChatBackend& chat,
                 ISynthesizer& synthesizer,
                 const PipelineConfig& config,
                 const AudioFormat& format);
    ~TurnPipeline();

    TurnPipeline(const TurnPipeline&) = delete;
    TurnPipeline& operator=(const TurnPipeline&) = delete;

    /// Set before the first turn
    void set_reply_sink(ReplySink sink);
    void set_session_probe(SessionProbe probe);

    /// Called once per finished turn (on the turn's thread)
    void set_turn_observer(TurnObserver observer);

    /**
     * @brief Run one turn on the calling thread
     * @param base64_audio The audio-stream payload
     */
    TurnContext process(const std::string& base64_audio);

    /**
     * @brief Queue one turn on the worker pool
     * @return False when the pipeline is shut down
     */
    bool dispatch(std::string base64_audio);

    /// Turns queued or running
    size_t pending() const;

    /**
     * @brief Wait for queued turns to finish
     * @return False on timeout
     */
    bool wait_idle(int timeout_ms);

    /// Finish queued turns and stop the workers
    void shutdown();

    uint64_t turns_dispatched() const;
    uint64_t count(TurnDisposition disposition) const;

private:
    void record(TurnDisposition disposition);
    void finish(TurnContext& turn);
    bool deliver(TurnContext& turn, const std::string& text);

    ITranscriber& transcriber_;
    IChatBackend& chat_;
    ISynthesizer& synthesizer_;
    PipelineConfig config_;
    AudioFormat format_;

    ReplySink reply_sink_;
    SessionProbe session_probe_;
    TurnObserver observer_;

    std::unique_ptr<WorkerPool> workers_;
    std::atomic<uint64_t> next_turn_id_;
    std::atomic<uint64_t> dispatched_;
    std::array<std::atomic<uint64_t>, kTurnDispositionCount> outcomes_;
};

} // namespace call_relay
