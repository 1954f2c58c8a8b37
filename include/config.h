#pragma once

#include "common.h"
#include <string>
#include <cstdint>
#include <map>

namespace call_relay {

struct AudioConfig {
    std::string input_device;   ///< Substring of the capture device name (empty = system default)
    std::string output_device;  ///< Substring of the playback device name (empty = system default)
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = DEFAULT_CHANNELS;
    int frames_per_chunk = DEFAULT_FRAMES_PER_CHUNK;
    int stop_join_timeout_ms = DEFAULT_STOP_JOIN_TIMEOUT_MS;
    int device_open_timeout_ms = DEFAULT_DEVICE_OPEN_TIMEOUT_MS;

    AudioFormat format() const {
        AudioFormat f;
        f.sample_rate = sample_rate;
        f.channels = channels;
        f.frames_per_chunk = frames_per_chunk;
        return f;
    }
};

/// Coordinator side of the relay: where the audio endpoint is reached
struct RelayConfig {
    std::string host = "127.0.0.1";
    int port = 5002;
    std::string path = "/relay";
    int connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS;
    int ack_timeout_ms = DEFAULT_ACK_TIMEOUT_MS;
    size_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES;
};

/// Audio endpoint listener (/relay websocket and /devices)
struct AudioServerConfig {
    std::string host = "0.0.0.0";
    int port = 5002;
    int io_threads = 1;
};

/// Coordinator call lifecycle listener
struct CallServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int io_threads = 1;
    int worker_threads = 4;
};

struct ChatConfig {
    std::string base_url = "http://127.0.0.1:8001";
    int timeout_ms = 10000;
    std::string source = "call";  ///< Metadata source tag attached to every prompt
};

struct SpeechConfig {
    std::string base_url = "http://127.0.0.1:5001";
    int timeout_ms = 30000;
    std::string language;          ///< Optional transcription language hint
    std::string voice;             ///< Optional synthesis voice id
    std::string audio_format = "pcm";  ///< Synthesis output format; pcm is what the endpoint plays
};

struct PipelineConfig {
    size_t max_concurrent_turns = 2;
    size_t max_queued_turns = 32;
    std::string fallback_utterance = "Sorry, I didn't catch that. Could you say it again?";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  ///< Empty = console only
};

struct Config {
    AudioConfig audio;
    RelayConfig relay;
    AudioServerConfig audio_server;
    CallServerConfig call_server;
    ChatConfig chat;
    SpeechConfig speech;
    PipelineConfig pipeline;
    LoggingConfig logging;

    /// Directory of the loaded config file (where .env is looked up)
    std::string config_dir_;

    /**
     * @brief Load configuration from a JSON file
     *
     * Missing or unparsable file: logs a warning and returns defaults.
     */
    static Config load_from_file(const std::string& path);

    /**
     * @brief Overlay .env (next to the config file) and then process environment
     */
    void apply_environment();

    /**
     * @brief Overlay an explicit variable map (same keys as the environment)
     */
    void apply_variables(const std::map<std::string, std::string>& vars);
};

/**
 * @brief Parse a KEY=VALUE file; '#' lines are comments, quotes are stripped
 * @return Empty map when the file cannot be read
 */
std::map<std::string, std::string> parse_env_file(const std::string& path);

} // namespace call_relay
