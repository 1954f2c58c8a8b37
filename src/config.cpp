#include "config.h"
#include "logger.h"
#include "utils.h"
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

/// Every variable apply_environment() looks at
const char* const kKnownVariables[] = {
    "AUDIO_INPUT_DEVICE",
    "AUDIO_OUTPUT_DEVICE",
    "CALL_SERVICE_HOST",
    "CALL_SERVICE_PORT",
    "SERVER_HOST",
    "SERVER_PORT",
    "CHAT_BASE_URL",
    "AUDIO_SERVICE_URL",
    "BACKEND_HTTP_TIMEOUT",
    "AUDIO_CLIENT_TIMEOUT",
    "CALL_RELAY_LOG_LEVEL",
    "CALL_RELAY_LOG_FILE",
};

bool parse_port(const std::string& key, const std::string& value, int& out) {
    try {
        size_t used = 0;
        int port = std::stoi(value, &used);
        if (used != value.size() || port <= 0 || port > 65535) {
            throw std::out_of_range("port range");
        }
        out = port;
        return true;
    } catch (const std::exception&) {
        call_relay::Logger::warn(key + "=" + value + " is not a valid port; keeping " + std::to_string(out));
        return false;
    }
}

/// Longest collaborator timeout accepted from the environment (one day)
constexpr double kMaxTimeoutSeconds = 86400.0;

/// Seconds (possibly fractional, as "10" or "2.5") to milliseconds
bool parse_seconds(const std::string& key, const std::string& value, int& out_ms) {
    try {
        size_t used = 0;
        double seconds = std::stod(value, &used);
        // Written so NaN fails too
        if (used != value.size() || !(seconds > 0.0 && seconds <= kMaxTimeoutSeconds)) {
            throw std::out_of_range("timeout range");
        }
        out_ms = static_cast<int>(seconds * 1000.0);
        return true;
    } catch (const std::exception&) {
        call_relay::Logger::warn(key + "=" + value + " is not a valid timeout; keeping " + std::to_string(out_ms) + " ms");
        return false;
    }
}

std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

void apply_json_to_config(call_relay::Config& cfg, const json& j) {
    // Audio config
    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("input_device")) cfg.audio.input_device = a["input_device"];
        if (a.contains("output_device")) cfg.audio.output_device = a["output_device"];
        if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"];
        if (a.contains("channels")) cfg.audio.channels = a["channels"];
        if (a.contains("frames_per_chunk")) cfg.audio.frames_per_chunk = a["frames_per_chunk"];
        if (a.contains("stop_join_timeout_ms")) cfg.audio.stop_join_timeout_ms = a["stop_join_timeout_ms"];
        if (a.contains("device_open_timeout_ms")) cfg.audio.device_open_timeout_ms = a["device_open_timeout_ms"];
    }

    // Relay (coordinator -> audio endpoint)
    if (j.contains("relay")) {
        auto& r = j["relay"];
        if (r.contains("host")) cfg.relay.host = r["host"];
        if (r.contains("port")) cfg.relay.port = r["port"];
        if (r.contains("path")) cfg.relay.path = r["path"];
        if (r.contains("connect_timeout_ms")) cfg.relay.connect_timeout_ms = r["connect_timeout_ms"];
        if (r.contains("ack_timeout_ms")) cfg.relay.ack_timeout_ms = r["ack_timeout_ms"];
        if (r.contains("max_message_bytes")) cfg.relay.max_message_bytes = r["max_message_bytes"];
    }

    if (j.contains("audio_server")) {
        auto& s = j["audio_server"];
        if (s.contains("host")) cfg.audio_server.host = s["host"];
        if (s.contains("port")) cfg.audio_server.port = s["port"];
        if (s.contains("io_threads")) cfg.audio_server.io_threads = s["io_threads"];
    }

    if (j.contains("call_server")) {
        auto& s = j["call_server"];
        if (s.contains("host")) cfg.call_server.host = s["host"];
        if (s.contains("port")) cfg.call_server.port = s["port"];
        if (s.contains("io_threads")) cfg.call_server.io_threads = s["io_threads"];
        if (s.contains("worker_threads")) cfg.call_server.worker_threads = s["worker_threads"];
    }

    if (j.contains("chat")) {
        auto& c = j["chat"];
        if (c.contains("base_url")) cfg.chat.base_url = strip_trailing_slashes(c["base_url"].get<std::string>());
        if (c.contains("timeout_ms")) cfg.chat.timeout_ms = c["timeout_ms"];
        if (c.contains("source")) cfg.chat.source = c["source"];
    }

    if (j.contains("speech")) {
        auto& s = j["speech"];
        if (s.contains("base_url")) cfg.speech.base_url = strip_trailing_slashes(s["base_url"].get<std::string>());
        if (s.contains("timeout_ms")) cfg.speech.timeout_ms = s["timeout_ms"];
        if (s.contains("language")) cfg.speech.language = s["language"];
        if (s.contains("voice")) cfg.speech.voice = s["voice"];
        if (s.contains("audio_format")) cfg.speech.audio_format = s["audio_format"];
    }

    // Turn dispatch
    if (j.contains("pipeline")) {
        auto& p = j["pipeline"];
        if (p.contains("max_concurrent_turns")) cfg.pipeline.max_concurrent_turns = p["max_concurrent_turns"];
        if (p.contains("max_queued_turns")) cfg.pipeline.max_queued_turns = p["max_queued_turns"];
        if (p.contains("fallback_utterance")) cfg.pipeline.fallback_utterance = p["fallback_utterance"];
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        if (l.contains("level")) cfg.logging.level = l["level"];
        if (l.contains("file")) cfg.logging.file = l["file"];
    }
}

} // anonymous namespace

namespace call_relay {

std::map<std::string, std::string> parse_env_file(const std::string& path) {
    std::map<std::string, std::string> out;
    std::ifstream f(path);
    if (!f.is_open()) return out;
    std::string line;
    while (std::getline(f, line)) {
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        if (line[start] == '#') continue;
        size_t eq = line.find('=', start);
        if (eq == std::string::npos) continue;
        std::string key = line.substr(start, eq - start);
        std::string value = line.substr(eq + 1);
        // Allow "export KEY=value"
        if (key.compare(0, 7, "export ") == 0) key = key.substr(7);
        utils::trim(key);
        utils::trim(value);
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty()) out[key] = value;
    }
    return out;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::string::size_type slash = path.find_last_of("/\\");
    if (slash != std::string::npos) {
        cfg.config_dir_ = path.substr(0, slash);
    } else {
        cfg.config_dir_ = ".";
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        return cfg;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        Logger::warn("Error parsing config JSON: " + std::string(e.what()) + ". Using defaults.");
        return cfg;
    }

    // Apply to a copy so a mistyped field cannot leave a half-applied config
    Config loaded = cfg;
    try {
        apply_json_to_config(loaded, j);
    } catch (const json::exception& e) {
        Logger::warn("Invalid value in " + path + ": " + std::string(e.what()) + ". Using defaults.");
        return cfg;
    }

    Logger::info("Loaded config from " + path);
    return loaded;
}

void Config::apply_environment() {
    std::string dir = config_dir_.empty() ? "." : config_dir_;
    auto file_vars = parse_env_file(dir + "/.env");
    if (!file_vars.empty()) {
        Logger::info("Applying " + std::to_string(file_vars.size()) + " variable(s) from " + dir + "/.env");
        apply_variables(file_vars);
    }

    std::map<std::string, std::string> process_vars;
    for (const char* key : kKnownVariables) {
        const char* value = std::getenv(key);
        if (value != nullptr) {
            process_vars[key] = value;
        }
    }
    apply_variables(process_vars);
}

void Config::apply_variables(const std::map<std::string, std::string>& vars) {
    auto get = [&vars](const char* key, std::string& out) {
        auto it = vars.find(key);
        if (it == vars.end()) return false;
        out = it->second;
        return true;
    };

    std::string value;
    if (get("AUDIO_INPUT_DEVICE", value)) audio.input_device = value;
    if (get("AUDIO_OUTPUT_DEVICE", value)) audio.output_device = value;

    // The endpoint binds CALL_SERVICE_HOST; the coordinator dials it
    if (get("CALL_SERVICE_HOST", value) && !value.empty()) {
        audio_server.host = value;
        relay.host = (value == "0.0.0.0") ? "127.0.0.1" : value;
    }
    if (get("CALL_SERVICE_PORT", value)) {
        if (parse_port("CALL_SERVICE_PORT", value, audio_server.port)) {
            relay.port = audio_server.port;
        }
    }

    if (get("SERVER_HOST", value) && !value.empty()) call_server.host = value;
    if (get("SERVER_PORT", value)) parse_port("SERVER_PORT", value, call_server.port);

    if (get("CHAT_BASE_URL", value) && !value.empty()) chat.base_url = strip_trailing_slashes(value);
    if (get("AUDIO_SERVICE_URL", value) && !value.empty()) speech.base_url = strip_trailing_slashes(value);
    if (get("BACKEND_HTTP_TIMEOUT", value)) parse_seconds("BACKEND_HTTP_TIMEOUT", value, chat.timeout_ms);
    if (get("AUDIO_CLIENT_TIMEOUT", value)) parse_seconds("AUDIO_CLIENT_TIMEOUT", value, speech.timeout_ms);

    if (get("CALL_RELAY_LOG_LEVEL", value) && !value.empty()) logging.level = value;
    if (get("CALL_RELAY_LOG_FILE", value)) logging.file = value;
}

} // namespace call_relay
