#pragma once

#include <cstdint>
#include <string>

namespace call_relay {

/**
 * @brief Derived call state
 *
 * - Idle: transport closed, capture stopped
 * - Connected: transport open, capture stopped
 * - Active: transport open, capture running
 */
enum class CallState {
    Idle,
    Connected,
    Active
};

inline const char* call_state_name(CallState state) {
    switch (state) {
        case CallState::Idle: return "idle";
        case CallState::Connected: return "connected";
        case CallState::Active: return "active";
    }
    return "unknown";
}

/**
 * @brief Per-process call session
 *
 * Owned by CallStateMachine and mutated only under its session mutex;
 * everyone else sees copies from status().
 */
struct CallSession {
    bool connected = false;
    bool active = false;
    uint64_t frames_sent = 0;        ///< audio-stream frames received from the endpoint
    uint64_t turns_dispatched = 0;
    uint64_t replies_delivered = 0;
    uint64_t disconnects = 0;
    std::string call_id;
    std::string caller;

    CallState state() const {
        if (!connected) return CallState::Idle;
        return active ? CallState::Active : CallState::Connected;
    }
};

} // namespace call_relay
