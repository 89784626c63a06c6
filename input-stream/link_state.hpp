// link_state.hpp
#pragma once
#include <string>

enum class LinkState {
    IDLE,          // constructed, no session yet
    CONNECTING,    // opening a session at the current offset
    STREAMING,     // delegating reads to the live session
    RECONNECTING,  // session dropped, waiting out the backoff
    EXHAUSTED,     // terminal: fatal error or budget used up
    CLOSED         // terminal: close() was called
};

struct RetryState {
    int attempts_used = 0;
    std::string last_error;
};

inline const char* to_string(LinkState s) noexcept {
    switch (s) {
        case LinkState::IDLE:         return "IDLE";
        case LinkState::CONNECTING:   return "CONNECTING";
        case LinkState::STREAMING:    return "STREAMING";
        case LinkState::RECONNECTING: return "RECONNECTING";
        case LinkState::EXHAUSTED:    return "EXHAUSTED";
        case LinkState::CLOSED:       return "CLOSED";
    }
    return "<UNK>";
}

inline bool is_legal_transition(LinkState from, LinkState to) noexcept {
    if (to == LinkState::CLOSED) {
        return from != LinkState::CLOSED;
    }
    switch (from) {
        case LinkState::IDLE:
            return to == LinkState::CONNECTING;
        case LinkState::CONNECTING:
            return to == LinkState::STREAMING || to == LinkState::RECONNECTING ||
                   to == LinkState::EXHAUSTED;
        case LinkState::STREAMING:
            return to == LinkState::RECONNECTING || to == LinkState::EXHAUSTED;
        case LinkState::RECONNECTING:
            return to == LinkState::CONNECTING || to == LinkState::EXHAUSTED;
        case LinkState::EXHAUSTED:
        case LinkState::CLOSED:
            return false;
    }
    return false;
}
