// link_config.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>

using ms_t = std::chrono::milliseconds;
using HeaderMap = std::map<std::string, std::string>;

// Reconnect hook: (resume offset, attempt number, reason)
using ReconnectHook = std::function<void(uint64_t, int, const std::string&)>;

constexpr int64_t DEFAULT_LINK_TIMEOUT_MS = 30 * 1000;
constexpr int DEFAULT_MAX_RECONNECTS = 32;
constexpr int64_t DEFAULT_BACKOFF_INITIAL_MS = 500;
constexpr int64_t DEFAULT_BACKOFF_MAX_MS = 30 * 1000;

struct LinkConfig {
    std::string url;

    // Bounds each connect/handshake and each individual read, not the whole transfer
    ms_t timeout{DEFAULT_LINK_TIMEOUT_MS};

    // Reconnects allowed over the reader's lifetime
    int max_reconnects = DEFAULT_MAX_RECONNECTS;

    // Static request headers, e.g. Authorization
    HeaderMap headers;

    // Remote offset of the first delivered byte
    uint64_t start_offset = 0;

    // Capped exponential backoff between reconnects
    ms_t backoff_initial{DEFAULT_BACKOFF_INITIAL_MS};
    ms_t backoff_max{DEFAULT_BACKOFF_MAX_MS};

    // Called right before each reconnect attempt. An exception thrown here
    // ends the reader like a fatal link error.
    ReconnectHook on_reconnect;

    // Log reconnects and premature EOFs to stderr
    bool verbose = true;

    void validate() const {
        if (url.empty()) {
            throw std::invalid_argument("[LinkConfig] url must not be empty");
        }
        if (timeout.count() <= 0) {
            throw std::invalid_argument("[LinkConfig] timeout must be positive");
        }
        if (max_reconnects < 0) {
            throw std::invalid_argument("[LinkConfig] max_reconnects must be >= 0");
        }
        if (backoff_initial.count() < 0 || backoff_max < backoff_initial) {
            throw std::invalid_argument("[LinkConfig] backoff must satisfy 0 <= initial <= max");
        }
        for (const auto& kv : headers) {
            if (kv.first.empty() || kv.first.find_first_of(":\r\n") != std::string::npos ||
                kv.second.find_first_of("\r\n") != std::string::npos) {
                throw std::invalid_argument("[LinkConfig] invalid header: " + kv.first);
            }
        }
    }

    // Delay before reconnect number `attempt` (1-based)
    ms_t backoff_for(int attempt) const noexcept {
        ms_t delay = backoff_initial;
        for (int i = 1; i < attempt && delay < backoff_max; ++i) {
            delay *= 2;
        }
        return delay < backoff_max ? delay : backoff_max;
    }
};
