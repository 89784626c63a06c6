// reconnecting_reader.hpp
#pragma once

#include "stream_reader.hpp"
#include "link_config.hpp"
#include "link_errors.hpp"
#include "link_session.hpp"
#include "link_state.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

// Presents one gapless, non-duplicating byte stream backed by a sequence of
// link sessions. A dropped, stalled or failed session is replaced by a new
// one opened at start_offset + position(), until max_reconnects is used up.
//
// Threading: read_into() must not be called concurrently from several
// threads. close() may be called from any thread; it aborts a pending
// connect, read or backoff and makes every later call throw ClosedError.
class ReconnectingLinkReader : public I_STREAM_READER {
private:
    const LinkConfig cfg_;
    LinkOpener opener_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    LinkState state_ = LinkState::IDLE;
    RetryState retry_;
    std::unique_ptr<I_LINK_SESSION> session_;
    std::exception_ptr terminal_error_;
    bool closed_ = false;
    bool busy_ = false;
    bool eof_ = false;
    int sessions_opened_ = 0;
    std::optional<uint64_t> total_length_;

    // Bytes delivered to the consumer
    std::atomic<uint64_t> offset_{0};

    // Marks a read_into() in flight. The session of a reader closed meanwhile
    // is released here, by the reading thread.
    class CallGuard {
    private:
        ReconnectingLinkReader& r_;

    public:
        explicit CallGuard(ReconnectingLinkReader& r) : r_(r) {
            std::lock_guard<std::mutex> lock(r_.mtx_);
            if (r_.closed_) {
                throw ClosedError("[ReconnectingLinkReader] Read after close: " + r_.cfg_.url);
            }
            if (r_.terminal_error_) {
                std::rethrow_exception(r_.terminal_error_);
            }
            r_.busy_ = true;
        }

        ~CallGuard() {
            std::unique_ptr<I_LINK_SESSION> orphan;
            {
                std::lock_guard<std::mutex> lock(r_.mtx_);
                r_.busy_ = false;
                if (r_.closed_) {
                    orphan = std::move(r_.session_);
                }
            }
            if (orphan) {
                orphan->close();
            }
        }

        CallGuard(const CallGuard&) = delete;
        CallGuard& operator=(const CallGuard&) = delete;
    };

    static LinkConfig validated(LinkConfig cfg) {
        cfg.validate();
        return cfg;
    }

    ClosedError closed_error() const {
        return ClosedError("[ReconnectingLinkReader] Closed: " + cfg_.url);
    }

    uint64_t remote_offset() const noexcept {
        return cfg_.start_offset + offset_.load();
    }

    void transition_locked(LinkState next) {
        if (closed_) {
            throw closed_error();
        }
        if (!is_legal_transition(state_, next)) {
            throw std::logic_error(std::string("[ReconnectingLinkReader] Illegal transition ") +
                                   to_string(state_) + " -> " + to_string(next));
        }
        state_ = next;
    }

    void transition(LinkState next) {
        std::lock_guard<std::mutex> lock(mtx_);
        transition_locked(next);
    }

    void release_session() noexcept {
        std::unique_ptr<I_LINK_SESSION> s;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            s = std::move(session_);
        }
        if (s) {
            s->close();
        }
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

    // CONNECTING -> STREAMING, always at the reader's own offset
    void connect() {
        uint64_t at = remote_offset();
        transition(LinkState::CONNECTING);

        std::unique_ptr<I_LINK_SESSION> s = opener_(at);
        if (!s) {
            throw ProtocolError("[ReconnectingLinkReader] No session for " + cfg_.url);
        }
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) {
                s->close();
                throw closed_error();
            }
            session_ = std::move(s);
        }

        session_->open();

        std::optional<uint64_t> total = session_->get_total_length();
        std::lock_guard<std::mutex> lock(mtx_);
        if (total) {
            if (total_length_ && *total_length_ != *total) {
                throw ProtocolError("[ReconnectingLinkReader] Resource length changed from " +
                                    std::to_string(*total_length_) + " to " + std::to_string(*total) +
                                    ": " + cfg_.url);
            }
            total_length_ = total;
        }
        ++sessions_opened_;
        transition_locked(LinkState::STREAMING);
    }

    // RECONNECTING: drop the session, spend one unit of budget, back off.
    // Must be called from inside the handler of `e`.
    void reconnect(const LinkError& e) {
        release_session();

        int attempt;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            transition_locked(LinkState::RECONNECTING);
            retry_.last_error = e.what();
            if (retry_.attempts_used >= cfg_.max_reconnects) {
                ReconnectBudgetExceededError err("[ReconnectingLinkReader] Reconnect budget exceeded for " + cfg_.url,
                                                 retry_.attempts_used, e.what(), std::current_exception());
                transition_locked(LinkState::EXHAUSTED);
                terminal_error_ = std::make_exception_ptr(err);
                throw err;
            }
            attempt = ++retry_.attempts_used;
        }

        uint64_t at = remote_offset();
        if (cfg_.verbose) {
            std::cerr << "Warning: [ReconnectingLinkReader] " << e.what()
                      << "; reconnecting[" << attempt << "/" << cfg_.max_reconnects
                      << "] at offset " << at << "\n";
        }
        if (cfg_.on_reconnect) {
            try {
                cfg_.on_reconnect(at, attempt, e.what());
            } catch (const std::exception& hook_error) {
                fail(std::current_exception(), hook_error.what());
                throw;
            }
        }

        std::unique_lock<std::mutex> lock(mtx_);
        if (cv_.wait_for(lock, cfg_.backoff_for(attempt), [this] { return closed_; })) {
            throw closed_error();
        }
    }

    // Fatal failure: EXHAUSTED, later reads rethrow `error`
    void fail(std::exception_ptr error, const char* what) {
        release_session();
        std::lock_guard<std::mutex> lock(mtx_);
        retry_.last_error = what;
        transition_locked(LinkState::EXHAUSTED);
        terminal_error_ = error;
    }

public:
    explicit ReconnectingLinkReader(LinkConfig cfg)
        : ReconnectingLinkReader(std::move(cfg), LinkOpener())
    {}

    // `opener` replaces the libcurl session, e.g. with a scripted one
    ReconnectingLinkReader(LinkConfig cfg, LinkOpener opener)
        : cfg_(validated(std::move(cfg)))
        , opener_(opener ? std::move(opener) : make_curl_opener(cfg_))
    {}

    ~ReconnectingLinkReader() override { close(); }

    ReconnectingLinkReader(const ReconnectingLinkReader&) = delete;
    ReconnectingLinkReader& operator=(const ReconnectingLinkReader&) = delete;

    size_t read_into(uint8_t* buff_ptr, size_t max_bytes) override {
        CallGuard guard(*this);
        if (max_bytes == 0 || eof_) {
            return 0;
        }

        while (true) {
            try {
                if (!session_) {
                    connect();
                }

                size_t rd = session_->read_into(buff_ptr, max_bytes);
                if (rd > 0) {
                    offset_ += rd;
                    return rd;
                }

                std::optional<uint64_t> total = total_length();
                if (total && remote_offset() < *total) {
                    throw TransportError("[ReconnectingLinkReader] Connection closed early at " +
                                         std::to_string(remote_offset()) + " of " + std::to_string(*total) +
                                         ": " + cfg_.url);
                }
                eof_ = true;
                release_session();
                return 0;

            } catch (const ClosedError&) {
                throw;
            } catch (const LinkError& e) {
                if (is_closed()) {
                    throw closed_error();
                }
                if (!e.retryable()) {
                    fail(std::current_exception(), e.what());
                    throw;
                }
                // Every declared byte is delivered, a late drop is still EOF
                std::optional<uint64_t> total = total_length();
                if (total && remote_offset() >= *total) {
                    eof_ = true;
                    release_session();
                    return 0;
                }
                reconnect(e);
            }
        }
    }

    void close() override {
        std::unique_ptr<I_LINK_SESSION> orphan;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) {
                return;
            }
            closed_ = true;
            state_ = LinkState::CLOSED;
            if (session_) {
                session_->interrupt();
                if (!busy_) {
                    orphan = std::move(session_);
                }
            }
            cv_.notify_all();
        }
        if (orphan) {
            orphan->close();
        }
    }

    std::string get_type() const noexcept override {
        return "reconnecting link reader: " + cfg_.url;
    }

    const LinkConfig& config() const noexcept { return cfg_; }

    // Bytes delivered so far
    uint64_t position() const noexcept { return offset_.load(); }

    LinkState state() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return state_;
    }

    int attempts_used() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return retry_.attempts_used;
    }

    int sessions_opened() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return sessions_opened_;
    }

    std::string last_error() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return retry_.last_error;
    }

    std::optional<uint64_t> total_length() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return total_length_;
    }

    ReaderState get_state() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        ReaderState st;
        st.type = "ReconnectingLinkReader";
        st.data_read = offset_.load();
        st.set("url", cfg_.url);
        st.set("start_offset", cfg_.start_offset);
        st.set("timeout_ms", static_cast<int64_t>(cfg_.timeout.count()));
        st.set("max_reconnects", cfg_.max_reconnects);
        st.set("content_length", total_length_ ? std::to_string(*total_length_) : std::string());
        st.set("reconnections", retry_.attempts_used);
        st.set("sessions", sessions_opened_);
        st.set("last_error", retry_.last_error);
        st.set("state", to_string(state_));
        return st;
    }

    // Short state summary for logs
    std::string describe() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return "ReconnectingLinkReader(url=" + cfg_.url +
               ", position=" + std::to_string(offset_.load()) +
               ", total=" + (total_length_ ? std::to_string(*total_length_) : std::string("?")) +
               ", attempts=" + std::to_string(retry_.attempts_used) + "/" + std::to_string(cfg_.max_reconnects) +
               ", sessions=" + std::to_string(sessions_opened_) +
               ", state=" + to_string(state_) + ")";
    }
};
