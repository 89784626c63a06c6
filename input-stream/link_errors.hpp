// link_errors.hpp
#pragma once
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

// Base of every reader failure. retryable() tells the reconnecting reader
// whether a fresh session at the current offset may succeed.
class LinkError : public std::runtime_error {
public:
    explicit LinkError(const std::string& msg) : std::runtime_error(msg) {}
    virtual bool retryable() const noexcept { return false; }
};

// Connect/handshake or a single read exceeded the per-attempt timeout
class TimeoutError : public LinkError {
public:
    explicit TimeoutError(const std::string& msg) : LinkError(msg) {}
    bool retryable() const noexcept override { return true; }
};

// Connection reset, DNS/network failure, 5xx, connection closed early
class TransportError : public LinkError {
public:
    explicit TransportError(const std::string& msg) : LinkError(msg) {}
    bool retryable() const noexcept override { return true; }
};

// Resource cannot be resumed at a non-zero offset
class RangeUnsupportedError : public LinkError {
public:
    explicit RangeUnsupportedError(const std::string& msg) : LinkError(msg) {}
};

// 4xx-class answer (bad locator, auth failure, not found)
class ClientError : public LinkError {
private:
    long status_;

public:
    ClientError(const std::string& msg, long status = 0) : LinkError(msg), status_(status) {}
    long status() const noexcept { return status_; }
};

// Malformed or inconsistent response
class ProtocolError : public LinkError {
public:
    explicit ProtocolError(const std::string& msg) : LinkError(msg) {}
};

// Operation attempted on (or aborted by) a closed reader
class ClosedError : public LinkError {
public:
    explicit ClosedError(const std::string& msg) : LinkError(msg) {}
};

// Terminal: reconnect budget used up. Wraps the last retryable failure.
class ReconnectBudgetExceededError : public LinkError {
private:
    int attempts_;
    std::string last_error_;
    std::exception_ptr cause_;

public:
    ReconnectBudgetExceededError(const std::string& msg,
                                 int attempts,
                                 const std::string& last_error,
                                 std::exception_ptr cause)
        : LinkError(msg + " (after " + std::to_string(attempts) + " reconnects, last error: " + last_error + ")")
        , attempts_(attempts)
        , last_error_(last_error)
        , cause_(cause)
    {}

    int attempts() const noexcept { return attempts_; }
    const std::string& last_error() const noexcept { return last_error_; }

    // Rethrows the wrapped failure
    [[noreturn]] void rethrow_cause() const { std::rethrow_exception(cause_); }
    std::exception_ptr cause() const noexcept { return cause_; }
};
