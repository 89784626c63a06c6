// link_session.hpp
#pragma once

#include "link_config.hpp"
#include "link_errors.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using steady_tick_t = std::chrono::steady_clock::time_point;

// Longest single curl_multi_poll() wait, deadlines are rechecked after each
constexpr int MAX_POLL_SLICE_MS = 1000;

// One physical connection delivering the resource from a given offset.
// open() and read_into() block the caller up to the configured timeout;
// interrupt() may be called from another thread to abort them.
class I_LINK_SESSION {
public:
    virtual ~I_LINK_SESSION() = default;

    // Issue the range request and wait for the response headers
    virtual void open() = 0;

    // 1..max_bytes bytes, or 0 at the natural end of the resource
    virtual size_t read_into(uint8_t* buff_ptr, size_t max_bytes) = 0;

    // Idempotent, safe on a never-opened session
    virtual void close() noexcept = 0;

    // Thread-safe. A blocked or later open()/read_into() throws ClosedError.
    virtual void interrupt() noexcept = 0;

    virtual uint64_t get_start_offset() const noexcept = 0;
    virtual bool is_live() const noexcept = 0;

    // Total resource length when the source declares it
    virtual std::optional<uint64_t> get_total_length() const noexcept = 0;
};

// Produces a not-yet-opened session starting at the given remote offset
using LinkOpener = std::function<std::unique_ptr<I_LINK_SESSION>(uint64_t)>;

class CurlInitializer {
public:
    CurlInitializer() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw TransportError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
    }

    ~CurlInitializer() {
        curl_global_cleanup();
    }

    // Singleton instance
    static CurlInitializer& instance() {
        static CurlInitializer inst;
        return inst;
    }
};

inline bool iequals(const std::string& a, const char* b) {
    size_t n = std::strlen(b);
    if (a.size() != n) {
        return false;
    }
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline bool has_http_scheme(const std::string& url) {
    size_t colon = url.find("://");
    if (colon == std::string::npos) {
        return false;
    }
    std::string scheme = url.substr(0, colon);
    return iequals(scheme, "http") || iequals(scheme, "https");
}

// "bytes 100-199/1000" -> 1000, "bytes 100-199/*" -> nullopt
inline std::optional<uint64_t> parse_content_range_total(const std::string& value) {
    size_t slash = value.rfind('/');
    if (slash == std::string::npos || slash + 1 >= value.size()) {
        return std::nullopt;
    }
    const char* begin = value.c_str() + slash + 1;
    char* end;
    unsigned long long total = std::strtoull(begin, &end, 10);
    if (end == begin) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(total);
}

// libcurl session for one URL from one offset.
//
// HTTP(S) transfers are paused while a chunk waits for the consumer, so at
// most one transport chunk is buffered. file:// and ftp:// transfers cannot
// be paused: libcurl delivers the whole remainder inside one perform step,
// the entire rest of the resource is held in memory, and the per-call
// timeout and interrupt() only take effect once that step returns.
class CurlLinkSession : public I_LINK_SESSION {
private:
    std::string url_;
    HeaderMap headers_;
    ms_t timeout_;
    uint64_t start_offset_;

    CURL* easy_ = nullptr;
    CURLM* multi_ = nullptr;
    curl_slist* header_list_ = nullptr;
    bool attached_ = false;
    char error_buf_[CURL_ERROR_SIZE];

    // For HTTP(S) at most one transport chunk waits here and the transfer
    // pauses meanwhile. file:// and ftp:// finish inside a single perform
    // step and cannot be paused safely, their chunks queue up instead.
    std::vector<uint8_t> pending_;
    size_t pending_pos_ = 0;
    bool paused_ = false;
    bool pausable_ = false;

    bool headers_done_ = false;
    bool body_started_ = false;
    bool transfer_done_ = false;
    CURLcode result_ = CURLE_OK;
    long status_ = 0;
    std::optional<uint64_t> range_total_;
    std::optional<uint64_t> total_length_;
    bool live_ = false;
    std::atomic<bool> interrupted_{false};

    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlLinkSession*>(userdata);
        size_t len = size * nmemb;
        self->body_started_ = true;
        if (self->pending_pos_ < self->pending_.size()) {
            if (self->pausable_) {
                self->paused_ = true;
                return CURL_WRITEFUNC_PAUSE;
            }
            self->pending_.insert(self->pending_.end(), ptr, ptr + len);
            return len;
        }
        self->pending_.assign(ptr, ptr + len);
        self->pending_pos_ = 0;
        return len;
    }

    static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlLinkSession*>(userdata);
        size_t len = size * nitems;
        std::string line(buffer, len);
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }

        if (line.compare(0, 5, "HTTP/") == 0) {
            // New response (first one or after a redirect / 1xx)
            size_t sp = line.find(' ');
            self->status_ = sp == std::string::npos ? 0 : std::strtol(line.c_str() + sp + 1, nullptr, 10);
            self->range_total_.reset();
            self->headers_done_ = false;
            return len;
        }

        if (line.empty()) {
            // 1xx and followed 3xx are intermediate responses
            if (self->status_ >= 200 && (self->status_ < 300 || self->status_ >= 400)) {
                self->headers_done_ = true;
            }
            return len;
        }

        size_t colon = line.find(':');
        if (colon != std::string::npos && iequals(line.substr(0, colon), "content-range")) {
            self->range_total_ = parse_content_range_total(line.substr(colon + 1));
        }
        return len;
    }

    std::string describe_error(CURLcode rc) const {
        std::string detail = error_buf_[0] ? std::string(error_buf_) : std::string(curl_easy_strerror(rc));
        return "[CurlLinkSession] " + url_ + ": " + detail;
    }

    [[noreturn]] void throw_transfer_error(CURLcode rc) const {
        std::string msg = describe_error(rc);
        switch (rc) {
            case CURLE_OPERATION_TIMEDOUT:
                throw TimeoutError(msg);
            case CURLE_RANGE_ERROR:
            case CURLE_BAD_DOWNLOAD_RESUME:
                throw RangeUnsupportedError(msg);
            case CURLE_UNSUPPORTED_PROTOCOL:
            case CURLE_URL_MALFORMAT:
            case CURLE_LOGIN_DENIED:
            case CURLE_REMOTE_ACCESS_DENIED:
            case CURLE_REMOTE_FILE_NOT_FOUND:
            case CURLE_FILE_COULDNT_READ_FILE:
            case CURLE_TOO_MANY_REDIRECTS:
                throw ClientError(msg, status_);
            case CURLE_WEIRD_SERVER_REPLY:
            case CURLE_BAD_CONTENT_ENCODING:
                throw ProtocolError(msg);
            default:
                throw TransportError(msg);
        }
    }

    void check_status() const {
        if (status_ == 0) {
            return;  // not HTTP (file://, ftp://), curl already applied the resume offset
        }
        std::string where = "[CurlLinkSession] " + url_ + " answered HTTP " + std::to_string(status_);
        if (status_ == 408) {
            throw TimeoutError(where);
        }
        if (status_ == 429) {
            throw TransportError(where);
        }
        if (status_ == 416) {
            throw RangeUnsupportedError(where + " for offset " + std::to_string(start_offset_));
        }
        if (status_ >= 400 && status_ < 500) {
            throw ClientError(where, status_);
        }
        if (status_ >= 500) {
            throw TransportError(where);
        }
        if (status_ < 200 || status_ >= 300) {
            throw ProtocolError(where);
        }
        if (start_offset_ > 0 && status_ != 206) {
            throw RangeUnsupportedError(where + " instead of partial content for offset " +
                                        std::to_string(start_offset_));
        }
    }

    template<typename T>
    void setopt(CURLoption opt, T value) {
        CURLcode rc = curl_easy_setopt(easy_, opt, value);
        if (rc != CURLE_OK) {
            throw TransportError("[CurlLinkSession] Failed to set curl option " + std::to_string(static_cast<int>(opt)) +
                                 ": " + curl_easy_strerror(rc));
        }
    }

    void set_options() {
        error_buf_[0] = '\0';
        setopt(CURLOPT_URL, url_.c_str());
        setopt(CURLOPT_ERRORBUFFER, error_buf_);
        setopt(CURLOPT_WRITEFUNCTION, &CurlLinkSession::write_cb);
        setopt(CURLOPT_WRITEDATA, this);
        setopt(CURLOPT_HEADERFUNCTION, &CurlLinkSession::header_cb);
        setopt(CURLOPT_HEADERDATA, this);
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_MAXREDIRS, 10L);
        setopt(CURLOPT_NOSIGNAL, 1L);
        setopt(CURLOPT_TCP_KEEPALIVE, 1L);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));

        for (const auto& kv : headers_) {
            std::string line = kv.first + ": " + kv.second;
            curl_slist* next = curl_slist_append(header_list_, line.c_str());
            if (!next) {
                throw TransportError("[CurlLinkSession] curl_slist_append failed");
            }
            header_list_ = next;
        }
        if (header_list_) {
            setopt(CURLOPT_HTTPHEADER, header_list_);
        }

        if (start_offset_ > 0) {
            // Range: bytes=<offset>- for HTTP, native resume for file/ftp
            setopt(CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(start_offset_));
        }
    }

    void perform_step() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            throw TransportError(std::string("[CurlLinkSession] curl_multi_perform failed: ") +
                                 curl_multi_strerror(mc));
        }
        int left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &left)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                transfer_done_ = true;
                result_ = msg->data.result;
            }
        }
        if (interrupted_.load()) {
            throw ClosedError("[CurlLinkSession] Interrupted: " + url_);
        }
    }

    void wait_step(steady_tick_t deadline, const char* what) {
        auto remaining = std::chrono::duration_cast<ms_t>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw TimeoutError("[CurlLinkSession] " + std::string(what) + " timed out after " +
                               std::to_string(timeout_.count()) + "ms: " + url_);
        }
        int slice = static_cast<int>(std::min<int64_t>(remaining.count(), MAX_POLL_SLICE_MS));
        CURLMcode mc = curl_multi_poll(multi_, nullptr, 0, slice, nullptr);
        if (mc != CURLM_OK) {
            throw TransportError(std::string("[CurlLinkSession] curl_multi_poll failed: ") +
                                 curl_multi_strerror(mc));
        }
        if (interrupted_.load()) {
            throw ClosedError("[CurlLinkSession] Interrupted: " + url_);
        }
    }

public:
    CurlLinkSession(const std::string& url, const HeaderMap& headers, ms_t timeout, uint64_t start_offset)
        : url_(url)
        , headers_(headers)
        , timeout_(timeout)
        , start_offset_(start_offset)
        , pausable_(has_http_scheme(url))
    {
        CurlInitializer::instance();
        error_buf_[0] = '\0';

        easy_ = curl_easy_init();
        multi_ = curl_multi_init();
        if (!easy_ || !multi_) {
            close();
            throw TransportError("[CurlLinkSession] Failed to create curl handles");
        }
    }

    ~CurlLinkSession() override { close(); }

    // Delete copy/move (callbacks hold `this`)
    CurlLinkSession(const CurlLinkSession&) = delete;
    CurlLinkSession& operator=(const CurlLinkSession&) = delete;
    CurlLinkSession(CurlLinkSession&&) = delete;
    CurlLinkSession& operator=(CurlLinkSession&&) = delete;

    void open() override {
        if (!easy_ || attached_) {
            throw ProtocolError("[CurlLinkSession] open() on a used session: " + url_);
        }
        set_options();

        CURLMcode mc = curl_multi_add_handle(multi_, easy_);
        if (mc != CURLM_OK) {
            throw TransportError(std::string("[CurlLinkSession] curl_multi_add_handle failed: ") +
                                 curl_multi_strerror(mc));
        }
        attached_ = true;

        steady_tick_t deadline = std::chrono::steady_clock::now() + timeout_;
        while (true) {
            perform_step();
            if (headers_done_ || body_started_ || transfer_done_) {
                break;
            }
            wait_step(deadline, "connect");
        }

        if (transfer_done_ && result_ != CURLE_OK) {
            throw_transfer_error(result_);
        }
        check_status();

        if (range_total_) {
            total_length_ = range_total_;
        } else {
            curl_off_t cl = -1;
            if (curl_easy_getinfo(easy_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0) {
                total_length_ = start_offset_ + static_cast<uint64_t>(cl);
            }
        }
        live_ = true;
    }

    size_t read_into(uint8_t* buff_ptr, size_t max_bytes) override {
        if (!live_) {
            throw ProtocolError("[CurlLinkSession] read on a session that is not open: " + url_);
        }
        if (max_bytes == 0) {
            return 0;
        }

        steady_tick_t deadline = std::chrono::steady_clock::now() + timeout_;
        while (true) {
            if (pending_pos_ < pending_.size()) {
                size_t n = std::min(max_bytes, pending_.size() - pending_pos_);
                std::memcpy(buff_ptr, pending_.data() + pending_pos_, n);
                pending_pos_ += n;
                if (pending_pos_ == pending_.size()) {
                    pending_.clear();
                    pending_pos_ = 0;
                }
                return n;
            }

            if (paused_) {
                paused_ = false;
                CURLcode rc = curl_easy_pause(easy_, CURLPAUSE_CONT);
                if (rc != CURLE_OK) {
                    throw_transfer_error(rc);
                }
                continue;
            }

            if (transfer_done_) {
                if (result_ == CURLE_OK) {
                    return 0;
                }
                throw_transfer_error(result_);
            }

            perform_step();
            if (pending_pos_ < pending_.size() || paused_ || transfer_done_) {
                continue;
            }
            wait_step(deadline, "read");
        }
    }

    void close() noexcept override {
        live_ = false;
        if (multi_ && easy_ && attached_) {
            curl_multi_remove_handle(multi_, easy_);
            attached_ = false;
        }
        if (easy_) {
            curl_easy_cleanup(easy_);
            easy_ = nullptr;
        }
        if (multi_) {
            curl_multi_cleanup(multi_);
            multi_ = nullptr;
        }
        if (header_list_) {
            curl_slist_free_all(header_list_);
            header_list_ = nullptr;
        }
        pending_.clear();
        pending_pos_ = 0;
    }

    void interrupt() noexcept override {
        interrupted_.store(true);
        if (multi_) {
            curl_multi_wakeup(multi_);
        }
    }

    uint64_t get_start_offset() const noexcept override { return start_offset_; }
    bool is_live() const noexcept override { return live_; }
    std::optional<uint64_t> get_total_length() const noexcept override { return total_length_; }
    long get_status() const noexcept { return status_; }
};

// Default opener used by the reconnecting reader
inline LinkOpener make_curl_opener(const LinkConfig& cfg)
{
    std::string url = cfg.url;
    HeaderMap headers = cfg.headers;
    ms_t timeout = cfg.timeout;
    return [url, headers, timeout](uint64_t offset) -> std::unique_ptr<I_LINK_SESSION> {
        return std::make_unique<CurlLinkSession>(url, headers, timeout, offset);
    };
}
