// digest_reader.hpp
#pragma once
#include "stream_reader.hpp"
#include "link_errors.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>
#include <string>

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

inline std::string to_hex(const unsigned char* data, size_t len)
{
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

// Passes a parent reader through and keeps a running SHA-256 of every
// delivered byte. hex_digest() may be called at any point of the stream.
class DigestReader : public I_STREAM_READER {
private:
    std::unique_ptr<I_STREAM_READER> parent_;
    EvpMdCtxPtr ctx_;
    uint64_t data_read_;

public:
    explicit DigestReader(std::unique_ptr<I_STREAM_READER> parent)
        : parent_(std::move(parent))
        , ctx_(EVP_MD_CTX_new())
        , data_read_(0)
    {
        if (!parent_) {
            throw std::invalid_argument("[DigestReader] parent reader is null");
        }
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("[DigestReader] Failed to initialize SHA-256");
        }
    }

    DigestReader(const DigestReader&) = delete;
    DigestReader& operator=(const DigestReader&) = delete;

    size_t read_into(uint8_t* buff_ptr, size_t max_bytes) override {
        size_t rd = parent_->read_into(buff_ptr, max_bytes);
        if (rd > 0 && EVP_DigestUpdate(ctx_.get(), buff_ptr, rd) != 1) {
            throw std::runtime_error("[DigestReader] SHA-256 update failed");
        }
        data_read_ += rd;
        return rd;
    }

    void close() override { parent_->close(); }

    // Digest of the bytes delivered so far, the running state is untouched
    std::string hex_digest() const {
        EvpMdCtxPtr snapshot(EVP_MD_CTX_new());
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (!snapshot || EVP_MD_CTX_copy_ex(snapshot.get(), ctx_.get()) != 1 ||
            EVP_DigestFinal_ex(snapshot.get(), md, &md_len) != 1) {
            throw std::runtime_error("[DigestReader] SHA-256 finalization failed");
        }
        return to_hex(md, md_len);
    }

    std::string get_type() const noexcept override {
        return "sha256 reader: " + parent_->get_type();
    }

    ReaderState get_state() const override {
        ReaderState st;
        st.type = "DigestReader";
        st.data_read = data_read_;
        st.set("sha256", hex_digest());
        st.children.push_back(parent_->get_state());
        return st;
    }

    uint64_t get_data_read() const noexcept { return data_read_; }
    I_STREAM_READER& parent() noexcept { return *parent_; }
};
