// memory_reader.hpp
#pragma once
#include "stream_reader.hpp"
#include "link_errors.hpp"
#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

// Reads from an owned in-memory buffer
class MemoryReader : public I_STREAM_READER {
private:
    std::vector<uint8_t> data_;
    size_t offset_;
    bool closed_;

public:
    explicit MemoryReader(std::vector<uint8_t> data)
        : data_(std::move(data)), offset_(0), closed_(false) {}

    explicit MemoryReader(const std::string& text)
        : data_(text.begin(), text.end()), offset_(0), closed_(false) {}

    size_t read_into(uint8_t* buff_ptr, size_t max_bytes) override {
        if (closed_) {
            throw ClosedError("[MemoryReader] Read after close");
        }
        size_t n = std::min(max_bytes, data_.size() - offset_);
        if (n > 0) {
            std::memcpy(buff_ptr, data_.data() + offset_, n);
            offset_ += n;
        }
        return n;
    }

    void close() override { closed_ = true; }

    std::string get_type() const noexcept override {
        return "memory reader: " + std::to_string(data_.size()) + " bytes";
    }

    ReaderState get_state() const override {
        ReaderState st;
        st.type = "MemoryReader";
        st.data_read = offset_;
        st.set("size", static_cast<uint64_t>(data_.size()));
        return st;
    }

    size_t get_size() const noexcept { return data_.size(); }
    size_t get_offset() const noexcept { return offset_; }
};
