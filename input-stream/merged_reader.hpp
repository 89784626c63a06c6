// merged_reader.hpp
#pragma once
#include "stream_reader.hpp"
#include "link_errors.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Concatenates several readers into one stream, in order
class MergedReader : public I_STREAM_READER {
private:
    std::vector<std::unique_ptr<I_STREAM_READER>> readers_;
    std::vector<bool> open_;
    size_t cur_;
    bool close_after_use_;
    bool closed_;
    uint64_t data_read_;

public:
    explicit MergedReader(std::vector<std::unique_ptr<I_STREAM_READER>> readers, bool close_after_use = true)
        : readers_(std::move(readers))
        , open_(readers_.size(), true)
        , cur_(0)
        , close_after_use_(close_after_use)
        , closed_(false)
        , data_read_(0)
    {
        for (const auto& r : readers_) {
            if (!r) {
                throw std::invalid_argument("[MergedReader] null reader");
            }
        }
    }

    ~MergedReader() override {
        try {
            close();
        } catch (const std::exception& e) {
            std::cerr << "Warning: [MergedReader] " << e.what() << "\n";
        }
    }

    MergedReader(const MergedReader&) = delete;
    MergedReader& operator=(const MergedReader&) = delete;

    size_t read_into(uint8_t* buff_ptr, size_t max_bytes) override {
        if (closed_) {
            throw ClosedError("[MergedReader] Read after close");
        }
        if (max_bytes == 0) {
            return 0;
        }
        while (cur_ < readers_.size()) {
            size_t rd = readers_[cur_]->read_into(buff_ptr, max_bytes);
            if (rd > 0) {
                data_read_ += rd;
                return rd;
            }
            if (close_after_use_) {
                readers_[cur_]->close();
                open_[cur_] = false;
            }
            ++cur_;
        }
        return 0;
    }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        for (size_t i = 0; i < readers_.size(); ++i) {
            if (open_[i]) {
                readers_[i]->close();
                open_[i] = false;
            }
        }
    }

    std::string get_type() const noexcept override {
        std::string desc = "merged reader: " + std::to_string(readers_.size()) + " parts";
        if (cur_ < readers_.size()) {
            desc += ", current " + readers_[cur_]->get_type();
        }
        return desc;
    }

    ReaderState get_state() const override {
        ReaderState st;
        st.type = "MergedReader";
        st.data_read = data_read_;
        st.set("current_index", static_cast<uint64_t>(cur_));
        st.set("close_after_use", close_after_use_);
        for (const auto& r : readers_) {
            st.children.push_back(r->get_state());
        }
        return st;
    }

    size_t get_current_index() const noexcept { return cur_; }
};
