// tee_reader.hpp
#pragma once
#include "stream_reader.hpp"
#include "link_errors.hpp"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

// Passes a parent reader through and copies every delivered byte to a file.
// The copy is written to "<path>.part" and renamed to <path> on close() once
// the parent has reported EOF. A stream closed early leaves only the .part file.
class TeeReader : public I_STREAM_READER {
private:
    std::unique_ptr<I_STREAM_READER> parent_;
    std::filesystem::path copy_path_;
    std::filesystem::path part_path_;
    FILE* copy_fp_;
    size_t data_read_;
    bool eof_;

public:
    TeeReader(std::unique_ptr<I_STREAM_READER> parent, const std::string& copy_path)
        : parent_(std::move(parent))
        , copy_path_(copy_path)
        , part_path_(copy_path + ".part")
        , copy_fp_(nullptr)
        , data_read_(0)
        , eof_(false)
    {
        if (!parent_) {
            throw std::invalid_argument("[TeeReader] parent reader is null");
        }
        copy_fp_ = fopen(part_path_.string().c_str(), "wb");
        if (!copy_fp_) {
            throw std::runtime_error("[TeeReader] Failed to open copy file: " + part_path_.string());
        }
    }

    ~TeeReader() override {
        try {
            close();
        } catch (const std::exception& e) {
            std::cerr << "Warning: [TeeReader] " << e.what() << "\n";
        }
    }

    TeeReader(const TeeReader&) = delete;
    TeeReader& operator=(const TeeReader&) = delete;

    size_t read_into(uint8_t* buff_ptr, size_t max_bytes) override {
        if (!copy_fp_) {
            throw ClosedError("[TeeReader] Read after close: " + copy_path_.string());
        }
        size_t rd = parent_->read_into(buff_ptr, max_bytes);
        if (rd > 0 && fwrite(buff_ptr, 1, rd, copy_fp_) != rd) {
            throw std::runtime_error("[TeeReader] Failed to write copy: " + part_path_.string());
        }
        if (rd == 0 && max_bytes > 0) {
            eof_ = true;
        }
        data_read_ += rd;
        return rd;
    }

    // Closes the parent, flushes the copy and moves it into place after EOF
    void close() override {
        if (!copy_fp_) {
            return;
        }
        parent_->close();
        bool write_ok = fflush(copy_fp_) == 0;
        write_ok = (fclose(copy_fp_) == 0) && write_ok;
        copy_fp_ = nullptr;
        if (!write_ok) {
            throw std::runtime_error("[TeeReader] Failed to flush copy: " + part_path_.string());
        }

        if (!eof_) {
            return;
        }
        std::error_code ec;
        std::filesystem::rename(part_path_, copy_path_, ec);
        if (ec) {
            throw std::runtime_error("[TeeReader] Failed to move " + part_path_.string() +
                                     " -> " + copy_path_.string() + ": " + ec.message());
        }
    }

    std::string get_type() const noexcept override {
        return "tee reader: " + parent_->get_type() + " -> " + copy_path_.string();
    }

    ReaderState get_state() const override {
        ReaderState st;
        st.type = "TeeReader";
        st.data_read = data_read_;
        st.set("copy", copy_path_.string());
        st.set("complete", eof_);
        st.children.push_back(parent_->get_state());
        return st;
    }

    size_t get_data_read() const noexcept { return data_read_; }
    bool is_complete() const noexcept { return eof_; }
    I_STREAM_READER& parent() noexcept { return *parent_; }
};
