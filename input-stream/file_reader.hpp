// file_reader.hpp
#pragma once
#include "stream_reader.hpp"
#include "link_errors.hpp"
#include <cstdio>
#include <string>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;
using STD_PATH = std::filesystem::path;

#ifdef _WIN32
    #define fseek64 _fseeki64
#else
    #define fseek64 fseeko64
#endif

constexpr size_t _default_buf_sz = (size_t)4 * 1024 * 1024;

class FileReader : public I_STREAM_READER {
private:
    STD_PATH path;
    size_t offs;  // Initial offset, bytes before it are never delivered
    FILE* pf;
    size_t fsz;
    size_t data_read;

    size_t file_buffer_sz;
    char* vbuf_ = nullptr;

public:
    FileReader(const std::string& file_path, size_t offset = 0, size_t file_buffer_size = _default_buf_sz)
        : path(file_path), offs(offset), pf(nullptr),
          fsz(0), data_read(0), file_buffer_sz(file_buffer_size)
    {
        pf = fopen(path.string().c_str(), "rb");
        if (!pf) {
            throw std::runtime_error("[FileReader] Failed to open file: " + path.string());
        }

        // Apply stdio buffering (must be before reads)
        if (file_buffer_sz > 8*1024) {
            vbuf_ = (char*)std::malloc(file_buffer_sz);
            if (!vbuf_) {
                fclose(pf);
                pf = nullptr;
                throw std::runtime_error("[FileReader] Failed to allocate stdio buffer");
            }
            if (setvbuf(pf, vbuf_, _IOFBF, file_buffer_sz) != 0) {
                std::free(vbuf_);
                vbuf_ = nullptr;
                fclose(pf);
                pf = nullptr;
                throw std::runtime_error("[FileReader] setvbuf failed");
            }
        }

        std::error_code ec;
        fsz = fs::file_size(path, ec);
        if (ec) {
            close();
            throw std::runtime_error("[FileReader] Cannot get size of " + path.string() + ": " + ec.message());
        }
        if (offs > fsz) {
            close();
            throw RangeUnsupportedError("[FileReader] Offset " + std::to_string(offs) +
                                        " is past the end of " + path.string());
        }

        try {
            jump_to(offs);
        } catch (...) {
            close();
            throw;
        }
    }

    ~FileReader() override { close(); }

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    size_t read_into(uint8_t* buff_ptr, size_t max_bytes) override {
        if (!pf) {
            throw ClosedError("[FileReader] Read after close: " + path.string());
        }
        size_t rd = fread(buff_ptr, 1, max_bytes, pf);
        if (rd < max_bytes && ferror(pf)) {
            throw std::runtime_error("[FileReader] Read error");
        }
        data_read += rd;
        return rd;
    }

    std::string get_type() const noexcept override { return "file reader: " + path.string(); }

    void jump_to(size_t offset) {
        if (fseek64(pf, offset, SEEK_SET) != 0) {
            throw std::runtime_error("[FileReader] Failed to seek to offset");
        }
    }

    ReaderState get_state() const override {
        ReaderState st;
        st.type = "FileReader";
        st.data_read = data_read;
        st.set("file", path.string());
        st.set("start_offset", static_cast<uint64_t>(offs));
        st.set("size", static_cast<uint64_t>(fsz));
        st.set("open", pf != nullptr);
        return st;
    }

    size_t get_size() const noexcept { return fsz; }
    size_t get_data_read() const noexcept { return data_read; }
    STD_PATH get_file_path() const noexcept { return path; }

    void close() override {
        if (pf) {
            fclose(pf);
            pf = nullptr;
        }
        if (vbuf_) {
            std::free(vbuf_);
            vbuf_ = nullptr;
        }
    }
};
