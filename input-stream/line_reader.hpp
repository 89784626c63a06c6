// line_reader.hpp
#pragma once
#include "stream_reader.hpp"
#include <string>
#include <vector>

constexpr size_t LINE_REFILL_SZ = 32 * 1024;

// Line iteration on top of any reader. Lines keep their trailing '\n';
// the last line may lack one.
class LineReader {
private:
    I_STREAM_READER& src_;
    std::string buf_;
    size_t pos_;
    bool done_;
    std::vector<uint8_t> chunk_;

    bool fill() {
        if (done_) {
            return false;
        }
        size_t rd = src_.read_into(chunk_.data(), chunk_.size());
        if (rd == 0) {
            done_ = true;
            return false;
        }
        if (pos_ > 0) {
            buf_.erase(0, pos_);
            pos_ = 0;
        }
        buf_.append(reinterpret_cast<const char*>(chunk_.data()), rd);
        return true;
    }

public:
    explicit LineReader(I_STREAM_READER& src, size_t refill_size = LINE_REFILL_SZ)
        : src_(src), pos_(0), done_(false), chunk_(refill_size > 0 ? refill_size : LINE_REFILL_SZ) {}

    // Returns false once the source is exhausted and no data is left
    bool read_line(std::string& line) {
        size_t scan_from = pos_;
        while (true) {
            size_t nl = buf_.find('\n', scan_from);
            if (nl != std::string::npos) {
                line.assign(buf_, pos_, nl + 1 - pos_);
                pos_ = nl + 1;
                return true;
            }
            size_t scanned = buf_.size() - pos_;
            if (!fill()) {
                break;
            }
            scan_from = pos_ + scanned;
        }
        if (pos_ >= buf_.size()) {
            line.clear();
            return false;
        }
        line.assign(buf_, pos_, std::string::npos);
        pos_ = buf_.size();
        return true;
    }

    std::vector<std::string> read_lines() {
        std::vector<std::string> lines;
        std::string line;
        while (read_line(line)) {
            lines.push_back(line);
        }
        return lines;
    }
};
