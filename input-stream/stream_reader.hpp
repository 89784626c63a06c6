// stream_reader.hpp
#pragma once
#include "reader_state.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

class I_STREAM_READER {
public:
    virtual ~I_STREAM_READER() = default;

    // Read up to max_bytes bytes into buffer
    // Returns: actual bytes read (0 <= result <= max_bytes), 0 means EOF
    // Throws: LinkError subclasses (ClosedError after close()) or
    //         std::runtime_error on fatal errors
    virtual size_t read_into(uint8_t* buff_ptr, size_t max_bytes) = 0;

    // Release the underlying resource. Idempotent.
    virtual void close() = 0;

    // Get reader type name for logging/debugging
    virtual std::string get_type() const noexcept
    {
        return "<UNK>";
    };

    // Snapshot of counters and settings, see ReaderState
    virtual ReaderState get_state() const
    {
        ReaderState st;
        st.type = "<UNK>";
        return st;
    }
};
