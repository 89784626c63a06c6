// reader_state.hpp
#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Point-in-time snapshot of a reader for logs and checkpoints.
// Wrapping readers nest the state of the readers they own in `children`.
struct ReaderState {
    std::string type;
    uint64_t data_read = 0;
    std::vector<std::pair<std::string, std::string>> fields;
    std::vector<ReaderState> children;

    void set(const std::string& key, const std::string& value) {
        for (auto& kv : fields) {
            if (kv.first == key) {
                kv.second = value;
                return;
            }
        }
        fields.emplace_back(key, value);
    }

    void set(const std::string& key, uint64_t value) { set(key, std::to_string(value)); }
    void set(const std::string& key, int64_t value) { set(key, std::to_string(value)); }
    void set(const std::string& key, int value) { set(key, std::to_string(value)); }
    void set(const std::string& key, bool value) { set(key, std::string(value ? "true" : "false")); }
    void set(const std::string& key, const char* value) { set(key, std::string(value)); }

    // Empty when the key is not set
    std::string get(const std::string& key) const {
        for (const auto& kv : fields) {
            if (kv.first == key) {
                return kv.second;
            }
        }
        return std::string();
    }

    bool has(const std::string& key) const {
        for (const auto& kv : fields) {
            if (kv.first == key) {
                return true;
            }
        }
        return false;
    }

    // TypeName(data_read=N, key=value, ..., [Child(...), ...])
    std::string to_string() const {
        std::string out = type + "(data_read=" + std::to_string(data_read);
        for (const auto& kv : fields) {
            out += ", " + kv.first + "=" + kv.second;
        }
        if (!children.empty()) {
            out += ", [";
            for (size_t i = 0; i < children.size(); ++i) {
                out += (i ? ", " : "") + children[i].to_string();
            }
            out += "]";
        }
        return out + ")";
    }
};
