#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <sodium.h>

namespace lf {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }
    sodium_memzero(ptr, numBytes);
}

inline void secureWipe(std::string& text) {
    secureZero(&text[0], text.size());
    text.clear();
}

// Byte buffer for key material; zeroed on destruction and on overwrite.
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(std::size_t count) : bytes_(count) {}

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;

    SecretBytes(SecretBytes&& other) noexcept : bytes_(std::move(other.bytes_)) {
        other.bytes_.clear();
    }

    SecretBytes& operator=(SecretBytes&& other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    ~SecretBytes() { wipe(); }

    void assign(const std::vector<unsigned char>& source) {
        wipe();
        bytes_ = source;
    }

    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    unsigned char* data() { return bytes_.data(); }
    const unsigned char* data() const { return bytes_.data(); }

private:
    void wipe() {
        if (!bytes_.empty()) {
            secureZero(bytes_.data(), bytes_.size());
        }
    }

    std::vector<unsigned char> bytes_;
};

} // namespace lf
