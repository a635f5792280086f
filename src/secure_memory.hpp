// Locked, zero-on-free storage for the wallet's shared private key and any
// other secret that passes through credentials:
// - Pages are pinned with mlock so the secret is never swapped to disk
// - Bytes are wiped before the buffer is released
// - Copies are impossible; ownership moves

#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <sys/mman.h>
#include <openssl/crypto.h>
#include "hex_utils.hpp"

namespace cosign {

class SecureMemory {
public:
    SecureMemory() : data_(nullptr), size_(0) {}

    SecureMemory(std::span<const uint8_t> input) : data_(nullptr), size_(input.size()) {
        if (size_ == 0) {
            return;
        }
        data_ = new uint8_t[size_];
        std::memcpy(data_, input.data(), size_);

        // mlock can fail without CAP_IPC_LOCK or under a low RLIMIT_MEMLOCK;
        // the secret is still wiped on release in that case
        locked_ = mlock(data_, size_) == 0;
    }

    // Parses hex text; the intermediate buffer is wiped before returning
    static SecureMemory from_hex(const std::string& hex) {
        auto bytes = HexUtils::decode(hex);
        SecureMemory secure(bytes);
        OPENSSL_cleanse(bytes.data(), bytes.size());
        return secure;
    }

    ~SecureMemory() { release(); }

    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;

    SecureMemory(SecureMemory&& other) noexcept
        : data_(other.data_), size_(other.size_), locked_(other.locked_) {
        other.data_ = nullptr;
        other.size_ = 0;
        other.locked_ = false;
    }

    SecureMemory& operator=(SecureMemory&& other) noexcept {
        if (this != &other) {
            release();
            data_ = other.data_;
            size_ = other.size_;
            locked_ = other.locked_;
            other.data_ = nullptr;
            other.size_ = 0;
            other.locked_ = false;
        }
        return *this;
    }

    std::span<const uint8_t> bytes() const { return {data_, size_}; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0 || data_ == nullptr; }

private:
    void release() {
        if (!data_) {
            return;
        }
        OPENSSL_cleanse(data_, size_);
        if (locked_) {
            munlock(data_, size_);
        }
        delete[] data_;
        data_ = nullptr;
        size_ = 0;
        locked_ = false;
    }

    uint8_t* data_;
    size_t size_;
    bool locked_ = false;
};

} // namespace cosign
