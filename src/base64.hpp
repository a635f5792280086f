#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "error.hpp"

namespace cosign {

// Standard (padded) base64 built on OpenSSL's block encoder.
class Base64 {
public:
    static std::string encode(std::span<const uint8_t> data) {
        if (data.empty()) {
            return "";
        }
        std::string out(4 * ((data.size() + 2) / 3), '\0');
        int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
        out.resize(static_cast<size_t>(len));
        return out;
    }

    static std::vector<uint8_t> decode(const std::string& text) {
        if (text.empty()) {
            return {};
        }
        if (text.size() % 4 != 0) {
            throw Error(Error::Code::InvalidArgument, "Invalid base64 length");
        }
        std::vector<uint8_t> out(3 * text.size() / 4);
        int len = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
        if (len < 0) {
            throw Error(Error::Code::InvalidArgument, "Invalid base64 text");
        }
        // EVP_DecodeBlock keeps the bytes produced by '=' padding
        size_t padding = 0;
        if (text.ends_with("==")) {
            padding = 2;
        } else if (text.ends_with('=')) {
            padding = 1;
        }
        out.resize(static_cast<size_t>(len) - padding);
        return out;
    }

private:
    Base64() = delete;
};

} // namespace cosign
