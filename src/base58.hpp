#pragma once

#include <string>
#include <vector>
#include <span>
#include <cstdint>

namespace cosign {

// Base58 is a utility class for Base58 encoding and decoding.
//
// Base58 is a binary-to-text encoding scheme used for legacy addresses and
// serialized extended keys. It uses a 58-character alphabet excluding the
// easily confused characters 0, O, I and l. The "check" variants append and
// verify a 4-byte double-SHA256 checksum.
class Base58 {
public:
    // Encodes raw bytes to Base58 text
    static std::string encode(std::span<const uint8_t> data);

    // Decodes Base58 text into raw bytes
    static std::vector<uint8_t> decode(const std::string& encoded);

    // Encodes bytes followed by their 4-byte checksum
    static std::string encode_check(std::span<const uint8_t> payload);

    // Decodes text and verifies and strips the trailing checksum
    static std::vector<uint8_t> decode_check(const std::string& encoded);

private:
    // Private constructor to prevent instantiation
    Base58() = delete;
};

} // namespace cosign
