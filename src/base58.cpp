#include "base58.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <algorithm>

namespace cosign {

namespace {

const std::string BASE58_CHARS =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

} // namespace

// Encodes bytes to Base58.
//
// The encoding process:
// 1. Treats the input as a big-endian number and repeatedly divides it by 58
// 2. Maps each remainder to the Base58 alphabet
// 3. Emits one '1' for every leading zero byte
std::string Base58::encode(std::span<const uint8_t> data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // Base58 digits, least significant first
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    for (size_t i = leading_zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        for (auto& digit : digits) {
            carry += static_cast<uint32_t>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(leading_zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result.push_back(BASE58_CHARS[*it]);
    }
    return result;
}

// Decodes a Base58-encoded string into bytes.
//
// The decoding process:
// 1. Converts each Base58 character to its corresponding value
// 2. Builds the result by multiplying existing value by 58 and adding new digits
// 3. Handles leading '1' characters (which represent leading zeros)
//
// Throws:
//   Error(Base58DecodeError) if the input contains a character outside the alphabet
std::vector<uint8_t> Base58::decode(const std::string& base58_string) {
    std::vector<uint8_t> result;
    for (char c : base58_string) {
        auto digit = BASE58_CHARS.find(c);
        if (digit == std::string::npos) {
            throw Error(Error::Code::Base58DecodeError);
        }

        // Multiply existing result by 58 and add new digit
        size_t carry = digit;
        for (auto it = result.rbegin(); it != result.rend(); ++it) {
            carry += static_cast<size_t>(*it) * 58;
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }

        // Add any remaining carry as new digits
        while (carry > 0) {
            result.insert(result.begin(), static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    // Handle leading '1' characters (0x00 bytes in output)
    for (char c : base58_string) {
        if (c != '1') break;
        result.insert(result.begin(), 0);
    }

    return result;
}

std::string Base58::encode_check(std::span<const uint8_t> payload) {
    std::vector<uint8_t> data(payload.begin(), payload.end());
    auto checksum = HashUtils::double_sha256(payload);
    data.insert(data.end(), checksum.begin(), checksum.begin() + 4);
    return encode(data);
}

// Decodes Base58Check text. The last 4 bytes must equal the first 4 bytes of
// the double SHA256 of the payload.
std::vector<uint8_t> Base58::decode_check(const std::string& encoded) {
    auto data = decode(encoded);
    if (data.size() < 4) {
        throw Error(Error::Code::Base58DecodeError);
    }

    std::span<const uint8_t> payload(data.data(), data.size() - 4);
    auto checksum = HashUtils::double_sha256(payload);
    if (!std::equal(checksum.begin(), checksum.begin() + 4, data.end() - 4)) {
        throw Error(Error::Code::Base58DecodeError, "Base58 checksum mismatch");
    }

    data.resize(data.size() - 4);
    return data;
}

} // namespace cosign
