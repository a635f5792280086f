#pragma once

#include <array>
#include <vector>
#include <span>
#include <string_view>
#include <cstdint>
#include <openssl/sha.h>
#include <openssl/ripemd.h>

namespace cosign {

using Hash256 = std::array<uint8_t, SHA256_DIGEST_LENGTH>;
using Hash160 = std::array<uint8_t, RIPEMD160_DIGEST_LENGTH>;

// HashUtils is a utility class for the hash functions used by wallet
// addresses, transaction ids, key derivation and message signing
class HashUtils {
public:
    // Computes the SHA256 hash of input data
    static Hash256 sha256(std::span<const uint8_t> data);

    // Computes double SHA256 hash (SHA256(SHA256(data)))
    static Hash256 double_sha256(std::span<const uint8_t> data);

    // Computes RIPEMD160 hash of input data
    static Hash160 ripemd160(std::span<const uint8_t> data);

    // Computes HASH160 (RIPEMD160(SHA256(data)))
    static Hash160 hash160(std::span<const uint8_t> data);

    // HMAC-SHA256, used by deterministic ECDSA nonces
    static Hash256 hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data);

    // HMAC-SHA512, used by BIP32 child derivation
    static std::array<uint8_t, 64> hmac_sha512(std::span<const uint8_t> key, std::span<const uint8_t> data);

    // BIP340 tagged hash: SHA256(SHA256(tag) || SHA256(tag) || data)
    static Hash256 tagged_hash(std::string_view tag, std::span<const uint8_t> data);

    static std::span<const uint8_t> as_bytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

private:
    // Private constructor to prevent instantiation
    HashUtils() = delete;
};

} // namespace cosign
