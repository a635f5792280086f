#include "hash_utils.hpp"
#include "error.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace cosign {

// Computes the SHA256 hash of input data
// SHA256 produces a fixed-size 32-byte output regardless of the input size.
// It is used for transaction ids, address checksums and message hashes.
Hash256 HashUtils::sha256(std::span<const uint8_t> data) {
    Hash256 hash;
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash.data(), &sha256);
    return hash;
}

// Computes double SHA256 hash (SHA256(SHA256(data)))
Hash256 HashUtils::double_sha256(std::span<const uint8_t> data) {
    auto first_hash = sha256(data);
    return sha256(std::span<const uint8_t>(first_hash.data(), first_hash.size()));
}

// Computes RIPEMD160 hash of input data
Hash160 HashUtils::ripemd160(std::span<const uint8_t> data) {
    Hash160 hash;
    RIPEMD160_CTX ripemd160;
    RIPEMD160_Init(&ripemd160);
    RIPEMD160_Update(&ripemd160, data.data(), data.size());
    RIPEMD160_Final(hash.data(), &ripemd160);
    return hash;
}

// Computes HASH160 (RIPEMD160(SHA256(data)))
// HASH160 shortens public keys and scripts for P2PKH, P2SH and P2WPKH outputs.
Hash160 HashUtils::hash160(std::span<const uint8_t> data) {
    auto sha256_result = sha256(data);
    return ripemd160(std::span<const uint8_t>(sha256_result.data(), sha256_result.size()));
}

Hash256 HashUtils::hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    Hash256 result;
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), result.data(), &len) ||
        len != result.size()) {
        throw Error(Error::Code::CryptoFailure, "HMAC-SHA256 failed");
    }
    return result;
}

std::array<uint8_t, 64> HashUtils::hmac_sha512(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    std::array<uint8_t, 64> result;
    unsigned int len = 0;
    if (!HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), result.data(), &len) ||
        len != result.size()) {
        throw Error(Error::Code::CryptoFailure, "HMAC-SHA512 failed");
    }
    return result;
}

// Tagged hashes domain-separate the BIP340/BIP341 hash uses so a digest from
// one context can never be replayed in another.
Hash256 HashUtils::tagged_hash(std::string_view tag, std::span<const uint8_t> data) {
    auto tag_hash = sha256(as_bytes(tag));
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, tag_hash.data(), tag_hash.size());
    SHA256_Update(&ctx, tag_hash.data(), tag_hash.size());
    SHA256_Update(&ctx, data.data(), data.size());
    Hash256 hash;
    SHA256_Final(hash.data(), &ctx);
    return hash;
}

} // namespace cosign
