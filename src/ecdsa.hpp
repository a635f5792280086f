#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace cosign {

// ECDSA over secp256k1 with deterministic nonces (RFC 6979) and low-S
// normalization. Digests are 32 bytes read big-endian.
class Ecdsa {
public:
    // Returns the DER-encoded signature (no sighash byte)
    static std::vector<uint8_t> sign(std::span<const uint8_t> private_key,
                                     std::span<const uint8_t> digest);

    // Verifies a DER signature against a SEC1 public key. Never throws;
    // malformed keys or signatures simply do not verify.
    static bool verify(std::span<const uint8_t> public_key,
                       std::span<const uint8_t> digest,
                       std::span<const uint8_t> der_signature);

private:
    Ecdsa() = delete;

    // RFC 6979 section 3.2 nonce for the given key, digest and retry round
    static std::array<uint8_t, 32> deterministic_nonce(std::span<const uint8_t> private_key,
                                                       std::span<const uint8_t> digest,
                                                       uint32_t round);
};

} // namespace cosign
