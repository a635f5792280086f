#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace cosign {

// BIP340 Schnorr signatures and the BIP341/BIP86 key-path tweak used by
// taproot wallets.
class Schnorr {
public:
    using XOnlyKey = std::array<uint8_t, 32>;
    using Signature = std::array<uint8_t, 64>;

    // Signs a 32-byte message. aux_rand defaults to all zero bytes, which
    // keeps signatures deterministic.
    static Signature sign(std::span<const uint8_t> private_key,
                          std::span<const uint8_t> message,
                          std::span<const uint8_t> aux_rand = {});

    // Never throws; any malformed input fails verification
    static bool verify(std::span<const uint8_t> x_only_public_key,
                       std::span<const uint8_t> message,
                       std::span<const uint8_t> signature);

    // Output key Q = lift_x(P) + H_TapTweak(P.x) * G for a script-less
    // (BIP86) internal key P given in compressed form
    static XOnlyKey taproot_output_key(std::span<const uint8_t> internal_public_key);

    // Private key matching taproot_output_key of its public key
    static std::array<uint8_t, 32> taproot_tweak_private_key(std::span<const uint8_t> private_key);

private:
    Schnorr() = delete;
};

} // namespace cosign
