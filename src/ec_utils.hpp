#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include <openssl/bn.h>
#include <openssl/ec.h>

namespace cosign {

using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using EcPointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

// Thin RAII layer over OpenSSL's secp256k1 primitives. Every failure of the
// underlying library is reported as Error(CryptoFailure); malformed caller
// input is reported as Error(InvalidKeyFormat).
class EcUtils {
public:
    static const EC_GROUP* group();

    // Curve order n
    static const BIGNUM* order();

    static BnPtr new_bn();
    static BnCtxPtr new_ctx();
    static EcPointPtr new_point();

    static BnPtr bn_from_bytes(std::span<const uint8_t> bytes);

    // Big-endian, left padded to 32 bytes
    static std::array<uint8_t, 32> bn_to_bytes32(const BIGNUM* bn);

    // Parses a compressed or uncompressed SEC1 public key
    static EcPointPtr point_from_bytes(std::span<const uint8_t> pubkey);

    // 33-byte compressed encoding
    static std::vector<uint8_t> point_to_bytes(const EC_POINT* point);

    // Point with the given x coordinate and even y, null if x is not on the curve
    static EcPointPtr lift_x(std::span<const uint8_t> x);

    static bool has_even_y(const EC_POINT* point);

    static std::array<uint8_t, 32> x_coordinate(const EC_POINT* point);

    static bool is_valid_private_key(std::span<const uint8_t> key);

    static bool is_valid_public_key(std::span<const uint8_t> key);

    // pub = priv * G, compressed
    static std::vector<uint8_t> public_key_from_private(std::span<const uint8_t> key);

    // P + tweak * G, compressed. Throws DerivationError when tweak >= n or
    // the result is the point at infinity.
    static std::vector<uint8_t> add_tweak_to_public(std::span<const uint8_t> pubkey,
                                                    std::span<const uint8_t> tweak);

    // (priv + tweak) mod n. Throws DerivationError when tweak >= n or the
    // result is zero.
    static std::array<uint8_t, 32> add_tweak_to_private(std::span<const uint8_t> key,
                                                        std::span<const uint8_t> tweak);

    // n - priv
    static std::array<uint8_t, 32> negate_private(std::span<const uint8_t> key);

private:
    EcUtils() = delete;
};

} // namespace cosign
