#include "ec_utils.hpp"
#include "error.hpp"
#include <openssl/obj_mac.h>

namespace cosign {

const EC_GROUP* EcUtils::group() {
    static const std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)> secp256k1(
        EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free);
    if (!secp256k1) {
        throw Error(Error::Code::CryptoFailure, "secp256k1 is not available");
    }
    return secp256k1.get();
}

const BIGNUM* EcUtils::order() {
    return EC_GROUP_get0_order(group());
}

BnPtr EcUtils::new_bn() {
    BnPtr bn(BN_new(), BN_free);
    if (!bn) {
        throw Error(Error::Code::CryptoFailure);
    }
    return bn;
}

BnCtxPtr EcUtils::new_ctx() {
    BnCtxPtr ctx(BN_CTX_new(), BN_CTX_free);
    if (!ctx) {
        throw Error(Error::Code::CryptoFailure);
    }
    return ctx;
}

EcPointPtr EcUtils::new_point() {
    EcPointPtr point(EC_POINT_new(group()), EC_POINT_free);
    if (!point) {
        throw Error(Error::Code::CryptoFailure);
    }
    return point;
}

BnPtr EcUtils::bn_from_bytes(std::span<const uint8_t> bytes) {
    BnPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), BN_free);
    if (!bn) {
        throw Error(Error::Code::CryptoFailure);
    }
    return bn;
}

std::array<uint8_t, 32> EcUtils::bn_to_bytes32(const BIGNUM* bn) {
    std::array<uint8_t, 32> out{};
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != 32) {
        throw Error(Error::Code::CryptoFailure, "Scalar does not fit in 32 bytes");
    }
    return out;
}

EcPointPtr EcUtils::point_from_bytes(std::span<const uint8_t> pubkey) {
    auto point = new_point();
    auto ctx = new_ctx();
    if (pubkey.empty() ||
        !EC_POINT_oct2point(group(), point.get(), pubkey.data(), pubkey.size(), ctx.get()) ||
        EC_POINT_is_at_infinity(group(), point.get())) {
        throw Error(Error::Code::InvalidKeyFormat, "Invalid public key");
    }
    return point;
}

std::vector<uint8_t> EcUtils::point_to_bytes(const EC_POINT* point) {
    auto ctx = new_ctx();
    std::vector<uint8_t> result(33);
    size_t size = EC_POINT_point2oct(group(), point, POINT_CONVERSION_COMPRESSED,
                                     result.data(), result.size(), ctx.get());
    if (size != 33) {
        throw Error(Error::Code::CryptoFailure, "Could not serialize point");
    }
    return result;
}

EcPointPtr EcUtils::lift_x(std::span<const uint8_t> x) {
    EcPointPtr none(nullptr, EC_POINT_free);
    if (x.size() != 32) {
        return none;
    }
    auto bn_x = bn_from_bytes(x);
    auto point = new_point();
    auto ctx = new_ctx();
    if (!EC_POINT_set_compressed_coordinates(group(), point.get(), bn_x.get(), 0, ctx.get())) {
        return none;
    }
    return point;
}

bool EcUtils::has_even_y(const EC_POINT* point) {
    auto x = new_bn();
    auto y = new_bn();
    auto ctx = new_ctx();
    if (!EC_POINT_get_affine_coordinates(group(), point, x.get(), y.get(), ctx.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    return !BN_is_odd(y.get());
}

std::array<uint8_t, 32> EcUtils::x_coordinate(const EC_POINT* point) {
    auto x = new_bn();
    auto ctx = new_ctx();
    if (!EC_POINT_get_affine_coordinates(group(), point, x.get(), nullptr, ctx.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    return bn_to_bytes32(x.get());
}

bool EcUtils::is_valid_private_key(std::span<const uint8_t> key) {
    if (key.size() != 32) {
        return false;
    }
    auto bn = bn_from_bytes(key);
    return !BN_is_zero(bn.get()) && BN_cmp(bn.get(), order()) < 0;
}

bool EcUtils::is_valid_public_key(std::span<const uint8_t> key) {
    if (key.size() != 33 && key.size() != 65) {
        return false;
    }
    try {
        point_from_bytes(key);
        return true;
    } catch (const Error&) {
        return false;
    }
}

// Derives a public key from a private key using elliptic curve multiplication
// public_key = private_key * G, serialized in compressed format:
// - First byte: 0x02 if y-coordinate is even, 0x03 if y-coordinate is odd
// - Remaining 32 bytes: x-coordinate
std::vector<uint8_t> EcUtils::public_key_from_private(std::span<const uint8_t> key) {
    if (!is_valid_private_key(key)) {
        throw Error(Error::Code::InvalidKeyFormat, "Invalid private key");
    }
    auto priv = bn_from_bytes(key);
    auto pub = new_point();
    auto ctx = new_ctx();
    if (!EC_POINT_mul(group(), pub.get(), priv.get(), nullptr, nullptr, ctx.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    return point_to_bytes(pub.get());
}

std::vector<uint8_t> EcUtils::add_tweak_to_public(std::span<const uint8_t> pubkey,
                                                  std::span<const uint8_t> tweak) {
    auto t = bn_from_bytes(tweak);
    if (BN_cmp(t.get(), order()) >= 0) {
        throw Error(Error::Code::DerivationError, "Tweak exceeds curve order");
    }
    auto point = point_from_bytes(pubkey);
    auto result = new_point();
    auto ctx = new_ctx();
    // result = t * G + 1 * P
    BnPtr one(BN_new(), BN_free);
    if (!one || !BN_one(one.get()) ||
        !EC_POINT_mul(group(), result.get(), t.get(), point.get(), one.get(), ctx.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    if (EC_POINT_is_at_infinity(group(), result.get())) {
        throw Error(Error::Code::DerivationError, "Tweaked key is the point at infinity");
    }
    return point_to_bytes(result.get());
}

std::array<uint8_t, 32> EcUtils::add_tweak_to_private(std::span<const uint8_t> key,
                                                      std::span<const uint8_t> tweak) {
    auto t = bn_from_bytes(tweak);
    if (BN_cmp(t.get(), order()) >= 0) {
        throw Error(Error::Code::DerivationError, "Tweak exceeds curve order");
    }
    auto k = bn_from_bytes(key);
    auto result = new_bn();
    auto ctx = new_ctx();
    if (!BN_mod_add(result.get(), k.get(), t.get(), order(), ctx.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    if (BN_is_zero(result.get())) {
        throw Error(Error::Code::DerivationError, "Tweaked key is zero");
    }
    return bn_to_bytes32(result.get());
}

std::array<uint8_t, 32> EcUtils::negate_private(std::span<const uint8_t> key) {
    auto k = bn_from_bytes(key);
    auto result = new_bn();
    if (!BN_sub(result.get(), order(), k.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    return bn_to_bytes32(result.get());
}

} // namespace cosign
