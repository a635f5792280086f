#include "ecdsa.hpp"
#include "ec_utils.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <memory>

namespace cosign {

// Derives the signing nonce k from the private key and the digest following
// RFC 6979 (HMAC-SHA256 DRBG). The same key and digest always produce the same
// signature, so a copayer re-signing a proposal yields identical bytes.
//
// The round parameter skips candidates, which is only needed in the
// astronomically unlikely case that r or s come out as zero.
std::array<uint8_t, 32> Ecdsa::deterministic_nonce(std::span<const uint8_t> private_key,
                                                   std::span<const uint8_t> digest,
                                                   uint32_t round) {
    // bits2octets(h1): the digest reduced modulo n
    auto ctx = EcUtils::new_ctx();
    auto z = EcUtils::bn_from_bytes(digest);
    if (!BN_nnmod(z.get(), z.get(), EcUtils::order(), ctx.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    auto h1 = EcUtils::bn_to_bytes32(z.get());

    std::array<uint8_t, 32> v;
    std::array<uint8_t, 32> k;
    v.fill(0x01);
    k.fill(0x00);

    auto update = [&](uint8_t separator) {
        std::vector<uint8_t> data(v.begin(), v.end());
        data.push_back(separator);
        data.insert(data.end(), private_key.begin(), private_key.end());
        data.insert(data.end(), h1.begin(), h1.end());
        k = HashUtils::hmac_sha256(k, data);
        v = HashUtils::hmac_sha256(k, v);
    };
    update(0x00);
    update(0x01);

    uint32_t produced = 0;
    while (true) {
        v = HashUtils::hmac_sha256(k, v);
        if (EcUtils::is_valid_private_key(v)) {
            if (produced == round) {
                return v;
            }
            ++produced;
        }
        std::vector<uint8_t> data(v.begin(), v.end());
        data.push_back(0x00);
        k = HashUtils::hmac_sha256(k, data);
        v = HashUtils::hmac_sha256(k, v);
    }
}

// Sign a digest with a private key using ECDSA on the secp256k1 curve.
//
// For any valid signature (r, s) the signature (r, n - s) is also valid. To
// remove that malleability vector the s value is always normalized into the
// lower half of the curve order (BIP62).
//
// The signature process:
// 1. Derive the deterministic nonce k
// 2. r = (k * G).x mod n
// 3. s = k^-1 * (z + r * d) mod n
// 4. Normalize s and encode (r, s) in DER
std::vector<uint8_t> Ecdsa::sign(std::span<const uint8_t> private_key,
                                 std::span<const uint8_t> digest) {
    if (digest.size() != 32) {
        throw Error(Error::Code::InvalidArgument, "Digest must be 32 bytes");
    }
    if (!EcUtils::is_valid_private_key(private_key)) {
        throw Error(Error::Code::InvalidKeyFormat, "Invalid private key");
    }

    const EC_GROUP* group = EcUtils::group();
    const BIGNUM* n = EcUtils::order();
    auto ctx = EcUtils::new_ctx();
    auto d = EcUtils::bn_from_bytes(private_key);
    auto z = EcUtils::bn_from_bytes(digest);
    if (!BN_nnmod(z.get(), z.get(), n, ctx.get())) {
        throw Error(Error::Code::CryptoFailure);
    }

    auto half_order = EcUtils::new_bn();
    if (!BN_rshift1(half_order.get(), n)) {
        throw Error(Error::Code::CryptoFailure);
    }

    for (uint32_t round = 0;; ++round) {
        auto k = EcUtils::bn_from_bytes(deterministic_nonce(private_key, digest, round));

        auto point = EcUtils::new_point();
        auto r = EcUtils::new_bn();
        if (!EC_POINT_mul(group, point.get(), k.get(), nullptr, nullptr, ctx.get()) ||
            !EC_POINT_get_affine_coordinates(group, point.get(), r.get(), nullptr, ctx.get()) ||
            !BN_nnmod(r.get(), r.get(), n, ctx.get())) {
            throw Error(Error::Code::CryptoFailure);
        }
        if (BN_is_zero(r.get())) {
            continue;
        }

        BnPtr k_inv(BN_mod_inverse(nullptr, k.get(), n, ctx.get()), BN_free);
        auto s = EcUtils::new_bn();
        if (!k_inv ||
            !BN_mod_mul(s.get(), r.get(), d.get(), n, ctx.get()) ||
            !BN_mod_add(s.get(), s.get(), z.get(), n, ctx.get()) ||
            !BN_mod_mul(s.get(), s.get(), k_inv.get(), n, ctx.get())) {
            throw Error(Error::Code::CryptoFailure);
        }
        if (BN_is_zero(s.get())) {
            continue;
        }

        // If S > n/2, replace S with n - S
        if (BN_cmp(s.get(), half_order.get()) > 0) {
            if (!BN_sub(s.get(), n, s.get())) {
                throw Error(Error::Code::CryptoFailure);
            }
        }

        std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(ECDSA_SIG_new(), ECDSA_SIG_free);
        if (!sig || ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
            throw Error(Error::Code::CryptoFailure);
        }
        // The signature owns r and s now
        r.release();
        s.release();

        unsigned char* der = nullptr;
        int der_len = i2d_ECDSA_SIG(sig.get(), &der);
        if (der_len <= 0) {
            throw Error(Error::Code::CryptoFailure, "DER encoding failed");
        }
        std::vector<uint8_t> signature(der, der + der_len);
        OPENSSL_free(der);
        return signature;
    }
}

bool Ecdsa::verify(std::span<const uint8_t> public_key,
                   std::span<const uint8_t> digest,
                   std::span<const uint8_t> der_signature) {
    if (digest.size() != 32 || der_signature.empty() || !EcUtils::is_valid_public_key(public_key)) {
        return false;
    }

    std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)> key(
        EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free);
    if (!key) {
        return false;
    }
    auto point = EcUtils::point_from_bytes(public_key);
    if (!EC_KEY_set_public_key(key.get(), point.get())) {
        return false;
    }

    const unsigned char* cursor = der_signature.data();
    std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(
        d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der_signature.size())), ECDSA_SIG_free);
    if (!sig || cursor != der_signature.data() + der_signature.size()) {
        return false;
    }

    return ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()), sig.get(), key.get()) == 1;
}

} // namespace cosign
