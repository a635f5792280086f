#include "schnorr.hpp"
#include "ec_utils.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <algorithm>

namespace cosign {

namespace {

std::vector<uint8_t> concat(std::initializer_list<std::span<const uint8_t>> parts) {
    std::vector<uint8_t> out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

BnPtr reduce(std::span<const uint8_t> bytes, BN_CTX* ctx) {
    auto bn = EcUtils::bn_from_bytes(bytes);
    if (!BN_nnmod(bn.get(), bn.get(), EcUtils::order(), ctx)) {
        throw Error(Error::Code::CryptoFailure);
    }
    return bn;
}

} // namespace

// BIP340 signing:
// 1. d = priv, negated when P = d*G has odd y
// 2. t = d xor H_aux(a); k = H_nonce(t || P.x || m) mod n
// 3. R = k*G, k negated when R has odd y
// 4. e = H_challenge(R.x || P.x || m) mod n
// 5. sig = R.x || (k + e*d) mod n
Schnorr::Signature Schnorr::sign(std::span<const uint8_t> private_key,
                                 std::span<const uint8_t> message,
                                 std::span<const uint8_t> aux_rand) {
    if (message.size() != 32) {
        throw Error(Error::Code::InvalidArgument, "Message must be 32 bytes");
    }
    if (!EcUtils::is_valid_private_key(private_key)) {
        throw Error(Error::Code::InvalidKeyFormat, "Invalid private key");
    }
    std::array<uint8_t, 32> aux{};
    if (!aux_rand.empty()) {
        if (aux_rand.size() != 32) {
            throw Error(Error::Code::InvalidArgument, "Auxiliary randomness must be 32 bytes");
        }
        std::copy(aux_rand.begin(), aux_rand.end(), aux.begin());
    }

    const EC_GROUP* group = EcUtils::group();
    const BIGNUM* n = EcUtils::order();
    auto ctx = EcUtils::new_ctx();

    auto d = EcUtils::bn_from_bytes(private_key);
    auto p = EcUtils::new_point();
    if (!EC_POINT_mul(group, p.get(), d.get(), nullptr, nullptr, ctx.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    if (!EcUtils::has_even_y(p.get()) && !BN_sub(d.get(), n, d.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    auto d_bytes = EcUtils::bn_to_bytes32(d.get());
    auto px = EcUtils::x_coordinate(p.get());

    auto aux_hash = HashUtils::tagged_hash("BIP0340/aux", aux);
    std::array<uint8_t, 32> t;
    for (size_t i = 0; i < t.size(); ++i) {
        t[i] = d_bytes[i] ^ aux_hash[i];
    }

    auto rand = HashUtils::tagged_hash("BIP0340/nonce", concat({t, px, message}));
    auto k = reduce(rand, ctx.get());
    if (BN_is_zero(k.get())) {
        throw Error(Error::Code::CryptoFailure, "Nonce is zero");
    }

    auto r = EcUtils::new_point();
    if (!EC_POINT_mul(group, r.get(), k.get(), nullptr, nullptr, ctx.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    if (!EcUtils::has_even_y(r.get()) && !BN_sub(k.get(), n, k.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    auto rx = EcUtils::x_coordinate(r.get());

    auto e = reduce(HashUtils::tagged_hash("BIP0340/challenge", concat({rx, px, message})), ctx.get());

    auto s = EcUtils::new_bn();
    if (!BN_mod_mul(s.get(), e.get(), d.get(), n, ctx.get()) ||
        !BN_mod_add(s.get(), s.get(), k.get(), n, ctx.get())) {
        throw Error(Error::Code::CryptoFailure);
    }
    auto s_bytes = EcUtils::bn_to_bytes32(s.get());

    Signature sig;
    std::copy(rx.begin(), rx.end(), sig.begin());
    std::copy(s_bytes.begin(), s_bytes.end(), sig.begin() + 32);
    return sig;
}

// BIP340 verification: R = s*G - e*P must have even y and R.x == r
bool Schnorr::verify(std::span<const uint8_t> x_only_public_key,
                     std::span<const uint8_t> message,
                     std::span<const uint8_t> signature) {
    if (x_only_public_key.size() != 32 || message.size() != 32 || signature.size() != 64) {
        return false;
    }
    auto p = EcUtils::lift_x(x_only_public_key);
    if (!p) {
        return false;
    }

    const EC_GROUP* group = EcUtils::group();
    const BIGNUM* n = EcUtils::order();
    auto ctx = EcUtils::new_ctx();

    auto r = EcUtils::bn_from_bytes(signature.subspan(0, 32));
    auto s = EcUtils::bn_from_bytes(signature.subspan(32, 32));
    auto field_prime = EcUtils::new_bn();
    if (!EC_GROUP_get_curve(group, field_prime.get(), nullptr, nullptr, ctx.get())) {
        return false;
    }
    if (BN_cmp(r.get(), field_prime.get()) >= 0 || BN_cmp(s.get(), n) >= 0) {
        return false;
    }

    auto e = reduce(HashUtils::tagged_hash("BIP0340/challenge",
                                           concat({signature.subspan(0, 32), x_only_public_key, message})),
                    ctx.get());
    auto neg_e = EcUtils::new_bn();
    if (!BN_sub(neg_e.get(), n, e.get())) {
        return false;
    }

    auto big_r = EcUtils::new_point();
    if (!EC_POINT_mul(group, big_r.get(), s.get(), p.get(), neg_e.get(), ctx.get()) ||
        EC_POINT_is_at_infinity(group, big_r.get()) ||
        !EcUtils::has_even_y(big_r.get())) {
        return false;
    }
    auto rx = EcUtils::x_coordinate(big_r.get());
    return std::equal(rx.begin(), rx.end(), signature.begin());
}

Schnorr::XOnlyKey Schnorr::taproot_output_key(std::span<const uint8_t> internal_public_key) {
    auto point = EcUtils::point_from_bytes(internal_public_key);
    auto px = EcUtils::x_coordinate(point.get());
    auto tweak = HashUtils::tagged_hash("TapTweak", px);

    std::vector<uint8_t> even_key{0x02};
    even_key.insert(even_key.end(), px.begin(), px.end());
    auto tweaked = EcUtils::add_tweak_to_public(even_key, tweak);

    XOnlyKey out;
    std::copy(tweaked.begin() + 1, tweaked.end(), out.begin());
    return out;
}

std::array<uint8_t, 32> Schnorr::taproot_tweak_private_key(std::span<const uint8_t> private_key) {
    auto pub = EcUtils::public_key_from_private(private_key);
    std::array<uint8_t, 32> d;
    std::copy(private_key.begin(), private_key.end(), d.begin());
    if (pub[0] == 0x03) {
        d = EcUtils::negate_private(d);
    }
    auto tweak = HashUtils::tagged_hash("TapTweak", std::span<const uint8_t>(pub).subspan(1));
    return EcUtils::add_tweak_to_private(d, tweak);
}

} // namespace cosign
