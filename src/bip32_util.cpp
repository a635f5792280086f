#include "bip32_util.hpp"
#include "ec_utils.hpp"
#include "hash_utils.hpp"
#include <sstream>
#include <algorithm>

namespace cosign {

namespace {

constexpr std::array<uint8_t, 4> XPRV_VERSION = {0x04, 0x88, 0xAD, 0xE4};
constexpr std::array<uint8_t, 4> XPUB_VERSION = {0x04, 0x88, 0xB2, 0x1E};
constexpr std::array<uint8_t, 4> TPRV_VERSION = {0x04, 0x35, 0x83, 0x94};
constexpr std::array<uint8_t, 4> TPUB_VERSION = {0x04, 0x35, 0x87, 0xCF};

std::array<uint8_t, 4> to_be32(uint32_t value) {
    return {
        static_cast<uint8_t>((value >> 24) & 0xff),
        static_cast<uint8_t>((value >> 16) & 0xff),
        static_cast<uint8_t>((value >> 8) & 0xff),
        static_cast<uint8_t>(value & 0xff)
    };
}

// Child metadata common to both derivation flavours: depth, parent fingerprint,
// child number and the right half of the HMAC as the new chain code.
ExKey make_child(const ExKey& parent, uint32_t child_num, const std::array<uint8_t, 64>& hmac_result) {
    if (parent.depth[0] == 0xff) {
        throw Error(Error::Code::DerivationError, "Maximum derivation depth reached");
    }
    ExKey child = parent;
    child.depth[0] += 1;
    auto fingerprint = HashUtils::hash160(parent.public_key());
    std::copy_n(fingerprint.begin(), 4, child.finger_print.begin());
    child.child_number = to_be32(child_num);
    std::copy_n(hmac_result.begin() + 32, 32, child.chaincode.begin());
    return child;
}

} // namespace

std::vector<uint8_t> ExKey::public_key() const {
    if (is_private()) {
        return Bip32Util::derive_public_key_from_private(private_key());
    }
    return std::vector<uint8_t>(key.begin(), key.end());
}

// Derives a public key from a private key using elliptic curve multiplication
// This implements the secp256k1 curve operation: public_key = private_key * G
// and serializes the point in compressed format (33 bytes).
std::vector<uint8_t> Bip32Util::derive_public_key_from_private(std::span<const uint8_t> key) {
    return EcUtils::public_key_from_private(key);
}

// Derives a child private key from a parent private key according to BIP32
// https://github.com/bitcoin/bips/blob/master/bip-0032.mediawiki
//
// The derivation process:
// 1. Create a seed data from parent key and child index
// 2. Calculate HMAC-SHA512 of the seed data using the parent chain code as key
// 3. Split the HMAC result into two 32-byte parts: left and right
// 4. The left part is added to the parent private key (mod n) to get the child private key
// 5. The right part becomes the child chain code
//
// There are two types of derivation:
// - Normal derivation (child_num < 0x80000000): uses parent public key in the seed
// - Hardened derivation (child_num >= 0x80000000): uses parent private key in the seed
ExKey Bip32Util::derive_priv_child(const ExKey& parent, uint32_t child_num) {
    if (!parent.is_private()) {
        throw Error(Error::Code::DerivationError, "Private derivation requires a private key");
    }

    std::vector<uint8_t> data;
    data.reserve(37);

    if (child_num >= HARDENED) {
        // Hardened derivation: data = 0x00 || parent private key
        data.insert(data.end(), parent.key.begin(), parent.key.end());
    } else {
        // Normal derivation: data = parent public key
        auto pubkey = derive_public_key_from_private(parent.private_key());
        data.insert(data.end(), pubkey.begin(), pubkey.end());
    }

    auto child_num_be = to_be32(child_num);
    data.insert(data.end(), child_num_be.begin(), child_num_be.end());

    auto hmac_result = HashUtils::hmac_sha512(parent.chaincode, data);

    // child_key = (parent_key + hmac_left) mod n
    // add_tweak_to_private rejects a left half >= n or a zero result, the two
    // cases BIP32 declares invalid
    ExKey child = make_child(parent, child_num, hmac_result);
    auto child_key = EcUtils::add_tweak_to_private(parent.private_key(),
                                                   std::span<const uint8_t>(hmac_result.data(), 32));
    child.key[0] = 0x00;
    std::copy(child_key.begin(), child_key.end(), child.key.begin() + 1);
    return child;
}

// Derives a child public key from a parent public key (CKDpub):
// child_pub = point(hmac_left) + parent_pub
// Only possible for non-hardened indices, which is what lets the service
// derive every copayer's addresses from extended public keys alone.
ExKey Bip32Util::derive_pub_child(const ExKey& parent, uint32_t child_num) {
    if (child_num >= HARDENED) {
        throw Error(Error::Code::DerivationError, "Cannot derive a hardened child from a public key");
    }

    auto parent_pub = parent.public_key();
    std::vector<uint8_t> data(parent_pub.begin(), parent_pub.end());
    auto child_num_be = to_be32(child_num);
    data.insert(data.end(), child_num_be.begin(), child_num_be.end());

    auto hmac_result = HashUtils::hmac_sha512(parent.chaincode, data);

    ExKey child = make_child(neuter(parent), child_num, hmac_result);
    auto child_pub = EcUtils::add_tweak_to_public(parent_pub,
                                                  std::span<const uint8_t>(hmac_result.data(), 32));
    std::copy(child_pub.begin(), child_pub.end(), child.key.begin());
    return child;
}

ExKey Bip32Util::derive_child(const ExKey& parent, uint32_t child_num) {
    return parent.is_private() ? derive_priv_child(parent, child_num)
                               : derive_pub_child(parent, child_num);
}

// Parses a derivation path:
// - "m" represents the key itself
// - "/" separates path components
// - Numbers with ' or h suffix represent hardened derivation (index + 0x80000000)
std::vector<uint32_t> Bip32Util::parse_path(const std::string& derivation_path) {
    std::string path = derivation_path;
    if (path == "m" || path == "M" || path.empty()) {
        return {};
    }
    if (path.starts_with("m/") || path.starts_with("M/")) {
        path = path.substr(2);
    }

    std::vector<uint32_t> indices;
    std::istringstream path_stream(path);
    std::string index_str;

    while (std::getline(path_stream, index_str, '/')) {
        bool hardened = index_str.ends_with('\'') || index_str.ends_with('h');
        if (hardened) {
            index_str.pop_back();
        }
        if (index_str.empty() ||
            !std::all_of(index_str.begin(), index_str.end(), [](char c) { return c >= '0' && c <= '9'; }) ||
            index_str.size() > 10) {
            throw Error(Error::Code::DerivationError, "Invalid derivation path: " + derivation_path);
        }

        uint64_t index = std::stoull(index_str);
        if (index >= HARDENED) {
            throw Error(Error::Code::DerivationError, "Derivation index out of range: " + derivation_path);
        }
        indices.push_back(static_cast<uint32_t>(hardened ? index + HARDENED : index));
    }

    return indices;
}

// Derives a child key at a specific derivation path from a parent key.
// Examples:
// - "m/0/1" derives the 2nd child of the 1st child of the key
// - "m/2" is the request-key authorization child of a copayer key
ExKey Bip32Util::get_child_key_at_path(const ExKey& key, const std::string& derivation_path) {
    ExKey current_key = key;
    for (uint32_t index : parse_path(derivation_path)) {
        current_key = derive_child(current_key, index);
    }
    return current_key;
}

ExKey Bip32Util::neuter(const ExKey& key) {
    if (!key.is_private()) {
        return key;
    }
    ExKey pub = key;
    if (key.version == XPRV_VERSION) {
        pub.version = XPUB_VERSION;
    } else if (key.version == TPRV_VERSION) {
        pub.version = TPUB_VERSION;
    } else {
        throw Error(Error::Code::InvalidKeyFormat, "Unknown extended private key version");
    }
    auto pubkey = key.public_key();
    std::copy(pubkey.begin(), pubkey.end(), pub.key.begin());
    return pub;
}

} // namespace cosign
