#pragma once

#include <vector>
#include <span>
#include <cstdint>
#include <array>
#include <string>
#include "error.hpp"

namespace cosign {

// Extended key structure used in BIP32 hierarchical deterministic wallets
struct ExKey {
    std::array<uint8_t, 4> version;      // Version bytes indicating key type (mainnet/testnet, private/public)
    std::array<uint8_t, 1> depth;        // Depth in the derivation path (0 for master keys)
    std::array<uint8_t, 4> finger_print; // First 4 bytes of the parent key's identifier
    std::array<uint8_t, 4> child_number; // Index of the key in relation to its parent
    std::array<uint8_t, 32> chaincode;   // Extra entropy used in child key derivation
    std::array<uint8_t, 33> key;         // 0x00 || private key, or a compressed public key

    bool is_private() const { return key[0] == 0x00; }

    // The 32-byte secret; only meaningful when is_private()
    std::span<const uint8_t> private_key() const { return std::span<const uint8_t>(key).subspan(1); }

    // Compressed public key, derived on demand for private keys
    std::vector<uint8_t> public_key() const;
};

// Utility class for BIP32 hierarchical deterministic wallet operations
class Bip32Util {
public:
    static constexpr uint32_t HARDENED = 0x80000000;

    // Derives a public key from a private key using elliptic curve multiplication
    static std::vector<uint8_t> derive_public_key_from_private(std::span<const uint8_t> key);

    // Derives a child private key from a parent private key using BIP32 derivation
    static ExKey derive_priv_child(const ExKey& parent, uint32_t child_num);

    // Derives a child public key from a parent public key (non-hardened only)
    static ExKey derive_pub_child(const ExKey& parent, uint32_t child_num);

    // Derives the child of either kind of key
    static ExKey derive_child(const ExKey& parent, uint32_t child_num);

    // Derives a key at a specific BIP32 derivation path from a parent key
    static ExKey get_child_key_at_path(const ExKey& key, const std::string& derivation_path);

    // Drops the private half, switching the version bytes to the public variant
    static ExKey neuter(const ExKey& key);

    // Parses "m/0/1'", "0/1" or "m" into child indices
    static std::vector<uint32_t> parse_path(const std::string& derivation_path);

private:
    Bip32Util() = delete;
};

} // namespace cosign
