#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "chain.hpp"

namespace cosign {

// Address owned by a wallet, as stored for change and escrow outputs
struct AddressRecord {
    std::string address;
    std::string path;                     // "m/1/4"
    std::vector<std::string> public_keys; // Hex, in ring order
    ScriptType type = ScriptType::P2PKH;
};

// Derives wallet addresses from the copayers' extended public keys.
//
// Every ring member's key is derived along the same non-hardened path; the
// resulting keys are combined according to the script type:
// - P2SH: sorted m-of-n multisig redeem script (or an escrow script when
//   escrow input paths are given)
// - P2WSH: sorted m-of-n multisig witness script
// - P2PKH, P2WPKH, P2TR: the first member's key
class AddressDeriver {
public:
    // extern_public_key (hex) replaces ring derivation for wallets whose
    // single key is derived outside the service
    static AddressRecord derive(ScriptType type,
                                const std::vector<std::string>& xpubs,
                                const std::string& path,
                                uint32_t m,
                                Chain chain,
                                Network network,
                                std::span<const std::string> escrow_input_paths = {},
                                const std::string& extern_public_key = "");

    // Compressed child public key of an extended public key text
    static std::vector<uint8_t> derive_public_key(const std::string& xpub, const std::string& path);

    // Address for a set of already derived keys
    static std::string address_for_keys(ScriptType type,
                                        const std::vector<std::vector<uint8_t>>& keys,
                                        uint32_t m,
                                        Chain chain,
                                        Network network);

private:
    AddressDeriver() = delete;
};

} // namespace cosign
