#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "chain.hpp"

namespace cosign {

// A parsed UTXO-chain address. hash is the 20-byte key or script hash for
// P2PKH, P2SH and P2WPKH, and the 32-byte witness program for P2WSH and P2TR.
struct Address {
    std::string text;
    ScriptType type;
    std::vector<uint8_t> hash;
};

// Text encodings of UTXO-chain addresses: Base58Check for legacy types,
// bech32/bech32m for witness programs and CashAddr for Bitcoin Cash.
class AddressCodec {
public:
    // Encodes in the chain's preferred format. BCH addresses come out as
    // prefixed CashAddr.
    static std::string encode(ScriptType type, std::span<const uint8_t> hash, Chain chain, Network network);

    // Throws Error(IncorrectAddressNetwork) for an address that is valid on
    // another network of the same chain and Error(InvalidAddress) otherwise.
    // BCH accepts CashAddr with or without prefix and legacy Base58.
    static Address parse(const std::string& text, Chain chain, Network network);

    static std::vector<uint8_t> script_for(const Address& address);

    // Locking script paying to the address text
    static std::vector<uint8_t> output_script(const std::string& text, Chain chain, Network network);

    // True when both texts encode the same locking script. Never throws.
    static bool same_destination(const std::string& a, const std::string& b, Chain chain, Network network);

private:
    AddressCodec() = delete;

    static std::optional<Address> try_parse(const std::string& text, const ChainParams& params);
};

} // namespace cosign
