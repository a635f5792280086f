#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cosign {

enum class Chain {
    Btc,
    Bch,
    Ltc,
    Doge,
    Eth,
    Matic,
    Arb,
    Base,
    Op,
    Xrp,
    Sol
};

enum class Network {
    Livenet,
    Testnet,
    Regtest
};

enum class ScriptType {
    P2PKH,
    P2SH,
    P2WPKH,
    P2WSH,
    P2TR
};

enum class SigningMethod {
    Ecdsa,
    Schnorr
};

// Static per chain and network parameters. Account-model chains leave the
// address fields empty; their encodings live behind AccountTxEncoder.
struct ChainParams {
    Chain chain;
    Network network;
    bool utxo_model;
    bool supports_multisig;
    bool supports_segwit;
    uint8_t p2pkh_version;
    uint8_t p2sh_version;
    std::string_view bech32_hrp;
    std::string_view cashaddr_prefix;
    uint64_t dust_amount;
    uint64_t max_tx_fee;
    uint32_t sighash_fork_id;
};

const ChainParams& chain_params(Chain chain, Network network);

bool is_utxo_chain(Chain chain);

bool is_evm_chain(Chain chain);

// Wire names ("btc", "livenet", "P2SH", ...). Parsing returns nothing for
// unknown names; everything inside the library uses the enums.
std::string to_string(Chain chain);
std::string to_string(Network network);
std::string to_string(ScriptType type);
std::string to_string(SigningMethod method);

std::optional<Chain> chain_from_string(std::string_view name);
std::optional<Network> network_from_string(std::string_view name);
std::optional<ScriptType> script_type_from_string(std::string_view name);
std::optional<SigningMethod> signing_method_from_string(std::string_view name);

} // namespace cosign
