#include "chain.hpp"
#include "error.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace cosign {

namespace {

constexpr uint64_t BTC_MAX_TX_FEE = 5'000'000;             // 0.05 BTC
constexpr uint64_t DOGE_MAX_TX_FEE = 400ULL * 100'000'000; // 400 DOGE
constexpr uint64_t DOGE_DUST = 1'000'000;                  // 0.01 DOGE
constexpr uint64_t XRP_MAX_TX_FEE = 1'000'000;             // drops
constexpr uint64_t EVM_MAX_TX_FEE = 1'000'000'000'000'000'000ULL;

constexpr ChainParams utxo(Chain chain, Network network, bool segwit, uint8_t p2pkh, uint8_t p2sh,
                           std::string_view hrp, std::string_view cashaddr, uint64_t dust,
                           uint64_t max_fee, uint32_t fork_id) {
    return ChainParams{chain, network, true, true, segwit, p2pkh, p2sh, hrp, cashaddr, dust, max_fee, fork_id};
}

constexpr ChainParams account(Chain chain, Network network, bool multisig, uint64_t max_fee) {
    return ChainParams{chain, network, false, multisig, false, 0, 0, "", "", 0, max_fee, 0};
}

constexpr std::array PARAMS = {
    utxo(Chain::Btc, Network::Livenet, true, 0x00, 0x05, "bc", "", 546, BTC_MAX_TX_FEE, 0),
    utxo(Chain::Btc, Network::Testnet, true, 0x6f, 0xc4, "tb", "", 546, BTC_MAX_TX_FEE, 0),
    utxo(Chain::Btc, Network::Regtest, true, 0x6f, 0xc4, "bcrt", "", 546, BTC_MAX_TX_FEE, 0),
    utxo(Chain::Bch, Network::Livenet, false, 0x00, 0x05, "", "bitcoincash", 546, BTC_MAX_TX_FEE, 0x40),
    utxo(Chain::Bch, Network::Testnet, false, 0x6f, 0xc4, "", "bchtest", 546, BTC_MAX_TX_FEE, 0x40),
    utxo(Chain::Bch, Network::Regtest, false, 0x6f, 0xc4, "", "bchreg", 546, BTC_MAX_TX_FEE, 0x40),
    utxo(Chain::Ltc, Network::Livenet, true, 0x30, 0x32, "ltc", "", 546, BTC_MAX_TX_FEE, 0),
    utxo(Chain::Ltc, Network::Testnet, true, 0x6f, 0x3a, "tltc", "", 546, BTC_MAX_TX_FEE, 0),
    utxo(Chain::Ltc, Network::Regtest, true, 0x6f, 0x3a, "rltc", "", 546, BTC_MAX_TX_FEE, 0),
    utxo(Chain::Doge, Network::Livenet, false, 0x1e, 0x16, "", "", DOGE_DUST, DOGE_MAX_TX_FEE, 0),
    utxo(Chain::Doge, Network::Testnet, false, 0x71, 0xc4, "", "", DOGE_DUST, DOGE_MAX_TX_FEE, 0),
    utxo(Chain::Doge, Network::Regtest, false, 0x6f, 0xc4, "", "", DOGE_DUST, DOGE_MAX_TX_FEE, 0),
    account(Chain::Eth, Network::Livenet, true, EVM_MAX_TX_FEE),
    account(Chain::Eth, Network::Testnet, true, EVM_MAX_TX_FEE),
    account(Chain::Eth, Network::Regtest, true, EVM_MAX_TX_FEE),
    account(Chain::Matic, Network::Livenet, true, EVM_MAX_TX_FEE),
    account(Chain::Matic, Network::Testnet, true, EVM_MAX_TX_FEE),
    account(Chain::Matic, Network::Regtest, true, EVM_MAX_TX_FEE),
    account(Chain::Arb, Network::Livenet, false, EVM_MAX_TX_FEE),
    account(Chain::Arb, Network::Testnet, false, EVM_MAX_TX_FEE),
    account(Chain::Arb, Network::Regtest, false, EVM_MAX_TX_FEE),
    account(Chain::Base, Network::Livenet, false, EVM_MAX_TX_FEE),
    account(Chain::Base, Network::Testnet, false, EVM_MAX_TX_FEE),
    account(Chain::Base, Network::Regtest, false, EVM_MAX_TX_FEE),
    account(Chain::Op, Network::Livenet, false, EVM_MAX_TX_FEE),
    account(Chain::Op, Network::Testnet, false, EVM_MAX_TX_FEE),
    account(Chain::Op, Network::Regtest, false, EVM_MAX_TX_FEE),
    account(Chain::Xrp, Network::Livenet, false, XRP_MAX_TX_FEE),
    account(Chain::Xrp, Network::Testnet, false, XRP_MAX_TX_FEE),
    account(Chain::Xrp, Network::Regtest, false, XRP_MAX_TX_FEE),
    account(Chain::Sol, Network::Livenet, false, XRP_MAX_TX_FEE),
    account(Chain::Sol, Network::Testnet, false, XRP_MAX_TX_FEE),
    account(Chain::Sol, Network::Regtest, false, XRP_MAX_TX_FEE),
};

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const ChainParams& chain_params(Chain chain, Network network) {
    for (const auto& params : PARAMS) {
        if (params.chain == chain && params.network == network) {
            return params;
        }
    }
    throw Error(Error::Code::InvalidNetwork);
}

bool is_utxo_chain(Chain chain) {
    switch (chain) {
        case Chain::Btc:
        case Chain::Bch:
        case Chain::Ltc:
        case Chain::Doge:
            return true;
        default:
            return false;
    }
}

bool is_evm_chain(Chain chain) {
    switch (chain) {
        case Chain::Eth:
        case Chain::Matic:
        case Chain::Arb:
        case Chain::Base:
        case Chain::Op:
            return true;
        default:
            return false;
    }
}

std::string to_string(Chain chain) {
    switch (chain) {
        case Chain::Btc: return "btc";
        case Chain::Bch: return "bch";
        case Chain::Ltc: return "ltc";
        case Chain::Doge: return "doge";
        case Chain::Eth: return "eth";
        case Chain::Matic: return "matic";
        case Chain::Arb: return "arb";
        case Chain::Base: return "base";
        case Chain::Op: return "op";
        case Chain::Xrp: return "xrp";
        case Chain::Sol: return "sol";
    }
    return "";
}

std::string to_string(Network network) {
    switch (network) {
        case Network::Livenet: return "livenet";
        case Network::Testnet: return "testnet";
        case Network::Regtest: return "regtest";
    }
    return "";
}

std::string to_string(ScriptType type) {
    switch (type) {
        case ScriptType::P2PKH: return "P2PKH";
        case ScriptType::P2SH: return "P2SH";
        case ScriptType::P2WPKH: return "P2WPKH";
        case ScriptType::P2WSH: return "P2WSH";
        case ScriptType::P2TR: return "P2TR";
    }
    return "";
}

std::string to_string(SigningMethod method) {
    return method == SigningMethod::Schnorr ? "schnorr" : "ecdsa";
}

std::optional<Chain> chain_from_string(std::string_view name) {
    auto key = lower(name);
    for (Chain chain : {Chain::Btc, Chain::Bch, Chain::Ltc, Chain::Doge, Chain::Eth, Chain::Matic,
                        Chain::Arb, Chain::Base, Chain::Op, Chain::Xrp, Chain::Sol}) {
        if (to_string(chain) == key) {
            return chain;
        }
    }
    return std::nullopt;
}

std::optional<Network> network_from_string(std::string_view name) {
    auto key = lower(name);
    if (key == "livenet" || key == "mainnet") return Network::Livenet;
    if (key == "testnet") return Network::Testnet;
    if (key == "regtest") return Network::Regtest;
    return std::nullopt;
}

std::optional<ScriptType> script_type_from_string(std::string_view name) {
    for (ScriptType type : {ScriptType::P2PKH, ScriptType::P2SH, ScriptType::P2WPKH,
                            ScriptType::P2WSH, ScriptType::P2TR}) {
        if (to_string(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<SigningMethod> signing_method_from_string(std::string_view name) {
    if (name == "ecdsa" || name.empty()) return SigningMethod::Ecdsa;
    if (name == "schnorr") return SigningMethod::Schnorr;
    return std::nullopt;
}

} // namespace cosign
