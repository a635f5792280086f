#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace cosign {

// Spendable output as reported by the wallet's indexer
struct Utxo {
    std::string txid;                     // Display (big-endian) hex
    uint32_t vout = 0;                    // Output index in transaction
    std::string address;                  // Owning wallet address
    std::string path;                     // Derivation path of the address, "m/0/3"
    uint64_t satoshis = 0;                // Amount in minor units
    uint32_t confirmations = 0;
    bool locked = false;                  // Reserved by an in-flight proposal
    std::vector<std::string> public_keys; // Hex keys of a multisig address
    std::string script_pubkey;            // Locking script hex, optional

    // "txid:vout", the key used for exclusion lists
    std::string outpoint() const { return txid + ":" + std::to_string(vout); }

    bool operator==(const Utxo& other) const { return txid == other.txid && vout == other.vout; }
};

// Wire keys follow the service records (camelCase)
inline void to_json(nlohmann::json& j, const Utxo& utxo) {
    j = nlohmann::json{
        {"txid", utxo.txid},
        {"vout", utxo.vout},
        {"address", utxo.address},
        {"path", utxo.path},
        {"satoshis", utxo.satoshis},
        {"confirmations", utxo.confirmations},
        {"locked", utxo.locked}
    };
    if (!utxo.public_keys.empty()) {
        j["publicKeys"] = utxo.public_keys;
    }
    if (!utxo.script_pubkey.empty()) {
        j["scriptPubKey"] = utxo.script_pubkey;
    }
}

inline void from_json(const nlohmann::json& j, Utxo& utxo) {
    j.at("txid").get_to(utxo.txid);
    j.at("vout").get_to(utxo.vout);
    j.at("satoshis").get_to(utxo.satoshis);
    utxo.address = j.value("address", "");
    utxo.path = j.value("path", "");
    utxo.confirmations = j.value("confirmations", 0u);
    utxo.locked = j.value("locked", false);
    utxo.public_keys = j.value("publicKeys", std::vector<std::string>{});
    utxo.script_pubkey = j.value("scriptPubKey", "");
}

} // namespace cosign
