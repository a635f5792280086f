#include "address_deriver.hpp"
#include "address.hpp"
#include "bip32_util.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "key_deserializer.hpp"
#include "schnorr.hpp"
#include "script.hpp"

namespace cosign {

std::vector<uint8_t> AddressDeriver::derive_public_key(const std::string& xpub, const std::string& path) {
    auto parent = KeyDeserializer::from_base58(xpub);
    return Bip32Util::get_child_key_at_path(parent, path).public_key();
}

std::string AddressDeriver::address_for_keys(ScriptType type,
                                             const std::vector<std::vector<uint8_t>>& keys,
                                             uint32_t m,
                                             Chain chain,
                                             Network network) {
    if (keys.empty()) {
        throw Error(Error::Code::InvalidWalletParams, "No public keys to derive an address from");
    }

    switch (type) {
        case ScriptType::P2SH: {
            auto redeem_script = Script::multisig(m, keys);
            auto hash = HashUtils::hash160(redeem_script);
            return AddressCodec::encode(type, hash, chain, network);
        }
        case ScriptType::P2WSH: {
            // The witness program is the single SHA256 of the witness script
            auto witness_script = Script::multisig(m, keys);
            auto hash = HashUtils::sha256(witness_script);
            return AddressCodec::encode(type, hash, chain, network);
        }
        case ScriptType::P2PKH:
        case ScriptType::P2WPKH: {
            auto hash = HashUtils::hash160(keys.front());
            return AddressCodec::encode(type, hash, chain, network);
        }
        case ScriptType::P2TR: {
            auto output_key = Schnorr::taproot_output_key(keys.front());
            return AddressCodec::encode(type, output_key, chain, network);
        }
    }
    throw Error(Error::Code::ScriptType);
}

AddressRecord AddressDeriver::derive(ScriptType type,
                                     const std::vector<std::string>& xpubs,
                                     const std::string& path,
                                     uint32_t m,
                                     Chain chain,
                                     Network network,
                                     std::span<const std::string> escrow_input_paths,
                                     const std::string& extern_public_key) {
    if (!is_utxo_chain(chain)) {
        throw Error(Error::Code::UnsupportedChain, "Address derivation for " + to_string(chain) +
                                                   " is done by its transaction encoder");
    }

    AddressRecord record;
    record.path = path;
    record.type = type;

    if (!extern_public_key.empty()) {
        auto key = HexUtils::decode(extern_public_key);
        record.address = address_for_keys(type, {key}, 1, chain, network);
        record.public_keys = {extern_public_key};
        return record;
    }

    if (xpubs.empty()) {
        throw Error(Error::Code::InvalidWalletParams, "Empty public key ring");
    }

    std::vector<std::vector<uint8_t>> keys;
    keys.reserve(xpubs.size());
    for (const auto& xpub : xpubs) {
        keys.push_back(derive_public_key(xpub, path));
    }

    if (type == ScriptType::P2SH && !escrow_input_paths.empty()) {
        // Escrow keys come from the first ring member at each input's path
        std::vector<std::vector<uint8_t>> input_keys;
        for (const auto& input_path : escrow_input_paths) {
            input_keys.push_back(derive_public_key(xpubs.front(), input_path));
        }
        auto escrow_script = Script::escrow(keys.front(), input_keys);
        auto hash = HashUtils::hash160(escrow_script);
        record.address = AddressCodec::encode(ScriptType::P2SH, hash, chain, network);

        record.public_keys.push_back(HexUtils::encode(keys.front()));
        for (const auto& key : input_keys) {
            record.public_keys.push_back(HexUtils::encode(key));
        }
        return record;
    }

    record.address = address_for_keys(type, keys, m, chain, network);
    for (const auto& key : keys) {
        record.public_keys.push_back(HexUtils::encode(key));
    }
    return record;
}

} // namespace cosign
