#include "address.hpp"
#include "base58.hpp"
#include "bech32.hpp"
#include "cashaddr.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "script.hpp"

namespace cosign {

namespace {

constexpr Network NETWORKS[] = {Network::Livenet, Network::Testnet, Network::Regtest};

const ChainParams& utxo_params(Chain chain, Network network) {
    const auto& params = chain_params(chain, network);
    if (!params.utxo_model) {
        throw Error(Error::Code::UnsupportedChain, "Chain has no UTXO address format");
    }
    return params;
}

} // namespace

std::string AddressCodec::encode(ScriptType type, std::span<const uint8_t> hash, Chain chain, Network network) {
    const auto& params = utxo_params(chain, network);

    switch (type) {
        case ScriptType::P2PKH:
        case ScriptType::P2SH: {
            if (hash.size() != PUBKEY_HASH_SIZE) {
                throw Error(Error::Code::InvalidArgument, "Address hash must be 20 bytes");
            }
            if (!params.cashaddr_prefix.empty()) {
                auto kind = type == ScriptType::P2PKH ? CashAddr::Type::PubKeyHash : CashAddr::Type::ScriptHash;
                return CashAddr::encode(params.cashaddr_prefix, kind, hash);
            }
            // Base58Check payload: version byte followed by the 20-byte hash
            std::vector<uint8_t> payload;
            payload.push_back(type == ScriptType::P2PKH ? params.p2pkh_version : params.p2sh_version);
            payload.insert(payload.end(), hash.begin(), hash.end());
            return Base58::encode_check(payload);
        }
        case ScriptType::P2WPKH:
        case ScriptType::P2WSH:
        case ScriptType::P2TR: {
            if (!params.supports_segwit) {
                throw Error(Error::Code::ScriptType, "Witness addresses are not supported on " + to_string(chain));
            }
            uint8_t version = type == ScriptType::P2TR ? WITNESS_VERSION_1 : WITNESS_VERSION_0;
            return Bech32::encode_segwit(params.bech32_hrp, version, hash);
        }
    }
    throw Error(Error::Code::ScriptType);
}

std::optional<Address> AddressCodec::try_parse(const std::string& text, const ChainParams& params) {
    // Legacy Base58Check
    try {
        auto payload = Base58::decode_check(text);
        if (payload.size() == PUBKEY_HASH_SIZE + 1) {
            std::vector<uint8_t> hash(payload.begin() + 1, payload.end());
            if (payload[0] == params.p2pkh_version) {
                return Address{text, ScriptType::P2PKH, std::move(hash)};
            }
            if (payload[0] == params.p2sh_version) {
                return Address{text, ScriptType::P2SH, std::move(hash)};
            }
        }
    } catch (const Error&) {
        // not base58, try the other encodings
    }

    if (params.supports_segwit && !params.bech32_hrp.empty()) {
        if (auto program = Bech32::decode_segwit(text, params.bech32_hrp)) {
            if (program->version == 0 && program->program.size() == PUBKEY_HASH_SIZE) {
                return Address{text, ScriptType::P2WPKH, std::move(program->program)};
            }
            if (program->version == 0 && program->program.size() == WITNESS_PROGRAM_SIZE) {
                return Address{text, ScriptType::P2WSH, std::move(program->program)};
            }
            if (program->version == 1 && program->program.size() == WITNESS_PROGRAM_SIZE) {
                return Address{text, ScriptType::P2TR, std::move(program->program)};
            }
            return std::nullopt;
        }
    }

    if (!params.cashaddr_prefix.empty()) {
        if (auto content = CashAddr::decode(text, params.cashaddr_prefix)) {
            if (content->hash.size() != PUBKEY_HASH_SIZE) {
                return std::nullopt;
            }
            auto type = content->type == CashAddr::Type::PubKeyHash ? ScriptType::P2PKH : ScriptType::P2SH;
            return Address{text, type, std::move(content->hash)};
        }
    }

    return std::nullopt;
}

Address AddressCodec::parse(const std::string& text, Chain chain, Network network) {
    if (auto address = try_parse(text, utxo_params(chain, network))) {
        return *address;
    }
    for (Network other : NETWORKS) {
        if (other != network && try_parse(text, chain_params(chain, other))) {
            throw Error(Error::Code::IncorrectAddressNetwork);
        }
    }
    throw Error(Error::Code::InvalidAddress, "Invalid address: " + text);
}

std::vector<uint8_t> AddressCodec::script_for(const Address& address) {
    switch (address.type) {
        case ScriptType::P2PKH: return Script::p2pkh(address.hash);
        case ScriptType::P2SH: return Script::p2sh(address.hash);
        case ScriptType::P2WPKH: return Script::p2wpkh(address.hash);
        case ScriptType::P2WSH: return Script::witness_program(WITNESS_VERSION_0, address.hash);
        case ScriptType::P2TR: return Script::p2tr(address.hash);
    }
    throw Error(Error::Code::ScriptType);
}

std::vector<uint8_t> AddressCodec::output_script(const std::string& text, Chain chain, Network network) {
    return script_for(parse(text, chain, network));
}

bool AddressCodec::same_destination(const std::string& a, const std::string& b, Chain chain, Network network) {
    try {
        return output_script(a, chain, network) == output_script(b, chain, network);
    } catch (const Error&) {
        return false;
    }
}

} // namespace cosign
