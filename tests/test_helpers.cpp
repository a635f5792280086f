#include "test_helpers.hpp"
#include "address.hpp"
#include "address_deriver.hpp"
#include "ec_utils.hpp"
#include "ecdsa.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "key_deserializer.hpp"
#include "message_signer.hpp"
#include "utxo_chain_adapter.hpp"

#include <algorithm>

namespace cosign::test {

std::optional<Error::Code> error_code_of(const std::function<void()>& fn) {
    try {
        fn();
    }
    catch (const Error& e) {
        return e.code();
    }
    return std::nullopt;
}

ExKey master_key(uint8_t seed_byte) {
    std::vector<uint8_t> seed(32, seed_byte);
    auto i = HashUtils::hmac_sha512(HashUtils::as_bytes("Bitcoin seed"), seed);

    ExKey key{};
    key.version = {0x04, 0x88, 0xAD, 0xE4};
    std::copy(i.begin() + 32, i.end(), key.chaincode.begin());
    key.key[0] = 0x00;
    std::copy(i.begin(), i.begin() + 32, key.key.begin() + 1);
    return key;
}

std::array<uint8_t, 32> fixed_private_key(uint8_t fill) {
    std::array<uint8_t, 32> key;
    key.fill(fill);
    return key;
}

std::string fixed_txid(uint8_t fill) {
    std::vector<uint8_t> bytes(32, fill);
    return HexUtils::encode(bytes);
}

std::string foreign_address(uint8_t fill, Chain chain, Network network) {
    std::vector<uint8_t> hash(20, fill);
    return AddressCodec::encode(ScriptType::P2PKH, hash, chain, network);
}

std::array<uint8_t, 32> wallet_private_key() {
    return fixed_private_key(0x11);
}

TestCopayer make_copayer(Chain chain, uint8_t seed_byte, const std::string& name) {
    TestCopayer result;
    auto master = master_key(seed_byte);
    result.xprv = KeyDeserializer::to_base58(master);
    result.xpub = KeyDeserializer::to_base58(Bip32Util::neuter(master));
    result.request_priv = fixed_private_key(static_cast<uint8_t>(seed_byte + 0x40));
    result.request_pub = HexUtils::encode(EcUtils::public_key_from_private(result.request_priv));

    auto wallet_key = wallet_private_key();
    auto signature = MessageSigner::sign_message(
        MessageSigner::copayer_hash(name, result.xpub, result.request_pub), wallet_key);
    result.copayer = Copayer::create(chain, name, result.xpub, result.request_pub, signature);
    return result;
}

std::vector<TestCopayer> make_copayers(Chain chain, size_t n) {
    std::vector<TestCopayer> copayers;
    for (size_t i = 0; i < n; ++i) {
        copayers.push_back(make_copayer(chain, static_cast<uint8_t>(0x21 + i), "copayer " + std::to_string(i)));
    }
    return copayers;
}

std::vector<std::string> xpubs_of(const std::vector<TestCopayer>& copayers) {
    std::vector<std::string> xpubs;
    for (const auto& copayer : copayers) {
        xpubs.push_back(copayer.xpub);
    }
    return xpubs;
}

nlohmann::json credentials_json(const std::vector<TestCopayer>& copayers,
                                size_t self,
                                uint32_t m,
                                ScriptType type,
                                Chain chain,
                                Network network) {
    nlohmann::json ring = nlohmann::json::array();
    for (const auto& copayer : copayers) {
        ring.push_back({{"xPubKey", copayer.xpub}, {"requestPubKey", copayer.request_pub}});
    }
    auto wallet_key = wallet_private_key();
    return nlohmann::json{
        {"chain", to_string(chain)},
        {"network", to_string(network)},
        {"m", m},
        {"n", copayers.size()},
        {"addressType", to_string(type)},
        {"publicKeyRing", ring},
        {"xPubKey", copayers.at(self).xpub},
        {"walletPrivKey", HexUtils::encode(wallet_key)}
    };
}

Utxo wallet_utxo(const std::vector<std::string>& xpubs,
                 uint32_t m,
                 ScriptType type,
                 const std::string& path,
                 uint64_t satoshis,
                 uint8_t txid_fill,
                 uint32_t confirmations,
                 Chain chain,
                 Network network) {
    auto record = AddressDeriver::derive(type, xpubs, path, m, chain, network);
    Utxo utxo;
    utxo.txid = fixed_txid(txid_fill);
    utxo.vout = 0;
    utxo.address = record.address;
    utxo.path = record.path;
    utxo.satoshis = satoshis;
    utxo.confirmations = confirmations;
    utxo.public_keys = record.public_keys;
    return utxo;
}

TxProposal::CreateOptions utxo_proposal_options(const std::vector<TestCopayer>& copayers,
                                                uint32_t m,
                                                ScriptType type,
                                                uint64_t amount,
                                                uint64_t fee_per_kb,
                                                Chain chain,
                                                Network network) {
    TxProposal::CreateOptions opts;
    opts.wallet_id = "wallet-1";
    opts.creator_id = copayers.at(0).copayer.id;
    opts.creator_name = copayers.at(0).copayer.name;
    opts.chain = chain;
    opts.network = network;
    opts.wallet_m = m;
    opts.wallet_n = static_cast<uint32_t>(copayers.size());
    opts.address_type = type;
    opts.outputs = {TxOutput{amount, foreign_address(0x55, chain, network)}};
    opts.fee_per_kb = fee_per_kb;
    opts.no_shuffle_outputs = true;

    UtxoPayload payload;
    payload.change_address = AddressDeriver::derive(type, xpubs_of(copayers), "m/1/0", m, chain, network);
    opts.payload = payload;
    return opts;
}

std::string sign_proposal(const ChainAdapter& adapter, const TxProposal& txp, const std::array<uint8_t, 32>& key) {
    return MessageSigner::sign_message(txp.raw_unsigned(adapter), key);
}

std::vector<std::string> sign_inputs(const UtxoChainAdapter& adapter, const TxProposal& txp, const std::string& xprv) {
    auto tx = adapter.build_utxo_transaction(txp, false);
    auto root = KeyDeserializer::from_base58(xprv);
    auto paths = txp.input_paths();

    std::vector<std::string> signatures;
    for (size_t i = 0; i < paths.size(); ++i) {
        auto key = Bip32Util::get_child_key_at_path(root, paths[i]);
        auto digest = tx->sighash(i);
        signatures.push_back(HexUtils::encode(Ecdsa::sign(key.private_key(), digest)));
    }
    return signatures;
}

} // namespace cosign::test
