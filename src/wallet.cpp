#include "wallet.hpp"
#include "consts.hpp"
#include "ec_utils.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "message_signer.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>

namespace cosign {

namespace {

constexpr const char* RECEIVE_BRANCH = "m/0/";
constexpr const char* CHANGE_BRANCH = "m/1/";

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

template <typename T>
T required(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        throw Error(Error::Code::InvalidArgument, std::string("Credentials are missing ") + key);
    }
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception&) {
        throw Error(Error::Code::InvalidArgument, std::string("Credentials field has the wrong type: ") + key);
    }
}

} // namespace

Copayer Copayer::create(Chain chain,
                        const std::string& name,
                        const std::string& xpub,
                        const std::string& request_pub_key,
                        const std::string& signature) {
    Copayer copayer;
    copayer.id = MessageSigner::xpub_to_copayer_id(chain, xpub);
    copayer.name = name;
    copayer.xpub = xpub;
    copayer.request_pub_key = request_pub_key;
    copayer.signature = signature;
    copayer.created_on = now_seconds();
    return copayer;
}

Wallet::Wallet(std::string id,
               std::string name,
               uint32_t m,
               uint32_t n,
               Chain chain,
               Network network,
               std::optional<ScriptType> address_type)
    : id_(std::move(id))
    , name_(std::move(name))
    , m_(m)
    , n_(n)
    , chain_(chain)
    , network_(network)
    , address_type_(address_type.value_or(n > 1 ? ScriptType::P2SH : ScriptType::P2PKH))
{
    check_params(m, n);
    chain_params(chain, network);
}

void Wallet::check_params(uint32_t m, uint32_t n) {
    if (m < 1 || n < 1 || m > n || n > defaults::MAX_KEYS) {
        throw Error(Error::Code::InvalidWalletParams);
    }
}

void Wallet::add_copayer(const Copayer& copayer) {
    if (is_complete()) {
        throw Error(Error::Code::InvalidWalletParams, "Wallet is full");
    }
    bool duplicate = std::any_of(copayers_.begin(), copayers_.end(), [&](const Copayer& c) {
        return c.id == copayer.id || c.xpub == copayer.xpub;
    });
    if (duplicate) {
        throw Error(Error::Code::InvalidArgument, "Copayer already in wallet");
    }
    copayers_.push_back(copayer);
}

const Copayer* Wallet::find_copayer(const std::string& copayer_id) const {
    auto it = std::find_if(copayers_.begin(), copayers_.end(),
                           [&](const Copayer& c) { return c.id == copayer_id; });
    return it == copayers_.end() ? nullptr : &*it;
}

std::vector<std::string> Wallet::xpubs() const {
    std::vector<std::string> result;
    result.reserve(copayers_.size());
    for (const auto& copayer : copayers_) {
        result.push_back(copayer.xpub);
    }
    return result;
}

AddressRecord Wallet::create_address(bool is_change, std::span<const std::string> escrow_input_paths) {
    if (!is_complete()) {
        throw Error(Error::Code::InvalidWalletParams, "Wallet is not complete");
    }
    uint32_t& index = is_change ? change_index_ : receive_index_;
    std::string path = (is_change ? CHANGE_BRANCH : RECEIVE_BRANCH) + std::to_string(index);

    auto record = AddressDeriver::derive(address_type_, xpubs(), path, m_, chain_, network_, escrow_input_paths);
    ++index;
    return record;
}

bool Wallet::is_zce_compatible() const {
    return chain_ == Chain::Bch && address_type_ == ScriptType::P2PKH;
}

Credentials Credentials::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw Error(Error::Code::InvalidArgument, "Credentials must be a JSON object");
    }

    Credentials creds;
    auto chain = chain_from_string(j.value("chain", "btc"));
    if (!chain) {
        throw Error(Error::Code::InvalidArgument, "Unknown chain in credentials");
    }
    auto network = network_from_string(j.value("network", "livenet"));
    if (!network) {
        throw Error(Error::Code::InvalidNetwork);
    }
    creds.chain = *chain;
    creds.network = *network;
    creds.m = required<uint32_t>(j, "m");
    creds.n = required<uint32_t>(j, "n");
    Wallet::check_params(creds.m, creds.n);

    auto address_type = script_type_from_string(
        j.value("addressType", creds.n > 1 ? "P2SH" : "P2PKH"));
    if (!address_type) {
        throw Error(Error::Code::ScriptType, "Unknown address type in credentials");
    }
    creds.address_type = *address_type;

    for (const auto& entry : required<nlohmann::json>(j, "publicKeyRing")) {
        creds.public_key_ring.push_back(PublicKeyRingEntry{
            required<std::string>(entry, "xPubKey"),
            entry.value("requestPubKey", "")
        });
    }
    creds.xpub = required<std::string>(j, "xPubKey");
    creds.wallet_priv_key = SecureMemory::from_hex(required<std::string>(j, "walletPrivKey"));
    creds.shared_encrypting_key = j.value("sharedEncryptingKey", "");
    if (creds.shared_encrypting_key.empty()) {
        creds.shared_encrypting_key = MessageSigner::private_key_to_aes_key(creds.wallet_priv_key.bytes());
    }
    creds.hardware_source_public_key = j.value("hardwareSourcePublicKey", "");
    return creds;
}

Credentials Credentials::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw Error(Error::Code::InvalidArgument, "Cannot open credentials file: " + path);
    }
    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw Error(Error::Code::InvalidArgument, "Credentials file is not valid JSON: " + path);
    }
    return from_json(j);
}

std::string Credentials::wallet_public_key() const {
    return HexUtils::encode(EcUtils::public_key_from_private(wallet_priv_key.bytes()));
}

std::vector<std::string> Credentials::xpubs() const {
    std::vector<std::string> result;
    result.reserve(public_key_ring.size());
    for (const auto& entry : public_key_ring) {
        result.push_back(entry.xpub);
    }
    return result;
}

} // namespace cosign
