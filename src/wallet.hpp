#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "address_deriver.hpp"
#include "chain.hpp"
#include "secure_memory.hpp"

namespace cosign {

// One copayer's keys as every member of the wallet sees them
struct PublicKeyRingEntry {
    std::string xpub;
    std::string request_pub_key;
};

struct Copayer {
    std::string id;               // See MessageSigner::xpub_to_copayer_id
    std::string name;             // Plain text or an encrypted envelope
    std::string xpub;
    std::string request_pub_key;
    std::string signature;        // Over "name|xpub|requestPubKey" by the wallet key
    int64_t created_on = 0;

    static Copayer create(Chain chain,
                          const std::string& name,
                          const std::string& xpub,
                          const std::string& request_pub_key,
                          const std::string& signature);
};

// Service-side view of an M-of-N wallet: its parameters, its copayers in
// joining order and the address counters of the receive and change branches
class Wallet {
public:
    // Throws Error(InvalidWalletParams) unless 1 <= m <= n <= MAX_KEYS and
    // Error(InvalidNetwork) for a network the chain does not know. The
    // address type defaults to P2SH for shared wallets and P2PKH otherwise.
    Wallet(std::string id,
           std::string name,
           uint32_t m,
           uint32_t n,
           Chain chain,
           Network network,
           std::optional<ScriptType> address_type = std::nullopt);

    static void check_params(uint32_t m, uint32_t n);

    // Throws Error(InvalidWalletParams) when the wallet is complete and
    // Error(InvalidArgument) for a copayer id or xpub already present
    void add_copayer(const Copayer& copayer);

    bool is_complete() const { return copayers_.size() == n_; }

    const Copayer* find_copayer(const std::string& copayer_id) const;

    // Extended public keys in ring order
    std::vector<std::string> xpubs() const;

    // Next receive ("m/0/i") or change ("m/1/i") address. Escrow input paths
    // turn a P2SH change address into an escrow address.
    AddressRecord create_address(bool is_change, std::span<const std::string> escrow_input_paths = {});

    // Instant-acceptance escrow works for single-key Bitcoin Cash wallets
    bool is_zce_compatible() const;

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    uint32_t m() const { return m_; }
    uint32_t n() const { return n_; }
    Chain chain() const { return chain_; }
    Network network() const { return network_; }
    ScriptType address_type() const { return address_type_; }
    const std::vector<Copayer>& copayers() const { return copayers_; }

private:
    std::string id_;
    std::string name_;
    uint32_t m_;
    uint32_t n_;
    Chain chain_;
    Network network_;
    ScriptType address_type_;
    std::vector<Copayer> copayers_;
    uint32_t receive_index_ = 0;
    uint32_t change_index_ = 0;
};

// Client-side wallet material: everything a copayer needs to check what the
// service reports. The wallet's shared private key is held in locked memory.
struct Credentials {
    Chain chain = Chain::Btc;
    Network network = Network::Livenet;
    uint32_t m = 1;
    uint32_t n = 1;
    ScriptType address_type = ScriptType::P2PKH;
    std::vector<PublicKeyRingEntry> public_key_ring;
    std::string xpub;                        // This copayer's extended public key
    SecureMemory wallet_priv_key;
    std::string shared_encrypting_key;       // Base64 memo key
    std::string hardware_source_public_key;  // Hex, single-key hardware wallets

    // Keys: chain, network, m, n, addressType, publicKeyRing[{xPubKey,
    // requestPubKey}], xPubKey, walletPrivKey (hex), sharedEncryptingKey,
    // hardwareSourcePublicKey. The memo key defaults to the one derived from
    // walletPrivKey.
    static Credentials from_json(const nlohmann::json& j);

    static Credentials load_from_file(const std::string& path);

    // Compressed public key of the wallet's shared key, hex
    std::string wallet_public_key() const;

    std::vector<std::string> xpubs() const;
};

} // namespace cosign
