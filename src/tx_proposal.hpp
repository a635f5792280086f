#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "address_deriver.hpp"
#include "chain.hpp"
#include "consts.hpp"
#include "utxo.hpp"

namespace cosign {

class ChainAdapter;
struct Copayer;

enum class ProposalStatus {
    Temporary,
    Pending,
    Accepted,
    Rejected,
    Broadcasted
};

enum class ActionType {
    Accept,
    Reject
};

std::string to_string(ProposalStatus status);
std::optional<ProposalStatus> proposal_status_from_string(const std::string& name);

struct TxOutput {
    uint64_t amount = 0;
    std::string to_address;           // Empty for raw script outputs
    std::string script;               // Hex, OP_RETURN only
    std::string message;              // Encrypted memo
    std::string data;                 // EVM call data, hex
    std::optional<uint64_t> gas_limit;
    std::optional<uint32_t> tag;      // XRP destination tag
};

// A copayer's vote. Actions are appended and never modified.
struct VoteAction {
    std::string copayer_id;
    ActionType type = ActionType::Accept;
    std::vector<std::string> signatures; // One per signature slot, accept only
    std::string xpub;                    // Key the signatures derive from, accept only
    std::string comment;
    int64_t created_on = 0;
};

struct UtxoPayload {
    std::vector<Utxo> inputs;
    std::optional<AddressRecord> change_address;
    std::optional<AddressRecord> escrow_address;
    uint64_t instant_acceptance_escrow = 0;
    bool enable_rbf = false;
    bool replace_tx_by_fee = false;
    bool exclude_unconfirmed_utxos = false;
    uint32_t lock_until_block_height = 0;
};

struct EvmPayload {
    uint64_t nonce = 0;
    uint64_t gas_price = 0;
    uint64_t max_gas_fee = 0;
    uint64_t priority_gas_fee = 0;
    uint64_t gas_limit = 0;
    uint32_t tx_type = 0;
    std::string from;
    std::string token_address;
    std::string multisig_contract_address;
    std::string multisend_contract_address;
    bool is_token_swap = false;
};

struct XrpPayload {
    std::optional<uint32_t> destination_tag;
    std::string invoice_id;
};

struct SolPayload {
    std::string block_hash;
    uint64_t block_height = 0;
    std::string nonce_address;
    std::string category;
    uint64_t compute_units = 0;
    uint64_t priority_fee = 0;
    std::string memo;
    std::string from_ata;
    uint32_t decimals = 0;
    uint64_t space = 0;
};

using ChainPayload = std::variant<UtxoPayload, EvmPayload, XrpPayload, SolPayload>;

// A spend request moving through temporary -> pending -> accepted/rejected
// -> broadcasted. Votes are only counted while pending; the transition to
// accepted assembles the fully signed transaction.
class TxProposal {
public:
    struct CreateOptions {
        std::string id;                  // Random UUID when empty
        uint32_t version = defaults::MIN_PROPOSAL_VERSION;
        std::string wallet_id;
        std::string creator_id;
        std::string creator_name;
        Chain chain = Chain::Btc;
        Network network = Network::Livenet;
        uint32_t wallet_m = 1;
        uint32_t wallet_n = 1;
        std::optional<ScriptType> address_type;
        std::vector<TxOutput> outputs;
        uint64_t fee_per_kb = 0;
        std::optional<uint64_t> fee;
        std::string message;
        std::string pay_pro_url;
        nlohmann::json custom_data;
        SigningMethod signing_method = SigningMethod::Ecdsa;
        bool multi_tx = false;
        bool no_shuffle_outputs = false;
        ChainPayload payload = UtxoPayload{};
    };

    struct PublishOptions {
        std::string proposal_signature;
        std::string signing_pub_key;     // One-time key, empty to sign with the request key
        std::string pub_key_signature;   // Authorization of signing_pub_key by the creator's xpub
    };

    // Throws Error(InvalidNetwork), Error(UnsupportedFormat) for versions
    // below 3, Error(InvalidWalletParams) and Error(InvalidArgument) when the
    // payload does not belong to the chain family
    static TxProposal create(const CreateOptions& opts);

    // temporary -> pending. The proposal signature must verify against the
    // unsigned serialization (or the pre-publish raw) under the creator's
    // request key or an authorized one-time key.
    void publish(const ChainAdapter& adapter, const Copayer& creator, const PublishOptions& opts);

    // Accept vote. All-or-nothing: a failing signature leaves the proposal
    // untouched. Throws Error(CopayerKeyMismatch) when xpub is not the
    // voting copayer's key.
    void sign(const ChainAdapter& adapter,
              const std::string& copayer_id,
              const std::vector<std::string>& signatures,
              const std::string& xpub);

    void reject(const std::string& copayer_id, const std::string& reason);

    void set_broadcasted();

    // Queries
    std::vector<std::string> actors() const;
    std::vector<std::string> approvers() const;
    const VoteAction* action_by(const std::string& copayer_id) const;
    std::vector<VoteAction> current_signatures() const;
    bool is_temporary() const { return status_ == ProposalStatus::Temporary; }
    bool is_pending() const;
    bool is_accepted() const;
    bool is_rejected() const { return status_ == ProposalStatus::Rejected; }
    bool is_broadcasted() const { return status_ == ProposalStatus::Broadcasted; }
    uint64_t total_amount() const;
    std::vector<std::string> input_paths() const;

    // Canonical unsigned serializations, one per transaction
    std::vector<std::string> raw_unsigned(const ChainAdapter& adapter) const;

    // Selection results
    void set_inputs(std::vector<Utxo> inputs);
    void set_fee(uint64_t fee) { fee_ = fee; }
    void set_change_address(AddressRecord change_address);
    void set_escrow_address(AddressRecord escrow_address);
    void set_pre_publish_raw(std::string raw) { pre_publish_raw_ = std::move(raw); }

    bool is_utxo() const { return std::holds_alternative<UtxoPayload>(payload_); }
    const UtxoPayload& utxo_payload() const;
    UtxoPayload& utxo_payload();
    const ChainPayload& payload() const { return payload_; }

    const std::string& id() const { return id_; }
    uint32_t version() const { return version_; }
    const std::string& wallet_id() const { return wallet_id_; }
    const std::string& creator_id() const { return creator_id_; }
    const std::string& creator_name() const { return creator_name_; }
    int64_t created_on() const { return created_on_; }
    Chain chain() const { return chain_; }
    Network network() const { return network_; }
    uint32_t wallet_m() const { return wallet_m_; }
    uint32_t wallet_n() const { return wallet_n_; }
    uint32_t required_signatures() const { return required_signatures_; }
    uint32_t required_rejections() const { return required_rejections_; }
    ScriptType address_type() const { return address_type_; }
    const std::vector<TxOutput>& outputs() const { return outputs_; }
    std::optional<uint64_t> fee() const { return fee_; }
    uint64_t fee_per_kb() const { return fee_per_kb_; }
    const std::vector<uint32_t>& output_order() const { return output_order_; }
    ProposalStatus status() const { return status_; }
    const std::vector<VoteAction>& actions() const { return actions_; }
    const std::string& message() const { return message_; }
    const std::string& pay_pro_url() const { return pay_pro_url_; }
    const nlohmann::json& custom_data() const { return custom_data_; }
    SigningMethod signing_method() const { return signing_method_; }
    const std::string& proposal_signature() const { return proposal_signature_; }
    const std::string& proposal_signature_pub_key() const { return proposal_signature_pub_key_; }
    const std::string& proposal_signature_pub_key_sig() const { return proposal_signature_pub_key_sig_; }
    const std::string& pre_publish_raw() const { return pre_publish_raw_; }
    bool multi_tx() const { return multi_tx_; }
    const std::string& txid() const { return txid_; }
    const std::vector<std::string>& txids() const { return txids_; }
    const std::vector<std::string>& raw() const { return raw_; }
    int64_t broadcasted_on() const { return broadcasted_on_; }

private:
    friend class ProposalCodec;

    TxProposal() = default;

    // Only acts on pending proposals
    void update_status(const ChainAdapter* adapter);

    void check_can_vote(const std::string& copayer_id) const;

    std::string id_;
    uint32_t version_ = defaults::MIN_PROPOSAL_VERSION;
    std::string wallet_id_;
    std::string creator_id_;
    std::string creator_name_;
    int64_t created_on_ = 0;
    Chain chain_ = Chain::Btc;
    Network network_ = Network::Livenet;
    uint32_t wallet_m_ = 1;
    uint32_t wallet_n_ = 1;
    uint32_t required_signatures_ = 1;
    uint32_t required_rejections_ = 1;
    ScriptType address_type_ = ScriptType::P2PKH;
    std::vector<TxOutput> outputs_;
    std::optional<uint64_t> fee_;
    uint64_t fee_per_kb_ = 0;
    std::vector<uint32_t> output_order_;
    ProposalStatus status_ = ProposalStatus::Temporary;
    std::vector<VoteAction> actions_;
    std::string message_;
    std::string pay_pro_url_;
    nlohmann::json custom_data_;
    SigningMethod signing_method_ = SigningMethod::Ecdsa;
    std::string proposal_signature_;
    std::string proposal_signature_pub_key_;
    std::string proposal_signature_pub_key_sig_;
    std::string pre_publish_raw_;
    bool multi_tx_ = false;
    std::string txid_;
    std::vector<std::string> txids_;
    std::vector<std::string> raw_;
    int64_t broadcasted_on_ = 0;
    ChainPayload payload_;
};

} // namespace cosign
