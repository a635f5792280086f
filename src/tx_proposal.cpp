#include "tx_proposal.hpp"
#include "chain_adapter.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "message_signer.hpp"
#include "wallet.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <iterator>
#include <numeric>
#include <random>
#include <openssl/rand.h>

namespace cosign {

namespace {

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Random (version 4) UUID in its canonical text form
std::string random_uuid() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw Error(Error::Code::CryptoFailure, "RAND_bytes failed");
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);

    static const char* digits = "0123456789abcdef";
    std::string uuid;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            uuid.push_back('-');
        }
        uuid.push_back(digits[bytes[i] >> 4]);
        uuid.push_back(digits[bytes[i] & 0x0f]);
    }
    return uuid;
}

bool payload_matches_chain(const ChainPayload& payload, Chain chain) {
    if (is_utxo_chain(chain)) {
        return std::holds_alternative<UtxoPayload>(payload);
    }
    if (is_evm_chain(chain)) {
        return std::holds_alternative<EvmPayload>(payload);
    }
    if (chain == Chain::Xrp) {
        return std::holds_alternative<XrpPayload>(payload);
    }
    return chain == Chain::Sol && std::holds_alternative<SolPayload>(payload);
}

} // namespace

std::string to_string(ProposalStatus status) {
    switch (status) {
        case ProposalStatus::Temporary: return "temporary";
        case ProposalStatus::Pending: return "pending";
        case ProposalStatus::Accepted: return "accepted";
        case ProposalStatus::Rejected: return "rejected";
        case ProposalStatus::Broadcasted: return "broadcasted";
    }
    return "unknown";
}

std::optional<ProposalStatus> proposal_status_from_string(const std::string& name) {
    for (auto status : {ProposalStatus::Temporary, ProposalStatus::Pending, ProposalStatus::Accepted,
                        ProposalStatus::Rejected, ProposalStatus::Broadcasted}) {
        if (to_string(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

TxProposal TxProposal::create(const CreateOptions& opts) {
    chain_params(opts.chain, opts.network);
    if (opts.version < defaults::MIN_PROPOSAL_VERSION) {
        throw Error(Error::Code::UnsupportedFormat,
                    "Transaction proposal version " + std::to_string(opts.version) + " is not supported");
    }
    Wallet::check_params(opts.wallet_m, opts.wallet_n);
    if (!payload_matches_chain(opts.payload, opts.chain)) {
        throw Error(Error::Code::InvalidArgument, "Payload does not belong to chain " + to_string(opts.chain));
    }
    if (opts.multi_tx && is_utxo_chain(opts.chain)) {
        throw Error(Error::Code::MultiTxUnsupported);
    }

    TxProposal txp;
    txp.id_ = opts.id.empty() ? random_uuid() : opts.id;
    txp.version_ = opts.version;
    txp.wallet_id_ = opts.wallet_id;
    txp.creator_id_ = opts.creator_id;
    txp.creator_name_ = opts.creator_name;
    txp.created_on_ = now_seconds();
    txp.chain_ = opts.chain;
    txp.network_ = opts.network;
    txp.wallet_m_ = opts.wallet_m;
    txp.wallet_n_ = opts.wallet_n;
    txp.required_signatures_ = opts.wallet_m;
    txp.required_rejections_ = std::min(opts.wallet_m, opts.wallet_n - opts.wallet_m + 1);
    txp.address_type_ = opts.address_type.value_or(opts.wallet_n > 1 ? ScriptType::P2SH : ScriptType::P2PKH);
    txp.outputs_ = opts.outputs;
    txp.fee_ = opts.fee;
    txp.fee_per_kb_ = opts.fee_per_kb;
    txp.message_ = opts.message;
    txp.pay_pro_url_ = opts.pay_pro_url;
    txp.custom_data_ = opts.custom_data;
    txp.signing_method_ = opts.signing_method;
    txp.multi_tx_ = opts.multi_tx;
    txp.payload_ = opts.payload;
    txp.status_ = ProposalStatus::Temporary;

    // One slot per output, one for the change and one for the escrow output
    size_t slots = txp.outputs_.size() + (txp.multi_tx_ ? 0 : 1);
    if (const auto* utxo = std::get_if<UtxoPayload>(&txp.payload_); utxo && utxo->instant_acceptance_escrow > 0) {
        ++slots;
    }
    txp.output_order_.resize(slots);
    std::iota(txp.output_order_.begin(), txp.output_order_.end(), 0);
    if (!opts.no_shuffle_outputs) {
        std::random_device rd;
        std::mt19937 rng(rd());
        std::shuffle(txp.output_order_.begin(), txp.output_order_.end(), rng);
    }

    get_logger()->debug("Created proposal {} on {}/{} with {} outputs", txp.id_, to_string(txp.chain_),
                        to_string(txp.network_), txp.outputs_.size());
    return txp;
}

void TxProposal::publish(const ChainAdapter& adapter, const Copayer& creator, const PublishOptions& opts) {
    if (status_ != ProposalStatus::Temporary) {
        throw Error(Error::Code::TxAlreadyPublished);
    }
    if (creator.id != creator_id_) {
        throw Error(Error::Code::InvalidArgument, "Only the creator can publish a proposal");
    }

    std::string signing_key = creator.request_pub_key;
    if (!opts.signing_pub_key.empty()) {
        if (!MessageSigner::verify_request_pub_key(opts.signing_pub_key, opts.pub_key_signature, creator.xpub)) {
            get_logger()->debug("Proposal {}: signing key is not authorized by the creator", id_);
            throw Error(Error::Code::ProposalSignatureInvalid);
        }
        signing_key = opts.signing_pub_key;
    }

    bool valid = MessageSigner::verify_message(raw_unsigned(adapter), opts.proposal_signature, signing_key);
    if (!valid && !pre_publish_raw_.empty()) {
        valid = MessageSigner::verify_message(pre_publish_raw_, opts.proposal_signature, signing_key);
    }
    if (!valid) {
        get_logger()->debug("Proposal {}: creator signature does not verify", id_);
        throw Error(Error::Code::ProposalSignatureInvalid);
    }

    proposal_signature_ = opts.proposal_signature;
    proposal_signature_pub_key_ = opts.signing_pub_key;
    proposal_signature_pub_key_sig_ = opts.pub_key_signature;
    status_ = ProposalStatus::Pending;
    get_logger()->info("Proposal {} published", id_);
}

void TxProposal::check_can_vote(const std::string& copayer_id) const {
    if (status_ == ProposalStatus::Temporary || status_ == ProposalStatus::Rejected ||
        status_ == ProposalStatus::Broadcasted) {
        throw Error(Error::Code::TxNotPending);
    }
    if (action_by(copayer_id)) {
        throw Error(Error::Code::CopayerVoted);
    }
}

void TxProposal::sign(const ChainAdapter& adapter,
                      const std::string& copayer_id,
                      const std::vector<std::string>& signatures,
                      const std::string& xpub) {
    try {
        check_can_vote(copayer_id);
        if (MessageSigner::xpub_to_copayer_id(chain_, xpub) != copayer_id) {
            throw Error(Error::Code::CopayerKeyMismatch, "Extended key does not belong to copayer " + copayer_id);
        }
        auto tx = adapter.build_transaction(*this, false);
        adapter.add_signatures(*tx, input_paths(), signatures, xpub, signing_method_);
    } catch (const Error& e) {
        get_logger()->debug("Proposal {}: accept vote from {} refused: {}", id_, copayer_id, e.what());
        throw;
    }

    VoteAction action;
    action.copayer_id = copayer_id;
    action.type = ActionType::Accept;
    action.signatures = signatures;
    action.xpub = xpub;
    action.created_on = now_seconds();
    actions_.push_back(std::move(action));

    // Assembling the signed transaction can still fail; the vote is only
    // kept when the whole transition succeeds
    try {
        update_status(&adapter);
    } catch (const Error& e) {
        actions_.pop_back();
        get_logger()->debug("Proposal {}: accept vote from {} refused: {}", id_, copayer_id, e.what());
        throw;
    }
}

void TxProposal::reject(const std::string& copayer_id, const std::string& reason) {
    try {
        check_can_vote(copayer_id);
    } catch (const Error& e) {
        get_logger()->debug("Proposal {}: reject vote from {} refused: {}", id_, copayer_id, e.what());
        throw;
    }

    VoteAction action;
    action.copayer_id = copayer_id;
    action.type = ActionType::Reject;
    action.comment = reason;
    action.created_on = now_seconds();
    actions_.push_back(std::move(action));

    update_status(nullptr);
}

void TxProposal::update_status(const ChainAdapter* adapter) {
    if (status_ != ProposalStatus::Pending) {
        return;
    }

    size_t accepts = 0;
    size_t rejects = 0;
    for (const auto& action : actions_) {
        (action.type == ActionType::Accept ? accepts : rejects)++;
    }

    if (rejects >= required_rejections_) {
        status_ = ProposalStatus::Rejected;
        get_logger()->info("Proposal {} rejected ({} of {} rejections)", id_, rejects, required_rejections_);
        return;
    }
    if (accepts < required_signatures_ || !adapter) {
        return;
    }

    auto tx = adapter->build_transaction(*this, true);
    if (!tx->is_fully_signed()) {
        throw Error(Error::Code::BadSignatures, "Quorum reached but the transaction is not fully signed");
    }
    auto txids = tx->txids();
    raw_ = tx->serialize();
    txid_ = txids.front();
    if (multi_tx_) {
        txids_ = std::move(txids);
    }
    status_ = ProposalStatus::Accepted;
    get_logger()->info("Proposal {} accepted, txid {}", id_, txid_);
}

void TxProposal::set_broadcasted() {
    if (status_ != ProposalStatus::Accepted) {
        throw Error(Error::Code::TxNotAccepted);
    }
    if (txid_.empty()) {
        throw Error(Error::Code::TxMissingId);
    }
    status_ = ProposalStatus::Broadcasted;
    broadcasted_on_ = now_seconds();
    get_logger()->info("Proposal {} broadcasted", id_);
}

std::vector<std::string> TxProposal::actors() const {
    std::vector<std::string> ids;
    for (const auto& action : actions_) {
        ids.push_back(action.copayer_id);
    }
    return ids;
}

std::vector<std::string> TxProposal::approvers() const {
    std::vector<std::string> ids;
    for (const auto& action : actions_) {
        if (action.type == ActionType::Accept) {
            ids.push_back(action.copayer_id);
        }
    }
    return ids;
}

const VoteAction* TxProposal::action_by(const std::string& copayer_id) const {
    auto it = std::find_if(actions_.begin(), actions_.end(), [&](const VoteAction& action) {
        return action.copayer_id == copayer_id;
    });
    return it == actions_.end() ? nullptr : &*it;
}

std::vector<VoteAction> TxProposal::current_signatures() const {
    std::vector<VoteAction> accepted;
    std::copy_if(actions_.begin(), actions_.end(), std::back_inserter(accepted), [](const VoteAction& action) {
        return action.type == ActionType::Accept;
    });
    return accepted;
}

bool TxProposal::is_pending() const {
    return status_ == ProposalStatus::Pending;
}

bool TxProposal::is_accepted() const {
    auto accepts = std::count_if(actions_.begin(), actions_.end(), [](const VoteAction& action) {
        return action.type == ActionType::Accept;
    });
    return static_cast<uint32_t>(accepts) >= required_signatures_;
}

uint64_t TxProposal::total_amount() const {
    uint64_t total = 0;
    for (const auto& output : outputs_) {
        total += output.amount;
    }
    return total;
}

std::vector<std::string> TxProposal::input_paths() const {
    std::vector<std::string> paths;
    if (const auto* utxo = std::get_if<UtxoPayload>(&payload_)) {
        for (const auto& input : utxo->inputs) {
            paths.push_back(input.path);
        }
    }
    return paths;
}

std::vector<std::string> TxProposal::raw_unsigned(const ChainAdapter& adapter) const {
    return adapter.build_transaction(*this, false)->unsigned_serializations();
}

void TxProposal::set_inputs(std::vector<Utxo> inputs) {
    utxo_payload().inputs = std::move(inputs);
}

void TxProposal::set_change_address(AddressRecord change_address) {
    utxo_payload().change_address = std::move(change_address);
}

void TxProposal::set_escrow_address(AddressRecord escrow_address) {
    utxo_payload().escrow_address = std::move(escrow_address);
}

const UtxoPayload& TxProposal::utxo_payload() const {
    const auto* payload = std::get_if<UtxoPayload>(&payload_);
    if (!payload) {
        throw Error(Error::Code::UnsupportedChain, "Not a UTXO proposal: " + to_string(chain_));
    }
    return *payload;
}

UtxoPayload& TxProposal::utxo_payload() {
    auto* payload = std::get_if<UtxoPayload>(&payload_);
    if (!payload) {
        throw Error(Error::Code::UnsupportedChain, "Not a UTXO proposal: " + to_string(chain_));
    }
    return *payload;
}

} // namespace cosign
