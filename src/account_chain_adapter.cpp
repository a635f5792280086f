#include "account_chain_adapter.hpp"
#include "error.hpp"
#include "tx_proposal.hpp"
#include "wallet.hpp"

#include <algorithm>

namespace cosign {

AccountTransaction::AccountTransaction(std::shared_ptr<const AccountTxEncoder> encoder,
                                       std::vector<std::string> raws)
    : encoder_(std::move(encoder))
    , raws_(std::move(raws))
    , signed_(raws_.size())
{}

bool AccountTransaction::verify_signature(size_t slot,
                                          const std::string& signature,
                                          std::span<const uint8_t> public_key,
                                          SigningMethod) const {
    if (slot >= raws_.size()) {
        return false;
    }
    return encoder_->verify_signature(raws_[slot], signature, public_key);
}

void AccountTransaction::apply_signature(size_t slot,
                                         const std::string& signature,
                                         std::span<const uint8_t>,
                                         SigningMethod) {
    signed_.at(slot) = encoder_->apply_signature(raws_.at(slot), signature);
}

bool AccountTransaction::is_fully_signed() const {
    return std::none_of(signed_.begin(), signed_.end(), [](const std::string& raw) { return raw.empty(); });
}

std::vector<std::string> AccountTransaction::serialize() const {
    std::vector<std::string> result;
    result.reserve(raws_.size());
    for (size_t i = 0; i < raws_.size(); ++i) {
        result.push_back(signed_[i].empty() ? raws_[i] : signed_[i]);
    }
    return result;
}

std::vector<std::string> AccountTransaction::txids() const {
    std::vector<std::string> result;
    for (const auto& raw : serialize()) {
        result.push_back(encoder_->txid(raw));
    }
    return result;
}

AccountChainAdapter::AccountChainAdapter(Chain chain,
                                         ServiceConfig config,
                                         std::shared_ptr<AccountTxEncoder> encoder,
                                         std::shared_ptr<spdlog::logger> logger)
    : ChainAdapter(chain, std::move(config), std::move(logger))
    , encoder_(std::move(encoder))
{
    if (!encoder_) {
        throw Error(Error::Code::UnsupportedChain, "No transaction encoder for " + to_string(chain));
    }
}

bool AccountChainAdapter::supports_multisig() const {
    return chain_params(chain_, Network::Livenet).supports_multisig;
}

size_t AccountChainAdapter::estimated_size(const TxProposal& txp, const EstimateOptions&) const {
    size_t size = 0;
    for (const auto& raw : encoder_->build_unsigned(txp)) {
        size += raw.size() / 2;
    }
    return size;
}

uint64_t AccountChainAdapter::estimated_fee(const TxProposal& txp, const EstimateOptions&) const {
    return encoder_->estimated_fee(txp);
}

std::unique_ptr<ChainTransaction> AccountChainAdapter::build_transaction(const TxProposal& txp, bool signed_tx) const {
    auto raws = encoder_->build_unsigned(txp);
    if (raws.empty()) {
        throw Error(Error::Code::InvalidArgument, "Encoder produced no transaction");
    }
    if (raws.size() > 1 && !txp.multi_tx()) {
        throw Error(Error::Code::InvalidArgument, "Several transactions for a single transaction proposal");
    }

    auto tx = std::make_unique<AccountTransaction>(encoder_, std::move(raws));
    if (signed_tx) {
        for (const auto& action : txp.current_signatures()) {
            add_signatures(*tx, {}, action.signatures, action.xpub, txp.signing_method());
        }
    }
    return tx;
}

uint64_t AccountChainAdapter::check_tx(const TxProposal& txp) const {
    auto tx = build_transaction(txp, false);
    uint64_t fee = txp.fee() ? *txp.fee() : encoder_->estimated_fee(txp);
    const auto& params = chain_params(chain_, txp.network());
    if (fee > params.max_tx_fee) {
        throw Error(Error::Code::FeeTooHigh);
    }
    logger_->debug("Built {} {} transaction(s), fee {}", tx->signature_slots(), to_string(chain_), fee);
    return fee;
}

void AccountChainAdapter::validate_address(const Wallet& wallet, const std::string& address) const {
    encoder_->validate_address(address, wallet.network());
}

void AccountChainAdapter::check_script_output(const TxOutput& output) const {
    if (!output.script.empty()) {
        throw Error(Error::Code::ScriptType, "Script outputs are not supported on " + to_string(chain_));
    }
}

std::string AccountChainAdapter::signing_path(const std::vector<std::string>&, size_t) const {
    return SIGNING_PATH;
}

} // namespace cosign
