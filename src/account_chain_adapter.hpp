#pragma once

#include <memory>
#include <span>
#include <string>
#include <vector>
#include "chain_adapter.hpp"

namespace cosign {

// Byte-level encoding of account-model transactions (EVM family, XRP,
// Solana). Implementations live with the chain libraries; the core only
// reaches them through this interface.
class AccountTxEncoder {
public:
    virtual ~AccountTxEncoder() = default;

    // One unsigned raw transaction (hex) per transaction of the proposal
    virtual std::vector<std::string> build_unsigned(const TxProposal& txp) const = 0;

    // Never throws
    virtual bool verify_signature(const std::string& raw,
                                  const std::string& signature,
                                  std::span<const uint8_t> public_key) const = 0;

    // Raw transaction with the signature applied
    virtual std::string apply_signature(const std::string& raw, const std::string& signature) const = 0;

    virtual std::string txid(const std::string& signed_raw) const = 0;

    virtual uint64_t estimated_fee(const TxProposal& txp) const = 0;

    // Throws Error(InvalidAddress)
    virtual void validate_address(const std::string& address, Network network) const = 0;
};

class AccountTransaction : public ChainTransaction {
public:
    AccountTransaction(std::shared_ptr<const AccountTxEncoder> encoder, std::vector<std::string> raws);

    std::vector<std::string> unsigned_serializations() const override { return raws_; }
    size_t signature_slots() const override { return raws_.size(); }
    bool verify_signature(size_t slot,
                          const std::string& signature,
                          std::span<const uint8_t> public_key,
                          SigningMethod method) const override;
    void apply_signature(size_t slot,
                         const std::string& signature,
                         std::span<const uint8_t> public_key,
                         SigningMethod method) override;
    bool is_fully_signed() const override;
    std::vector<std::string> serialize() const override;
    std::vector<std::string> txids() const override;

private:
    std::shared_ptr<const AccountTxEncoder> encoder_;
    std::vector<std::string> raws_;
    std::vector<std::string> signed_;
};

// Ethereum family, XRP and Solana. Every copayer signs each transaction with
// the key at m/0/0 of their extended key.
class AccountChainAdapter : public ChainAdapter {
public:
    AccountChainAdapter(Chain chain,
                        ServiceConfig config,
                        std::shared_ptr<AccountTxEncoder> encoder,
                        std::shared_ptr<spdlog::logger> logger);

    bool is_utxo_model() const override { return false; }
    bool supports_multisig() const override;

    uint64_t dust_threshold(Network) const override { return 0; }

    // Sum of the unsigned raw transaction sizes
    size_t estimated_size(const TxProposal& txp, const EstimateOptions& opts) const override;
    size_t estimated_size_for_single_input(const TxProposal&, const EstimateOptions&) const override { return 0; }
    uint64_t estimated_fee(const TxProposal& txp, const EstimateOptions& opts) const override;

    std::unique_ptr<ChainTransaction> build_transaction(const TxProposal& txp, bool signed_tx) const override;

    uint64_t check_tx(const TxProposal& txp) const override;

    void validate_address(const Wallet& wallet, const std::string& address) const override;
    void check_dust(const TxOutput&, Network) const override {}
    void check_script_output(const TxOutput& output) const override;

protected:
    std::string signing_path(const std::vector<std::string>& input_paths, size_t slot) const override;

private:
    static constexpr const char* SIGNING_PATH = "m/0/0";

    std::shared_ptr<AccountTxEncoder> encoder_;
};

} // namespace cosign
