#pragma once

#include <map>
#include <memory>
#include <vector>
#include "chain_adapter.hpp"
#include "consts.hpp"
#include "transaction.hpp"

namespace cosign {

// Unsigned UTXO transaction plus what is needed to sign and finalize each
// input. Signatures are collected per input and turned into scriptSigs or
// witness stacks on serialization.
class UtxoTransaction : public ChainTransaction {
public:
    struct InputSigning {
        ScriptType type = ScriptType::P2PKH;
        std::vector<uint8_t> script;                   // Redeem or witness script of multisig inputs
        std::vector<std::vector<uint8_t>> public_keys; // Sorted, multisig inputs only
        uint32_t required = 1;
        std::map<std::vector<uint8_t>, std::vector<uint8_t>> signatures; // Public key -> signature
    };

    UtxoTransaction(Transaction tx, std::vector<InputSigning> signing, uint32_t fork_id);

    std::vector<std::string> unsigned_serializations() const override;
    size_t signature_slots() const override { return tx_.inputs.size(); }
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

    // The transaction with every collected signature placed in its input
    Transaction finalized() const;

    const Transaction& transaction() const { return tx_; }

    // Digest signed for the given input
    Hash256 sighash(size_t index) const;

    // Hash type byte appended to ECDSA signatures
    uint8_t hash_type() const { return static_cast<uint8_t>(SIGHASH_ALL | fork_id_); }

private:
    // Whether the key is allowed to sign the input
    bool key_matches(size_t index, std::span<const uint8_t> public_key) const;

    Transaction tx_;
    std::vector<InputSigning> signing_;
    uint32_t fork_id_;
};

// Bitcoin-family chains: BTC, BCH, LTC and DOGE
class UtxoChainAdapter : public ChainAdapter {
public:
    UtxoChainAdapter(Chain chain, ServiceConfig config, std::shared_ptr<spdlog::logger> logger);

    bool is_utxo_model() const override { return true; }
    bool supports_multisig() const override { return true; }

    uint64_t dust_threshold(Network network) const override;

    size_t estimated_size(const TxProposal& txp, const EstimateOptions& opts) const override;
    size_t estimated_size_for_single_input(const TxProposal& txp, const EstimateOptions& opts) const override;
    uint64_t estimated_fee(const TxProposal& txp, const EstimateOptions& opts) const override;

    std::unique_ptr<ChainTransaction> build_transaction(const TxProposal& txp, bool signed_tx) const override;

    uint64_t check_tx(const TxProposal& txp) const override;

    void validate_address(const Wallet& wallet, const std::string& address) const override;
    void check_dust(const TxOutput& output, Network network) const override;
    void check_script_output(const TxOutput& output) const override;

    // Serialized size of one output paying to the address; an empty or
    // unparsable address counts as the widest standard output
    size_t estimated_size_for_single_output(const std::string& address, Network network) const;

    std::unique_ptr<UtxoTransaction> build_utxo_transaction(const TxProposal& txp, bool signed_tx) const;

protected:
    std::string signing_path(const std::vector<std::string>& input_paths, size_t slot) const override;

private:
    static constexpr size_t TX_OVERHEAD = 4 + 4 + 1 + 1; // version, locktime, input count, output count
    static constexpr size_t VALUE_AND_LENGTH_SIZE = 8 + 1;
    static constexpr size_t DEFAULT_OUTPUT_SCRIPT_SIZE = 34;
};

} // namespace cosign
