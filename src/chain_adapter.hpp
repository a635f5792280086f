#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "chain.hpp"
#include "config.hpp"
#include "utxo.hpp"

namespace cosign {

class TxProposal;
class Wallet;
struct TxOutput;
class AccountTxEncoder;

struct EstimateOptions {
    // Adds the per-input and relative size margins (payment protocol proposals)
    bool conservative = false;
    // Overrides the proposal's input count; 0 gives the size without inputs
    std::optional<size_t> input_count;
};

struct Balance {
    uint64_t total_amount = 0;
    uint64_t locked_amount = 0;
    uint64_t total_confirmed_amount = 0;
    uint64_t locked_confirmed_amount = 0;
    uint64_t available_amount = 0;
    uint64_t available_confirmed_amount = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Balance, total_amount, locked_amount, total_confirmed_amount,
                                   locked_confirmed_amount, available_amount, available_confirmed_amount)

// A transaction (or, for multi-transaction proposals, a batch) built from a
// proposal. Copayers sign one digest per signature slot: one per input on
// UTXO chains, one per transaction on account chains.
class ChainTransaction {
public:
    virtual ~ChainTransaction() = default;

    // Canonical unsigned serializations (hex), the values proposal
    // signatures commit to
    virtual std::vector<std::string> unsigned_serializations() const = 0;

    virtual size_t signature_slots() const = 0;

    // Never throws; malformed signatures do not verify
    virtual bool verify_signature(size_t slot,
                                  const std::string& signature,
                                  std::span<const uint8_t> public_key,
                                  SigningMethod method) const = 0;

    virtual void apply_signature(size_t slot,
                                 const std::string& signature,
                                 std::span<const uint8_t> public_key,
                                 SigningMethod method) = 0;

    virtual bool is_fully_signed() const = 0;

    // Broadcastable serializations (hex)
    virtual std::vector<std::string> serialize() const = 0;

    virtual std::vector<std::string> txids() const = 0;
};

// Chain-family specific transaction building and size/fee model
class ChainAdapter {
public:
    ChainAdapter(Chain chain, ServiceConfig config, std::shared_ptr<spdlog::logger> logger);
    virtual ~ChainAdapter() = default;

    ChainAdapter(const ChainAdapter&) = delete;
    ChainAdapter& operator=(const ChainAdapter&) = delete;

    Chain chain() const { return chain_; }
    const ServiceConfig& config() const { return config_; }

    virtual bool is_utxo_model() const = 0;
    virtual bool supports_multisig() const = 0;

    // Smallest output amount the chain relays
    virtual uint64_t dust_threshold(Network network) const = 0;

    virtual size_t estimated_size(const TxProposal& txp, const EstimateOptions& opts) const = 0;
    virtual size_t estimated_size_for_single_input(const TxProposal& txp, const EstimateOptions& opts) const = 0;
    virtual uint64_t estimated_fee(const TxProposal& txp, const EstimateOptions& opts) const = 0;

    // signed_tx applies the signatures of every accept vote
    virtual std::unique_ptr<ChainTransaction> build_transaction(const TxProposal& txp, bool signed_tx) const = 0;

    // Validates the built transaction and returns the fee it actually pays
    virtual uint64_t check_tx(const TxProposal& txp) const = 0;

    // Throws Error(InvalidAddress) or Error(IncorrectAddressNetwork)
    virtual void validate_address(const Wallet& wallet, const std::string& address) const = 0;

    // Throws Error(DustAmount)
    virtual void check_dust(const TxOutput& output, Network network) const = 0;

    // Throws Error(ScriptOpReturn) or Error(ScriptOpReturnAmount)
    virtual void check_script_output(const TxOutput& output) const = 0;

    Balance totalize_utxos(const std::vector<Utxo>& utxos) const;

    // Verifies one signature per slot against the keys derived from xpub, then
    // applies them all. Throws Error(SignatureCountMismatch) or
    // Error(BadSignatures) and leaves tx untouched in that case.
    void add_signatures(ChainTransaction& tx,
                        const std::vector<std::string>& input_paths,
                        const std::vector<std::string>& signatures,
                        const std::string& xpub,
                        SigningMethod method) const;

protected:
    // Derivation path of the key signing the given slot
    virtual std::string signing_path(const std::vector<std::string>& input_paths, size_t slot) const = 0;

    Chain chain_;
    ServiceConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Adapter for a chain. Account chains need the encoder for their byte
// format; Error(UnsupportedChain) is thrown without one.
std::unique_ptr<ChainAdapter> make_chain_adapter(Chain chain,
                                                 const ServiceConfig& config,
                                                 std::shared_ptr<AccountTxEncoder> encoder = nullptr);

} // namespace cosign
