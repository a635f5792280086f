#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "utxo.hpp"

namespace cosign {

class ChainAdapter;
class TxProposal;

struct SelectOptions {
    std::vector<std::string> utxos_to_exclude; // "txid:vout"
    bool zce_compatible = false;               // Wallet::is_zce_compatible
};

struct SendMaxOptions {
    bool exclude_unconfirmed_utxos = false;
    bool conservative = false;                 // Payment protocol proposals
    bool return_inputs = false;
};

struct SendMaxInfo {
    size_t size = 0;
    uint64_t amount = 0;
    uint64_t fee = 0;
    uint64_t fee_per_kb = 0;
    std::vector<Utxo> inputs;
    size_t utxos_below_fee = 0;
    uint64_t amount_below_fee = 0;
    size_t utxos_above_max_size = 0;
    uint64_t amount_above_max_size = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SendMaxInfo, size, amount, fee, fee_per_kb, inputs, utxos_below_fee,
                                   amount_below_fee, utxos_above_max_size, amount_above_max_size)

// Picks the inputs of a UTXO proposal and the fee they pay.
//
// Candidates are tried by confirmation depth (6, 1, then 0 unless unconfirmed
// funds are excluded). Within a group, inputs well above the amount are
// "big"; the others are accumulated largest first while the added fee stays
// reasonable compared to spending one big input, which is the fallback.
// Selection is deterministic for a given UTXO set.
class CoinSelector {
public:
    struct Selection {
        std::vector<Utxo> inputs;
        uint64_t fee = 0;
    };

    explicit CoinSelector(const ChainAdapter& adapter, std::shared_ptr<spdlog::logger> logger = nullptr);

    // Stores the selected inputs and fee in the proposal, then validates the
    // built transaction. Preset inputs (other than a fee bump) are only
    // checked. Throws FundsError / Error with the failure of the last tried
    // confirmation group.
    void select_tx_inputs(TxProposal& txp, const std::vector<Utxo>& utxos, const SelectOptions& opts = {}) const;

    // One selection pass over a candidate set. required lists the outpoints
    // that are kept regardless of their value and considered first.
    Selection select(const TxProposal& txp,
                     const std::vector<Utxo>& candidates,
                     const std::vector<Utxo>& required = {}) const;

    // Largest amount the proposal's wallet can send in one transaction at its
    // fee rate, without change
    SendMaxInfo send_max_info(const TxProposal& txp,
                              const std::vector<Utxo>& utxos,
                              const SendMaxOptions& opts = {}) const;

    // Throws Error(UnavailableUtxos) unless every input is in the set and unlocked
    static void check_utxos_available(const std::vector<Utxo>& inputs, const std::vector<Utxo>& utxos);

private:
    const ChainAdapter& adapter_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cosign
