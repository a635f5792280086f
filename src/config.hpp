#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "consts.hpp"

namespace cosign {

// Thresholds steering the small-input accumulation of the coin selector
struct UtxoSelectionFactors {
    double max_single_utxo = defaults::UTXO_SELECTION_MAX_SINGLE_UTXO_FACTOR;
    double min_tx_amount_vs_utxo = defaults::UTXO_SELECTION_MIN_TX_AMOUNT_VS_UTXO_FACTOR;
    double max_fee_vs_tx_amount = defaults::UTXO_SELECTION_MAX_FEE_VS_TX_AMOUNT_FACTOR;
    double max_fee_vs_single_utxo_fee = defaults::UTXO_SELECTION_MAX_FEE_VS_SINGLE_UTXO_FEE_FACTOR;
};

struct ServiceConfig {
    double size_estimation_margin = defaults::SIZE_ESTIMATION_MARGIN;
    size_t input_size_estimation_margin = defaults::INPUT_SIZE_ESTIMATION_MARGIN;
    size_t max_tx_size_in_kb = defaults::MAX_TX_SIZE_IN_KB;
    UtxoSelectionFactors utxo_selection;
    uint64_t min_output_amount = defaults::MIN_OUTPUT_AMOUNT;
    uint32_t lock_wait_ms = defaults::LOCK_WAIT_TIME_MS;
    uint32_t lock_lease_ms = defaults::LOCK_EXE_TIME_MS;
    std::string log_level = "info";

    // Keys missing from the document keep their defaults and unknown keys are
    // ignored. A key with the wrong JSON type throws Error(InvalidArgument).
    static ServiceConfig from_json(const nlohmann::json& j);

    static ServiceConfig load_from_file(const std::string& path);
};

} // namespace cosign
