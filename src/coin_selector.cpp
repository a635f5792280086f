#include "coin_selector.hpp"
#include "chain_adapter.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "tx_proposal.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <optional>
#include <set>

namespace cosign {

namespace {

uint64_t sum_satoshis(const std::vector<Utxo>& utxos) {
    uint64_t total = 0;
    for (const auto& utxo : utxos) {
        total += utxo.satoshis;
    }
    return total;
}

std::set<std::string> outpoints(const std::vector<Utxo>& utxos) {
    std::set<std::string> result;
    for (const auto& utxo : utxos) {
        result.insert(utxo.outpoint());
    }
    return result;
}

uint64_t fee_for_size(size_t size, uint64_t fee_per_kb) {
    return static_cast<uint64_t>(std::ceil(static_cast<double>(size) * fee_per_kb / 1000.0));
}

} // namespace

CoinSelector::CoinSelector(const ChainAdapter& adapter, std::shared_ptr<spdlog::logger> logger)
    : adapter_(adapter)
    , logger_(logger ? std::move(logger) : get_logger())
{}

CoinSelector::Selection CoinSelector::select(const TxProposal& txp,
                                             const std::vector<Utxo>& candidates,
                                             const std::vector<Utxo>& required) const {
    const auto& payload = txp.utxo_payload();
    const auto& factors = adapter_.config().utxo_selection;

    EstimateOptions estimate;
    estimate.conservative = !txp.pay_pro_url().empty();
    EstimateOptions base_estimate = estimate;
    base_estimate.input_count = 0;

    const uint64_t escrow_amount = payload.instant_acceptance_escrow;
    const uint64_t target = txp.total_amount() + escrow_amount;
    const uint64_t rate = txp.fee_per_kb();
    const size_t base_size = adapter_.estimated_size(txp, base_estimate);
    const size_t input_size = adapter_.estimated_size_for_single_input(txp, estimate);
    const double base_fee = static_cast<double>(base_size) * rate / 1000.0;
    const double fee_per_input = static_cast<double>(input_size) * rate / 1000.0;

    logger_->debug("Amount {} baseSize {} baseFee {} sizePerInput {} feePerInput {}",
                   target, base_size, base_fee, input_size, fee_per_input);

    if (sum_satoshis(candidates) < target) {
        logger_->debug("Total value in utxos is insufficient to cover for amount {}", target);
        throw Error(Error::Code::InsufficientFunds);
    }

    // Drop inputs that cost more to spend than they are worth
    auto required_set = outpoints(required);
    auto is_required = [&](const Utxo& utxo) { return required_set.count(utxo.outpoint()) > 0; };
    std::vector<Utxo> utxos;
    for (const auto& utxo : candidates) {
        if (is_required(utxo) || static_cast<double>(utxo.satoshis) > fee_per_input) {
            utxos.push_back(utxo);
        }
    }

    double net_value = static_cast<double>(sum_satoshis(utxos)) - base_fee - utxos.size() * fee_per_input;
    if (net_value < static_cast<double>(target)) {
        auto required_fee = static_cast<uint64_t>(std::ceil(base_fee));
        logger_->debug("Value after fees in utxos ({}) is insufficient to cover for amount {}", net_value, target);
        throw FundsError(Error::Code::InsufficientFundsForFee, required_fee,
                         "Insufficient funds for fee. RequiredFee: " + std::to_string(required_fee));
    }

    const double big_threshold = target * factors.max_single_utxo + base_fee + fee_per_input;
    std::vector<Utxo> big_inputs;
    std::vector<Utxo> small_inputs;
    for (const auto& utxo : utxos) {
        (static_cast<double>(utxo.satoshis) > big_threshold ? big_inputs : small_inputs).push_back(utxo);
    }
    // Required inputs first, then smallest big input / largest small input
    std::stable_sort(big_inputs.begin(), big_inputs.end(), [&](const Utxo& a, const Utxo& b) {
        if (is_required(a) != is_required(b)) {
            return is_required(a);
        }
        return a.satoshis < b.satoshis;
    });
    std::stable_sort(small_inputs.begin(), small_inputs.end(), [&](const Utxo& a, const Utxo& b) {
        if (is_required(a) != is_required(b)) {
            return is_required(a);
        }
        return a.satoshis > b.satoshis;
    });

    logger_->debug("Considering {} big inputs and {} small inputs (threshold {})",
                   big_inputs.size(), small_inputs.size(), big_threshold);

    Selection selection;
    uint64_t total = 0;
    double net_total = -base_fee;
    double full_amount = static_cast<double>(target);
    uint64_t fee = fee_for_size(base_size + input_size, rate);
    std::exception_ptr error;

    for (const auto& input : small_inputs) {
        double net_input = static_cast<double>(input.satoshis) - fee_per_input;
        selection.inputs.push_back(input);
        total += input.satoshis;
        net_total += net_input;

        size_t size = base_size + selection.inputs.size() * input_size;
        fee = fee_for_size(size, rate);

        // The escrow output holds the merchant's escrow plus the miner fee
        full_amount = escrow_amount > 0 ? static_cast<double>(target + fee) : static_cast<double>(target);

        logger_->debug("Input {}: contributes {}, tx size {}, fee {}", input.outpoint(), net_input, size, fee);

        if (size > adapter_.config().max_tx_size_in_kb * 1000) {
            error = std::make_exception_ptr(Error(Error::Code::TxMaxSizeExceeded));
            break;
        }

        if (!big_inputs.empty()) {
            if (net_input / full_amount < factors.min_tx_amount_vs_utxo) {
                logger_->debug("Input is too small compared to the amount");
                break;
            }
            if (fee / full_amount > factors.max_fee_vs_tx_amount &&
                fee / (base_fee + fee_per_input) > factors.max_fee_vs_single_utxo_fee) {
                logger_->debug("Fee is too high compared to spending a single big input");
                break;
            }
        }

        if (net_total >= full_amount) {
            auto change = static_cast<int64_t>(total) - static_cast<int64_t>(full_amount) - static_cast<int64_t>(fee);
            auto dust = adapter_.dust_threshold(txp.network());
            if (change > 0 && static_cast<uint64_t>(change) <= dust) {
                logger_->debug("Change {} below dust threshold {}, added to the fee", change, dust);
                fee += static_cast<uint64_t>(change);
            }
            break;
        }
    }

    if (net_total < full_amount) {
        logger_->debug("Could not reach {} with small inputs, missing {}", full_amount, full_amount - net_total);
        selection.inputs.clear();
        if (!big_inputs.empty()) {
            const auto& input = big_inputs.front();
            logger_->debug("Using big input {}", input.outpoint());
            fee = fee_for_size(base_size + input_size, rate);
            selection.inputs = {input};
        }
    }

    if (selection.inputs.empty()) {
        if (error) {
            std::rethrow_exception(error);
        }
        throw FundsError(Error::Code::InsufficientFundsForFee, fee,
                         "Insufficient funds for fee. RequiredFee: " + std::to_string(fee));
    }

    selection.fee = fee;
    return selection;
}

void CoinSelector::select_tx_inputs(TxProposal& txp, const std::vector<Utxo>& utxos, const SelectOptions& opts) const {
    if (!adapter_.is_utxo_model()) {
        if (!txp.fee()) {
            txp.set_fee(adapter_.estimated_fee(txp, EstimateOptions{}));
        }
        txp.set_fee(adapter_.check_tx(txp));
        return;
    }

    auto& payload = txp.utxo_payload();
    if (!payload.inputs.empty() && !payload.replace_tx_by_fee) {
        check_utxos_available(payload.inputs, utxos);
        if (!txp.fee()) {
            EstimateOptions conservative;
            conservative.conservative = true;
            txp.set_fee(adapter_.estimated_fee(txp, conservative));
        }
        adapter_.check_tx(txp);
        return;
    }

    // A fee bump may spend the inputs of the transaction it replaces even
    // though they are locked or unconfirmed
    std::vector<Utxo> replaced = payload.replace_tx_by_fee ? payload.inputs : std::vector<Utxo>{};
    auto replaced_set = outpoints(replaced);
    std::vector<Utxo> wallet_utxos = utxos;
    for (auto& utxo : wallet_utxos) {
        if (replaced_set.count(utxo.outpoint())) {
            utxo.locked = false;
        }
    }

    const bool exclude_unconfirmed = payload.exclude_unconfirmed_utxos && !payload.replace_tx_by_fee;
    const uint64_t amount = txp.total_amount();
    auto balance = adapter_.totalize_utxos(wallet_utxos);
    uint64_t total_amount = exclude_unconfirmed ? balance.total_confirmed_amount : balance.total_amount;
    uint64_t available_amount = exclude_unconfirmed ? balance.available_confirmed_amount : balance.available_amount;
    if (total_amount < amount) {
        throw Error(Error::Code::InsufficientFunds);
    }
    if (available_amount < amount) {
        throw Error(Error::Code::LockedFunds);
    }

    std::set<std::string> excluded(opts.utxos_to_exclude.begin(), opts.utxos_to_exclude.end());
    std::vector<Utxo> sanitized;
    for (const auto& utxo : wallet_utxos) {
        if (utxo.locked || excluded.count(utxo.outpoint())) {
            continue;
        }
        if (exclude_unconfirmed && utxo.confirmations == 0) {
            continue;
        }
        sanitized.push_back(utxo);
    }

    std::vector<uint32_t> groups = {6, 1};
    if (!payload.exclude_unconfirmed_utxos) {
        groups.push_back(0);
    }

    Selection selection;
    std::exception_ptr selection_error;
    std::optional<size_t> last_group_size;
    for (uint32_t group : groups) {
        std::vector<Utxo> candidates;
        std::copy_if(sanitized.begin(), sanitized.end(), std::back_inserter(candidates), [&](const Utxo& utxo) {
            return utxo.confirmations >= group;
        });

        // Instant-acceptance escrow needs one input per address
        if (payload.instant_acceptance_escrow > 0 && opts.zce_compatible) {
            std::stable_sort(candidates.begin(), candidates.end(), [](const Utxo& a, const Utxo& b) {
                return a.satoshis > b.satoshis;
            });
            std::set<std::string> seen;
            std::vector<Utxo> unique;
            for (const auto& utxo : candidates) {
                if (seen.insert(utxo.address).second) {
                    unique.push_back(utxo);
                }
            }
            candidates = std::move(unique);
        }

        if (!replaced.empty()) {
            std::stable_partition(candidates.begin(), candidates.end(), [&](const Utxo& utxo) {
                return replaced_set.count(utxo.outpoint()) > 0;
            });
        }

        if (last_group_size == candidates.size()) {
            logger_->debug("Group >= {} confirmations adds no utxos, skipped", group);
            continue;
        }
        last_group_size = candidates.size();

        try {
            selection = select(txp, candidates, replaced);
            selection_error = nullptr;
            logger_->debug("Selected {} inputs with >= {} confirmations, fee {}",
                           selection.inputs.size(), group, selection.fee);
            break;
        } catch (const Error& e) {
            logger_->debug("No inputs selected with >= {} confirmations: {}", group, e.what());
            selection_error = std::current_exception();
        }
    }

    if (selection.inputs.empty()) {
        if (selection_error) {
            std::rethrow_exception(selection_error);
        }
        throw Error(Error::Code::InsufficientFunds, "Could not select tx inputs");
    }

    if (!replaced.empty()) {
        bool keeps_replaced = std::any_of(selection.inputs.begin(), selection.inputs.end(), [&](const Utxo& utxo) {
            return replaced_set.count(utxo.outpoint()) > 0;
        });
        if (!keeps_replaced) {
            throw Error(Error::Code::UnavailableUtxos);
        }
    }

    txp.set_inputs(std::move(selection.inputs));
    txp.set_fee(selection.fee);
    txp.set_fee(adapter_.check_tx(txp));

    uint64_t change = sum_satoshis(txp.utxo_payload().inputs) - txp.total_amount() - *txp.fee();
    logger_->debug("Successfully built transaction. Total fees: {}, total change: {}", *txp.fee(), change);
}

SendMaxInfo CoinSelector::send_max_info(const TxProposal& txp,
                                        const std::vector<Utxo>& utxos,
                                        const SendMaxOptions& opts) const {
    if (!adapter_.is_utxo_model()) {
        throw Error(Error::Code::UnsupportedChain, "Send max is only computed for UTXO chains");
    }

    TxProposal draft = txp;
    draft.utxo_payload().change_address.reset();
    draft.set_inputs({});

    SendMaxInfo info;
    info.fee_per_kb = txp.fee_per_kb();

    EstimateOptions estimate;
    estimate.conservative = opts.conservative;
    const size_t input_size = adapter_.estimated_size_for_single_input(draft, estimate);
    const double fee_per_input = static_cast<double>(input_size) * txp.fee_per_kb() / 1000.0;
    const size_t max_size = adapter_.config().max_tx_size_in_kb * 1000;

    std::vector<Utxo> candidates;
    for (const auto& utxo : utxos) {
        if (utxo.locked || (opts.exclude_unconfirmed_utxos && utxo.confirmations == 0)) {
            continue;
        }
        if (static_cast<double>(utxo.satoshis) <= fee_per_input) {
            info.utxos_below_fee++;
            info.amount_below_fee += utxo.satoshis;
            continue;
        }
        candidates.push_back(utxo);
    }
    std::stable_sort(candidates.begin(), candidates.end(), [](const Utxo& a, const Utxo& b) {
        return a.satoshis > b.satoshis;
    });

    EstimateOptions base_estimate = estimate;
    base_estimate.input_count = 0;
    size_t size = adapter_.estimated_size(draft, base_estimate);
    std::vector<Utxo> inputs;
    for (const auto& utxo : candidates) {
        if (size + input_size > max_size) {
            info.utxos_above_max_size++;
            info.amount_above_max_size += utxo.satoshis;
            continue;
        }
        size += input_size;
        inputs.push_back(utxo);
    }
    if (inputs.empty()) {
        return info;
    }

    draft.set_inputs(inputs);
    info.size = adapter_.estimated_size(draft, estimate);
    info.fee = adapter_.estimated_fee(draft, estimate);
    uint64_t total = sum_satoshis(inputs);
    if (total <= info.fee || total - info.fee < adapter_.dust_threshold(txp.network())) {
        logger_->debug("Send max: {} in inputs does not cover fee {} plus dust", total, info.fee);
        info.size = 0;
        info.fee = 0;
        return info;
    }
    info.amount = total - info.fee;
    if (opts.return_inputs) {
        info.inputs = std::move(inputs);
    }
    return info;
}

void CoinSelector::check_utxos_available(const std::vector<Utxo>& inputs, const std::vector<Utxo>& utxos) {
    std::set<std::string> available;
    for (const auto& utxo : utxos) {
        if (!utxo.locked) {
            available.insert(utxo.outpoint());
        }
    }
    for (const auto& input : inputs) {
        if (!available.count(input.outpoint())) {
            throw Error(Error::Code::UnavailableUtxos, "Input " + input.outpoint() + " is not available");
        }
    }
}

} // namespace cosign
