#include "utxo_chain_adapter.hpp"
#include "address.hpp"
#include "ecdsa.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "schnorr.hpp"
#include "script.hpp"
#include "tx_proposal.hpp"
#include "wallet.hpp"

#include <algorithm>
#include <cmath>

namespace cosign {

namespace {

constexpr size_t SIGNATURE_SIZE = 72 + 1; // DER with hash type, plus the push opcode
constexpr size_t PUBKEY_SIZE = 33 + 1;
constexpr size_t SCHNORR_SIGNATURE_SIZE = 64;

std::array<uint8_t, 32> txid_to_internal(const std::string& txid) {
    auto bytes = HexUtils::decode(txid);
    if (bytes.size() != 32) {
        throw Error(Error::Code::InvalidArgument, "Input txid must be 32 bytes: " + txid);
    }
    std::array<uint8_t, 32> internal{};
    std::reverse_copy(bytes.begin(), bytes.end(), internal.begin());
    return internal;
}

std::vector<std::vector<uint8_t>> decode_keys(const std::vector<std::string>& keys) {
    std::vector<std::vector<uint8_t>> decoded;
    decoded.reserve(keys.size());
    for (const auto& key : keys) {
        decoded.push_back(HexUtils::decode(key));
    }
    return decoded;
}

// Locking script a single key pays to for the given script type
std::vector<uint8_t> single_key_script(ScriptType type, std::span<const uint8_t> public_key) {
    switch (type) {
        case ScriptType::P2PKH:
            return Script::p2pkh(HashUtils::hash160(public_key));
        case ScriptType::P2WPKH:
            return Script::p2wpkh(HashUtils::hash160(public_key));
        case ScriptType::P2TR:
            return Script::p2tr(Schnorr::taproot_output_key(public_key));
        default:
            throw Error(Error::Code::ScriptType, "Not a single key script type");
    }
}

bool is_multisig(ScriptType type) {
    return type == ScriptType::P2SH || type == ScriptType::P2WSH;
}

} // namespace

UtxoTransaction::UtxoTransaction(Transaction tx, std::vector<InputSigning> signing, uint32_t fork_id)
    : tx_(std::move(tx))
    , signing_(std::move(signing))
    , fork_id_(fork_id)
{}

// Unsigned serialization: empty scriptSigs and no witness section
std::vector<std::string> UtxoTransaction::unsigned_serializations() const {
    return {HexUtils::encode(tx_.serialize(false))};
}

Hash256 UtxoTransaction::sighash(size_t index) const {
    const auto& input = tx_.inputs.at(index);
    const auto& signing = signing_.at(index);

    if (signing.type == ScriptType::P2TR) {
        return Sighash::taproot_key_path(tx_, index, SIGHASH_DEFAULT);
    }

    // P2WPKH signs with the P2PKH script of its key hash as script code
    std::vector<uint8_t> script_code;
    if (is_multisig(signing.type)) {
        script_code = signing.script;
    } else if (signing.type == ScriptType::P2WPKH) {
        if (input.prev_script.size() != PUBKEY_HASH_SIZE + 2) {
            throw Error(Error::Code::ScriptType, "Input is not a P2WPKH output");
        }
        script_code = Script::p2pkh(std::span<const uint8_t>(input.prev_script).subspan(2, PUBKEY_HASH_SIZE));
    } else {
        script_code = input.prev_script;
    }

    // Replay-protected chains use the BIP143 digest for every input
    if (fork_id_ != 0 || signing.type == ScriptType::P2WPKH || signing.type == ScriptType::P2WSH) {
        return Sighash::segwit_v0(tx_, index, script_code, input.amount, hash_type());
    }
    return Sighash::legacy(tx_, index, script_code, hash_type());
}

bool UtxoTransaction::key_matches(size_t index, std::span<const uint8_t> public_key) const {
    const auto& signing = signing_.at(index);
    if (is_multisig(signing.type)) {
        return std::any_of(signing.public_keys.begin(), signing.public_keys.end(), [&](const auto& key) {
            return std::equal(key.begin(), key.end(), public_key.begin(), public_key.end());
        });
    }
    try {
        return single_key_script(signing.type, public_key) == tx_.inputs.at(index).prev_script;
    } catch (const Error&) {
        return false;
    }
}

bool UtxoTransaction::verify_signature(size_t slot,
                                       const std::string& signature,
                                       std::span<const uint8_t> public_key,
                                       SigningMethod method) const {
    if (slot >= signing_.size() || !HexUtils::is_hex(signature) || !key_matches(slot, public_key)) {
        return false;
    }
    auto sig = HexUtils::decode(signature);

    try {
        auto digest = sighash(slot);
        if (signing_[slot].type == ScriptType::P2TR) {
            if (method != SigningMethod::Schnorr || sig.size() != SCHNORR_SIGNATURE_SIZE) {
                return false;
            }
            auto output_key = Schnorr::taproot_output_key(public_key);
            return Schnorr::verify(output_key, digest, sig);
        }
        return method == SigningMethod::Ecdsa && Ecdsa::verify(public_key, digest, sig);
    } catch (const Error&) {
        return false;
    }
}

void UtxoTransaction::apply_signature(size_t slot,
                                      const std::string& signature,
                                      std::span<const uint8_t> public_key,
                                      SigningMethod method) {
    auto& signing = signing_.at(slot);
    auto sig = HexUtils::decode(signature);
    if (method == SigningMethod::Ecdsa) {
        sig.push_back(hash_type());
    }
    signing.signatures[std::vector<uint8_t>(public_key.begin(), public_key.end())] = std::move(sig);
}

bool UtxoTransaction::is_fully_signed() const {
    return std::all_of(signing_.begin(), signing_.end(), [](const InputSigning& signing) {
        return signing.signatures.size() >= signing.required;
    });
}

Transaction UtxoTransaction::finalized() const {
    Transaction tx = tx_;

    for (size_t i = 0; i < tx.inputs.size(); ++i) {
        const auto& signing = signing_[i];
        auto& input = tx.inputs[i];
        if (signing.signatures.empty()) {
            continue;
        }

        switch (signing.type) {
            case ScriptType::P2PKH: {
                const auto& [key, sig] = *signing.signatures.begin();
                Script::append_push(input.script_sig, sig);
                Script::append_push(input.script_sig, key);
                break;
            }
            case ScriptType::P2WPKH: {
                const auto& [key, sig] = *signing.signatures.begin();
                input.witness = {sig, key};
                break;
            }
            case ScriptType::P2TR:
                input.witness = {signing.signatures.begin()->second};
                break;
            case ScriptType::P2SH:
            case ScriptType::P2WSH: {
                // CHECKMULTISIG expects signatures in the order of the keys in
                // the script, after a dummy element for its off-by-one pop
                std::vector<std::vector<uint8_t>> sigs;
                for (const auto& key : signing.public_keys) {
                    auto it = signing.signatures.find(key);
                    if (it != signing.signatures.end() && sigs.size() < signing.required) {
                        sigs.push_back(it->second);
                    }
                }
                if (signing.type == ScriptType::P2SH) {
                    input.script_sig.push_back(OP_0);
                    for (const auto& sig : sigs) {
                        Script::append_push(input.script_sig, sig);
                    }
                    Script::append_push(input.script_sig, signing.script);
                } else {
                    input.witness.push_back({});
                    input.witness.insert(input.witness.end(), sigs.begin(), sigs.end());
                    input.witness.push_back(signing.script);
                }
                break;
            }
        }
    }
    return tx;
}

std::vector<std::string> UtxoTransaction::serialize() const {
    return {HexUtils::encode(finalized().serialize())};
}

std::vector<std::string> UtxoTransaction::txids() const {
    return {finalized().txid_hex()};
}

UtxoChainAdapter::UtxoChainAdapter(Chain chain, ServiceConfig config, std::shared_ptr<spdlog::logger> logger)
    : ChainAdapter(chain, std::move(config), std::move(logger))
{}

uint64_t UtxoChainAdapter::dust_threshold(Network network) const {
    return std::max(config_.min_output_amount, chain_params(chain_, network).dust_amount);
}

// https://bitcoin.stackexchange.com/questions/88226/how-to-calculate-the-size-of-multisig-transaction
size_t UtxoChainAdapter::estimated_size_for_single_input(const TxProposal& txp, const EstimateOptions& opts) const {
    size_t margin = opts.conservative ? config_.input_size_estimation_margin : 0;
    size_t m = txp.required_signatures();
    size_t n = txp.wallet_n();

    switch (txp.address_type()) {
        case ScriptType::P2PKH:
            return 148 + margin;
        case ScriptType::P2WPKH:
            return 69 + margin; // vsize
        case ScriptType::P2TR:
            return 58 + margin; // vsize
        case ScriptType::P2WSH: {
            double vsize = 32 + 4 + 1 + (5 + m * 74 + n * 34) / 4.0 + 4;
            return static_cast<size_t>(std::ceil(vsize)) + margin;
        }
        case ScriptType::P2SH:
            break;
    }
    return 46 + m * SIGNATURE_SIZE + n * PUBKEY_SIZE + margin;
}

size_t UtxoChainAdapter::estimated_size_for_single_output(const std::string& address, Network network) const {
    size_t script_size = DEFAULT_OUTPUT_SCRIPT_SIZE;
    if (!address.empty()) {
        try {
            switch (AddressCodec::parse(address, chain_, network).type) {
                case ScriptType::P2PKH: script_size = 25; break;
                case ScriptType::P2SH: script_size = 23; break;
                case ScriptType::P2WPKH: script_size = 22; break;
                case ScriptType::P2WSH: script_size = 34; break;
                case ScriptType::P2TR: script_size = DEFAULT_OUTPUT_SCRIPT_SIZE; break;
            }
        } catch (const Error&) {
            logger_->debug("Unknown output address type for {}", address);
        }
    }
    return script_size + VALUE_AND_LENGTH_SIZE;
}

size_t UtxoChainAdapter::estimated_size(const TxProposal& txp, const EstimateOptions& opts) const {
    const auto& payload = txp.utxo_payload();
    size_t input_size = estimated_size_for_single_input(txp, opts);
    size_t input_count = opts.input_count.value_or(payload.inputs.size());

    size_t outputs_size = 0;
    for (const auto& output : txp.outputs()) {
        if (!output.script.empty()) {
            outputs_size += output.script.size() / 2 + VALUE_AND_LENGTH_SIZE;
        } else {
            outputs_size += estimated_size_for_single_output(output.to_address, txp.network());
        }
    }
    if (payload.change_address) {
        outputs_size += estimated_size_for_single_output(payload.change_address->address, txp.network());
    }
    if (payload.instant_acceptance_escrow > 0) {
        outputs_size += 23 + VALUE_AND_LENGTH_SIZE;
    }

    // No outputs yet (send max): assume one default output
    if (outputs_size == 0) {
        outputs_size = DEFAULT_OUTPUT_SCRIPT_SIZE + VALUE_AND_LENGTH_SIZE;
    }

    size_t size = TX_OVERHEAD + input_size * input_count + outputs_size;
    if (!opts.conservative) {
        return size;
    }
    return static_cast<size_t>(std::ceil(static_cast<double>(size) * (1.0 + config_.size_estimation_margin)));
}

uint64_t UtxoChainAdapter::estimated_fee(const TxProposal& txp, const EstimateOptions& opts) const {
    const auto& payload = txp.utxo_payload();

    // A complete transaction without change pays whatever is left over
    if (!payload.inputs.empty() && !payload.change_address && !txp.outputs().empty()) {
        uint64_t total_inputs = 0;
        for (const auto& input : payload.inputs) {
            total_inputs += input.satoshis;
        }
        uint64_t total_outputs = txp.total_amount();
        if (total_outputs > 0 && total_inputs > total_outputs) {
            return total_inputs - total_outputs;
        }
    }

    auto size = estimated_size(txp, opts);
    auto fee = static_cast<uint64_t>(std::ceil(static_cast<double>(txp.fee_per_kb()) * size / 1000.0));
    return std::max(fee, chain_params(chain_, txp.network()).dust_amount);
}

std::unique_ptr<UtxoTransaction> UtxoChainAdapter::build_utxo_transaction(const TxProposal& txp, bool signed_tx) const {
    if (txp.multi_tx()) {
        throw Error(Error::Code::MultiTxUnsupported);
    }
    if (!txp.fee()) {
        throw Error(Error::Code::InvalidArgument, "Proposal has no fee");
    }

    const auto& params = chain_params(chain_, txp.network());
    const auto& payload = txp.utxo_payload();
    uint64_t fee = *txp.fee();

    Transaction tx;
    if (txp.version() <= 3) {
        tx.version = 1;
    } else {
        tx.version = 2;
        tx.locktime = payload.lock_until_block_height;
    }

    std::vector<UtxoTransaction::InputSigning> signing;
    for (const auto& utxo : payload.inputs) {
        UtxoTransaction::InputSigning input_signing;
        input_signing.type = txp.address_type();
        input_signing.required = txp.required_signatures();

        TxIn input;
        input.prev_txid = txid_to_internal(utxo.txid);
        input.prev_vout = utxo.vout;
        input.amount = utxo.satoshis;
        input.sequence = payload.enable_rbf ? SEQUENCE_RBF : SEQUENCE_FINAL;

        if (is_multisig(input_signing.type)) {
            if (utxo.public_keys.empty()) {
                throw Error(Error::Code::InvalidArgument, "Inputs should include public keys: " + utxo.outpoint());
            }
            input_signing.public_keys = decode_keys(utxo.public_keys);
            std::sort(input_signing.public_keys.begin(), input_signing.public_keys.end());
            input_signing.script = Script::multisig(input_signing.required, input_signing.public_keys);
        }

        // Locking script of the spent output: as reported, or rebuilt from the
        // address keys, or decoded from the address
        if (!utxo.script_pubkey.empty()) {
            input.prev_script = HexUtils::decode(utxo.script_pubkey);
        } else if (input_signing.type == ScriptType::P2SH) {
            input.prev_script = Script::p2sh(HashUtils::hash160(input_signing.script));
        } else if (input_signing.type == ScriptType::P2WSH) {
            input.prev_script = Script::p2wsh(input_signing.script);
        } else if (!utxo.public_keys.empty()) {
            input.prev_script = single_key_script(input_signing.type, HexUtils::decode(utxo.public_keys.front()));
        } else {
            input.prev_script = AddressCodec::output_script(utxo.address, chain_, txp.network());
        }

        tx.inputs.push_back(std::move(input));
        signing.push_back(std::move(input_signing));
    }

    for (const auto& output : txp.outputs()) {
        if (output.script.empty() && output.to_address.empty()) {
            throw Error(Error::Code::InvalidArgument, "Output should have either toAddress or script specified");
        }
        TxOut out;
        out.amount = output.amount;
        out.script = output.script.empty()
                         ? AddressCodec::output_script(output.to_address, chain_, txp.network())
                         : HexUtils::decode(output.script);
        tx.outputs.push_back(std::move(out));
    }

    // The escrow output carries the merchant's escrow plus the miner fee
    if (payload.instant_acceptance_escrow > 0 && payload.escrow_address) {
        tx.outputs.push_back(TxOut{
            payload.instant_acceptance_escrow + fee,
            AddressCodec::output_script(payload.escrow_address->address, chain_, txp.network())
        });
    }

    if (payload.change_address) {
        uint64_t spent = tx.output_total() + fee;
        if (tx.input_total() < spent) {
            throw Error(Error::Code::NotEnoughInputs);
        }
        uint64_t change = tx.input_total() - spent;
        // Change at or below the dust threshold is left to the miner
        if (change > dust_threshold(txp.network())) {
            tx.outputs.push_back(TxOut{
                change,
                AddressCodec::output_script(payload.change_address->address, chain_, txp.network())
            });
        }
    }

    // Shuffle outputs for privacy, ignoring slots that were not realized
    if (tx.outputs.size() > 1) {
        std::vector<uint32_t> order;
        for (uint32_t index : txp.output_order()) {
            if (index < tx.outputs.size()) {
                order.push_back(index);
            }
        }
        if (order.size() != tx.outputs.size()) {
            throw Error(Error::Code::InvalidArgument, "Output order does not match the outputs");
        }
        std::vector<TxOut> sorted;
        sorted.reserve(order.size());
        for (uint32_t index : order) {
            sorted.push_back(tx.outputs[index]);
        }
        tx.outputs = std::move(sorted);
    }

    uint64_t total_inputs = tx.input_total();
    uint64_t total_outputs = tx.output_total();
    if (total_inputs == 0 || total_outputs == 0 || total_inputs < total_outputs) {
        throw Error(Error::Code::NotEnoughInputs);
    }
    if (total_inputs - total_outputs > params.max_tx_fee) {
        throw Error(Error::Code::FeeTooHigh);
    }

    auto utxo_tx = std::make_unique<UtxoTransaction>(std::move(tx), std::move(signing), params.sighash_fork_id);

    if (signed_tx) {
        auto paths = txp.input_paths();
        for (const auto& action : txp.current_signatures()) {
            add_signatures(*utxo_tx, paths, action.signatures, action.xpub, txp.signing_method());
        }
    }
    return utxo_tx;
}

std::unique_ptr<ChainTransaction> UtxoChainAdapter::build_transaction(const TxProposal& txp, bool signed_tx) const {
    return build_utxo_transaction(txp, signed_tx);
}

uint64_t UtxoChainAdapter::check_tx(const TxProposal& txp) const {
    EstimateOptions conservative;
    conservative.conservative = true;
    if (estimated_size(txp, conservative) > config_.max_tx_size_in_kb * 1000) {
        throw Error(Error::Code::TxMaxSizeExceeded);
    }

    auto paths = txp.input_paths();
    if (paths.empty() || std::any_of(paths.begin(), paths.end(), [](const auto& p) { return p.empty(); })) {
        throw Error(Error::Code::NoInputPaths);
    }

    auto utxo_tx = build_utxo_transaction(txp, false);
    const auto& tx = utxo_tx->transaction();

    // A data carrier output disables the dust check for the whole transaction
    bool has_op_return = std::any_of(txp.outputs().begin(), txp.outputs().end(), [](const TxOutput& o) {
        return o.script.starts_with("6a");
    });
    if (!has_op_return) {
        uint64_t dust = dust_threshold(txp.network());
        for (const auto& output : tx.outputs) {
            if (output.amount < dust) {
                throw Error(Error::Code::DustAmount);
            }
        }
    }

    uint64_t actual_fee = tx.input_total() - tx.output_total();
    if (actual_fee < txp.fee().value_or(0)) {
        throw FundsError(Error::Code::InsufficientFundsForFee, *txp.fee(),
                         "Insufficient funds for fee. RequiredFee: " + std::to_string(*txp.fee()));
    }

    logger_->debug("Built transaction with {} inputs, {} outputs, fee {}",
                   tx.inputs.size(), tx.outputs.size(), actual_fee);
    return actual_fee;
}

void UtxoChainAdapter::validate_address(const Wallet& wallet, const std::string& address) const {
    AddressCodec::parse(address, wallet.chain(), wallet.network());
}

void UtxoChainAdapter::check_dust(const TxOutput& output, Network network) const {
    if (output.amount < dust_threshold(network)) {
        throw Error(Error::Code::DustAmount);
    }
}

void UtxoChainAdapter::check_script_output(const TxOutput& output) const {
    if (output.script.empty()) {
        return;
    }
    if (!HexUtils::is_hex(output.script)) {
        throw Error(Error::Code::ScriptType);
    }
    if (!output.script.starts_with("6a")) {
        throw Error(Error::Code::ScriptOpReturn);
    }
    if (output.amount != 0) {
        throw Error(Error::Code::ScriptOpReturnAmount);
    }
}

std::string UtxoChainAdapter::signing_path(const std::vector<std::string>& input_paths, size_t slot) const {
    if (slot >= input_paths.size() || input_paths[slot].empty()) {
        throw Error(Error::Code::NoInputPaths);
    }
    return input_paths[slot];
}

} // namespace cosign
