#include "chain_adapter.hpp"
#include "account_chain_adapter.hpp"
#include "bip32_util.hpp"
#include "error.hpp"
#include "key_deserializer.hpp"
#include "logging.hpp"
#include "utxo_chain_adapter.hpp"

namespace cosign {

ChainAdapter::ChainAdapter(Chain chain, ServiceConfig config, std::shared_ptr<spdlog::logger> logger)
    : chain_(chain)
    , config_(std::move(config))
    , logger_(logger ? std::move(logger) : get_logger())
{}

Balance ChainAdapter::totalize_utxos(const std::vector<Utxo>& utxos) const {
    Balance balance;
    for (const auto& utxo : utxos) {
        balance.total_amount += utxo.satoshis;
        if (utxo.locked) {
            balance.locked_amount += utxo.satoshis;
        }
        if (utxo.confirmations > 0) {
            balance.total_confirmed_amount += utxo.satoshis;
            if (utxo.locked) {
                balance.locked_confirmed_amount += utxo.satoshis;
            }
        }
    }
    balance.available_amount = balance.total_amount - balance.locked_amount;
    balance.available_confirmed_amount = balance.total_confirmed_amount - balance.locked_confirmed_amount;
    return balance;
}

void ChainAdapter::add_signatures(ChainTransaction& tx,
                                  const std::vector<std::string>& input_paths,
                                  const std::vector<std::string>& signatures,
                                  const std::string& xpub,
                                  SigningMethod method) const {
    if (signatures.size() != tx.signature_slots()) {
        throw Error(Error::Code::SignatureCountMismatch);
    }

    auto parent = KeyDeserializer::from_base58(xpub);
    std::vector<std::vector<uint8_t>> keys;
    keys.reserve(signatures.size());
    for (size_t i = 0; i < signatures.size(); ++i) {
        keys.push_back(Bip32Util::get_child_key_at_path(parent, signing_path(input_paths, i)).public_key());
    }

    // Check everything before touching the transaction
    for (size_t i = 0; i < signatures.size(); ++i) {
        if (!tx.verify_signature(i, signatures[i], keys[i], method)) {
            logger_->debug("Signature {} of {} does not verify", i, signatures.size());
            throw Error(Error::Code::BadSignatures);
        }
    }
    for (size_t i = 0; i < signatures.size(); ++i) {
        tx.apply_signature(i, signatures[i], keys[i], method);
    }
}

std::unique_ptr<ChainAdapter> make_chain_adapter(Chain chain,
                                                 const ServiceConfig& config,
                                                 std::shared_ptr<AccountTxEncoder> encoder) {
    if (is_utxo_chain(chain)) {
        return std::make_unique<UtxoChainAdapter>(chain, config, get_logger());
    }
    if (!encoder) {
        throw Error(Error::Code::UnsupportedChain, "No transaction encoder for " + to_string(chain));
    }
    return std::make_unique<AccountChainAdapter>(chain, config, std::move(encoder), get_logger());
}

} // namespace cosign
