#include "verifier.hpp"
#include "address.hpp"
#include "chain_adapter.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "memo_cipher.hpp"
#include "message_signer.hpp"

#include <algorithm>
#include <set>

namespace cosign {

namespace {

// Empty text stands for "not set"
std::string decrypt_or_empty(const std::string& message, const std::string& key) {
    return message.empty() ? std::string() : MemoCipher::decrypt_message(message, key);
}

} // namespace

bool Verifier::check_address(const Credentials& credentials,
                             const AddressRecord& address,
                             std::span<const std::string> escrow_input_paths) {
    auto logger = get_logger();
    if (credentials.public_key_ring.size() != credentials.n) {
        logger->debug("Credentials are not complete");
        return false;
    }

    AddressRecord local;
    try {
        local = AddressDeriver::derive(address.type, credentials.xpubs(), address.path, credentials.m,
                                       credentials.chain, credentials.network, escrow_input_paths,
                                       credentials.hardware_source_public_key);
    } catch (const Error& e) {
        logger->debug("Cannot derive address at {}: {}", address.path, e.what());
        return false;
    }

    if (!AddressCodec::same_destination(local.address, address.address, credentials.chain, credentials.network)) {
        logger->debug("Address {} does not match local derivation {}", address.address, local.address);
        return false;
    }
    for (const auto& key : local.public_keys) {
        if (std::find(address.public_keys.begin(), address.public_keys.end(), key) == address.public_keys.end()) {
            logger->debug("Address {} is missing public key {}", address.address, key);
            return false;
        }
    }
    return true;
}

bool Verifier::check_copayers(const Credentials& credentials, const std::vector<Copayer>& copayers) {
    auto logger = get_logger();
    if (credentials.wallet_priv_key.empty()) {
        logger->debug("Credentials have no wallet private key");
        return false;
    }
    if (copayers.size() != credentials.n) {
        logger->debug("Missing public keys in server response");
        return false;
    }

    std::string wallet_pub_key;
    try {
        wallet_pub_key = credentials.wallet_public_key();
    } catch (const Error& e) {
        logger->debug("Invalid wallet private key: {}", e.what());
        return false;
    }

    std::set<std::string> seen;
    for (const auto& copayer : copayers) {
        if (!seen.insert(copayer.xpub).second) {
            logger->debug("Repeated public keys in server response");
            return false;
        }
        if (copayer.name.empty() || copayer.xpub.empty() || copayer.request_pub_key.empty() ||
            copayer.signature.empty()) {
            logger->debug("Missing copayer fields in server response");
            return false;
        }
        auto hash = MessageSigner::copayer_hash(copayer.name, copayer.xpub, copayer.request_pub_key);
        if (!MessageSigner::verify_message(hash, copayer.signature, wallet_pub_key)) {
            logger->debug("Invalid signatures in server response");
            return false;
        }
    }

    if (!seen.count(credentials.xpub)) {
        logger->debug("Server response does not contain our public keys");
        return false;
    }
    return true;
}

bool Verifier::check_proposal_creation(const ProposalArgs& args,
                                       const TxProposal& txp,
                                       const std::string& encrypting_key) {
    auto logger = get_logger();
    const auto& outputs = txp.outputs();
    if (outputs.size() != args.outputs.size()) {
        logger->debug("Output count differs: {} vs {}", outputs.size(), args.outputs.size());
        return false;
    }

    try {
        for (size_t i = 0; i < outputs.size(); ++i) {
            const auto& reported = outputs[i];
            const auto& requested = args.outputs[i];
            if (reported.to_address != requested.to_address || reported.script != requested.script ||
                reported.amount != requested.amount) {
                logger->debug("Output {} differs from the request", i);
                return false;
            }
            auto requested_memo = decrypt_or_empty(requested.message, encrypting_key);
            if (MemoCipher::decrypt_message_no_throw(reported.message, encrypting_key) != requested_memo) {
                logger->debug("Output {} memo differs from the request", i);
                return false;
            }
        }

        std::string change_address = txp.is_utxo() && txp.utxo_payload().change_address
                                          ? txp.utxo_payload().change_address->address
                                          : std::string();
        if (!args.change_address.empty() && change_address != args.change_address) {
            logger->debug("Change address differs from the request");
            return false;
        }
        if (args.fee_per_kb && txp.fee_per_kb() != *args.fee_per_kb) {
            logger->debug("Fee rate differs from the request");
            return false;
        }
        if (txp.pay_pro_url() != args.pay_pro_url) {
            logger->debug("Payment protocol URL differs from the request");
            return false;
        }

        auto requested_message = decrypt_or_empty(args.message, encrypting_key);
        if (MemoCipher::decrypt_message_no_throw(txp.message(), encrypting_key) != requested_message) {
            logger->debug("Message differs from the request");
            return false;
        }
    } catch (const Error& e) {
        logger->debug("Cannot decrypt requested text: {}", e.what());
        return false;
    }

    if ((!args.custom_data.is_null() || !txp.custom_data().is_null()) && args.custom_data != txp.custom_data()) {
        logger->debug("Custom data differs from the request");
        return false;
    }
    return true;
}

bool Verifier::check_tx_proposal_signature(const Credentials& credentials,
                                           const TxProposal& txp,
                                           const ChainAdapter& adapter) {
    auto logger = get_logger();
    if (txp.creator_id().empty() || credentials.public_key_ring.size() != credentials.n) {
        logger->debug("Proposal has no creator or credentials are not complete");
        return false;
    }

    auto creator = std::find_if(credentials.public_key_ring.begin(), credentials.public_key_ring.end(),
                                [&](const PublicKeyRingEntry& entry) {
                                    return MessageSigner::xpub_to_copayer_id(txp.chain(), entry.xpub) ==
                                           txp.creator_id();
                                });
    if (creator == credentials.public_key_ring.end()) {
        logger->debug("Creator {} is not in the key ring", txp.creator_id());
        return false;
    }

    // A one-time signing key must be authorized by the creator's extended key
    std::string signing_key = creator->request_pub_key;
    if (!txp.proposal_signature_pub_key().empty()) {
        if (!MessageSigner::verify_request_pub_key(txp.proposal_signature_pub_key(),
                                                   txp.proposal_signature_pub_key_sig(), creator->xpub)) {
            logger->debug("Proposal signing key is not authorized by the creator");
            return false;
        }
        signing_key = txp.proposal_signature_pub_key();
    }
    if (signing_key.empty()) {
        return false;
    }

    std::vector<std::string> hash;
    try {
        hash = txp.raw_unsigned(adapter);
    } catch (const Error& e) {
        logger->debug("Cannot rebuild the proposal transaction: {}", e.what());
        return false;
    }

    logger->debug("Regenerating & verifying tx proposal hash -> Hash: {} Signature: {}",
                  hash.empty() ? std::string() : hash.front(), txp.proposal_signature());

    bool verified = MessageSigner::verify_message(hash, txp.proposal_signature(), signing_key);
    if (!verified && !txp.pre_publish_raw().empty()) {
        verified = MessageSigner::verify_message(txp.pre_publish_raw(), txp.proposal_signature(), signing_key);
    }
    if (!verified) {
        logger->debug("Proposal signature does not verify");
        return false;
    }

    if (txp.is_utxo()) {
        const auto& payload = txp.utxo_payload();
        if (payload.change_address && !check_address(credentials, *payload.change_address)) {
            logger->debug("Change address does not belong to the wallet");
            return false;
        }
        if (payload.escrow_address) {
            auto paths = txp.input_paths();
            if (!check_address(credentials, *payload.escrow_address, paths)) {
                logger->debug("Escrow address does not belong to the wallet");
                return false;
            }
        }
    }
    return true;
}

bool Verifier::check_paypro(const TxProposal& txp, const PaymentRequest& request) {
    auto logger = get_logger();
    if (request.instructions.empty() || txp.outputs().empty()) {
        logger->debug("Payment request or proposal has no outputs");
        return false;
    }

    uint64_t requested = 0;
    for (const auto& instruction : request.instructions) {
        requested += instruction.amount;
    }
    if (txp.total_amount() != requested) {
        logger->debug("Proposal amount {} differs from the invoice {}", txp.total_amount(), requested);
        return false;
    }

    // Address texts are compared by destination so CashAddr and legacy forms match
    const auto& to_address = txp.outputs().front().to_address;
    const auto& invoice_address = request.instructions.front().to_address;
    bool same = is_utxo_chain(txp.chain())
                    ? AddressCodec::same_destination(to_address, invoice_address, txp.chain(), txp.network())
                    : to_address == invoice_address;
    if (!same) {
        logger->debug("Proposal destination {} differs from the invoice {}", to_address, invoice_address);
        return false;
    }

    // TODO: compare the proposal fee rate with request.required_fee_rate once
    // wallets agree on the rounding of fee-per-kb vs fee-per-byte rates
    return true;
}

bool Verifier::check_tx_proposal(const Credentials& credentials,
                                 const TxProposal& txp,
                                 const ChainAdapter& adapter,
                                 const PaymentRequest* paypro) {
    if (!check_tx_proposal_signature(credentials, txp, adapter)) {
        return false;
    }
    return !paypro || check_paypro(txp, *paypro);
}

} // namespace cosign
