#include "proposal_codec.hpp"
#include "error.hpp"
#include "wallet.hpp"

#include <algorithm>
#include <fstream>

namespace cosign {

namespace {

using json = nlohmann::json;

json address_to_json(const AddressRecord& record) {
    return json{
        {"address", record.address},
        {"path", record.path},
        {"publicKeys", record.public_keys},
        {"type", to_string(record.type)}
    };
}

AddressRecord address_from_json(const json& j) {
    AddressRecord record;
    record.address = j.at("address").get<std::string>();
    record.path = j.value("path", "");
    record.public_keys = j.value("publicKeys", std::vector<std::string>{});
    auto type = script_type_from_string(j.value("type", "P2PKH"));
    if (!type) {
        throw Error(Error::Code::ScriptType, "Unknown address type " + j.value("type", ""));
    }
    record.type = *type;
    return record;
}

json output_to_json(const TxOutput& output) {
    json j{{"amount", output.amount}};
    if (!output.to_address.empty()) {
        j["toAddress"] = output.to_address;
    }
    if (!output.script.empty()) {
        j["script"] = output.script;
    }
    if (!output.message.empty()) {
        j["message"] = output.message;
    }
    if (!output.data.empty()) {
        j["data"] = output.data;
    }
    if (output.gas_limit) {
        j["gasLimit"] = *output.gas_limit;
    }
    if (output.tag) {
        j["tag"] = *output.tag;
    }
    return j;
}

TxOutput output_from_json(const json& j) {
    TxOutput output;
    output.amount = j.at("amount").get<uint64_t>();
    output.to_address = j.value("toAddress", "");
    output.script = j.value("script", "");
    output.message = j.value("message", "");
    output.data = j.value("data", "");
    if (j.contains("gasLimit") && !j["gasLimit"].is_null()) {
        output.gas_limit = j["gasLimit"].get<uint64_t>();
    }
    if (j.contains("tag") && !j["tag"].is_null()) {
        output.tag = j["tag"].get<uint32_t>();
    }
    return output;
}

json action_to_json(const VoteAction& action) {
    json j{
        {"copayerId", action.copayer_id},
        {"type", action.type == ActionType::Accept ? "accept" : "reject"},
        {"createdOn", action.created_on}
    };
    if (!action.signatures.empty()) {
        j["signatures"] = action.signatures;
    }
    if (!action.xpub.empty()) {
        j["xpub"] = action.xpub;
    }
    if (!action.comment.empty()) {
        j["comment"] = action.comment;
    }
    return j;
}

VoteAction action_from_json(const json& j) {
    VoteAction action;
    action.copayer_id = j.at("copayerId").get<std::string>();
    auto type = j.at("type").get<std::string>();
    if (type != "accept" && type != "reject") {
        throw Error(Error::Code::InvalidArgument, "Unknown action type " + type);
    }
    action.type = type == "accept" ? ActionType::Accept : ActionType::Reject;
    action.signatures = j.value("signatures", std::vector<std::string>{});
    action.xpub = j.value("xpub", "");
    action.comment = j.value("comment", "");
    action.created_on = j.value("createdOn", int64_t{0});
    return action;
}

void payload_to_json(const ChainPayload& payload, json& j) {
    if (const auto* utxo = std::get_if<UtxoPayload>(&payload)) {
        j["inputs"] = utxo->inputs;
        j["changeAddress"] = utxo->change_address ? address_to_json(*utxo->change_address) : json();
        if (utxo->escrow_address) {
            j["escrowAddress"] = address_to_json(*utxo->escrow_address);
        }
        j["instantAcceptanceEscrow"] = utxo->instant_acceptance_escrow;
        j["enableRBF"] = utxo->enable_rbf;
        j["replaceTxByFee"] = utxo->replace_tx_by_fee;
        j["excludeUnconfirmedUtxos"] = utxo->exclude_unconfirmed_utxos;
        j["lockUntilBlockHeight"] = utxo->lock_until_block_height;
    } else if (const auto* evm = std::get_if<EvmPayload>(&payload)) {
        j["nonce"] = evm->nonce;
        j["gasPrice"] = evm->gas_price;
        j["maxGasFee"] = evm->max_gas_fee;
        j["priorityGasFee"] = evm->priority_gas_fee;
        j["gasLimit"] = evm->gas_limit;
        j["txType"] = evm->tx_type;
        j["from"] = evm->from;
        j["tokenAddress"] = evm->token_address;
        j["multisigContractAddress"] = evm->multisig_contract_address;
        j["multisendContractAddress"] = evm->multisend_contract_address;
        j["isTokenSwap"] = evm->is_token_swap;
    } else if (const auto* xrp = std::get_if<XrpPayload>(&payload)) {
        j["destinationTag"] = xrp->destination_tag ? json(*xrp->destination_tag) : json();
        j["invoiceID"] = xrp->invoice_id;
    } else if (const auto* sol = std::get_if<SolPayload>(&payload)) {
        j["blockHash"] = sol->block_hash;
        j["blockHeight"] = sol->block_height;
        j["nonceAddress"] = sol->nonce_address;
        j["category"] = sol->category;
        j["computeUnits"] = sol->compute_units;
        j["priorityFee"] = sol->priority_fee;
        j["memo"] = sol->memo;
        j["fromAta"] = sol->from_ata;
        j["decimals"] = sol->decimals;
        j["space"] = sol->space;
    }
}

ChainPayload payload_from_json(const json& j, Chain chain) {
    if (is_utxo_chain(chain)) {
        UtxoPayload utxo;
        utxo.inputs = j.value("inputs", std::vector<Utxo>{});
        if (j.contains("changeAddress") && j["changeAddress"].is_object()) {
            utxo.change_address = address_from_json(j["changeAddress"]);
        }
        if (j.contains("escrowAddress") && j["escrowAddress"].is_object()) {
            utxo.escrow_address = address_from_json(j["escrowAddress"]);
        }
        utxo.instant_acceptance_escrow = j.value("instantAcceptanceEscrow", uint64_t{0});
        utxo.enable_rbf = j.value("enableRBF", false);
        utxo.replace_tx_by_fee = j.value("replaceTxByFee", false);
        utxo.exclude_unconfirmed_utxos = j.value("excludeUnconfirmedUtxos", false);
        utxo.lock_until_block_height = j.value("lockUntilBlockHeight", 0u);
        return utxo;
    }
    if (is_evm_chain(chain)) {
        EvmPayload evm;
        evm.nonce = j.value("nonce", uint64_t{0});
        evm.gas_price = j.value("gasPrice", uint64_t{0});
        evm.max_gas_fee = j.value("maxGasFee", uint64_t{0});
        evm.priority_gas_fee = j.value("priorityGasFee", uint64_t{0});
        evm.gas_limit = j.value("gasLimit", uint64_t{0});
        evm.tx_type = j.value("txType", 0u);
        evm.from = j.value("from", "");
        evm.token_address = j.value("tokenAddress", "");
        evm.multisig_contract_address = j.value("multisigContractAddress", "");
        evm.multisend_contract_address = j.value("multisendContractAddress", "");
        evm.is_token_swap = j.value("isTokenSwap", false);
        return evm;
    }
    if (chain == Chain::Xrp) {
        XrpPayload xrp;
        if (j.contains("destinationTag") && !j["destinationTag"].is_null()) {
            xrp.destination_tag = j["destinationTag"].get<uint32_t>();
        }
        xrp.invoice_id = j.value("invoiceID", "");
        return xrp;
    }
    SolPayload sol;
    sol.block_hash = j.value("blockHash", "");
    sol.block_height = j.value("blockHeight", uint64_t{0});
    sol.nonce_address = j.value("nonceAddress", "");
    sol.category = j.value("category", "");
    sol.compute_units = j.value("computeUnits", uint64_t{0});
    sol.priority_fee = j.value("priorityFee", uint64_t{0});
    sol.memo = j.value("memo", "");
    sol.from_ata = j.value("fromAta", "");
    sol.decimals = j.value("decimals", 0u);
    sol.space = j.value("space", uint64_t{0});
    return sol;
}

} // namespace

nlohmann::json ProposalCodec::to_json(const TxProposal& txp) {
    json outputs = json::array();
    for (const auto& output : txp.outputs_) {
        outputs.push_back(output_to_json(output));
    }
    json actions = json::array();
    for (const auto& action : txp.actions_) {
        actions.push_back(action_to_json(action));
    }

    json j{
        {"id", txp.id_},
        {"version", txp.version_},
        {"status", to_string(txp.status_)},
        {"chain", to_string(txp.chain_)},
        {"network", to_string(txp.network_)},
        {"walletId", txp.wallet_id_},
        {"creatorId", txp.creator_id_},
        {"creatorName", txp.creator_name_},
        {"createdOn", txp.created_on_},
        {"walletM", txp.wallet_m_},
        {"walletN", txp.wallet_n_},
        {"requiredSignatures", txp.required_signatures_},
        {"requiredRejections", txp.required_rejections_},
        {"addressType", to_string(txp.address_type_)},
        {"outputs", outputs},
        {"amount", txp.total_amount()},
        {"fee", txp.fee_ ? json(*txp.fee_) : json()},
        {"feePerKb", txp.fee_per_kb_},
        {"outputOrder", txp.output_order_},
        {"actions", actions},
        {"message", txp.message_},
        {"payProUrl", txp.pay_pro_url_},
        {"customData", txp.custom_data_},
        {"signingMethod", to_string(txp.signing_method_)},
        {"proposalSignature", txp.proposal_signature_},
        {"multiTx", txp.multi_tx_},
        {"txid", txp.txid_},
        {"broadcastedOn", txp.broadcasted_on_}
    };
    if (!txp.proposal_signature_pub_key_.empty()) {
        j["proposalSignaturePubKey"] = txp.proposal_signature_pub_key_;
        j["proposalSignaturePubKeySig"] = txp.proposal_signature_pub_key_sig_;
    }
    if (!txp.pre_publish_raw_.empty()) {
        j["prePublishRaw"] = txp.pre_publish_raw_;
    }
    if (!txp.txids_.empty()) {
        j["txids"] = txp.txids_;
    }
    // A single transaction is stored as its hex text
    if (txp.raw_.size() == 1) {
        j["raw"] = txp.raw_.front();
    } else if (!txp.raw_.empty()) {
        j["raw"] = txp.raw_;
    }

    payload_to_json(txp.payload_, j);
    return j;
}

TxProposal ProposalCodec::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw Error(Error::Code::InvalidArgument, "Proposal must be a JSON object");
    }
    if (!j.contains("version") || !j["version"].is_number_unsigned() ||
        j["version"].get<uint32_t>() < defaults::MIN_PROPOSAL_VERSION) {
        throw Error(Error::Code::UnsupportedFormat);
    }

    try {
        TxProposal txp;
        txp.version_ = j["version"].get<uint32_t>();

        auto chain = chain_from_string(j.at("chain").get<std::string>());
        if (!chain) {
            throw Error(Error::Code::InvalidArgument, "Unknown chain " + j["chain"].get<std::string>());
        }
        auto network = network_from_string(j.at("network").get<std::string>());
        if (!network) {
            throw Error(Error::Code::InvalidNetwork);
        }
        chain_params(*chain, *network);
        auto status = proposal_status_from_string(j.at("status").get<std::string>());
        if (!status) {
            throw Error(Error::Code::InvalidArgument, "Unknown proposal status " + j["status"].get<std::string>());
        }
        auto signing_method = signing_method_from_string(j.value("signingMethod", "ecdsa"));
        if (!signing_method) {
            throw Error(Error::Code::InvalidArgument, "Unknown signing method");
        }

        txp.id_ = j.at("id").get<std::string>();
        txp.chain_ = *chain;
        txp.network_ = *network;
        txp.status_ = *status;
        txp.signing_method_ = *signing_method;
        txp.wallet_id_ = j.value("walletId", "");
        txp.creator_id_ = j.at("creatorId").get<std::string>();
        txp.creator_name_ = j.value("creatorName", "");
        txp.created_on_ = j.value("createdOn", int64_t{0});
        txp.wallet_m_ = j.at("walletM").get<uint32_t>();
        txp.wallet_n_ = j.at("walletN").get<uint32_t>();
        Wallet::check_params(txp.wallet_m_, txp.wallet_n_);
        // The quorum follows from the wallet parameters; a record cannot relax it
        txp.required_signatures_ = txp.wallet_m_;
        txp.required_rejections_ = std::min(txp.wallet_m_, txp.wallet_n_ - txp.wallet_m_ + 1);
        if (j.value("requiredSignatures", txp.required_signatures_) != txp.required_signatures_ ||
            j.value("requiredRejections", txp.required_rejections_) != txp.required_rejections_) {
            throw Error(Error::Code::InvalidArgument, "Proposal quorum does not match walletM/walletN");
        }

        auto address_type = script_type_from_string(
            j.value("addressType", txp.wallet_n_ > 1 ? "P2SH" : "P2PKH"));
        if (!address_type) {
            throw Error(Error::Code::ScriptType, "Unknown address type");
        }
        txp.address_type_ = *address_type;

        for (const auto& output : j.at("outputs")) {
            txp.outputs_.push_back(output_from_json(output));
        }
        if (j.contains("fee") && !j["fee"].is_null()) {
            txp.fee_ = j["fee"].get<uint64_t>();
        }
        txp.fee_per_kb_ = j.value("feePerKb", uint64_t{0});
        txp.output_order_ = j.value("outputOrder", std::vector<uint32_t>{});
        for (const auto& action : j.value("actions", json::array())) {
            txp.actions_.push_back(action_from_json(action));
        }
        txp.message_ = j.value("message", "");
        txp.pay_pro_url_ = j.value("payProUrl", "");
        txp.custom_data_ = j.value("customData", json());
        txp.proposal_signature_ = j.value("proposalSignature", "");
        txp.proposal_signature_pub_key_ = j.value("proposalSignaturePubKey", "");
        txp.proposal_signature_pub_key_sig_ = j.value("proposalSignaturePubKeySig", "");
        txp.pre_publish_raw_ = j.value("prePublishRaw", "");
        txp.multi_tx_ = j.value("multiTx", false);
        txp.txid_ = j.value("txid", "");
        txp.txids_ = j.value("txids", std::vector<std::string>{});
        if (j.contains("raw")) {
            if (j["raw"].is_string()) {
                txp.raw_ = {j["raw"].get<std::string>()};
            } else if (j["raw"].is_array()) {
                txp.raw_ = j["raw"].get<std::vector<std::string>>();
            }
        }
        txp.broadcasted_on_ = j.value("broadcastedOn", int64_t{0});
        txp.payload_ = payload_from_json(j, txp.chain_);
        return txp;
    } catch (const nlohmann::json::exception& e) {
        throw Error(Error::Code::InvalidArgument, std::string("Malformed proposal record: ") + e.what());
    }
}

TxProposal ProposalCodec::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw Error(Error::Code::InvalidArgument, "Cannot open proposal file: " + path);
    }
    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw Error(Error::Code::InvalidArgument, "Proposal file is not valid JSON: " + path);
    }
    return from_json(j);
}

} // namespace cosign
