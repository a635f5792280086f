// cosign-tool
//
// Operator front end of the cosign library. Every command works on JSON
// files so the same records the service stores can be inspected offline.
//
// Commands:
// - select <utxos.json> <amount> <feePerKb>: runs coin selection over a UTXO
//   set and prints the chosen inputs and fee
// - verify <credentials.json> <proposal.json> [--paypro invoice.json]:
//   re-checks a proposal against the copayer's own credentials
// - derive <credentials.json> <path>: prints the wallet address at a path
//
// All commands accept --config <file> with a ServiceConfig document.

#include "address_deriver.hpp"
#include "chain_adapter.hpp"
#include "coin_selector.hpp"
#include "config.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "proposal_codec.hpp"
#include "tx_proposal.hpp"
#include "verifier.hpp"
#include "wallet.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace cosign;

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  cosign-tool select <utxos.json> <amount> <feePerKb> [--config file]\n"
              << "  cosign-tool verify <credentials.json> <proposal.json> [--paypro invoice.json] [--config file]\n"
              << "  cosign-tool derive <credentials.json> <path> [--config file]\n";
}

nlohmann::json load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw Error(Error::Code::InvalidArgument, "Cannot open file: " + path);
    }
    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw Error(Error::Code::InvalidArgument, "Not valid JSON: " + path);
    }
    return j;
}

uint64_t parse_amount(const std::string& text) {
    size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != text.size() || text.front() == '-') {
        throw Error(Error::Code::InvalidArgument, "Not an amount: " + text);
    }
    return value;
}

// Positional arguments plus "--name value" options
struct Arguments {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                throw Error(Error::Code::InvalidArgument, "Missing value for " + arg);
            }
            args.options[arg.substr(2)] = argv[++i];
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

// The UTXO file is either a bare array (a single-key BTC livenet wallet) or
// {"wallet": {...}, "utxos": [...], "toAddress": ..., "changeAddress": ...}
int run_select(const Arguments& args, const ServiceConfig& config) {
    auto j = load_json(args.positional.at(1));
    uint64_t amount = parse_amount(args.positional.at(2));
    uint64_t fee_per_kb = parse_amount(args.positional.at(3));

    nlohmann::json wallet = nlohmann::json::object();
    nlohmann::json utxos_json = j;
    if (j.is_object()) {
        wallet = j.value("wallet", nlohmann::json::object());
        utxos_json = j.at("utxos");
    }
    auto utxos = utxos_json.get<std::vector<Utxo>>();

    auto chain = chain_from_string(wallet.value("chain", "btc"));
    auto network = network_from_string(wallet.value("network", "livenet"));
    if (!chain || !network) {
        throw Error(Error::Code::InvalidArgument, "Unknown chain or network");
    }
    TxProposal::CreateOptions opts;
    opts.chain = *chain;
    opts.network = *network;
    opts.wallet_m = wallet.value("m", 1u);
    opts.wallet_n = wallet.value("n", 1u);
    if (wallet.contains("addressType")) {
        opts.address_type = script_type_from_string(wallet["addressType"].get<std::string>());
        if (!opts.address_type) {
            throw Error(Error::Code::ScriptType, "Unknown address type");
        }
    }
    std::string to_address = j.is_object() ? j.value("toAddress", "") : "";
    opts.outputs = {TxOutput{amount, to_address}};
    opts.fee_per_kb = fee_per_kb;
    opts.no_shuffle_outputs = true;

    auto txp = TxProposal::create(opts);
    if (j.is_object() && j.contains("changeAddress")) {
        AddressRecord change;
        change.address = j["changeAddress"].get<std::string>();
        change.path = "m/1/0";
        change.type = txp.address_type();
        txp.set_change_address(change);
    }

    auto adapter = make_chain_adapter(txp.chain(), config);
    CoinSelector selector(*adapter);

    std::vector<Utxo> inputs;
    uint64_t fee = 0;
    if (!to_address.empty()) {
        // A full selection: confirmation ladder and a built transaction
        selector.select_tx_inputs(txp, utxos);
        inputs = txp.utxo_payload().inputs;
        fee = txp.fee().value_or(0);
    } else {
        std::vector<Utxo> unlocked;
        for (const auto& utxo : utxos) {
            if (!utxo.locked) {
                unlocked.push_back(utxo);
            }
        }
        auto selection = selector.select(txp, unlocked);
        inputs = selection.inputs;
        fee = selection.fee;
    }

    uint64_t total = 0;
    nlohmann::json outpoints = nlohmann::json::array();
    for (const auto& input : inputs) {
        total += input.satoshis;
        outpoints.push_back(input.outpoint());
    }
    nlohmann::json result{
        {"inputs", outpoints},
        {"fee", fee},
        {"change", total - amount - fee}
    };
    std::cout << std::setw(4) << result << std::endl;
    return 0;
}

int run_verify(const Arguments& args, const ServiceConfig& config) {
    auto credentials = Credentials::load_from_file(args.positional.at(1));
    auto txp = ProposalCodec::load_from_file(args.positional.at(2));
    auto adapter = make_chain_adapter(txp.chain(), config);

    std::optional<PaymentRequest> paypro;
    if (auto it = args.options.find("paypro"); it != args.options.end()) {
        auto invoice = load_json(it->second);
        paypro = PaymentRequest{};
        for (const auto& instruction : invoice.at("instructions")) {
            paypro->instructions.push_back(PaymentInstruction{
                instruction.at("toAddress").get<std::string>(),
                instruction.at("amount").get<uint64_t>()
            });
        }
    }

    bool ok = Verifier::check_tx_proposal(credentials, txp, *adapter, paypro ? &*paypro : nullptr);
    std::cout << (ok ? "ok" : "tampered") << std::endl;
    return ok ? 0 : 1;
}

int run_derive(const Arguments& args) {
    auto credentials = Credentials::load_from_file(args.positional.at(1));
    auto record = AddressDeriver::derive(credentials.address_type, credentials.xpubs(), args.positional.at(2),
                                         credentials.m, credentials.chain, credentials.network, {},
                                         credentials.hardware_source_public_key);
    std::cout << record.address << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto args = parse_arguments(argc, argv);
        if (args.positional.empty()) {
            print_usage();
            return 1;
        }

        ServiceConfig config;
        if (auto it = args.options.find("config"); it != args.options.end()) {
            config = ServiceConfig::load_from_file(it->second);
        }
        set_log_level(config.log_level);

        const auto& command = args.positional.front();
        if (command == "select" && args.positional.size() == 4) {
            return run_select(args, config);
        }
        if (command == "verify" && args.positional.size() == 3) {
            return run_verify(args, config);
        }
        if (command == "derive" && args.positional.size() == 3) {
            return run_derive(args);
        }
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
