#include "config.hpp"
#include "error.hpp"

#include <fstream>
#include <type_traits>

namespace cosign {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    try {
        it->get_to(target);
    } catch (const nlohmann::json::exception& e) {
        throw Error(Error::Code::InvalidArgument, std::string("Invalid config value for ") + key + ": " + e.what());
    }
}

// Numbers must be numbers; nlohmann would otherwise accept booleans for
// arithmetic targets
template <typename T>
void read_number(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_number()) {
        throw Error(Error::Code::InvalidArgument, std::string("Config value for ") + key + " must be a number");
    }
    if (it != j.end() && std::is_unsigned_v<T> && it->is_number_integer() && it->get<int64_t>() < 0) {
        throw Error(Error::Code::InvalidArgument, std::string("Config value for ") + key + " must not be negative");
    }
    read_field(j, key, target);
}

} // namespace

ServiceConfig ServiceConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw Error(Error::Code::InvalidArgument, "Config must be a JSON object");
    }

    ServiceConfig config;
    read_number(j, "sizeEstimationMargin", config.size_estimation_margin);
    read_number(j, "inputSizeEstimationMargin", config.input_size_estimation_margin);
    read_number(j, "maxTxSizeInKb", config.max_tx_size_in_kb);
    read_number(j, "minOutputAmount", config.min_output_amount);
    read_number(j, "lockWaitMs", config.lock_wait_ms);
    read_number(j, "lockLeaseMs", config.lock_lease_ms);

    if (j.contains("logLevel") && !j["logLevel"].is_string()) {
        throw Error(Error::Code::InvalidArgument, "Config value for logLevel must be a string");
    }
    read_field(j, "logLevel", config.log_level);

    if (j.contains("utxoSelection")) {
        const auto& factors = j["utxoSelection"];
        if (!factors.is_object()) {
            throw Error(Error::Code::InvalidArgument, "Config value for utxoSelection must be an object");
        }
        read_number(factors, "maxSingleUtxoFactor", config.utxo_selection.max_single_utxo);
        read_number(factors, "minTxAmountVsUtxoFactor", config.utxo_selection.min_tx_amount_vs_utxo);
        read_number(factors, "maxFeeVsTxAmountFactor", config.utxo_selection.max_fee_vs_tx_amount);
        read_number(factors, "maxFeeVsSingleUtxoFeeFactor", config.utxo_selection.max_fee_vs_single_utxo_fee);
    }

    return config;
}

ServiceConfig ServiceConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw Error(Error::Code::InvalidArgument, "Cannot open config file: " + path);
    }

    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw Error(Error::Code::InvalidArgument, "Config file is not valid JSON: " + path);
    }
    return from_json(j);
}

} // namespace cosign
