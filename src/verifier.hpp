#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tx_proposal.hpp"
#include "wallet.hpp"

namespace cosign {

class ChainAdapter;

// What the client asked the service for when creating a proposal. Memos and
// the message are in their encrypted form, as they were sent.
struct ProposalArgs {
    std::vector<TxOutput> outputs;
    std::string change_address;
    std::optional<uint64_t> fee_per_kb;
    std::string pay_pro_url;
    std::string message;
    nlohmann::json custom_data;
};

struct PaymentInstruction {
    std::string to_address;
    uint64_t amount = 0;
};

// Payment protocol invoice
struct PaymentRequest {
    std::vector<PaymentInstruction> instructions;
    std::optional<double> required_fee_rate;
};

// Client-side checks of what the service reports. Everything is recomputed
// from the copayer's own credentials; a check only answers yes or no and the
// reason for a mismatch goes to the debug log.
class Verifier {
public:
    // The address and its public keys derive from the wallet's key ring
    static bool check_address(const Credentials& credentials,
                              const AddressRecord& address,
                              std::span<const std::string> escrow_input_paths = {});

    static bool check_copayers(const Credentials& credentials, const std::vector<Copayer>& copayers);

    // The proposal returned by the service carries what was asked for
    static bool check_proposal_creation(const ProposalArgs& args,
                                        const TxProposal& txp,
                                        const std::string& encrypting_key);

    // The creator's signature covers the transaction the proposal builds,
    // and the change and escrow addresses belong to the wallet
    static bool check_tx_proposal_signature(const Credentials& credentials,
                                            const TxProposal& txp,
                                            const ChainAdapter& adapter);

    static bool check_paypro(const TxProposal& txp, const PaymentRequest& request);

    static bool check_tx_proposal(const Credentials& credentials,
                                  const TxProposal& txp,
                                  const ChainAdapter& adapter,
                                  const PaymentRequest* paypro = nullptr);

private:
    Verifier() = delete;
};

} // namespace cosign
