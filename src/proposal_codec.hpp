#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "tx_proposal.hpp"

namespace cosign {

// JSON wire record of a proposal. Keys are camelCase and the chain payload
// fields sit at the top level next to the envelope, as in the service's
// stored records.
class ProposalCodec {
public:
    static nlohmann::json to_json(const TxProposal& txp);

    // Throws Error(UnsupportedFormat) for records below version 3 and
    // Error(InvalidArgument) for missing or mistyped fields
    static TxProposal from_json(const nlohmann::json& j);

    static TxProposal load_from_file(const std::string& path);

private:
    ProposalCodec() = delete;
};

} // namespace cosign
