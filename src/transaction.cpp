#include "transaction.hpp"
#include "hex_utils.hpp"

namespace cosign {

void Transaction::append_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void Transaction::append_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

// CompactSize: one byte below 0xfd, otherwise a marker byte followed by a
// 2, 4 or 8 byte little-endian integer
void Transaction::append_varint(std::vector<uint8_t>& out, uint64_t value) {
    if (value < 0xfd) {
        out.push_back(static_cast<uint8_t>(value));
    } else if (value <= 0xffff) {
        out.push_back(0xfd);
        out.push_back(static_cast<uint8_t>(value));
        out.push_back(static_cast<uint8_t>(value >> 8));
    } else if (value <= 0xffffffff) {
        out.push_back(0xfe);
        append_u32(out, static_cast<uint32_t>(value));
    } else {
        out.push_back(0xff);
        append_u64(out, value);
    }
}

// Create a serialized transaction output from a script and value
// This follows the Bitcoin transaction output format:
// https://en.bitcoin.it/wiki/Transaction#Output
//
// Transaction output structure:
// - [8 bytes]: Value in satoshis (little-endian)
// - [1-9 bytes]: Script length (varint)
// - [variable]: Script (scriptPubKey)
std::vector<uint8_t> Transaction::create_output(std::span<const uint8_t> script, uint64_t value) {
    std::vector<uint8_t> output;
    output.reserve(script.size() + 9);
    append_u64(output, value);
    append_varint(output, script.size());
    output.insert(output.end(), script.begin(), script.end());
    return output;
}

bool Transaction::has_witness() const {
    for (const auto& input : inputs) {
        if (!input.witness.empty()) {
            return true;
        }
    }
    return false;
}

// Assemble a transaction, following BIP141 and BIP144 when witness data is
// present
// https://github.com/bitcoin/bips/blob/master/bip-0144.mediawiki
//
// Transaction structure:
// 1. Transaction version (4 bytes)
// 2. Marker (1 byte, 0x00) and flag (1 byte, 0x01), segwit only
// 3. Input count (varint)
// 4. Inputs: outpoint (36 bytes), scriptSig (varint + bytes), sequence (4 bytes)
// 5. Output count (varint)
// 6. Outputs (variable)
// 7. Witness data, one stack per input, segwit only
// 8. Locktime (4 bytes)
std::vector<uint8_t> Transaction::serialize(bool include_witness) const {
    bool segwit = include_witness && has_witness();

    std::vector<uint8_t> tx;
    append_u32(tx, version);

    if (segwit) {
        tx.push_back(0x00); // marker
        tx.push_back(0x01); // flag
    }

    append_varint(tx, inputs.size());
    for (const auto& input : inputs) {
        tx.insert(tx.end(), input.prev_txid.begin(), input.prev_txid.end());
        append_u32(tx, input.prev_vout);
        append_varint(tx, input.script_sig.size());
        tx.insert(tx.end(), input.script_sig.begin(), input.script_sig.end());
        append_u32(tx, input.sequence);
    }

    append_varint(tx, outputs.size());
    for (const auto& output : outputs) {
        auto serialized_output = create_output(output.script, output.amount);
        tx.insert(tx.end(), serialized_output.begin(), serialized_output.end());
    }

    // Inputs without witness data still contribute an empty stack
    if (segwit) {
        for (const auto& input : inputs) {
            append_varint(tx, input.witness.size());
            for (const auto& item : input.witness) {
                append_varint(tx, item.size());
                tx.insert(tx.end(), item.begin(), item.end());
            }
        }
    }

    append_u32(tx, locktime);
    return tx;
}

// The txid is the double SHA256 of the transaction excluding the marker,
// flag and witness data, so signatures cannot change it
Hash256 Transaction::txid() const {
    return HashUtils::double_sha256(serialize(false));
}

std::string Transaction::txid_hex() const {
    return HexUtils::encode_reversed(txid());
}

size_t Transaction::weight() const {
    return serialize(false).size() * 3 + serialize(true).size();
}

size_t Transaction::vsize() const {
    return (weight() + 3) / 4;
}

uint64_t Transaction::input_total() const {
    uint64_t total = 0;
    for (const auto& input : inputs) {
        total += input.amount;
    }
    return total;
}

uint64_t Transaction::output_total() const {
    uint64_t total = 0;
    for (const auto& output : outputs) {
        total += output.amount;
    }
    return total;
}

Hash256 Sighash::legacy(const Transaction& tx, size_t index,
                        std::span<const uint8_t> script_code, uint32_t hash_type) {
    Transaction copy = tx;
    for (size_t i = 0; i < copy.inputs.size(); ++i) {
        copy.inputs[i].witness.clear();
        if (i == index) {
            copy.inputs[i].script_sig.assign(script_code.begin(), script_code.end());
        } else {
            copy.inputs[i].script_sig.clear();
        }
    }

    auto preimage = copy.serialize(false);
    Transaction::append_u32(preimage, hash_type);
    return HashUtils::double_sha256(preimage);
}

// Create the transaction digest (hash) for signing according to BIP143
// https://github.com/bitcoin/bips/blob/master/bip-0143.mediawiki
//
// The commitment structure includes:
// 1. Transaction version (4 bytes)
// 2. Hash of all input outpoints (32 bytes) - double SHA256
// 3. Hash of all input sequence numbers (32 bytes) - double SHA256
// 4. Outpoint being spent (36 bytes)
// 5. Script code of the input (varint + bytes)
// 6. Value of the output being spent (8 bytes)
// 7. Sequence number of the input (4 bytes)
// 8. Hash of all outputs (32 bytes) - double SHA256
// 9. Locktime (4 bytes)
// 10. Sighash type (4 bytes)
Hash256 Sighash::segwit_v0(const Transaction& tx, size_t index,
                           std::span<const uint8_t> script_code, uint64_t amount,
                           uint32_t hash_type) {
    const auto& input = tx.inputs.at(index);

    std::vector<uint8_t> prevouts;
    std::vector<uint8_t> sequences;
    for (const auto& in : tx.inputs) {
        prevouts.insert(prevouts.end(), in.prev_txid.begin(), in.prev_txid.end());
        Transaction::append_u32(prevouts, in.prev_vout);
        Transaction::append_u32(sequences, in.sequence);
    }

    std::vector<uint8_t> serialized_outputs;
    for (const auto& output : tx.outputs) {
        auto serialized_output = Transaction::create_output(output.script, output.amount);
        serialized_outputs.insert(serialized_outputs.end(), serialized_output.begin(), serialized_output.end());
    }

    auto hash_prevouts = HashUtils::double_sha256(prevouts);
    auto hash_sequence = HashUtils::double_sha256(sequences);
    auto hash_outputs = HashUtils::double_sha256(serialized_outputs);

    std::vector<uint8_t> commitment;
    Transaction::append_u32(commitment, tx.version);
    commitment.insert(commitment.end(), hash_prevouts.begin(), hash_prevouts.end());
    commitment.insert(commitment.end(), hash_sequence.begin(), hash_sequence.end());
    commitment.insert(commitment.end(), input.prev_txid.begin(), input.prev_txid.end());
    Transaction::append_u32(commitment, input.prev_vout);
    Transaction::append_varint(commitment, script_code.size());
    commitment.insert(commitment.end(), script_code.begin(), script_code.end());
    Transaction::append_u64(commitment, amount);
    Transaction::append_u32(commitment, input.sequence);
    commitment.insert(commitment.end(), hash_outputs.begin(), hash_outputs.end());
    Transaction::append_u32(commitment, tx.locktime);
    Transaction::append_u32(commitment, hash_type);

    return HashUtils::double_sha256(commitment);
}

// BIP341 signature message for a key-path spend
// https://github.com/bitcoin/bips/blob/master/bip-0341.mediawiki#common-signature-message
//
// The message is hashed with the "TapSighash" tag and includes:
// 1. Epoch (1 byte, 0x00)
// 2. Hash type (1 byte)
// 3. Version and locktime (4 bytes each)
// 4. Single SHA256 of prevouts, amounts, scriptPubKeys and sequences
// 5. Single SHA256 of all outputs
// 6. Spend type (1 byte, 0x00: key path, no annex)
// 7. Index of the input being signed (4 bytes)
Hash256 Sighash::taproot_key_path(const Transaction& tx, size_t index, uint8_t hash_type) {
    std::vector<uint8_t> prevouts;
    std::vector<uint8_t> amounts;
    std::vector<uint8_t> script_pubkeys;
    std::vector<uint8_t> sequences;
    for (const auto& in : tx.inputs) {
        prevouts.insert(prevouts.end(), in.prev_txid.begin(), in.prev_txid.end());
        Transaction::append_u32(prevouts, in.prev_vout);
        Transaction::append_u64(amounts, in.amount);
        Transaction::append_varint(script_pubkeys, in.prev_script.size());
        script_pubkeys.insert(script_pubkeys.end(), in.prev_script.begin(), in.prev_script.end());
        Transaction::append_u32(sequences, in.sequence);
    }

    std::vector<uint8_t> serialized_outputs;
    for (const auto& output : tx.outputs) {
        auto serialized_output = Transaction::create_output(output.script, output.amount);
        serialized_outputs.insert(serialized_outputs.end(), serialized_output.begin(), serialized_output.end());
    }

    std::vector<uint8_t> message;
    message.push_back(0x00);
    message.push_back(hash_type);
    Transaction::append_u32(message, tx.version);
    Transaction::append_u32(message, tx.locktime);
    for (const auto* part : {&prevouts, &amounts, &script_pubkeys, &sequences, &serialized_outputs}) {
        auto digest = HashUtils::sha256(*part);
        message.insert(message.end(), digest.begin(), digest.end());
    }
    message.push_back(0x00);
    Transaction::append_u32(message, static_cast<uint32_t>(index));

    return HashUtils::tagged_hash("TapSighash", message);
}

} // namespace cosign
