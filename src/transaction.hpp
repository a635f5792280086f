#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "hash_utils.hpp"

namespace cosign {

struct TxIn {
    std::array<uint8_t, 32> prev_txid{};         // Internal (little-endian) byte order
    uint32_t prev_vout = 0;
    uint64_t amount = 0;                         // Value of the spent output
    std::vector<uint8_t> prev_script;            // scriptPubKey of the spent output
    uint32_t sequence = 0xFFFFFFFF;
    std::vector<uint8_t> script_sig;
    std::vector<std::vector<uint8_t>> witness;
};

struct TxOut {
    uint64_t amount = 0;
    std::vector<uint8_t> script;
};

// A UTXO-chain transaction in the Bitcoin wire format, with or without the
// BIP144 witness section
class Transaction {
public:
    uint32_t version = 1;
    uint32_t locktime = 0;
    std::vector<TxIn> inputs;
    std::vector<TxOut> outputs;

    // Full serialization; the witness section is written only when an input
    // carries witness data and include_witness is set
    std::vector<uint8_t> serialize(bool include_witness = true) const;

    bool has_witness() const;

    // Double SHA256 of the non-witness serialization, internal byte order
    Hash256 txid() const;

    // Display (reversed) hex
    std::string txid_hex() const;

    // BIP141 weight: base size * 3 + total size
    size_t weight() const;
    size_t vsize() const;

    uint64_t input_total() const;
    uint64_t output_total() const;

    // Serializes a transaction output with script and value
    static std::vector<uint8_t> create_output(std::span<const uint8_t> script, uint64_t value);

    // Bitcoin CompactSize length prefix
    static void append_varint(std::vector<uint8_t>& out, uint64_t value);

    static void append_u32(std::vector<uint8_t>& out, uint32_t value);
    static void append_u64(std::vector<uint8_t>& out, uint64_t value);
};

// Signature hashes for the three digest algorithms in use. Only the ALL
// variants are produced; inputs are always signed over every output.
class Sighash {
public:
    // Pre-segwit digest: the transaction with every scriptSig emptied except
    // the signed input's, which carries script_code
    static Hash256 legacy(const Transaction& tx, size_t index,
                          std::span<const uint8_t> script_code, uint32_t hash_type);

    // BIP143 digest, also used with SIGHASH_FORKID by Bitcoin Cash
    static Hash256 segwit_v0(const Transaction& tx, size_t index,
                             std::span<const uint8_t> script_code, uint64_t amount,
                             uint32_t hash_type);

    // BIP341 key-path digest (no annex, no script path)
    static Hash256 taproot_key_path(const Transaction& tx, size_t index, uint8_t hash_type);

private:
    Sighash() = delete;
};

} // namespace cosign
