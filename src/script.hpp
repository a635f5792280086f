#pragma once

#include <vector>
#include <span>
#include <cstdint>

namespace cosign {

// Builders for the locking and redeem scripts a wallet pays to
class Script {
public:
    // Append a minimal push of data (direct push, OP_PUSHDATA1 or OP_PUSHDATA2)
    static void append_push(std::vector<uint8_t>& script, std::span<const uint8_t> data);

    // Push of a small integer: OP_0, OP_1..OP_16, or a minimally encoded number
    static void append_number(std::vector<uint8_t>& script, uint32_t n);

    // OP_DUP OP_HASH160 <hash> OP_EQUALVERIFY OP_CHECKSIG
    static std::vector<uint8_t> p2pkh(std::span<const uint8_t> pubkey_hash);

    // OP_HASH160 <hash> OP_EQUAL
    static std::vector<uint8_t> p2sh(std::span<const uint8_t> script_hash);

    // Witness v0 key hash program from a 20-byte hash
    static std::vector<uint8_t> p2wpkh(std::span<const uint8_t> pubkey_hash);

    // Witness v0 script hash program; the witness script is hashed here
    static std::vector<uint8_t> p2wsh(std::span<const uint8_t> witness_script);

    // Witness v1 program from a 32-byte x-only output key
    static std::vector<uint8_t> p2tr(std::span<const uint8_t> output_key);

    // Generic witness program output: <version> <program>
    static std::vector<uint8_t> witness_program(uint8_t version, std::span<const uint8_t> program);

    // m-of-n CHECKMULTISIG script. Keys are sorted lexicographically first so
    // every copayer derives the same script from the same key set.
    static std::vector<uint8_t> multisig(uint32_t m, std::vector<std::vector<uint8_t>> keys);

    // Instant-acceptance escrow: spendable by the reclaim key, or by any one
    // of the keys that signed the inputs of the funding transaction
    static std::vector<uint8_t> escrow(std::span<const uint8_t> reclaim_key,
                                       std::vector<std::vector<uint8_t>> input_keys);

    // OP_RETURN <data>
    static std::vector<uint8_t> op_return(std::span<const uint8_t> data);

    static bool is_op_return(std::span<const uint8_t> script);

private:
    Script() = delete;
};

} // namespace cosign
