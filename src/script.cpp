#include "script.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <algorithm>

namespace cosign {

// Push data onto the script stack using the smallest opcode able to carry it
// https://en.bitcoin.it/wiki/Script#Constants
//
// - up to 75 bytes: a single length byte doubles as the opcode
// - up to 255 bytes: OP_PUSHDATA1 followed by a 1-byte length
// - up to 520 bytes: OP_PUSHDATA2 followed by a 2-byte little-endian length
void Script::append_push(std::vector<uint8_t>& script, std::span<const uint8_t> data) {
    if (data.size() < OP_PUSHDATA1) {
        script.push_back(static_cast<uint8_t>(data.size()));
    } else if (data.size() <= 0xff) {
        script.push_back(OP_PUSHDATA1);
        script.push_back(static_cast<uint8_t>(data.size()));
    } else if (data.size() <= 0xffff) {
        script.push_back(OP_PUSHDATA2);
        script.push_back(static_cast<uint8_t>(data.size() & 0xff));
        script.push_back(static_cast<uint8_t>(data.size() >> 8));
    } else {
        throw Error(Error::Code::InvalidArgument, "Script push too large");
    }
    script.insert(script.end(), data.begin(), data.end());
}

void Script::append_number(std::vector<uint8_t>& script, uint32_t n) {
    if (n == 0) {
        script.push_back(OP_0);
        return;
    }
    if (n <= 16) {
        script.push_back(static_cast<uint8_t>(OP_1 + n - 1));
        return;
    }
    // Script numbers are little-endian sign-magnitude
    std::vector<uint8_t> bytes;
    while (n > 0) {
        bytes.push_back(static_cast<uint8_t>(n & 0xff));
        n >>= 8;
    }
    if (bytes.back() & 0x80) {
        bytes.push_back(0x00);
    }
    append_push(script, bytes);
}

// Pay-to-Public-Key-Hash locking script (25 bytes):
// - 0x76     : OP_DUP
// - 0xA9     : OP_HASH160
// - 0x14     : Push 20 bytes
// - [20 bytes]: HASH160 of the public key
// - 0x88     : OP_EQUALVERIFY
// - 0xAC     : OP_CHECKSIG
//
// This is also the BIP143 scriptCode of a P2WPKH input.
std::vector<uint8_t> Script::p2pkh(std::span<const uint8_t> pubkey_hash) {
    if (pubkey_hash.size() != PUBKEY_HASH_SIZE) {
        throw Error(Error::Code::InvalidArgument, "Public key hash must be 20 bytes");
    }
    std::vector<uint8_t> script;
    script.reserve(25);
    script.push_back(OP_DUP);
    script.push_back(OP_HASH160);
    script.push_back(PUBKEY_HASH_SIZE);
    script.insert(script.end(), pubkey_hash.begin(), pubkey_hash.end());
    script.push_back(OP_EQUALVERIFY);
    script.push_back(OP_CHECKSIG);
    return script;
}

// Pay-to-Script-Hash locking script (23 bytes), BIP16
std::vector<uint8_t> Script::p2sh(std::span<const uint8_t> script_hash) {
    if (script_hash.size() != PUBKEY_HASH_SIZE) {
        throw Error(Error::Code::InvalidArgument, "Script hash must be 20 bytes");
    }
    std::vector<uint8_t> script;
    script.reserve(23);
    script.push_back(OP_HASH160);
    script.push_back(PUBKEY_HASH_SIZE);
    script.insert(script.end(), script_hash.begin(), script_hash.end());
    script.push_back(OP_EQUAL);
    return script;
}

// Pay-to-Witness-Public-Key-Hash (P2WPKH) program as defined in BIP141
// https://github.com/bitcoin/bips/blob/master/bip-0141.mediawiki
//
// P2WPKH structure (22 bytes total):
// - 0x00     : Witness version 0
// - 0x14     : Push 20 bytes
// - [20 bytes]: HASH160 of public key
std::vector<uint8_t> Script::p2wpkh(std::span<const uint8_t> pubkey_hash) {
    if (pubkey_hash.size() != PUBKEY_HASH_SIZE) {
        throw Error(Error::Code::InvalidArgument, "Public key hash must be 20 bytes");
    }
    return witness_program(WITNESS_VERSION_0, pubkey_hash);
}

// Pay-to-Witness-Script-Hash (P2WSH) program as defined in BIP141
//
// The process:
// 1. Compute SHA256 of the witness script (note: single SHA256, not double)
// 2. Create witness program: [version byte] [push byte] [32-byte hash]
std::vector<uint8_t> Script::p2wsh(std::span<const uint8_t> witness_script) {
    auto hash = HashUtils::sha256(witness_script);
    return witness_program(WITNESS_VERSION_0, hash);
}

// Taproot output (BIP341): OP_1 followed by the 32-byte tweaked key
std::vector<uint8_t> Script::p2tr(std::span<const uint8_t> output_key) {
    if (output_key.size() != WITNESS_PROGRAM_SIZE) {
        throw Error(Error::Code::InvalidArgument, "Taproot output key must be 32 bytes");
    }
    return witness_program(WITNESS_VERSION_1, output_key);
}

std::vector<uint8_t> Script::witness_program(uint8_t version, std::span<const uint8_t> program) {
    std::vector<uint8_t> script;
    script.reserve(program.size() + 2);
    script.push_back(version == 0 ? OP_0 : static_cast<uint8_t>(OP_1 + version - 1));
    script.push_back(static_cast<uint8_t>(program.size()));
    script.insert(script.end(), program.begin(), program.end());
    return script;
}

// Multisignature script used as P2SH redeem script or P2WSH witness script:
// OP_m <pubkey1> <pubkey2> ... <pubkey_n> OP_n OP_CHECKMULTISIG
//
// Multisig script structure:
// - OP_m     : Number of signatures required
// - 0x21     : Push 33 bytes (compressed public key size), once per key
// - [33 bytes]: Public key
// - OP_n     : Total number of keys
// - OP_CHECKMULTISIG: Verify the signatures
std::vector<uint8_t> Script::multisig(uint32_t m, std::vector<std::vector<uint8_t>> keys) {
    if (m == 0 || m > keys.size()) {
        throw Error(Error::Code::InvalidWalletParams);
    }
    std::sort(keys.begin(), keys.end());

    std::vector<uint8_t> script;
    append_number(script, m);
    for (const auto& key : keys) {
        append_push(script, key);
    }
    append_number(script, static_cast<uint32_t>(keys.size()));
    script.push_back(OP_CHECKMULTISIG);
    return script;
}

// OP_IF <reclaim> OP_CHECKSIG OP_ELSE OP_1 <input keys...> OP_k OP_CHECKMULTISIG OP_ENDIF
std::vector<uint8_t> Script::escrow(std::span<const uint8_t> reclaim_key,
                                    std::vector<std::vector<uint8_t>> input_keys) {
    if (input_keys.empty()) {
        throw Error(Error::Code::InvalidArgument, "Escrow needs at least one input key");
    }
    std::sort(input_keys.begin(), input_keys.end());

    std::vector<uint8_t> script;
    script.push_back(OP_IF);
    append_push(script, reclaim_key);
    script.push_back(OP_CHECKSIG);
    script.push_back(OP_ELSE);
    append_number(script, 1);
    for (const auto& key : input_keys) {
        append_push(script, key);
    }
    append_number(script, static_cast<uint32_t>(input_keys.size()));
    script.push_back(OP_CHECKMULTISIG);
    script.push_back(OP_ENDIF);
    return script;
}

// OP_RETURN outputs are provably unspendable and carry a small data payload.
// Standard relay policy caps the payload at 80 bytes.
std::vector<uint8_t> Script::op_return(std::span<const uint8_t> data) {
    if (data.size() > 80) {
        throw Error(Error::Code::ScriptOpReturn, "OP_RETURN data too long");
    }
    std::vector<uint8_t> script;
    script.push_back(OP_RETURN);
    append_push(script, data);
    return script;
}

bool Script::is_op_return(std::span<const uint8_t> script) {
    return !script.empty() && script[0] == OP_RETURN;
}

} // namespace cosign
