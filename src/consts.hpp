#pragma once

#include <cstdint>
#include <cstddef>

namespace cosign {

    // Bitcoin Script Operation Codes
    constexpr uint8_t OP_0 = 0x00;
    constexpr uint8_t OP_PUSHDATA1 = 0x4c;
    constexpr uint8_t OP_PUSHDATA2 = 0x4d;
    constexpr uint8_t OP_1 = 0x51;
    constexpr uint8_t OP_IF = 0x63;
    constexpr uint8_t OP_ELSE = 0x67;
    constexpr uint8_t OP_ENDIF = 0x68;
    constexpr uint8_t OP_RETURN = 0x6a;
    constexpr uint8_t OP_DUP = 0x76;
    constexpr uint8_t OP_EQUAL = 0x87;
    constexpr uint8_t OP_EQUALVERIFY = 0x88;
    constexpr uint8_t OP_HASH160 = 0xA9;
    constexpr uint8_t OP_CHECKSIG = 0xAC;
    constexpr uint8_t OP_CHECKMULTISIG = 0xAE;

    // Common script-related constants
    constexpr uint8_t COMPRESSED_PUBKEY_SIZE = 0x21; // 33 bytes
    constexpr uint8_t PUBKEY_HASH_SIZE = 0x14; // 20 bytes
    constexpr uint8_t WITNESS_VERSION_0 = 0x00;
    constexpr uint8_t WITNESS_VERSION_1 = 0x01;
    constexpr uint8_t WITNESS_PROGRAM_SIZE = 0x20; // 32 bytes

    // Transaction-related constants
    constexpr uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;
    constexpr uint32_t SEQUENCE_RBF = 0xFFFFFFFD;
    constexpr uint32_t SIGHASH_ALL = 0x01;
    constexpr uint32_t SIGHASH_FORKID = 0x40;
    constexpr uint8_t SIGHASH_DEFAULT = 0x00;
    constexpr uint32_t TX_VERSION = 0x01;
    constexpr uint8_t TX_MARKER = 0x00;
    constexpr uint8_t TX_FLAG = 0x01;

    // Service defaults
    namespace defaults {
        constexpr uint32_t MAX_KEYS = 100;
        constexpr uint32_t MIN_PROPOSAL_VERSION = 3;
        constexpr uint64_t MIN_OUTPUT_AMOUNT = 546;
        constexpr size_t MAX_TX_SIZE_IN_KB = 100;
        constexpr double SIZE_ESTIMATION_MARGIN = 0.01;
        constexpr size_t INPUT_SIZE_ESTIMATION_MARGIN = 2;

        constexpr double UTXO_SELECTION_MAX_SINGLE_UTXO_FACTOR = 2;
        constexpr double UTXO_SELECTION_MIN_TX_AMOUNT_VS_UTXO_FACTOR = 0.1;
        constexpr double UTXO_SELECTION_MAX_FEE_VS_TX_AMOUNT_FACTOR = 0.05;
        constexpr double UTXO_SELECTION_MAX_FEE_VS_SINGLE_UTXO_FEE_FACTOR = 5;

        constexpr uint32_t LOCK_WAIT_TIME_MS = 5 * 1000;
        constexpr uint32_t LOCK_EXE_TIME_MS = 40 * 1000;

        // Path under a copayer's extended key that authorizes request keys.
        constexpr const char* REQUEST_KEY_AUTH_PATH = "m/2";
    }

} // namespace cosign
