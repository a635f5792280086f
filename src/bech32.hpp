#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cosign {

// Segregated witness address encoding (BIP173 bech32 for witness v0,
// BIP350 bech32m for v1 and above).
class Bech32 {
public:
    struct WitnessProgram {
        uint8_t version;
        std::vector<uint8_t> program;
    };

    // Encodes a witness program; the checksum constant follows the version
    static std::string encode_segwit(std::string_view hrp, uint8_t witness_version,
                                     std::span<const uint8_t> program);

    // Decodes an address for the expected human readable part. Returns nothing
    // if the text is malformed, the hrp differs or the checksum variant does
    // not match the witness version.
    static std::optional<WitnessProgram> decode_segwit(std::string_view address,
                                                       std::string_view expected_hrp);

    // Regroups a bit stream, used by bech32 and CashAddr payloads alike
    static bool convert_bits(std::vector<uint8_t>* out, int from_bits, int to_bits, bool pad,
                             std::span<const uint8_t> data);

    static constexpr std::string_view CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

private:
    Bech32() = delete;
};

} // namespace cosign
