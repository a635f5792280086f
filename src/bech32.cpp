#include "bech32.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include "error.hpp"

namespace cosign {

namespace {

constexpr uint32_t BECH32_CONST = 1;
constexpr uint32_t BECH32M_CONST = 0x2bc830a3;

constexpr std::array<int8_t, 128> make_decode_map() {
    std::array<int8_t, 128> map{};
    map.fill(-1);
    for (size_t i = 0; i < Bech32::CHARSET.size(); ++i) {
        map[static_cast<unsigned>(Bech32::CHARSET[i])] = static_cast<int8_t>(i);
    }
    return map;
}

constexpr auto DECODE_MAP = make_decode_map();

uint32_t polymod(const std::vector<uint8_t>& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = chk >> 25;
        chk = (chk & 0x1ffffff) << 5 ^ v;
        if (top & 0x01) chk ^= 0x3b6a57b2;
        if (top & 0x02) chk ^= 0x26508e6d;
        if (top & 0x04) chk ^= 0x1ea119fa;
        if (top & 0x08) chk ^= 0x3d4233dd;
        if (top & 0x10) chk ^= 0x2a1462b3;
    }
    return chk;
}

std::vector<uint8_t> hrp_expand(std::string_view hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) >> 5));
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) & 0x1f));
    }
    return ret;
}

bool is_valid_hrp(std::string_view hrp) {
    if (hrp.empty() || hrp.size() > 83) {
        return false;
    }
    return std::all_of(hrp.begin(), hrp.end(), [](char c) { return c >= 0x21 && c <= 0x7e; });
}

} // namespace

bool Bech32::convert_bits(std::vector<uint8_t>* out, int from_bits, int to_bits, bool pad,
                          std::span<const uint8_t> data) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to_bits) - 1;
    for (uint8_t value : data) {
        if (value >> from_bits) {
            return false;
        }
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out->push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits) {
            out->push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
        return false;
    }
    return true;
}

std::string Bech32::encode_segwit(std::string_view hrp, uint8_t witness_version,
                                  std::span<const uint8_t> program) {
    if (!is_valid_hrp(hrp)) {
        throw Error(Error::Code::InvalidAddress, "Invalid bech32 prefix");
    }
    if (witness_version > 16 || program.size() < 2 || program.size() > 40) {
        throw Error(Error::Code::InvalidAddress, "Invalid witness program");
    }

    std::vector<uint8_t> data{witness_version};
    if (!convert_bits(&data, 8, 5, true, program)) {
        throw Error(Error::Code::InvalidAddress, "Invalid witness program");
    }

    auto values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    values.insert(values.end(), 6, 0);
    uint32_t checksum_const = witness_version == 0 ? BECH32_CONST : BECH32M_CONST;
    uint32_t mod = polymod(values) ^ checksum_const;

    std::string ret(hrp);
    ret.push_back('1');
    for (uint8_t v : data) {
        ret.push_back(CHARSET[v]);
    }
    for (int i = 0; i < 6; ++i) {
        ret.push_back(CHARSET[(mod >> (5 * (5 - i))) & 31]);
    }
    return ret;
}

std::optional<Bech32::WitnessProgram> Bech32::decode_segwit(std::string_view address,
                                                            std::string_view expected_hrp) {
    if (address.size() < 8 || address.size() > 90) {
        return std::nullopt;
    }
    bool lower = false;
    bool upper = false;
    for (char c : address) {
        if (std::isupper(static_cast<unsigned char>(c))) upper = true;
        if (std::islower(static_cast<unsigned char>(c))) lower = true;
    }
    if (upper && lower) {
        return std::nullopt;
    }

    auto pos = address.rfind('1');
    if (pos == std::string_view::npos || pos == 0 || pos + 7 > address.size()) {
        return std::nullopt;
    }
    std::string_view hrp = address.substr(0, pos);
    if (!is_valid_hrp(hrp) || hrp.size() != expected_hrp.size() ||
        !std::equal(hrp.begin(), hrp.end(), expected_hrp.begin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        })) {
        return std::nullopt;
    }

    std::vector<uint8_t> data;
    for (char c : address.substr(pos + 1)) {
        auto uc = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
        if (uc > 127 || DECODE_MAP[uc] == -1) {
            return std::nullopt;
        }
        data.push_back(static_cast<uint8_t>(DECODE_MAP[uc]));
    }

    auto values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    uint32_t mod = polymod(values);
    data.resize(data.size() - 6);
    if (data.empty()) {
        return std::nullopt;
    }

    WitnessProgram result;
    result.version = data.front();
    if (result.version > 16) {
        return std::nullopt;
    }
    uint32_t expected_const = result.version == 0 ? BECH32_CONST : BECH32M_CONST;
    if (mod != expected_const) {
        return std::nullopt;
    }
    if (!convert_bits(&result.program, 5, 8, false,
                      std::span<const uint8_t>(data.begin() + 1, data.end()))) {
        return std::nullopt;
    }
    if (result.program.size() < 2 || result.program.size() > 40) {
        return std::nullopt;
    }
    if (result.version == 0 && result.program.size() != 20 && result.program.size() != 32) {
        return std::nullopt;
    }
    return result;
}

} // namespace cosign
