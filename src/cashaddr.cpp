#include "cashaddr.hpp"

#include <cctype>
#include "bech32.hpp"
#include "error.hpp"

namespace cosign {

namespace {

uint64_t polymod(const std::vector<uint8_t>& values) {
    uint64_t c = 1;
    for (uint8_t d : values) {
        uint8_t c0 = static_cast<uint8_t>(c >> 35);
        c = ((c & 0x07ffffffffULL) << 5) ^ d;
        if (c0 & 0x01) c ^= 0x98f2bc8e61ULL;
        if (c0 & 0x02) c ^= 0x79b76d99e2ULL;
        if (c0 & 0x04) c ^= 0xf33e5fb3c4ULL;
        if (c0 & 0x08) c ^= 0xae2eabe2a8ULL;
        if (c0 & 0x10) c ^= 0x1e4f43e470ULL;
    }
    return c ^ 1;
}

std::vector<uint8_t> expand_prefix(std::string_view prefix) {
    std::vector<uint8_t> ret;
    ret.reserve(prefix.size() + 1);
    for (char c : prefix) {
        ret.push_back(static_cast<uint8_t>(c & 0x1f));
    }
    ret.push_back(0);
    return ret;
}

// Size code of the version byte, 0 for the 160-bit hashes in use
std::optional<uint8_t> size_code(size_t hash_size) {
    switch (hash_size) {
        case 20: return 0;
        case 24: return 1;
        case 28: return 2;
        case 32: return 3;
        default: return std::nullopt;
    }
}

} // namespace

std::string CashAddr::encode(std::string_view prefix, Type type, std::span<const uint8_t> hash) {
    auto code = size_code(hash.size());
    if (!code) {
        throw Error(Error::Code::InvalidAddress, "Unsupported cashaddr hash size");
    }

    std::vector<uint8_t> payload_bytes;
    payload_bytes.push_back(static_cast<uint8_t>((static_cast<uint8_t>(type) << 3) | *code));
    payload_bytes.insert(payload_bytes.end(), hash.begin(), hash.end());

    std::vector<uint8_t> payload;
    Bech32::convert_bits(&payload, 8, 5, true, payload_bytes);

    auto values = expand_prefix(prefix);
    values.insert(values.end(), payload.begin(), payload.end());
    values.insert(values.end(), 8, 0);
    uint64_t mod = polymod(values);

    std::string ret(prefix);
    ret.push_back(':');
    for (uint8_t v : payload) {
        ret.push_back(Bech32::CHARSET[v]);
    }
    for (int i = 0; i < 8; ++i) {
        ret.push_back(Bech32::CHARSET[(mod >> (5 * (7 - i))) & 0x1f]);
    }
    return ret;
}

std::optional<CashAddr::Content> CashAddr::decode(std::string_view address, std::string_view expected_prefix) {
    std::string lowered;
    bool lower = false;
    bool upper = false;
    for (char c : address) {
        if (std::isupper(static_cast<unsigned char>(c))) upper = true;
        if (std::islower(static_cast<unsigned char>(c))) lower = true;
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (upper && lower) {
        return std::nullopt;
    }

    std::string_view body = lowered;
    auto colon = body.find(':');
    if (colon != std::string_view::npos) {
        if (body.substr(0, colon) != expected_prefix) {
            return std::nullopt;
        }
        body = body.substr(colon + 1);
    }
    if (body.size() < 8 + 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> data;
    data.reserve(body.size());
    for (char c : body) {
        auto pos = Bech32::CHARSET.find(c);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        data.push_back(static_cast<uint8_t>(pos));
    }

    auto values = expand_prefix(expected_prefix);
    values.insert(values.end(), data.begin(), data.end());
    if (polymod(values) != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes;
    data.resize(data.size() - 8);
    if (!Bech32::convert_bits(&bytes, 5, 8, false, data) || bytes.empty()) {
        return std::nullopt;
    }

    uint8_t version = bytes.front();
    if (version & 0x80) {
        return std::nullopt;
    }
    Content content;
    uint8_t type = (version >> 3) & 0x0f;
    if (type > 1) {
        return std::nullopt;
    }
    content.type = static_cast<Type>(type);
    content.hash.assign(bytes.begin() + 1, bytes.end());
    auto code = size_code(content.hash.size());
    if (!code || *code != (version & 0x07)) {
        return std::nullopt;
    }
    return content;
}

} // namespace cosign
