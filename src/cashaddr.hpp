#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cosign {

// Bitcoin Cash address format. Payloads are a version byte (type << 3 | size
// code) followed by the hash; the prefix ("bitcoincash", "bchtest", ...) is
// covered by the 40-bit checksum but may be omitted in the text.
class CashAddr {
public:
    enum class Type : uint8_t {
        PubKeyHash = 0,
        ScriptHash = 1
    };

    struct Content {
        Type type;
        std::vector<uint8_t> hash;
    };

    // Returns "prefix:payload"
    static std::string encode(std::string_view prefix, Type type, std::span<const uint8_t> hash);

    // Accepts text with or without the prefix. Returns nothing on any
    // malformed input or a prefix other than the expected one.
    static std::optional<Content> decode(std::string_view address, std::string_view expected_prefix);

private:
    CashAddr() = delete;
};

} // namespace cosign
