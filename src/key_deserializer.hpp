#pragma once

#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include "bip32_util.hpp"

namespace cosign {

class KeyDeserializer {
public:
    // Deserialize the 78-byte BIP32 serialization into an extended key
    static ExKey deserialize(std::span<const uint8_t> bytes);

    static std::vector<uint8_t> serialize(const ExKey& key);

    // Parses xpub/xprv/tpub/tprv text
    static ExKey from_base58(const std::string& text);

    static std::string to_base58(const ExKey& key);
};

} // namespace cosign
