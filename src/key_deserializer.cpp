#include "key_deserializer.hpp"
#include "base58.hpp"
#include "ec_utils.hpp"
#include "error.hpp"
#include <algorithm>

namespace cosign {

// Deserialize bytes into an extended key.
// Layout: version(4) depth(1) fingerprint(4) child(4) chaincode(32) key(33)
// Throws: Error(InvalidKeyFormat) if the input has invalid format or the key
// material is not a valid secp256k1 scalar or point
ExKey KeyDeserializer::deserialize(std::span<const uint8_t> bytes) {
    if (bytes.size() != 78) {
        throw Error(Error::Code::InvalidKeyFormat);
    }

    ExKey key;
    std::copy_n(bytes.begin(), 4, key.version.begin());
    std::copy_n(bytes.begin() + 4, 1, key.depth.begin());
    std::copy_n(bytes.begin() + 5, 4, key.finger_print.begin());
    std::copy_n(bytes.begin() + 9, 4, key.child_number.begin());
    std::copy_n(bytes.begin() + 13, 32, key.chaincode.begin());
    std::copy_n(bytes.begin() + 45, 33, key.key.begin());

    bool valid = key.is_private() ? EcUtils::is_valid_private_key(key.private_key())
                                  : EcUtils::is_valid_public_key(key.key);
    if (!valid) {
        throw Error(Error::Code::InvalidKeyFormat, "Invalid extended key material");
    }
    return key;
}

std::vector<uint8_t> KeyDeserializer::serialize(const ExKey& key) {
    std::vector<uint8_t> bytes;
    bytes.reserve(78);
    bytes.insert(bytes.end(), key.version.begin(), key.version.end());
    bytes.insert(bytes.end(), key.depth.begin(), key.depth.end());
    bytes.insert(bytes.end(), key.finger_print.begin(), key.finger_print.end());
    bytes.insert(bytes.end(), key.child_number.begin(), key.child_number.end());
    bytes.insert(bytes.end(), key.chaincode.begin(), key.chaincode.end());
    bytes.insert(bytes.end(), key.key.begin(), key.key.end());
    return bytes;
}

ExKey KeyDeserializer::from_base58(const std::string& text) {
    try {
        return deserialize(Base58::decode_check(text));
    } catch (const Error& e) {
        if (e.code() == Error::Code::Base58DecodeError) {
            throw Error(Error::Code::InvalidKeyFormat, "Invalid extended key encoding");
        }
        throw;
    }
}

std::string KeyDeserializer::to_base58(const ExKey& key) {
    return Base58::encode_check(serialize(key));
}

} // namespace cosign
