#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "chain.hpp"

namespace cosign {

// Message-level signing shared by the service and its clients: proposal
// signatures, copayer registration proofs and request-key delegation.
//
// Messages are hashed with double SHA256 and the digest is stored reversed;
// signing reads that reversed hash little-endian, so the ECDSA scalar equals
// the plain double-SHA256 digest. Signatures travel as DER hex.
class MessageSigner {
public:
    // Reversed double SHA256 of the UTF-8 text
    static std::array<uint8_t, 32> hash_message(const std::string& text);

    static std::string sign_message(const std::string& text, std::span<const uint8_t> private_key);

    // Multi-part messages are comma-joined before hashing
    static std::string sign_message(const std::vector<std::string>& parts, std::span<const uint8_t> private_key);

    // Never throws; malformed hex or keys fail verification
    static bool verify_message(const std::string& text, const std::string& signature_hex,
                               const std::string& public_key_hex);

    static bool verify_message(const std::vector<std::string>& parts, const std::string& signature_hex,
                               const std::string& public_key_hex);

    // "name|xPubKey|requestPubKey", the message a copayer signs to join a wallet
    static std::string copayer_hash(const std::string& name, const std::string& xpub,
                                    const std::string& request_pub_key);

    // Stable copayer id: hex SHA256 of the extended public key text, prefixed
    // with the chain ticker for every chain except BTC
    static std::string xpub_to_copayer_id(Chain chain, const std::string& xpub);

    // Signature of the request public key by the extended private key's
    // child at the request-key authorization path
    static std::string sign_request_pub_key(const std::string& request_pub_key, const std::string& xprv);

    static bool verify_request_pub_key(const std::string& request_pub_key, const std::string& signature_hex,
                                       const std::string& xpub);

    // Base64 of the first 16 bytes of SHA256 over the private key bytes
    static std::string private_key_to_aes_key(std::span<const uint8_t> private_key);

private:
    MessageSigner() = delete;

    static std::string join(const std::vector<std::string>& parts, char separator);
};

} // namespace cosign
