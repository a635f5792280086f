#pragma once

#include <string>

namespace cosign {

// Symmetric encryption of memos, copayer names and proposal messages with the
// wallet's shared key. The envelope is the SJCL JSON format (AES-128-CCM,
// 64-bit tag, 13-byte nonce) so ciphertexts interoperate with existing
// clients.
class MemoCipher {
public:
    // Placeholder returned when a ciphertext cannot be decrypted with the key
    static constexpr const char* CANNOT_DECRYPT = "<ECANNOTDECRYPT>";

    // key is the base64 AES key from MessageSigner::private_key_to_aes_key
    static std::string encrypt_message(const std::string& message, const std::string& key);

    // Throws Error(DecryptionFailed) on a malformed envelope, a wrong key or
    // a tampered ciphertext
    static std::string decrypt_message(const std::string& envelope, const std::string& key);

    // Empty input decrypts to empty text, text that is not an envelope is
    // returned unchanged and failures yield CANNOT_DECRYPT
    static std::string decrypt_message_no_throw(const std::string& envelope, const std::string& key);

private:
    MemoCipher() = delete;
};

} // namespace cosign
