#include "memo_cipher.hpp"
#include "base64.hpp"
#include "error.hpp"

#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace cosign {

namespace {

constexpr size_t KEY_SIZE = 16;
constexpr size_t IV_SIZE = 16;
constexpr int TAG_SIZE = 8;

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtxPtr new_cipher_ctx() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw Error(Error::Code::CryptoFailure);
    }
    return ctx;
}

std::vector<uint8_t> decode_key(const std::string& key) {
    std::vector<uint8_t> bytes;
    try {
        bytes = Base64::decode(key);
    } catch (const Error&) {
        throw Error(Error::Code::InvalidArgument, "Encrypting key is not base64");
    }
    if (bytes.size() != KEY_SIZE) {
        throw Error(Error::Code::InvalidArgument, "Encrypting key must be 128 bits");
    }
    return bytes;
}

// CCM length field size as SJCL picks it: at least 2 bytes, more for long
// messages, and never less than what a nonce cut from the IV leaves over.
size_t nonce_size(size_t plaintext_size) {
    size_t l = 2;
    while (l < 4 && (plaintext_size >> (8 * l)) != 0) {
        ++l;
    }
    return 15 - l;
}

} // namespace

std::string MemoCipher::encrypt_message(const std::string& message, const std::string& key) {
    auto key_bytes = decode_key(key);

    std::vector<uint8_t> iv(IV_SIZE);
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
        throw Error(Error::Code::CryptoFailure, "Random generator failure");
    }
    int nonce_len = static_cast<int>(nonce_size(message.size()));

    auto ctx = new_cipher_ctx();
    std::vector<uint8_t> out(message.size() + TAG_SIZE);
    int len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_ccm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_SET_IVLEN, nonce_len, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_SET_TAG, TAG_SIZE, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_bytes.data(), iv.data()) != 1 ||
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, nullptr, static_cast<int>(message.size())) != 1) {
        throw Error(Error::Code::CryptoFailure, "Cipher initialization failed");
    }
    if (!message.empty() &&
        EVP_EncryptUpdate(ctx.get(), out.data(), &len,
                          reinterpret_cast<const unsigned char*>(message.data()),
                          static_cast<int>(message.size())) != 1) {
        throw Error(Error::Code::CryptoFailure, "Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + message.size(), &final_len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_GET_TAG, TAG_SIZE, out.data() + message.size()) != 1) {
        throw Error(Error::Code::CryptoFailure, "Could not compute tag");
    }

    nlohmann::json envelope = {
        {"iv", Base64::encode(iv)},
        {"v", 1},
        {"iter", 1},
        {"ks", 128},
        {"ts", TAG_SIZE * 8},
        {"mode", "ccm"},
        {"adata", ""},
        {"cipher", "aes"},
        {"ct", Base64::encode(out)}
    };
    return envelope.dump();
}

std::string MemoCipher::decrypt_message(const std::string& envelope, const std::string& key) {
    auto key_bytes = decode_key(key);

    auto json = nlohmann::json::parse(envelope, nullptr, false);
    if (json.is_discarded() || !json.is_object() ||
        !json.contains("iv") || !json.contains("ct") ||
        !json["iv"].is_string() || !json["ct"].is_string()) {
        throw Error(Error::Code::DecryptionFailed, "Not an encrypted message");
    }
    if (json.value("mode", "ccm") != "ccm" || json.value("cipher", "aes") != "aes" ||
        json.value("ks", 128) != 128 || json.value("ts", 64) != TAG_SIZE * 8) {
        throw Error(Error::Code::DecryptionFailed, "Unsupported cipher parameters");
    }

    std::vector<uint8_t> iv;
    std::vector<uint8_t> ct;
    try {
        iv = Base64::decode(json["iv"].get<std::string>());
        ct = Base64::decode(json["ct"].get<std::string>());
    } catch (const Error&) {
        throw Error(Error::Code::DecryptionFailed, "Malformed envelope");
    }
    if (ct.size() < static_cast<size_t>(TAG_SIZE)) {
        throw Error(Error::Code::DecryptionFailed, "Ciphertext too short");
    }

    size_t plaintext_size = ct.size() - TAG_SIZE;
    size_t nonce_len = nonce_size(plaintext_size);
    if (iv.size() < nonce_len) {
        throw Error(Error::Code::DecryptionFailed, "IV too short");
    }

    auto ctx = new_cipher_ctx();
    std::vector<uint8_t> plaintext(plaintext_size + 1);
    int len = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_ccm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_SET_IVLEN, static_cast<int>(nonce_len), nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_SET_TAG, TAG_SIZE, ct.data() + plaintext_size) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_bytes.data(), iv.data()) != 1 ||
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, nullptr, static_cast<int>(plaintext_size)) != 1) {
        throw Error(Error::Code::CryptoFailure, "Cipher initialization failed");
    }
    // In CCM mode the tag is checked by the single update call
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ct.data(),
                          static_cast<int>(plaintext_size)) <= 0) {
        throw Error(Error::Code::DecryptionFailed, "Message authentication failed");
    }

    return std::string(plaintext.begin(), plaintext.begin() + static_cast<long>(plaintext_size));
}

std::string MemoCipher::decrypt_message_no_throw(const std::string& envelope, const std::string& key) {
    if (key.empty()) {
        return CANNOT_DECRYPT;
    }
    if (envelope.empty()) {
        return "";
    }

    auto json = nlohmann::json::parse(envelope, nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("iv") || !json.contains("ct")) {
        return envelope;
    }

    try {
        return decrypt_message(envelope, key);
    } catch (const Error&) {
        return CANNOT_DECRYPT;
    }
}

} // namespace cosign
