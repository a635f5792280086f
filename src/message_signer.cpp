#include "message_signer.hpp"
#include "base64.hpp"
#include "bip32_util.hpp"
#include "consts.hpp"
#include "ecdsa.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "key_deserializer.hpp"
#include <algorithm>

namespace cosign {

std::string MessageSigner::join(const std::vector<std::string>& parts, char separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.push_back(separator);
        }
        out += parts[i];
    }
    return out;
}

std::array<uint8_t, 32> MessageSigner::hash_message(const std::string& text) {
    auto hash = HashUtils::double_sha256(HashUtils::as_bytes(text));
    std::reverse(hash.begin(), hash.end());
    return hash;
}

std::string MessageSigner::sign_message(const std::string& text, std::span<const uint8_t> private_key) {
    auto digest = hash_message(text);
    std::reverse(digest.begin(), digest.end());
    return HexUtils::encode(Ecdsa::sign(private_key, digest));
}

std::string MessageSigner::sign_message(const std::vector<std::string>& parts,
                                        std::span<const uint8_t> private_key) {
    return sign_message(join(parts, ','), private_key);
}

bool MessageSigner::verify_message(const std::string& text, const std::string& signature_hex,
                                   const std::string& public_key_hex) {
    if (signature_hex.empty() || !HexUtils::is_hex(signature_hex) || !HexUtils::is_hex(public_key_hex)) {
        return false;
    }
    auto digest = hash_message(text);
    std::reverse(digest.begin(), digest.end());
    return Ecdsa::verify(HexUtils::decode(public_key_hex), digest, HexUtils::decode(signature_hex));
}

bool MessageSigner::verify_message(const std::vector<std::string>& parts, const std::string& signature_hex,
                                   const std::string& public_key_hex) {
    return verify_message(join(parts, ','), signature_hex, public_key_hex);
}

std::string MessageSigner::copayer_hash(const std::string& name, const std::string& xpub,
                                        const std::string& request_pub_key) {
    return join({name, xpub, request_pub_key}, '|');
}

std::string MessageSigner::xpub_to_copayer_id(Chain chain, const std::string& xpub) {
    std::string text = chain == Chain::Btc ? xpub : to_string(chain) + xpub;
    return HexUtils::encode(HashUtils::sha256(HashUtils::as_bytes(text)));
}

std::string MessageSigner::sign_request_pub_key(const std::string& request_pub_key, const std::string& xprv) {
    auto root = KeyDeserializer::from_base58(xprv);
    if (!root.is_private()) {
        throw Error(Error::Code::InvalidKeyFormat, "Request key delegation needs an extended private key");
    }
    auto auth = Bip32Util::get_child_key_at_path(root, defaults::REQUEST_KEY_AUTH_PATH);
    return sign_message(request_pub_key, auth.private_key());
}

bool MessageSigner::verify_request_pub_key(const std::string& request_pub_key, const std::string& signature_hex,
                                           const std::string& xpub) {
    try {
        auto root = KeyDeserializer::from_base58(xpub);
        auto auth = Bip32Util::get_child_key_at_path(root, defaults::REQUEST_KEY_AUTH_PATH);
        return verify_message(request_pub_key, signature_hex, HexUtils::encode(auth.public_key()));
    } catch (const Error&) {
        return false;
    }
}

std::string MessageSigner::private_key_to_aes_key(std::span<const uint8_t> private_key) {
    auto hash = HashUtils::sha256(private_key);
    return Base64::encode(std::span<const uint8_t>(hash.data(), 16));
}

} // namespace cosign
