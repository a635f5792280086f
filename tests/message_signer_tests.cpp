#include "test_helpers.hpp"
#include "ec_utils.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "memo_cipher.hpp"
#include "message_signer.hpp"

#include <algorithm>

using namespace cosign;
using namespace cosign::test;

////////////////////////////////////////////////////////////////////////////////
class MessageSignerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        priv_ = fixed_private_key(0x07);
        pub_ = HexUtils::encode(EcUtils::public_key_from_private(priv_));
    }

    std::array<uint8_t, 32> priv_;
    std::string pub_;
};

TEST_F(MessageSignerTest, SignAndVerify)
{
    auto signature = MessageSigner::sign_message("hello", priv_);
    EXPECT_TRUE(MessageSigner::verify_message("hello", signature, pub_));
    EXPECT_FALSE(MessageSigner::verify_message("hello!", signature, pub_));

    auto other = HexUtils::encode(EcUtils::public_key_from_private(fixed_private_key(0x08)));
    EXPECT_FALSE(MessageSigner::verify_message("hello", signature, other));
}

TEST_F(MessageSignerTest, MalformedInputsDoNotVerify)
{
    auto signature = MessageSigner::sign_message("hello", priv_);
    EXPECT_FALSE(MessageSigner::verify_message("hello", "zz", pub_));
    EXPECT_FALSE(MessageSigner::verify_message("hello", signature, "02abcd"));
    EXPECT_FALSE(MessageSigner::verify_message("hello", "", pub_));
}

TEST_F(MessageSignerTest, PartsAreCommaJoined)
{
    std::vector<std::string> parts{"aa", "bb", "cc"};
    auto signature = MessageSigner::sign_message(parts, priv_);
    EXPECT_TRUE(MessageSigner::verify_message("aa,bb,cc", signature, pub_));
    EXPECT_TRUE(MessageSigner::verify_message(parts, signature, pub_));
    EXPECT_FALSE(MessageSigner::verify_message(std::vector<std::string>{"aa", "bb"}, signature, pub_));
}

TEST_F(MessageSignerTest, HashIsReversedDoubleSha)
{
    auto digest = HashUtils::double_sha256(HashUtils::as_bytes("hello"));
    auto hash = MessageSigner::hash_message("hello");
    EXPECT_TRUE(std::equal(hash.begin(), hash.end(), digest.rbegin()));
}

TEST_F(MessageSignerTest, CopayerHash)
{
    EXPECT_EQ(MessageSigner::copayer_hash("alice", "xpub1", "02ab"), "alice|xpub1|02ab");
}

TEST_F(MessageSignerTest, CopayerIdDependsOnChain)
{
    const std::string xpub = make_copayer(Chain::Btc, 0x21, "a").xpub;
    auto btc = MessageSigner::xpub_to_copayer_id(Chain::Btc, xpub);
    auto bch = MessageSigner::xpub_to_copayer_id(Chain::Bch, xpub);

    EXPECT_EQ(btc, HexUtils::encode(HashUtils::sha256(HashUtils::as_bytes(xpub))));
    EXPECT_EQ(bch, HexUtils::encode(HashUtils::sha256(HashUtils::as_bytes("bch" + xpub))));
    EXPECT_NE(btc, bch);
    EXPECT_EQ(btc.size(), 64u);
}

TEST_F(MessageSignerTest, RequestKeyDelegation)
{
    auto alice = make_copayer(Chain::Btc, 0x31, "alice");
    auto bob = make_copayer(Chain::Btc, 0x32, "bob");

    auto signature = MessageSigner::sign_request_pub_key(alice.request_pub, alice.xprv);
    EXPECT_TRUE(MessageSigner::verify_request_pub_key(alice.request_pub, signature, alice.xpub));
    EXPECT_FALSE(MessageSigner::verify_request_pub_key(alice.request_pub, signature, bob.xpub));
    EXPECT_FALSE(MessageSigner::verify_request_pub_key(bob.request_pub, signature, alice.xpub));

    EXPECT_EQ(error_code_of([&] { MessageSigner::sign_request_pub_key(alice.request_pub, alice.xpub); }),
              Error::Code::InvalidKeyFormat);
}

TEST_F(MessageSignerTest, AesKeyIsBase64Of128Bits)
{
    auto key = MessageSigner::private_key_to_aes_key(priv_);
    EXPECT_EQ(key.size(), 24u);
    EXPECT_EQ(key, MessageSigner::private_key_to_aes_key(priv_));
    EXPECT_NE(key, MessageSigner::private_key_to_aes_key(fixed_private_key(0x08)));
}

////////////////////////////////////////////////////////////////////////////////
class MemoCipherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        key_ = MessageSigner::private_key_to_aes_key(wallet_private_key());
        other_key_ = MessageSigner::private_key_to_aes_key(fixed_private_key(0x12));
    }

    std::string key_;
    std::string other_key_;
};

TEST_F(MemoCipherTest, RoundTrip)
{
    auto envelope = MemoCipher::encrypt_message("rent for march", key_);
    EXPECT_NE(envelope, "rent for march");
    EXPECT_EQ(MemoCipher::decrypt_message(envelope, key_), "rent for march");

    auto parsed = nlohmann::json::parse(envelope);
    EXPECT_TRUE(parsed.contains("iv"));
    EXPECT_TRUE(parsed.contains("ct"));
}

TEST_F(MemoCipherTest, FreshNoncePerMessage)
{
    EXPECT_NE(MemoCipher::encrypt_message("same", key_), MemoCipher::encrypt_message("same", key_));
}

TEST_F(MemoCipherTest, WrongKeyFails)
{
    auto envelope = MemoCipher::encrypt_message("secret", key_);
    EXPECT_EQ(error_code_of([&] { MemoCipher::decrypt_message(envelope, other_key_); }),
              Error::Code::DecryptionFailed);
    EXPECT_EQ(MemoCipher::decrypt_message_no_throw(envelope, other_key_), MemoCipher::CANNOT_DECRYPT);
}

TEST_F(MemoCipherTest, TamperedCiphertextFails)
{
    auto envelope = nlohmann::json::parse(MemoCipher::encrypt_message("secret", key_));
    auto ct = envelope["ct"].get<std::string>();
    ct[0] = ct[0] == 'A' ? 'B' : 'A';
    envelope["ct"] = ct;
    EXPECT_THROW(MemoCipher::decrypt_message(envelope.dump(), key_), Error);
}

TEST_F(MemoCipherTest, NoThrowPassThrough)
{
    EXPECT_EQ(MemoCipher::decrypt_message_no_throw("", key_), "");
    EXPECT_EQ(MemoCipher::decrypt_message_no_throw("plain note", key_), "plain note");
    EXPECT_THROW(MemoCipher::decrypt_message("plain note", key_), Error);
}
