#include "test_helpers.hpp"
#include "address.hpp"
#include "address_deriver.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "script.hpp"

using namespace cosign;
using namespace cosign::test;

namespace {

const char* GENERATOR_HASH = "751e76e8199196d454941c45d1b3a323f1433bd6";

} // namespace

////////////////////////////////////////////////////////////////////////////////
class AddressCodecTest : public ::testing::Test
{};

TEST_F(AddressCodecTest, BitcoinEncodings)
{
    auto hash = HexUtils::decode(GENERATOR_HASH);
    EXPECT_EQ(AddressCodec::encode(ScriptType::P2PKH, hash, Chain::Btc, Network::Livenet),
              "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH");
    EXPECT_EQ(AddressCodec::encode(ScriptType::P2WPKH, hash, Chain::Btc, Network::Livenet),
              "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");
}

TEST_F(AddressCodecTest, ParseGivesTypeAndHash)
{
    auto address = AddressCodec::parse("1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", Chain::Btc, Network::Livenet);
    EXPECT_EQ(address.type, ScriptType::P2PKH);
    EXPECT_EQ(HexUtils::encode(address.hash), GENERATOR_HASH);

    auto segwit = AddressCodec::parse("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4", Chain::Btc, Network::Livenet);
    EXPECT_EQ(segwit.type, ScriptType::P2WPKH);
    EXPECT_EQ(HexUtils::encode(AddressCodec::script_for(segwit)),
              std::string("0014") + GENERATOR_HASH);
}

TEST_F(AddressCodecTest, WrongNetworkIsReported)
{
    auto code = error_code_of([] {
        AddressCodec::parse("1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", Chain::Btc, Network::Testnet);
    });
    EXPECT_EQ(code, Error::Code::IncorrectAddressNetwork);
}

TEST_F(AddressCodecTest, GarbageIsInvalid)
{
    auto code = error_code_of([] {
        AddressCodec::parse("not-an-address", Chain::Btc, Network::Livenet);
    });
    EXPECT_EQ(code, Error::Code::InvalidAddress);
    EXPECT_THROW(AddressCodec::output_script("", Chain::Btc, Network::Livenet), Error);
}

TEST_F(AddressCodecTest, AccountChainsHaveNoCodec)
{
    auto hash = HexUtils::decode(GENERATOR_HASH);
    auto code = error_code_of([&] {
        AddressCodec::encode(ScriptType::P2PKH, hash, Chain::Eth, Network::Livenet);
    });
    EXPECT_EQ(code, Error::Code::UnsupportedChain);
}

TEST_F(AddressCodecTest, BitcoinCashUsesCashAddr)
{
    auto hash = HexUtils::decode(GENERATOR_HASH);
    auto cash = AddressCodec::encode(ScriptType::P2PKH, hash, Chain::Bch, Network::Livenet);
    EXPECT_EQ(cash.rfind("bitcoincash:q", 0), 0u);

    // Legacy Base58 and CashAddr of the same key pay the same script
    EXPECT_TRUE(AddressCodec::same_destination(cash, "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH",
                                               Chain::Bch, Network::Livenet));

    // The prefix is optional on input
    auto bare = cash.substr(std::string("bitcoincash:").size());
    auto parsed = AddressCodec::parse(bare, Chain::Bch, Network::Livenet);
    EXPECT_EQ(HexUtils::encode(parsed.hash), GENERATOR_HASH);
}

TEST_F(AddressCodecTest, SameDestinationNeverThrows)
{
    EXPECT_FALSE(AddressCodec::same_destination("garbage", "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH",
                                                Chain::Btc, Network::Livenet));
    EXPECT_FALSE(AddressCodec::same_destination(foreign_address(0x01), foreign_address(0x02),
                                                Chain::Btc, Network::Livenet));
    EXPECT_TRUE(AddressCodec::same_destination(foreign_address(0x01), foreign_address(0x01),
                                               Chain::Btc, Network::Livenet));
}

////////////////////////////////////////////////////////////////////////////////
class AddressDeriverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        copayers_ = make_copayers(Chain::Btc, 3);
        xpubs_ = xpubs_of(copayers_);
    }

    std::vector<TestCopayer> copayers_;
    std::vector<std::string> xpubs_;
};

TEST_F(AddressDeriverTest, MultisigIsDeterministic)
{
    auto first = AddressDeriver::derive(ScriptType::P2SH, xpubs_, "m/0/0", 2, Chain::Btc, Network::Livenet);
    auto again = AddressDeriver::derive(ScriptType::P2SH, xpubs_, "m/0/0", 2, Chain::Btc, Network::Livenet);
    EXPECT_EQ(first.address, again.address);
    EXPECT_EQ(first.path, "m/0/0");
    EXPECT_EQ(first.type, ScriptType::P2SH);
    ASSERT_EQ(first.public_keys.size(), 3u);
    EXPECT_EQ(first.address.front(), '3');

    auto next = AddressDeriver::derive(ScriptType::P2SH, xpubs_, "m/0/1", 2, Chain::Btc, Network::Livenet);
    EXPECT_NE(first.address, next.address);
}

TEST_F(AddressDeriverTest, KeyOrderDoesNotMatter)
{
    std::vector<std::string> reversed(xpubs_.rbegin(), xpubs_.rend());
    auto a = AddressDeriver::derive(ScriptType::P2WSH, xpubs_, "m/1/2", 2, Chain::Btc, Network::Livenet);
    auto b = AddressDeriver::derive(ScriptType::P2WSH, reversed, "m/1/2", 2, Chain::Btc, Network::Livenet);
    EXPECT_EQ(a.address, b.address);
    EXPECT_EQ(a.address.rfind("bc1q", 0), 0u);
}

TEST_F(AddressDeriverTest, SingleKeyUsesFirstMember)
{
    std::vector<std::string> one{xpubs_[0]};
    auto record = AddressDeriver::derive(ScriptType::P2PKH, one, "m/0/0", 1, Chain::Btc, Network::Livenet);
    auto key = AddressDeriver::derive_public_key(xpubs_[0], "m/0/0");
    EXPECT_EQ(record.address,
              AddressDeriver::address_for_keys(ScriptType::P2PKH, {key}, 1, Chain::Btc, Network::Livenet));
    ASSERT_EQ(record.public_keys.size(), 1u);
    EXPECT_EQ(record.public_keys[0], HexUtils::encode(key));
}

TEST_F(AddressDeriverTest, ExternKeyReplacesRing)
{
    std::vector<std::string> one{xpubs_[0]};
    auto extern_key = AddressDeriver::derive_public_key(xpubs_[1], "m/0/7");
    auto record = AddressDeriver::derive(ScriptType::P2WPKH, one, "m/0/0", 1, Chain::Btc, Network::Livenet,
                                         {}, HexUtils::encode(extern_key));
    EXPECT_EQ(record.address,
              AddressDeriver::address_for_keys(ScriptType::P2WPKH, {extern_key}, 1, Chain::Btc, Network::Livenet));
}

TEST_F(AddressDeriverTest, AccountChainsAreRejected)
{
    auto code = error_code_of([&] {
        AddressDeriver::derive(ScriptType::P2PKH, xpubs_, "m/0/0", 2, Chain::Eth, Network::Livenet);
    });
    EXPECT_EQ(code, Error::Code::UnsupportedChain);
}

////////////////////////////////////////////////////////////////////////////////
class WalletAddressTest : public ::testing::Test
{};

TEST_F(WalletAddressTest, BranchesAndCounters)
{
    auto copayers = make_copayers(Chain::Btc, 3);
    Wallet wallet("w1", "shared", 2, 3, Chain::Btc, Network::Livenet);
    EXPECT_EQ(wallet.address_type(), ScriptType::P2SH);
    EXPECT_THROW(wallet.create_address(false), Error);

    for (const auto& copayer : copayers) {
        wallet.add_copayer(copayer.copayer);
    }
    ASSERT_TRUE(wallet.is_complete());

    EXPECT_EQ(wallet.create_address(false).path, "m/0/0");
    EXPECT_EQ(wallet.create_address(false).path, "m/0/1");
    auto change = wallet.create_address(true);
    EXPECT_EQ(change.path, "m/1/0");
    EXPECT_EQ(change.address,
              AddressDeriver::derive(ScriptType::P2SH, wallet.xpubs(), "m/1/0", 2, Chain::Btc,
                                     Network::Livenet).address);
}

TEST_F(WalletAddressTest, FullWalletRejectsCopayers)
{
    auto copayers = make_copayers(Chain::Btc, 2);
    Wallet wallet("w1", "solo", 1, 1, Chain::Btc, Network::Livenet);
    EXPECT_EQ(wallet.address_type(), ScriptType::P2PKH);
    wallet.add_copayer(copayers[0].copayer);
    EXPECT_THROW(wallet.add_copayer(copayers[1].copayer), Error);
}

TEST_F(WalletAddressTest, DuplicateCopayerRejected)
{
    auto copayers = make_copayers(Chain::Btc, 1);
    Wallet wallet("w1", "pair", 2, 2, Chain::Btc, Network::Livenet);
    wallet.add_copayer(copayers[0].copayer);
    auto code = error_code_of([&] { wallet.add_copayer(copayers[0].copayer); });
    EXPECT_EQ(code, Error::Code::InvalidArgument);
}

TEST_F(WalletAddressTest, ParamsAreChecked)
{
    EXPECT_THROW(Wallet::check_params(0, 1), Error);
    EXPECT_THROW(Wallet::check_params(3, 2), Error);
    EXPECT_NO_THROW(Wallet::check_params(2, 3));
}

TEST_F(WalletAddressTest, ZceNeedsSingleKeyCash)
{
    Wallet cash("w1", "cash", 1, 1, Chain::Bch, Network::Livenet);
    Wallet btc("w2", "btc", 1, 1, Chain::Btc, Network::Livenet);
    EXPECT_TRUE(cash.is_zce_compatible());
    EXPECT_FALSE(btc.is_zce_compatible());
}
