#include "test_helpers.hpp"
#include "account_chain_adapter.hpp"
#include "bip32_util.hpp"
#include "coin_selector.hpp"
#include "ecdsa.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "key_deserializer.hpp"

using namespace cosign;
using namespace cosign::test;

namespace {

// Toy byte format: one "nonce:to:amount" record per transaction, signed with
// ECDSA over its sha256
class FakeEncoder : public AccountTxEncoder {
public:
    std::vector<std::string> build_unsigned(const TxProposal& txp) const override
    {
        uint64_t nonce = 0;
        if (const auto* evm = std::get_if<EvmPayload>(&txp.payload())) {
            nonce = evm->nonce;
        }
        std::vector<std::string> raws;
        if (txp.multi_tx()) {
            for (const auto& output : txp.outputs()) {
                raws.push_back(record(nonce++, {output}));
            }
        } else {
            raws.push_back(record(nonce, txp.outputs()));
        }
        return raws;
    }

    bool verify_signature(const std::string& raw,
                          const std::string& signature,
                          std::span<const uint8_t> public_key) const override
    {
        if (!HexUtils::is_hex(signature)) {
            return false;
        }
        return Ecdsa::verify(public_key, digest(raw), HexUtils::decode(signature));
    }

    std::string apply_signature(const std::string& raw, const std::string& signature) const override
    {
        return raw + signature;
    }

    std::string txid(const std::string& signed_raw) const override
    {
        return HexUtils::encode(HashUtils::sha256(HexUtils::decode(signed_raw)));
    }

    uint64_t estimated_fee(const TxProposal& txp) const override
    {
        uint64_t gas_price = 1;
        if (const auto* evm = std::get_if<EvmPayload>(&txp.payload())) {
            gas_price = evm->gas_price;
        }
        return 21000 * gas_price * build_unsigned(txp).size();
    }

    void validate_address(const std::string& address, Network) const override
    {
        if (address.size() != 42 || address.rfind("0x", 0) != 0 || !HexUtils::is_hex(address.substr(2))) {
            throw Error(Error::Code::InvalidAddress, address);
        }
    }

    static Hash256 digest(const std::string& raw)
    {
        return HashUtils::sha256(HexUtils::decode(raw));
    }

private:
    static std::string record(uint64_t nonce, const std::vector<TxOutput>& outputs)
    {
        std::string text = std::to_string(nonce);
        for (const auto& output : outputs) {
            text += ":" + output.to_address + ":" + std::to_string(output.amount);
        }
        return HexUtils::encode(HashUtils::as_bytes(text));
    }
};

const std::string RECIPIENT = "0x37d7b3bbd88efde6a93cf74d2f5b0385d3e3b08a";
const std::string OTHER_RECIPIENT = "0x6d4e6d4e6d4e6d4e6d4e6d4e6d4e6d4e6d4e6d4e";

} // namespace

////////////////////////////////////////////////////////////////////////////////
class AccountChainAdapterTest : public ::testing::Test
{
protected:
    AccountChainAdapterTest()
        : encoder_(std::make_shared<FakeEncoder>())
        , adapter_(Chain::Eth, ServiceConfig{}, encoder_, nullptr)
    {
        copayers_ = make_copayers(Chain::Eth, 3);
    }

    TxProposal::CreateOptions options(std::vector<TxOutput> outputs, bool multi_tx = false)
    {
        TxProposal::CreateOptions opts;
        opts.chain = Chain::Eth;
        opts.wallet_id = "eth-wallet";
        opts.creator_id = copayers_[0].copayer.id;
        opts.creator_name = copayers_[0].copayer.name;
        opts.wallet_m = 2;
        opts.wallet_n = 3;
        opts.outputs = std::move(outputs);
        opts.multi_tx = multi_tx;
        opts.no_shuffle_outputs = true;
        EvmPayload evm;
        evm.nonce = 7;
        evm.gas_price = 30;
        evm.gas_limit = 21000;
        opts.payload = evm;
        return opts;
    }

    TxProposal published(const TxProposal::CreateOptions& opts)
    {
        auto txp = TxProposal::create(opts);
        TxProposal::PublishOptions publish;
        publish.proposal_signature = sign_proposal(adapter_, txp, copayers_[0].request_priv);
        txp.publish(adapter_, copayers_[0].copayer, publish);
        return txp;
    }

    // One signature per transaction by the copayer's key at m/0/0
    std::vector<std::string> sign_all(const TxProposal& txp, size_t who)
    {
        auto key = Bip32Util::get_child_key_at_path(KeyDeserializer::from_base58(copayers_[who].xprv), "m/0/0");
        std::vector<std::string> signatures;
        for (const auto& raw : encoder_->build_unsigned(txp)) {
            signatures.push_back(HexUtils::encode(Ecdsa::sign(key.private_key(), FakeEncoder::digest(raw))));
        }
        return signatures;
    }

    void accept(TxProposal& txp, size_t who)
    {
        txp.sign(adapter_, copayers_[who].copayer.id, sign_all(txp, who), copayers_[who].xpub);
    }

    std::shared_ptr<FakeEncoder> encoder_;
    AccountChainAdapter adapter_;
    std::vector<TestCopayer> copayers_;
};

TEST_F(AccountChainAdapterTest, Model)
{
    EXPECT_FALSE(adapter_.is_utxo_model());
    EXPECT_TRUE(adapter_.supports_multisig());
    EXPECT_EQ(adapter_.dust_threshold(Network::Livenet), 0u);

    AccountChainAdapter xrp(Chain::Xrp, ServiceConfig{}, encoder_, nullptr);
    EXPECT_FALSE(xrp.supports_multisig());
}

TEST_F(AccountChainAdapterTest, SizeAndFee)
{
    auto txp = TxProposal::create(options({TxOutput{1000, RECIPIENT}}));
    auto raw = encoder_->build_unsigned(txp).front();

    EXPECT_EQ(adapter_.estimated_size(txp, {}), raw.size() / 2);
    EXPECT_EQ(adapter_.estimated_size_for_single_input(txp, {}), 0u);
    EXPECT_EQ(adapter_.estimated_fee(txp, {}), 21000u * 30);
    EXPECT_EQ(adapter_.check_tx(txp), 21000u * 30);

    txp.set_fee(50000);
    EXPECT_EQ(adapter_.check_tx(txp), 50000u);
}

TEST_F(AccountChainAdapterTest, FeeAboveChainMaximum)
{
    TxProposal::CreateOptions opts;
    opts.chain = Chain::Xrp;
    opts.creator_id = "creator";
    opts.outputs = {TxOutput{1000, RECIPIENT}};
    opts.payload = XrpPayload{};
    auto txp = TxProposal::create(opts);
    AccountChainAdapter xrp(Chain::Xrp, ServiceConfig{}, encoder_, nullptr);

    txp.set_fee(1'000'000);
    EXPECT_EQ(xrp.check_tx(txp), 1'000'000u);
    txp.set_fee(1'000'001);
    EXPECT_EQ(error_code_of([&] { xrp.check_tx(txp); }), Error::Code::FeeTooHigh);
}

TEST_F(AccountChainAdapterTest, SharedWalletFlow)
{
    auto txp = published(options({TxOutput{1000, RECIPIENT}}));
    EXPECT_TRUE(txp.is_pending());

    accept(txp, 0);
    EXPECT_TRUE(txp.is_pending());
    accept(txp, 2);
    ASSERT_EQ(txp.status(), ProposalStatus::Accepted);

    auto raw = encoder_->build_unsigned(txp).front();
    ASSERT_EQ(txp.raw().size(), 1u);
    EXPECT_EQ(txp.raw().front().rfind(raw, 0), 0u);
    EXPECT_GT(txp.raw().front().size(), raw.size());
    EXPECT_EQ(txp.txid(), encoder_->txid(txp.raw().front()));
    EXPECT_TRUE(txp.txids().empty());

    txp.set_broadcasted();
    EXPECT_EQ(txp.status(), ProposalStatus::Broadcasted);
}

TEST_F(AccountChainAdapterTest, MultiTransactionProposal)
{
    auto txp = published(options({TxOutput{1000, RECIPIENT}, TxOutput{2000, OTHER_RECIPIENT}}, true));
    EXPECT_EQ(txp.output_order().size(), 2u);
    EXPECT_EQ(txp.raw_unsigned(adapter_).size(), 2u);
    EXPECT_EQ(adapter_.check_tx(txp), 2u * 21000 * 30);

    // One signature for each transaction
    auto partial = sign_all(txp, 1);
    partial.pop_back();
    EXPECT_EQ(error_code_of([&] { txp.sign(adapter_, copayers_[1].copayer.id, partial, copayers_[1].xpub); }),
              Error::Code::SignatureCountMismatch);
    EXPECT_TRUE(txp.actions().empty());

    accept(txp, 1);
    accept(txp, 0);
    ASSERT_EQ(txp.status(), ProposalStatus::Accepted);
    EXPECT_EQ(txp.raw().size(), 2u);
    ASSERT_EQ(txp.txids().size(), 2u);
    EXPECT_EQ(txp.txid(), txp.txids().front());
    EXPECT_NE(txp.txids()[0], txp.txids()[1]);
}

TEST_F(AccountChainAdapterTest, SeveralTransactionsNeedMultiTx)
{
    class SplittingEncoder : public FakeEncoder {
    public:
        std::vector<std::string> build_unsigned(const TxProposal& txp) const override
        {
            auto raws = FakeEncoder::build_unsigned(txp);
            raws.push_back(raws.front());
            return raws;
        }
    };
    AccountChainAdapter adapter(Chain::Eth, ServiceConfig{}, std::make_shared<SplittingEncoder>(), nullptr);
    auto txp = TxProposal::create(options({TxOutput{1000, RECIPIENT}}));
    EXPECT_EQ(error_code_of([&] { adapter.build_transaction(txp, false); }), Error::Code::InvalidArgument);
}

TEST_F(AccountChainAdapterTest, SignaturesFromAnotherKey)
{
    auto txp = published(options({TxOutput{1000, RECIPIENT}}));

    // Copayer 1 signing with copayer 2's key
    EXPECT_EQ(error_code_of([&] {
        txp.sign(adapter_, copayers_[1].copayer.id, sign_all(txp, 2), copayers_[1].xpub);
    }), Error::Code::BadSignatures);
    EXPECT_EQ(error_code_of([&] {
        txp.sign(adapter_, copayers_[1].copayer.id, {"not-hex"}, copayers_[1].xpub);
    }), Error::Code::BadSignatures);
    EXPECT_TRUE(txp.is_pending());
    EXPECT_TRUE(txp.actions().empty());
}

TEST_F(AccountChainAdapterTest, Outputs)
{
    Wallet wallet("eth-wallet", "treasury", 2, 3, Chain::Eth, Network::Livenet);
    EXPECT_NO_THROW(adapter_.validate_address(wallet, RECIPIENT));
    EXPECT_EQ(error_code_of([&] { adapter_.validate_address(wallet, "0x1234"); }), Error::Code::InvalidAddress);
    EXPECT_EQ(error_code_of([&] { adapter_.validate_address(wallet, foreign_address(0x55)); }),
              Error::Code::InvalidAddress);

    TxOutput dust{1, RECIPIENT};
    EXPECT_NO_THROW(adapter_.check_dust(dust, Network::Livenet));

    TxOutput script{0, ""};
    script.script = "6a0568656c6c6f";
    EXPECT_EQ(error_code_of([&] { adapter_.check_script_output(script); }), Error::Code::ScriptType);
    EXPECT_NO_THROW(adapter_.check_script_output(dust));
}

TEST_F(AccountChainAdapterTest, SendMaxIsUtxoOnly)
{
    auto txp = TxProposal::create(options({}));
    CoinSelector selector(adapter_);
    EXPECT_EQ(error_code_of([&] { selector.send_max_info(txp, {}); }), Error::Code::UnsupportedChain);
}

TEST_F(AccountChainAdapterTest, Factory)
{
    EXPECT_EQ(error_code_of([] { make_chain_adapter(Chain::Eth, ServiceConfig{}); }),
              Error::Code::UnsupportedChain);
    EXPECT_EQ(error_code_of([] { AccountChainAdapter(Chain::Sol, ServiceConfig{}, nullptr, nullptr); }),
              Error::Code::UnsupportedChain);

    auto adapter = make_chain_adapter(Chain::Matic, ServiceConfig{}, encoder_);
    EXPECT_EQ(adapter->chain(), Chain::Matic);
    EXPECT_FALSE(adapter->is_utxo_model());

    EXPECT_TRUE(make_chain_adapter(Chain::Ltc, ServiceConfig{})->is_utxo_model());
}
