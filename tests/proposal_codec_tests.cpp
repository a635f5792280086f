#include "test_helpers.hpp"
#include "proposal_codec.hpp"
#include "utxo_chain_adapter.hpp"

#include <filesystem>
#include <fstream>

using namespace cosign;
using namespace cosign::test;

////////////////////////////////////////////////////////////////////////////////
class ProposalCodecTest : public ::testing::Test
{
protected:
    ProposalCodecTest()
        : adapter_(Chain::Btc, ServiceConfig{}, nullptr)
    {
        copayers_ = make_copayers(Chain::Btc, 3);
    }

    TxProposal published()
    {
        auto opts = utxo_proposal_options(copayers_, 2, ScriptType::P2SH, 4000, 1000);
        opts.no_shuffle_outputs = false;
        opts.custom_data = {{"invoice", "A-17"}};
        auto txp = TxProposal::create(opts);
        txp.set_inputs({wallet_utxo(xpubs_of(copayers_), 2, ScriptType::P2SH, "m/0/0", 5000, 0x01)});
        txp.set_fee(370);

        TxProposal::PublishOptions publish;
        publish.proposal_signature = sign_proposal(adapter_, txp, copayers_[0].request_priv);
        txp.publish(adapter_, copayers_[0].copayer, publish);
        return txp;
    }

    void accept(TxProposal& txp, size_t who)
    {
        txp.sign(adapter_, copayers_[who].copayer.id, sign_inputs(adapter_, txp, copayers_[who].xprv),
                 copayers_[who].xpub);
    }

    UtxoChainAdapter adapter_;
    std::vector<TestCopayer> copayers_;
};

TEST_F(ProposalCodecTest, RecordKeys)
{
    auto txp = published();
    accept(txp, 0);
    auto j = ProposalCodec::to_json(txp);

    EXPECT_EQ(j["id"], txp.id());
    EXPECT_EQ(j["version"], 3);
    EXPECT_EQ(j["status"], "pending");
    EXPECT_EQ(j["chain"], "btc");
    EXPECT_EQ(j["network"], "livenet");
    EXPECT_EQ(j["walletM"], 2);
    EXPECT_EQ(j["walletN"], 3);
    EXPECT_EQ(j["requiredRejections"], 2);
    EXPECT_EQ(j["addressType"], "P2SH");
    EXPECT_EQ(j["amount"], 4000);
    EXPECT_EQ(j["fee"], 370);
    EXPECT_EQ(j["feePerKb"], 1000);
    EXPECT_EQ(j["outputs"][0]["toAddress"], foreign_address(0x55));
    EXPECT_EQ(j["changeAddress"]["path"], "m/1/0");
    EXPECT_EQ(j["inputs"].size(), 1u);
    EXPECT_EQ(j["inputs"][0]["publicKeys"].size(), 3u);
    EXPECT_EQ(j["actions"][0]["type"], "accept");
    EXPECT_EQ(j["actions"][0]["signatures"].size(), 1u);
    EXPECT_EQ(j["customData"]["invoice"], "A-17");
    EXPECT_EQ(j["outputOrder"].size(), 2u);
    EXPECT_FALSE(j.contains("raw"));
    EXPECT_FALSE(j.contains("proposalSignaturePubKey"));
}

TEST_F(ProposalCodecTest, DecodedProposalKeepsCollectingVotes)
{
    auto txp = published();
    accept(txp, 0);

    auto decoded = ProposalCodec::from_json(ProposalCodec::to_json(txp));
    EXPECT_EQ(decoded.id(), txp.id());
    EXPECT_TRUE(decoded.is_pending());
    EXPECT_EQ(decoded.output_order(), txp.output_order());
    EXPECT_EQ(decoded.raw_unsigned(adapter_), txp.raw_unsigned(adapter_));
    EXPECT_EQ(decoded.actions().size(), 1u);

    accept(decoded, 1);
    EXPECT_EQ(decoded.status(), ProposalStatus::Accepted);

    auto j = ProposalCodec::to_json(decoded);
    EXPECT_EQ(j["status"], "accepted");
    ASSERT_TRUE(j["raw"].is_string());
    EXPECT_EQ(j["raw"], decoded.raw().front());
    EXPECT_EQ(j["txid"], decoded.txid());
}

TEST_F(ProposalCodecTest, UnsetFee)
{
    auto txp = TxProposal::create(utxo_proposal_options(copayers_, 2, ScriptType::P2SH, 4000, 1000));
    auto j = ProposalCodec::to_json(txp);
    EXPECT_TRUE(j["fee"].is_null());
    EXPECT_FALSE(ProposalCodec::from_json(j).fee());
}

TEST_F(ProposalCodecTest, AccountPayload)
{
    TxProposal::CreateOptions opts;
    opts.chain = Chain::Eth;
    opts.creator_id = "creator";
    opts.wallet_m = 1;
    opts.wallet_n = 1;
    TxOutput output{1000, "0x37d7B3bBD88EFdE6a93cF74D2F5b0385D3E3B08A"};
    output.gas_limit = 21000;
    opts.outputs = {output};
    EvmPayload evm;
    evm.nonce = 4;
    evm.gas_price = 20;
    evm.from = "0x6d4E6d4E6d4E6d4E6d4E6d4E6d4E6d4E6d4E6d4E";
    opts.payload = evm;
    auto txp = TxProposal::create(opts);

    auto j = ProposalCodec::to_json(txp);
    EXPECT_EQ(j["nonce"], 4);
    EXPECT_EQ(j["gasPrice"], 20);
    EXPECT_EQ(j["outputs"][0]["gasLimit"], 21000);
    EXPECT_FALSE(j.contains("inputs"));

    auto decoded = ProposalCodec::from_json(j);
    ASSERT_TRUE(std::holds_alternative<EvmPayload>(decoded.payload()));
    EXPECT_EQ(std::get<EvmPayload>(decoded.payload()).from, evm.from);
    ASSERT_TRUE(decoded.outputs()[0].gas_limit);
    EXPECT_EQ(*decoded.outputs()[0].gas_limit, 21000u);
}

TEST_F(ProposalCodecTest, OldOrBrokenRecords)
{
    auto j = ProposalCodec::to_json(published());

    auto old = j;
    old["version"] = 2;
    EXPECT_EQ(error_code_of([&] { ProposalCodec::from_json(old); }), Error::Code::UnsupportedFormat);

    auto unversioned = j;
    unversioned.erase("version");
    EXPECT_EQ(error_code_of([&] { ProposalCodec::from_json(unversioned); }), Error::Code::UnsupportedFormat);

    auto bad_status = j;
    bad_status["status"] = "lost";
    EXPECT_EQ(error_code_of([&] { ProposalCodec::from_json(bad_status); }), Error::Code::InvalidArgument);

    auto bad_network = j;
    bad_network["network"] = "moonnet";
    EXPECT_EQ(error_code_of([&] { ProposalCodec::from_json(bad_network); }), Error::Code::InvalidNetwork);

    auto no_outputs = j;
    no_outputs.erase("outputs");
    EXPECT_EQ(error_code_of([&] { ProposalCodec::from_json(no_outputs); }), Error::Code::InvalidArgument);

    auto bad_fee = j;
    bad_fee["fee"] = "cheap";
    EXPECT_EQ(error_code_of([&] { ProposalCodec::from_json(bad_fee); }), Error::Code::InvalidArgument);

    EXPECT_EQ(error_code_of([] { ProposalCodec::from_json(nlohmann::json::array()); }),
              Error::Code::InvalidArgument);
}

TEST_F(ProposalCodecTest, QuorumFollowsWalletParameters)
{
    auto j = ProposalCodec::to_json(published());

    auto decoded = ProposalCodec::from_json(j);
    EXPECT_EQ(decoded.required_signatures(), 2u);
    EXPECT_EQ(decoded.required_rejections(), 2u);

    auto one_signature = j;
    one_signature["requiredSignatures"] = 1;
    EXPECT_EQ(error_code_of([&] { ProposalCodec::from_json(one_signature); }), Error::Code::InvalidArgument);

    auto no_rejections = j;
    no_rejections["requiredRejections"] = 0;
    EXPECT_EQ(error_code_of([&] { ProposalCodec::from_json(no_rejections); }), Error::Code::InvalidArgument);

    // Absent values are derived
    auto bare = j;
    bare.erase("requiredSignatures");
    bare.erase("requiredRejections");
    auto derived = ProposalCodec::from_json(bare);
    EXPECT_EQ(derived.required_signatures(), 2u);
    EXPECT_EQ(derived.required_rejections(), 2u);
}

TEST_F(ProposalCodecTest, LoadFromFile)
{
    auto txp = published();
    auto path = (std::filesystem::temp_directory_path() / "cosign_proposal_test.json").string();
    {
        std::ofstream out(path);
        out << ProposalCodec::to_json(txp).dump(2);
    }
    auto loaded = ProposalCodec::load_from_file(path);
    std::filesystem::remove(path);

    EXPECT_EQ(loaded.id(), txp.id());
    EXPECT_EQ(loaded.proposal_signature(), txp.proposal_signature());
    EXPECT_THROW(ProposalCodec::load_from_file(path), Error);
}
