#include "test_helpers.hpp"
#include "ec_utils.hpp"
#include "hex_utils.hpp"
#include "memo_cipher.hpp"
#include "message_signer.hpp"
#include "utxo_chain_adapter.hpp"
#include "verifier.hpp"

using namespace cosign;
using namespace cosign::test;

////////////////////////////////////////////////////////////////////////////////
class VerifierTest : public ::testing::Test
{
protected:
    VerifierTest()
        : adapter_(Chain::Btc, ServiceConfig{}, nullptr)
    {
        copayers_ = make_copayers(Chain::Btc, 3);
        credentials_ = Credentials::from_json(credentials_json(copayers_, 1, 2, ScriptType::P2SH));
        key_ = MessageSigner::private_key_to_aes_key(wallet_private_key());
    }

    TxProposal draft(const TxProposal::CreateOptions& opts)
    {
        auto txp = TxProposal::create(opts);
        txp.set_inputs({wallet_utxo(xpubs_of(copayers_), 2, ScriptType::P2SH, "m/0/0", 5000, 0x01)});
        txp.set_fee(370);
        return txp;
    }

    TxProposal::CreateOptions options()
    {
        return utxo_proposal_options(copayers_, 2, ScriptType::P2SH, 4000, 1000);
    }

    void publish(TxProposal& txp)
    {
        TxProposal::PublishOptions opts;
        opts.proposal_signature = sign_proposal(adapter_, txp, copayers_[0].request_priv);
        txp.publish(adapter_, copayers_[0].copayer, opts);
    }

    UtxoChainAdapter adapter_;
    std::vector<TestCopayer> copayers_;
    Credentials credentials_;
    std::string key_;
};

TEST_F(VerifierTest, WalletAddress)
{
    auto record = AddressDeriver::derive(ScriptType::P2SH, xpubs_of(copayers_), "m/0/4", 2, Chain::Btc,
                                         Network::Livenet);
    EXPECT_TRUE(Verifier::check_address(credentials_, record));

    auto foreign = record;
    foreign.address = foreign_address(0x09);
    EXPECT_FALSE(Verifier::check_address(credentials_, foreign));

    auto wrong_path = record;
    wrong_path.path = "m/0/5";
    EXPECT_FALSE(Verifier::check_address(credentials_, wrong_path));

    auto missing_key = record;
    missing_key.public_keys.pop_back();
    EXPECT_FALSE(Verifier::check_address(credentials_, missing_key));
}

TEST_F(VerifierTest, IncompleteCredentials)
{
    auto j = credentials_json(copayers_, 1, 2, ScriptType::P2SH);
    j["n"] = 4;
    auto incomplete = Credentials::from_json(j);

    auto record = AddressDeriver::derive(ScriptType::P2SH, xpubs_of(copayers_), "m/0/0", 2, Chain::Btc,
                                         Network::Livenet);
    EXPECT_FALSE(Verifier::check_address(incomplete, record));
}

TEST_F(VerifierTest, Copayers)
{
    std::vector<Copayer> copayers;
    for (const auto& c : copayers_) {
        copayers.push_back(c.copayer);
    }
    EXPECT_TRUE(Verifier::check_copayers(credentials_, copayers));

    auto missing = copayers;
    missing.pop_back();
    EXPECT_FALSE(Verifier::check_copayers(credentials_, missing));

    auto repeated = copayers;
    repeated[2] = repeated[0];
    EXPECT_FALSE(Verifier::check_copayers(credentials_, repeated));

    auto renamed = copayers;
    renamed[0].name = "mallory";
    EXPECT_FALSE(Verifier::check_copayers(credentials_, renamed));

    // Validly signed, but our own key is gone
    auto replaced = copayers;
    replaced[1] = make_copayer(Chain::Btc, 0x61, "outsider").copayer;
    EXPECT_FALSE(Verifier::check_copayers(credentials_, replaced));
}

TEST_F(VerifierTest, ProposalCreation)
{
    auto opts = options();
    opts.outputs[0].message = MemoCipher::encrypt_message("invoice 42", key_);
    opts.message = MemoCipher::encrypt_message("march payroll", key_);
    opts.custom_data = {{"ref", 7}};
    auto txp = TxProposal::create(opts);

    // What the client sent: same texts, encrypted separately
    ProposalArgs args;
    args.outputs = {TxOutput{4000, foreign_address(0x55)}};
    args.outputs[0].message = MemoCipher::encrypt_message("invoice 42", key_);
    args.message = MemoCipher::encrypt_message("march payroll", key_);
    args.change_address = txp.utxo_payload().change_address->address;
    args.fee_per_kb = 1000;
    args.custom_data = {{"ref", 7}};
    EXPECT_TRUE(Verifier::check_proposal_creation(args, txp, key_));

    auto other_memo = args;
    other_memo.outputs[0].message = MemoCipher::encrypt_message("invoice 43", key_);
    EXPECT_FALSE(Verifier::check_proposal_creation(other_memo, txp, key_));

    auto other_amount = args;
    other_amount.outputs[0].amount = 4001;
    EXPECT_FALSE(Verifier::check_proposal_creation(other_amount, txp, key_));

    auto other_change = args;
    other_change.change_address = foreign_address(0x09);
    EXPECT_FALSE(Verifier::check_proposal_creation(other_change, txp, key_));

    auto other_rate = args;
    other_rate.fee_per_kb = 2000;
    EXPECT_FALSE(Verifier::check_proposal_creation(other_rate, txp, key_));

    auto other_data = args;
    other_data.custom_data = {{"ref", 8}};
    EXPECT_FALSE(Verifier::check_proposal_creation(other_data, txp, key_));

    auto other_message = args;
    other_message.message = MemoCipher::encrypt_message("april payroll", key_);
    EXPECT_FALSE(Verifier::check_proposal_creation(other_message, txp, key_));

    // Not decryptable with the wallet key
    auto undecryptable = args;
    undecryptable.message = MemoCipher::encrypt_message("march payroll",
                                                        MessageSigner::private_key_to_aes_key(fixed_private_key(0x12)));
    EXPECT_FALSE(Verifier::check_proposal_creation(undecryptable, txp, key_));
}

TEST_F(VerifierTest, UnsetFieldsAreNotCompared)
{
    auto txp = TxProposal::create(options());
    ProposalArgs args;
    args.outputs = {TxOutput{4000, foreign_address(0x55)}};
    EXPECT_TRUE(Verifier::check_proposal_creation(args, txp, key_));

    args.outputs.push_back(TxOutput{1000, foreign_address(0x56)});
    EXPECT_FALSE(Verifier::check_proposal_creation(args, txp, key_));
}

TEST_F(VerifierTest, CreatorSignature)
{
    auto txp = draft(options());
    publish(txp);
    EXPECT_TRUE(Verifier::check_tx_proposal_signature(credentials_, txp, adapter_));
    EXPECT_TRUE(Verifier::check_tx_proposal(credentials_, txp, adapter_));

    // The service changed the fee after the creator signed
    txp.set_fee(400);
    EXPECT_FALSE(Verifier::check_tx_proposal_signature(credentials_, txp, adapter_));
}

TEST_F(VerifierTest, DelegatedCreatorSignature)
{
    auto txp = draft(options());
    auto one_time = fixed_private_key(0x71);
    auto one_time_pub = HexUtils::encode(EcUtils::public_key_from_private(one_time));

    TxProposal::PublishOptions opts;
    opts.proposal_signature = sign_proposal(adapter_, txp, one_time);
    opts.signing_pub_key = one_time_pub;
    opts.pub_key_signature = MessageSigner::sign_request_pub_key(one_time_pub, copayers_[0].xprv);
    txp.publish(adapter_, copayers_[0].copayer, opts);

    EXPECT_TRUE(Verifier::check_tx_proposal_signature(credentials_, txp, adapter_));
}

TEST_F(VerifierTest, ForeignChangeAddress)
{
    // Signed by the creator but paying change outside the wallet
    auto opts = options();
    auto payload = std::get<UtxoPayload>(opts.payload);
    payload.change_address->address = foreign_address(0x09);
    opts.payload = payload;
    auto txp = draft(opts);
    publish(txp);

    EXPECT_FALSE(Verifier::check_tx_proposal_signature(credentials_, txp, adapter_));
}

TEST_F(VerifierTest, CreatorOutsideTheRing)
{
    std::vector<TestCopayer> others;
    for (uint8_t i = 0; i < 3; ++i) {
        others.push_back(make_copayer(Chain::Btc, static_cast<uint8_t>(0x60 + i), "other " + std::to_string(i)));
    }
    auto foreign_credentials = Credentials::from_json(credentials_json(others, 0, 2, ScriptType::P2SH));

    auto txp = draft(options());
    publish(txp);
    EXPECT_FALSE(Verifier::check_tx_proposal_signature(foreign_credentials, txp, adapter_));
}

TEST_F(VerifierTest, PaymentRequest)
{
    auto txp = draft(options());
    publish(txp);

    PaymentRequest request;
    request.instructions = {PaymentInstruction{foreign_address(0x55), 4000}};
    EXPECT_TRUE(Verifier::check_paypro(txp, request));
    EXPECT_TRUE(Verifier::check_tx_proposal(credentials_, txp, adapter_, &request));

    auto other_amount = request;
    other_amount.instructions[0].amount = 3999;
    EXPECT_FALSE(Verifier::check_paypro(txp, other_amount));
    EXPECT_FALSE(Verifier::check_tx_proposal(credentials_, txp, adapter_, &other_amount));

    auto other_address = request;
    other_address.instructions[0].to_address = foreign_address(0x56);
    EXPECT_FALSE(Verifier::check_paypro(txp, other_address));

    EXPECT_FALSE(Verifier::check_paypro(txp, PaymentRequest{}));
}

TEST_F(VerifierTest, CashAddrInvoiceMatchesLegacy)
{
    auto cash_copayers = make_copayers(Chain::Bch, 1);
    auto opts = utxo_proposal_options(cash_copayers, 1, ScriptType::P2PKH, 4000, 1000, Chain::Bch);
    opts.outputs[0].to_address = foreign_address(0x55, Chain::Btc);
    auto txp = TxProposal::create(opts);

    PaymentRequest request;
    request.instructions = {PaymentInstruction{foreign_address(0x55, Chain::Bch), 4000}};
    EXPECT_TRUE(Verifier::check_paypro(txp, request));
}
