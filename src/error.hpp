#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cosign {

// Error is the single exception type raised by the library. Every error carries
// a precise code; the category is derived from the code so callers can decide
// whether a failure is retryable (funds, state) or a bug in the request.
class Error : public std::runtime_error {
public:
    enum class Category {
        Validation,
        Funds,
        Integrity,
        State,
        Capability,
        Internal
    };

    enum class Code {
        // validation
        InvalidArgument,
        InvalidNetwork,
        InvalidAddress,
        IncorrectAddressNetwork,
        InvalidWalletParams,
        InvalidKeyFormat,
        DerivationError,
        Base58DecodeError,
        ScriptType,
        ScriptOpReturn,
        ScriptOpReturnAmount,
        DustAmount,
        TxMaxSizeExceeded,
        NoInputPaths,
        NotEnoughInputs,
        FeeTooHigh,
        UnsupportedFormat,
        // funds
        InsufficientFunds,
        InsufficientFundsForFee,
        LockedFunds,
        UnavailableUtxos,
        // integrity
        SignatureCountMismatch,
        BadSignatures,
        ProposalSignatureInvalid,
        PaymentProtocolMismatch,
        CopayerKeyMismatch,
        DecryptionFailed,
        // state
        TxNotPending,
        TxAlreadyPublished,
        TxNotAccepted,
        TxMissingId,
        CopayerVoted,
        LockBusy,
        // capability
        MultiTxUnsupported,
        UnsupportedChain,
        // internal
        CryptoFailure
    };

    Error(Code code, const std::string& message = "")
        : std::runtime_error(message.empty() ? default_message(code) : message)
        , code_(code)
    {}

    Code code() const { return code_; }

    Category category() const { return category_of(code_); }

    static Category category_of(Code code) {
        switch (code) {
            case Code::InsufficientFunds:
            case Code::InsufficientFundsForFee:
            case Code::LockedFunds:
            case Code::UnavailableUtxos:
                return Category::Funds;
            case Code::SignatureCountMismatch:
            case Code::BadSignatures:
            case Code::ProposalSignatureInvalid:
            case Code::PaymentProtocolMismatch:
            case Code::CopayerKeyMismatch:
            case Code::DecryptionFailed:
                return Category::Integrity;
            case Code::TxNotPending:
            case Code::TxAlreadyPublished:
            case Code::TxNotAccepted:
            case Code::TxMissingId:
            case Code::CopayerVoted:
            case Code::LockBusy:
                return Category::State;
            case Code::MultiTxUnsupported:
            case Code::UnsupportedChain:
                return Category::Capability;
            case Code::CryptoFailure:
                return Category::Internal;
            default:
                return Category::Validation;
        }
    }

    static std::string default_message(Code code) {
        switch (code) {
            case Code::InvalidNetwork: return "Invalid network";
            case Code::InvalidAddress: return "Invalid address";
            case Code::IncorrectAddressNetwork: return "Incorrect address network";
            case Code::InvalidWalletParams: return "Invalid combination of required copayers / total copayers";
            case Code::InvalidKeyFormat: return "Invalid extended key format";
            case Code::DerivationError: return "Key derivation failed";
            case Code::Base58DecodeError: return "Invalid base58 string";
            case Code::ScriptType: return "Script must be a valid data type";
            case Code::ScriptOpReturn: return "The only supported script is OP_RETURN";
            case Code::ScriptOpReturnAmount: return "The amount on an OP_RETURN output must be 0";
            case Code::DustAmount: return "Amount below dust threshold";
            case Code::TxMaxSizeExceeded: return "Your transaction exceeds the maximum size";
            case Code::NoInputPaths: return "Transaction proposal has no input paths";
            case Code::NotEnoughInputs: return "Inputs do not cover outputs";
            case Code::FeeTooHigh: return "Fee exceeds the maximum allowed for this chain";
            case Code::UnsupportedFormat: return "Transaction proposal format not supported";
            case Code::InsufficientFunds: return "Insufficient funds";
            case Code::InsufficientFundsForFee: return "Insufficient funds for fee";
            case Code::LockedFunds: return "Funds are locked by pending transaction proposals";
            case Code::UnavailableUtxos: return "Some inputs of the replaced transaction are unavailable";
            case Code::SignatureCountMismatch: return "Number of signatures does not match number of inputs";
            case Code::BadSignatures: return "Bad signatures";
            case Code::ProposalSignatureInvalid: return "Proposal signature does not verify";
            case Code::PaymentProtocolMismatch: return "Proposal does not match the payment request";
            case Code::CopayerKeyMismatch: return "Copayer key set mismatch";
            case Code::DecryptionFailed: return "Could not decrypt message";
            case Code::TxNotPending: return "The transaction proposal is not pending";
            case Code::TxAlreadyPublished: return "The transaction proposal is already published";
            case Code::TxNotAccepted: return "The transaction proposal is not accepted";
            case Code::TxMissingId: return "The transaction proposal has no txid";
            case Code::CopayerVoted: return "Copayer already voted on this transaction proposal";
            case Code::LockBusy: return "Wallet is locked by another operation";
            case Code::MultiTxUnsupported: return "Desired chain does not support multi transaction proposals";
            case Code::UnsupportedChain: return "Operation not supported for this chain";
            case Code::CryptoFailure: return "Cryptographic operation failed";
            default: return "Invalid argument";
        }
    }

private:
    Code code_;
};

// Funds errors that can tell the caller how much fee the selection needed.
class FundsError : public Error {
public:
    FundsError(Code code, uint64_t required_fee, const std::string& message = "")
        : Error(code, message)
        , required_fee_(required_fee)
    {}

    uint64_t required_fee() const { return required_fee_; }

private:
    uint64_t required_fee_;
};

} // namespace cosign
