#pragma once

// Copyright 2022 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/NetworkConfig.h"
#include "transactions/ContractAuthSigner.h"
#include "transactions/NonceTracker.h"
#include "transactions/SorobanResult.h"
#include "xdr/Stellar-transaction.h"

namespace soroban
{
class Config;

// Validates an InvokeHostFunctionOp and the SorobanTransactionData that
// accompanies it, as the network would before applying it. Holds references
// only; the operation, data and source account must outlive the frame.
class InvokeHostFunctionOpFrame
{
    InvokeHostFunctionOp const& mInvokeHostFunction;
    SorobanTransactionData const& mSorobanData;
    AccountID const& mSourceAccount;

    SorobanResultCode checkHostFunctions(Hash const& networkID) const;
    SorobanResultCode checkAuthorizations(Hash const& networkID,
                                          SorobanNetworkConfig const& config,
                                          NonceTracker const& tracker,
                                          ContractAccountVerifier const* verifier) const;

  public:
    InvokeHostFunctionOpFrame(InvokeHostFunctionOp const& op,
                              SorobanTransactionData const& sorobanData,
                              AccountID const& sourceAccount);

    // Runs every check in order and returns the first failure. Nothing is
    // modified, in particular no nonce is consumed.
    SorobanResultCode
    doCheckValid(Hash const& networkID, SorobanNetworkConfig const& config,
                 NonceTracker const& tracker,
                 ContractAccountVerifier const* verifier,
                 MetaDataFeeFunction const& minRefundableFee) const;
    SorobanResultCode doCheckValid(Config const& appConfig,
                                   NonceTracker const& tracker,
                                   ContractAccountVerifier const* verifier) const;

    // What the ledger does to nonces once the operation is applied: every
    // authorizing address consumes its nonce, in order. A nonce that would
    // leave the stored value unable to advance is LIMIT_EXCEEDED.
    SorobanResultCode consumeNonces(NonceTracker& tracker) const;

    InvokeHostFunctionOp const&
    getOperation() const
    {
        return mInvokeHostFunction;
    }
};
}
