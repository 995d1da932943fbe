#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/ContractAuthSigner.h"
#include "transactions/NonceTracker.h"
#include "transactions/SorobanResult.h"
#include "util/XDROperators.h"
#include "xdr/Stellar-transaction.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace soroban
{

// Assembles an InvokeHostFunctionOp one host function at a time, then
// authorizes it and packages its SorobanTransactionData:
//
//   InvokeHostFunctionBuilder b(networkID, source, tracker);
//   size_t fn;
//   b.addInvokeContract(swapID, "swap", args, fn);
//   b.authorize(fn, tree, makeAccountAddress(a), signerA);
//   b.buildTransactionData(suggested, fee, data);
//
// Nonces come from the tracker, which is only read. Several authorizations
// by one address for one root contract get consecutive nonces.
class InvokeHostFunctionBuilder
{
    Hash const mNetworkID;
    AccountID const mSourceAccount;
    NonceTracker const& mTracker;

    InvokeHostFunctionOp mOp;
    std::map<std::pair<SCAddress, Hash>, uint64_t> mPendingNonces;

    SorobanResultCode addHostFunction(HostFunctionArgs&& args,
                                      size_t& fnIndex);
    HostFunction& getFunction(size_t fnIndex);

  public:
    InvokeHostFunctionBuilder(Hash const& networkID,
                              AccountID const& sourceAccount,
                              NonceTracker const& tracker);

    // Each add* returns LIMIT_EXCEEDED once MAX_OPS_PER_TX functions are
    // present and writes the new function's index on success.
    SorobanResultCode addInvokeContract(Hash const& contractID,
                                        std::string const& functionName,
                                        SCVec const& args, size_t& fnIndex);
    // Also derives the new contract's ID, failing the way getContractID
    // does.
    SorobanResultCode addCreateContract(CreateContractArgs const& args,
                                        size_t& fnIndex, Hash& contractID);
    SorobanResultCode addUploadContractWasm(std::vector<uint8_t> const& code,
                                            size_t& fnIndex, Hash& wasmHash);

    // Signs `invocation` for `address` with the next nonce and attaches it
    // to function `fnIndex`. LIMIT_EXCEEDED when the pair has run out of
    // nonces. Throws std::out_of_range for a bad index.
    SorobanResultCode authorize(size_t fnIndex,
                                AuthorizedInvocation const& invocation,
                                SCAddress const& address,
                                ContractAuthSigner const& signer);
    // Attaches `invocation` as authorized by the transaction source.
    SorobanResultCode authorizeAsInvoker(size_t fnIndex,
                                         AuthorizedInvocation const& invocation);

    // Footprint is the suggested one augmented with what the operation
    // requires; the numeric resources are taken from `suggested` as is.
    SorobanResultCode
    buildTransactionData(SorobanResources const& suggested,
                         int64_t refundableFee,
                         SorobanTransactionData& data) const;

    InvokeHostFunctionOp const& getOperation() const;
    size_t getFunctionCount() const;
};
}
