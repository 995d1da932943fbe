// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/InvokeHostFunctionBuilder.h"
#include "crypto/Hex.h"
#include "crypto/SHA.h"
#include "transactions/ContractAuthUtils.h"
#include "transactions/ContractIDUtils.h"
#include "transactions/SorobanResourceUtils.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include <stdexcept>

namespace soroban
{

InvokeHostFunctionBuilder::InvokeHostFunctionBuilder(
    Hash const& networkID, AccountID const& sourceAccount,
    NonceTracker const& tracker)
    : mNetworkID(networkID), mSourceAccount(sourceAccount), mTracker(tracker)
{
}

SorobanResultCode
InvokeHostFunctionBuilder::addHostFunction(HostFunctionArgs&& args,
                                           size_t& fnIndex)
{
    if (mOp.functions.size() >= MAX_OPS_PER_TX)
    {
        CLOG_DEBUG(Tx, "cannot add more than {} host functions",
                   MAX_OPS_PER_TX);
        return SorobanResultCode::LIMIT_EXCEEDED;
    }
    mOp.functions.emplace_back();
    mOp.functions.back().args = std::move(args);
    fnIndex = mOp.functions.size() - 1;
    return SorobanResultCode::SUCCESS;
}

HostFunction&
InvokeHostFunctionBuilder::getFunction(size_t fnIndex)
{
    if (fnIndex >= mOp.functions.size())
    {
        throw std::out_of_range("no such host function");
    }
    return mOp.functions[fnIndex];
}

SorobanResultCode
InvokeHostFunctionBuilder::addInvokeContract(Hash const& contractID,
                                             std::string const& functionName,
                                             SCVec const& args,
                                             size_t& fnIndex)
{
    if (!isSymbolValid(functionName))
    {
        CLOG_DEBUG(Tx, "invalid function name '{}'", functionName);
        return SorobanResultCode::MALFORMED_INPUT;
    }
    if (args.size() + 2 > SCVAL_LIMIT)
    {
        return SorobanResultCode::LIMIT_EXCEEDED;
    }

    HostFunctionArgs hfArgs(HOST_FUNCTION_TYPE_INVOKE_CONTRACT);
    auto& invokeArgs = hfArgs.invokeContract();
    invokeArgs.emplace_back(makeBytesSCVal(contractID));
    invokeArgs.emplace_back(makeSymbolSCVal(functionName));
    invokeArgs.insert(invokeArgs.end(), args.begin(), args.end());
    return addHostFunction(std::move(hfArgs), fnIndex);
}

SorobanResultCode
InvokeHostFunctionBuilder::addCreateContract(CreateContractArgs const& args,
                                             size_t& fnIndex, Hash& contractID)
{
    Hash id;
    auto res = getContractID(mNetworkID, mSourceAccount, args, id);
    if (!isSuccess(res))
    {
        return res;
    }

    HostFunctionArgs hfArgs(HOST_FUNCTION_TYPE_CREATE_CONTRACT);
    hfArgs.createContract() = args;
    res = addHostFunction(std::move(hfArgs), fnIndex);
    if (isSuccess(res))
    {
        contractID = id;
        CLOG_DEBUG(Tx, "creating contract {}", hexAbbrev(contractID));
    }
    return res;
}

SorobanResultCode
InvokeHostFunctionBuilder::addUploadContractWasm(
    std::vector<uint8_t> const& code, size_t& fnIndex, Hash& wasmHash)
{
    if (code.size() > SCVAL_LIMIT)
    {
        CLOG_DEBUG(Tx, "Wasm of {} bytes exceeds {}", code.size(),
                   SCVAL_LIMIT);
        return SorobanResultCode::LIMIT_EXCEEDED;
    }

    HostFunctionArgs hfArgs(HOST_FUNCTION_TYPE_UPLOAD_CONTRACT_WASM);
    hfArgs.uploadContractWasm().code.assign(code.begin(), code.end());
    auto res = addHostFunction(std::move(hfArgs), fnIndex);
    if (isSuccess(res))
    {
        wasmHash = sha256(code);
    }
    return res;
}

SorobanResultCode
InvokeHostFunctionBuilder::authorize(size_t fnIndex,
                                     AuthorizedInvocation const& invocation,
                                     SCAddress const& address,
                                     ContractAuthSigner const& signer)
{
    auto& fn = getFunction(fnIndex);
    auto pendingKey = std::make_pair(address, invocation.contractID);
    auto it = mPendingNonces.find(pendingKey);
    uint64_t pending = it == mPendingNonces.end() ? 0 : it->second;
    uint64_t nonce = 0;
    auto res =
        mTracker.nonceAfter(address, invocation.contractID, pending, nonce);
    if (!isSuccess(res))
    {
        return res;
    }

    ContractAuth auth;
    res = buildContractAuth(mNetworkID, makeAddressWithNonce(address, nonce),
                            invocation, &signer, auth);
    if (!isSuccess(res))
    {
        return res;
    }
    fn.auth.emplace_back(std::move(auth));
    mPendingNonces[pendingKey] = pending + 1;
    CLOG_DEBUG(Auth, "{} authorized {} on {} with nonce {}",
               addressAbbrev(address), std::string(invocation.functionName),
               hexAbbrev(invocation.contractID), nonce);
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
InvokeHostFunctionBuilder::authorizeAsInvoker(
    size_t fnIndex, AuthorizedInvocation const& invocation)
{
    auto& fn = getFunction(fnIndex);
    ContractAuth auth;
    auto res =
        buildContractAuth(mNetworkID, std::nullopt, invocation, nullptr, auth);
    if (isSuccess(res))
    {
        fn.auth.emplace_back(std::move(auth));
    }
    return res;
}

SorobanResultCode
InvokeHostFunctionBuilder::buildTransactionData(
    SorobanResources const& suggested, int64_t refundableFee,
    SorobanTransactionData& data) const
{
    LedgerFootprint computed;
    auto res = buildFootprint(mNetworkID, mSourceAccount, mOp, computed);
    if (!isSuccess(res))
    {
        return res;
    }

    SorobanTransactionData built;
    built.resources = suggested;
    built.resources.footprint = augmentFootprint(suggested.footprint, computed);
    built.refundableFee = refundableFee;
    data = std::move(built);
    return SorobanResultCode::SUCCESS;
}

InvokeHostFunctionOp const&
InvokeHostFunctionBuilder::getOperation() const
{
    return mOp;
}

size_t
InvokeHostFunctionBuilder::getFunctionCount() const
{
    return mOp.functions.size();
}
}
