// Copyright 2022 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/InvokeHostFunctionOpFrame.h"
#include "main/Config.h"
#include "transactions/AuthorizedInvocationBuilder.h"
#include "transactions/ContractAuthUtils.h"
#include "transactions/ContractIDUtils.h"
#include "transactions/SorobanResourceUtils.h"
#include "util/Logging.h"
#include "util/XDROperators.h"
#include <map>
#include <stdexcept>
#include <utility>

namespace soroban
{

InvokeHostFunctionOpFrame::InvokeHostFunctionOpFrame(
    InvokeHostFunctionOp const& op, SorobanTransactionData const& sorobanData,
    AccountID const& sourceAccount)
    : mInvokeHostFunction(op)
    , mSorobanData(sorobanData)
    , mSourceAccount(sourceAccount)
{
}

SorobanResultCode
InvokeHostFunctionOpFrame::checkHostFunctions(Hash const& networkID) const
{
    auto const& functions = mInvokeHostFunction.functions;
    if (functions.empty())
    {
        CLOG_DEBUG(Tx, "operation has no host functions");
        return SorobanResultCode::MALFORMED_INPUT;
    }
    if (functions.size() > MAX_OPS_PER_TX)
    {
        CLOG_DEBUG(Tx, "operation has {} host functions, limit is {}",
                   functions.size(), MAX_OPS_PER_TX);
        return SorobanResultCode::LIMIT_EXCEEDED;
    }

    for (auto const& fn : functions)
    {
        // check contract ID derivation if creating a contract
        if (fn.args.type() == HOST_FUNCTION_TYPE_CREATE_CONTRACT)
        {
            Hash contractID;
            auto res = getContractID(networkID, mSourceAccount,
                                     fn.args.createContract(), contractID);
            if (!isSuccess(res))
            {
                return res;
            }
        }
    }
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
InvokeHostFunctionOpFrame::checkAuthorizations(
    Hash const& networkID, SorobanNetworkConfig const& config,
    NonceTracker const& tracker, ContractAccountVerifier const* verifier) const
{
    auto auths = collectContractAuths(mInvokeHostFunction);
    for (auto const* auth : auths)
    {
        auto res = validateAuthorizedInvocation(auth->rootInvocation, config);
        if (!isSuccess(res))
        {
            return res;
        }
    }

    auto res = checkNonceConflicts(auths);
    if (!isSuccess(res))
    {
        return res;
    }

    // Repeated authorizations by one address of trees rooted at one contract
    // use consecutive nonces in order of appearance.
    std::map<std::pair<SCAddress, Hash>, uint64_t> used;
    for (auto const* auth : auths)
    {
        uint64_t expected = 0;
        if (auth->addressWithNonce)
        {
            auto const& address = auth->addressWithNonce->address;
            auto const& contractID = auth->rootInvocation.contractID;
            auto& count = used[std::make_pair(address, contractID)];
            res = tracker.nonceAfter(address, contractID, count, expected);
            if (!isSuccess(res))
            {
                return res;
            }
            ++count;
        }
        res = verifyContractAuth(*auth, networkID, expected, verifier);
        if (!isSuccess(res))
        {
            return res;
        }
    }
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
InvokeHostFunctionOpFrame::doCheckValid(
    Hash const& networkID, SorobanNetworkConfig const& config,
    NonceTracker const& tracker, ContractAccountVerifier const* verifier,
    MetaDataFeeFunction const& minRefundableFee) const
{
    auto res = checkHostFunctions(networkID);
    if (!isSuccess(res))
    {
        return res;
    }

    res = checkAuthorizations(networkID, config, tracker, verifier);
    if (!isSuccess(res))
    {
        return res;
    }

    LedgerFootprint computed;
    res = buildFootprint(networkID, mSourceAccount, mInvokeHostFunction,
                         computed);
    if (!isSuccess(res))
    {
        return res;
    }

    res = validateSorobanTransactionData(mSorobanData, computed, config,
                                         minRefundableFee);
    if (isSuccess(res))
    {
        CLOG_TRACE(Tx, "host function op with {} functions is valid",
                   mInvokeHostFunction.functions.size());
    }
    return res;
}

SorobanResultCode
InvokeHostFunctionOpFrame::doCheckValid(
    Config const& appConfig, NonceTracker const& tracker,
    ContractAccountVerifier const* verifier) const
{
    auto const& config = appConfig.sorobanNetworkConfig();
    return doCheckValid(appConfig.networkID(), config, tracker, verifier,
                        config.metaDataFeeFunction());
}

SorobanResultCode
InvokeHostFunctionOpFrame::consumeNonces(NonceTracker& tracker) const
{
    auto auths = collectContractAuths(mInvokeHostFunction);

    // all or nothing: check the whole sequence before storing anything
    std::map<std::pair<SCAddress, Hash>, uint64_t> used;
    for (auto const* auth : auths)
    {
        if (!auth->addressWithNonce)
        {
            continue;
        }
        auto const& address = auth->addressWithNonce->address;
        auto const& contractID = auth->rootInvocation.contractID;
        auto& count = used[std::make_pair(address, contractID)];
        uint64_t expected = 0;
        auto res = tracker.nonceAfter(address, contractID, count, expected);
        if (!isSuccess(res))
        {
            return res;
        }
        if (auth->addressWithNonce->nonce != expected)
        {
            return SorobanResultCode::NONCE_MISMATCH;
        }
        ++count;
    }

    for (auto const* auth : auths)
    {
        if (!auth->addressWithNonce)
        {
            continue;
        }
        auto res = tracker.observe(auth->addressWithNonce->address,
                                   auth->rootInvocation.contractID,
                                   auth->addressWithNonce->nonce);
        if (!isSuccess(res))
        {
            throw std::runtime_error("nonce store changed while consuming");
        }
    }
    return SorobanResultCode::SUCCESS;
}
}
