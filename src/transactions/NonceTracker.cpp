// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/NonceTracker.h"
#include "crypto/Hex.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include <limits>
#include <set>
#include <tuple>

namespace soroban
{

std::optional<uint64_t>
InMemoryNonceStore::loadNonce(LedgerKey const& nonceKey) const
{
    auto it = mNonces.find(nonceKey);
    if (it == mNonces.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void
InMemoryNonceStore::storeNonce(LedgerKey const& nonceKey, uint64_t nonce)
{
    mNonces[nonceKey] = nonce;
}

NonceTracker::NonceTracker(NonceStore& store) : mStore(store)
{
}

uint64_t
NonceTracker::next(SCAddress const& address, Hash const& contractID) const
{
    auto stored = mStore.loadNonce(getNonceKey(contractID, address));
    return stored ? *stored : 0;
}

SorobanResultCode
NonceTracker::nonceAfter(SCAddress const& address, Hash const& contractID,
                         uint64_t precedingUses, uint64_t& nonce) const
{
    auto stored = next(address, contractID);
    auto const maxUsable = std::numeric_limits<uint64_t>::max() - 1;
    if (stored > maxUsable || precedingUses > maxUsable - stored)
    {
        CLOG_DEBUG(Auth, "nonce {} + {} for {} on {} leaves no room", stored,
                   precedingUses, addressAbbrev(address),
                   hexAbbrev(contractID));
        return SorobanResultCode::LIMIT_EXCEEDED;
    }
    nonce = stored + precedingUses;
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
NonceTracker::observe(SCAddress const& address, Hash const& contractID,
                      uint64_t usedNonce)
{
    auto expected = next(address, contractID);
    if (usedNonce != expected)
    {
        CLOG_DEBUG(Auth, "nonce {} observed for {} on {}, expected {}",
                   usedNonce, addressAbbrev(address), hexAbbrev(contractID),
                   expected);
        return SorobanResultCode::NONCE_MISMATCH;
    }
    if (usedNonce == std::numeric_limits<uint64_t>::max())
    {
        CLOG_DEBUG(Auth, "nonce space exhausted for {} on {}",
                   addressAbbrev(address), hexAbbrev(contractID));
        return SorobanResultCode::LIMIT_EXCEEDED;
    }
    mStore.storeNonce(getNonceKey(contractID, address), usedNonce + 1);
    return SorobanResultCode::SUCCESS;
}

std::vector<ContractAuth const*>
collectContractAuths(InvokeHostFunctionOp const& op)
{
    std::vector<ContractAuth const*> auths;
    for (auto const& fn : op.functions)
    {
        for (auto const& auth : fn.auth)
        {
            auths.emplace_back(&auth);
        }
    }
    return auths;
}

SorobanResultCode
checkNonceConflicts(std::vector<ContractAuth const*> const& auths)
{
    std::set<std::tuple<SCAddress, Hash, uint64_t>> seen;
    for (auto const* auth : auths)
    {
        if (!auth->addressWithNonce)
        {
            continue;
        }
        auto const& awn = *auth->addressWithNonce;
        if (!seen.emplace(awn.address, auth->rootInvocation.contractID,
                          awn.nonce)
                 .second)
        {
            CLOG_DEBUG(Auth, "nonce {} reused by {} on {}", awn.nonce,
                       addressAbbrev(awn.address),
                       hexAbbrev(auth->rootInvocation.contractID));
            return SorobanResultCode::NONCE_CONFLICT;
        }
    }
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
checkNonceConflicts(InvokeHostFunctionOp const& op)
{
    return checkNonceConflicts(collectContractAuths(op));
}
}
