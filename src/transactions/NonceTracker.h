#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/SorobanResult.h"
#include "util/XDROperators.h"
#include "xdr/Stellar-transaction.h"
#include <map>
#include <optional>
#include <vector>

namespace soroban
{

// Storage of nonce ledger entries, owned by the ledger collaborator. Keys
// are CONTRACT_DATA{contractID, SCV_LEDGER_KEY_NONCE(address)}; the stored
// value is the next nonce the address must use.
class NonceStore
{
  public:
    virtual ~NonceStore() = default;

    virtual std::optional<uint64_t>
    loadNonce(LedgerKey const& nonceKey) const = 0;
    virtual void storeNonce(LedgerKey const& nonceKey, uint64_t nonce) = 0;
};

class InMemoryNonceStore : public NonceStore
{
    std::map<LedgerKey, uint64_t> mNonces;

  public:
    std::optional<uint64_t>
    loadNonce(LedgerKey const& nonceKey) const override;
    void storeNonce(LedgerKey const& nonceKey, uint64_t nonce) override;

    size_t
    size() const
    {
        return mNonces.size();
    }
};

// Reads nonces for authorization entries. It never increments on its own:
// the store only advances through observe(), which mirrors what the ledger
// does after applying a transaction. Callers building transactions
// concurrently must serialize next()/observe() per (address, contractID).
class NonceTracker
{
    NonceStore& mStore;

  public:
    explicit NonceTracker(NonceStore& store);

    // Stored nonce for the pair, 0 if there is none yet.
    uint64_t next(SCAddress const& address, Hash const& contractID) const;

    // Nonce the pair must use after `precedingUses` more entries have been
    // consumed. LIMIT_EXCEEDED when that nonce could not be consumed
    // without the stored value wrapping around.
    SorobanResultCode nonceAfter(SCAddress const& address,
                                 Hash const& contractID,
                                 uint64_t precedingUses,
                                 uint64_t& nonce) const;

    // Records that `usedNonce` was consumed. NONCE_MISMATCH if it is not the
    // currently expected nonce, LIMIT_EXCEEDED if it is the largest uint64
    // and the stored value cannot advance.
    SorobanResultCode observe(SCAddress const& address, Hash const& contractID,
                              uint64_t usedNonce);
};

// NONCE_CONFLICT when two entries authorize the same (address, root
// contract) pair with the same nonce. Entries without an address are the
// invoker's and carry no nonce.
SorobanResultCode
checkNonceConflicts(std::vector<ContractAuth const*> const& auths);
SorobanResultCode checkNonceConflicts(InvokeHostFunctionOp const& op);

std::vector<ContractAuth const*>
collectContractAuths(InvokeHostFunctionOp const& op);
}
