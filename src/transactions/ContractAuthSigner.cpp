// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/ContractAuthSigner.h"
#include "crypto/Hex.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include "util/XDROperators.h"
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace soroban
{

namespace
{
char const* const PUBLIC_KEY_FIELD = "public_key";
char const* const SIGNATURE_FIELD = "signature";

SCMapEntry
makeMapEntry(char const* key, SCVal val)
{
    SCMapEntry entry;
    entry.key = makeSymbolSCVal(std::string(key));
    entry.val = std::move(val);
    return entry;
}

bool
isSymbol(SCVal const& val, char const* sym)
{
    return val.type() == SCV_SYMBOL && val.sym() == sym;
}

bool
isBytesOfSize(SCVal const& val, size_t size)
{
    return val.type() == SCV_BYTES && val.bytes().size() == size;
}
}

SCVal
makeAccountSignatureArgs(std::vector<SecretKey> const& keys,
                         uint256 const& payload)
{
    std::vector<SecretKey> sorted(keys);
    std::sort(sorted.begin(), sorted.end(),
              [](SecretKey const& lhs, SecretKey const& rhs) {
                  return lhs.getPublicKey().ed25519() <
                         rhs.getPublicKey().ed25519();
              });
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    std::vector<SCVal> entries;
    for (auto const& key : sorted)
    {
        SCVal entry(SCV_MAP);
        auto& map = entry.map().activate();
        map.emplace_back(makeMapEntry(
            PUBLIC_KEY_FIELD, makeBytesSCVal(key.getPublicKey().ed25519())));
        map.emplace_back(
            makeMapEntry(SIGNATURE_FIELD, makeBytesSCVal(key.sign(payload))));
        entries.emplace_back(std::move(entry));
    }
    return makeVecSCVal(std::move(entries));
}

SorobanResultCode
verifyAccountSignatureArgs(AccountID const& account, uint256 const& payload,
                           SCVec const& signatureArgs)
{
    if (signatureArgs.size() != 1 || signatureArgs[0].type() != SCV_VEC ||
        !signatureArgs[0].vec())
    {
        CLOG_DEBUG(Auth, "account signature args must be a single vector");
        return SorobanResultCode::MALFORMED_INPUT;
    }

    auto const& entries = *signatureArgs[0].vec();
    bool signedByAccount = false;
    std::optional<uint256> prevKey;
    for (auto const& entry : entries)
    {
        if (entry.type() != SCV_MAP || !entry.map() ||
            entry.map()->size() != 2)
        {
            CLOG_DEBUG(Auth, "account signature entry is not a 2-field map");
            return SorobanResultCode::MALFORMED_INPUT;
        }
        auto const& fields = *entry.map();
        if (!isSymbol(fields[0].key, PUBLIC_KEY_FIELD) ||
            !isBytesOfSize(fields[0].val, sizeof(uint256)) ||
            !isSymbol(fields[1].key, SIGNATURE_FIELD) ||
            !isBytesOfSize(fields[1].val, 64))
        {
            CLOG_DEBUG(Auth, "account signature entry has unexpected fields");
            return SorobanResultCode::MALFORMED_INPUT;
        }

        uint256 key;
        std::copy(fields[0].val.bytes().begin(), fields[0].val.bytes().end(),
                  key.begin());
        Signature sig;
        sig.assign(fields[1].val.bytes().begin(),
                   fields[1].val.bytes().end());

        // strictly increasing keys: sorted and no duplicates
        if (prevKey && !(*prevKey < key))
        {
            CLOG_DEBUG(Auth, "account signatures are not sorted by key");
            return SorobanResultCode::MALFORMED_INPUT;
        }

        if (!PubKeyUtils::verifySig(PubKeyUtils::fromEd25519(key), sig,
                                    payload))
        {
            CLOG_DEBUG(Auth, "signature by {} does not verify",
                       hexAbbrev(key));
            return SorobanResultCode::SIGNATURE_INVALID;
        }
        if (key == account.ed25519())
        {
            signedByAccount = true;
        }
        prevKey = key;
    }
    if (!signedByAccount)
    {
        CLOG_DEBUG(Auth, "no signature by account key {}",
                   hexAbbrev(account.ed25519()));
        return SorobanResultCode::SIGNATURE_INVALID;
    }
    return SorobanResultCode::SUCCESS;
}

Ed25519AccountSigner::Ed25519AccountSigner(SecretKey const& accountKey,
                                           std::vector<SecretKey> additionalKeys)
{
    mKeys.emplace_back(accountKey);
    for (auto& key : additionalKeys)
    {
        mKeys.emplace_back(std::move(key));
    }
}

SCAddressType
Ed25519AccountSigner::addressType() const
{
    return SC_ADDRESS_TYPE_ACCOUNT;
}

AccountID const&
Ed25519AccountSigner::getAccountID() const
{
    return mKeys.front().getPublicKey();
}

SorobanResultCode
Ed25519AccountSigner::sign(SCAddress const& address, uint256 const& payload,
                           SCVec& signatureArgs) const
{
    if (address.type() != SC_ADDRESS_TYPE_ACCOUNT)
    {
        return SorobanResultCode::UNSUPPORTED_ADDRESS_KIND;
    }
    if (!(address.accountId() == getAccountID()))
    {
        CLOG_DEBUG(Auth, "signer for {} cannot sign for {}",
                   hexAbbrev(getAccountID().ed25519()),
                   addressAbbrev(address));
        return SorobanResultCode::UNSUPPORTED_ADDRESS_KIND;
    }
    signatureArgs.clear();
    signatureArgs.emplace_back(makeAccountSignatureArgs(mKeys, payload));
    return SorobanResultCode::SUCCESS;
}

ContractAccountSigner::ContractAccountSigner(SignFunction fn)
    : mSign(std::move(fn))
{
    if (!mSign)
    {
        throw std::invalid_argument("ContractAccountSigner needs a function");
    }
}

SCAddressType
ContractAccountSigner::addressType() const
{
    return SC_ADDRESS_TYPE_CONTRACT;
}

SorobanResultCode
ContractAccountSigner::sign(SCAddress const& address, uint256 const& payload,
                            SCVec& signatureArgs) const
{
    if (address.type() != SC_ADDRESS_TYPE_CONTRACT)
    {
        return SorobanResultCode::UNSUPPORTED_ADDRESS_KIND;
    }
    SCVec produced;
    auto res = mSign(address, payload, produced);
    if (isSuccess(res))
    {
        signatureArgs = std::move(produced);
    }
    return res;
}
}
