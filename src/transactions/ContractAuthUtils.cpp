// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/ContractAuthUtils.h"
#include "crypto/Hex.h"
#include "crypto/SHA.h"
#include "transactions/AuthorizedInvocationBuilder.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include "util/XDRCodec.h"

namespace soroban
{

HashIDPreimage
makeContractAuthPreimage(Hash const& networkID, uint64_t nonce,
                         AuthorizedInvocation const& invocation)
{
    HashIDPreimage preImage;
    preImage.type(ENVELOPE_TYPE_CONTRACT_AUTH);
    preImage.contractAuth().networkID = networkID;
    preImage.contractAuth().nonce = nonce;
    preImage.contractAuth().invocation = invocation;
    return preImage;
}

uint256
getContractAuthPayload(Hash const& networkID, uint64_t nonce,
                       AuthorizedInvocation const& invocation)
{
    return xdrSha256(makeContractAuthPreimage(networkID, nonce, invocation));
}

AddressWithNonce
makeAddressWithNonce(SCAddress const& address, uint64_t nonce)
{
    AddressWithNonce awn;
    awn.address = address;
    awn.nonce = nonce;
    return awn;
}

SorobanResultCode
buildContractAuth(Hash const& networkID,
                  std::optional<AddressWithNonce> const& addressWithNonce,
                  AuthorizedInvocation const& invocation,
                  ContractAuthSigner const* signer, ContractAuth& auth)
{
    // unbounded here; network limits are applied when the op is validated
    auto res = validateAuthorizedInvocation(invocation, 0, 0);
    if (!isSuccess(res))
    {
        return res;
    }

    ContractAuth built;
    built.rootInvocation = invocation;
    if (!addressWithNonce)
    {
        auth = std::move(built);
        return SorobanResultCode::SUCCESS;
    }

    auto const& address = addressWithNonce->address;
    if (!signer || signer->addressType() != address.type())
    {
        CLOG_DEBUG(Auth, "no signer for address {}", addressAbbrev(address));
        return SorobanResultCode::UNSUPPORTED_ADDRESS_KIND;
    }

    auto payload =
        getContractAuthPayload(networkID, addressWithNonce->nonce, invocation);
    res = signer->sign(address, payload, built.signatureArgs);
    if (!isSuccess(res))
    {
        CLOG_DEBUG(Auth, "signer for {} failed: {}", addressAbbrev(address),
                   toString(res));
        return res;
    }
    built.addressWithNonce.activate() = *addressWithNonce;
    auth = std::move(built);
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
verifyContractAuth(ContractAuth const& auth, Hash const& networkID,
                   uint64_t expectedNonce,
                   ContractAccountVerifier const* verifier)
{
    if (!auth.addressWithNonce)
    {
        if (!auth.signatureArgs.empty())
        {
            CLOG_DEBUG(Auth, "signature args without an authorizing address");
            return SorobanResultCode::MALFORMED_INPUT;
        }
        return SorobanResultCode::SUCCESS;
    }

    // an entry that cannot go on the wire has nothing valid to sign
    std::vector<uint8_t> encoded;
    auto codecRes = encodeXDR(auth.rootInvocation, encoded);
    if (!isSuccess(codecRes))
    {
        return codecRes;
    }

    auto const& awn = *auth.addressWithNonce;
    auto payload =
        getContractAuthPayload(networkID, awn.nonce, auth.rootInvocation);

    switch (awn.address.type())
    {
    case SC_ADDRESS_TYPE_ACCOUNT:
    {
        auto res = verifyAccountSignatureArgs(awn.address.accountId(), payload,
                                              auth.signatureArgs);
        if (!isSuccess(res))
        {
            return res;
        }
        break;
    }
    case SC_ADDRESS_TYPE_CONTRACT:
        if (!verifier)
        {
            CLOG_DEBUG(Auth, "no verifier for custom account {}",
                       addressAbbrev(awn.address));
            return SorobanResultCode::UNSUPPORTED_ADDRESS_KIND;
        }
        if (!verifier->verify(awn.address.contractId(), payload,
                              auth.signatureArgs))
        {
            CLOG_DEBUG(Auth, "custom account {} rejected signature",
                       addressAbbrev(awn.address));
            return SorobanResultCode::SIGNATURE_INVALID;
        }
        break;
    default:
        return SorobanResultCode::UNSUPPORTED_ADDRESS_KIND;
    }

    if (awn.nonce != expectedNonce)
    {
        CLOG_DEBUG(Auth, "nonce {} for {} on {}, expected {}", awn.nonce,
                   addressAbbrev(awn.address),
                   hexAbbrev(auth.rootInvocation.contractID), expectedNonce);
        return SorobanResultCode::NONCE_MISMATCH;
    }
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
verifyContractAuth(ContractAuth const& auth, Hash const& networkID,
                   NonceTracker const& tracker,
                   ContractAccountVerifier const* verifier)
{
    uint64_t expected = 0;
    if (auth.addressWithNonce)
    {
        auto res = tracker.nonceAfter(auth.addressWithNonce->address,
                                      auth.rootInvocation.contractID, 0,
                                      expected);
        if (!isSuccess(res))
        {
            return res;
        }
    }
    return verifyContractAuth(auth, networkID, expected, verifier);
}
}
