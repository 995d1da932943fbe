// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/TestUtils.h"
#include "crypto/SHA.h"
#include "transactions/AuthorizedInvocationBuilder.h"
#include "transactions/TransactionUtils.h"
#include <algorithm>
#include <stdexcept>

namespace soroban
{
namespace txtest
{

SecretKey
getAccount(std::string const& name)
{
    return SecretKey::pseudoRandomForTesting(name);
}

Hash
makeHash(std::string const& seed)
{
    return sha256(seed);
}

Asset
makeAsset(SecretKey const& issuer, std::string const& code)
{
    Asset asset;
    if (code.size() <= 4)
    {
        asset.type(ASSET_TYPE_CREDIT_ALPHANUM4);
        asset.alphaNum4().assetCode.fill(0);
        std::copy(code.begin(), code.end(),
                  asset.alphaNum4().assetCode.begin());
        asset.alphaNum4().issuer = issuer.getPublicKey();
    }
    else if (code.size() <= 12)
    {
        asset.type(ASSET_TYPE_CREDIT_ALPHANUM12);
        asset.alphaNum12().assetCode.fill(0);
        std::copy(code.begin(), code.end(),
                  asset.alphaNum12().assetCode.begin());
        asset.alphaNum12().issuer = issuer.getPublicKey();
    }
    else
    {
        throw std::invalid_argument("asset code too long");
    }
    return asset;
}

namespace
{
uint256
contractAccountDigest(Hash const& accountContractID, uint256 const& payload)
{
    SHA256 hasher;
    hasher.add(accountContractID);
    hasher.add(payload);
    return hasher.finish();
}
}

SCVec
makeTestContractAccountSignature(Hash const& accountContractID,
                                 uint256 const& payload)
{
    SCVec sig;
    sig.emplace_back(
        makeBytesSCVal(contractAccountDigest(accountContractID, payload)));
    return sig;
}

bool
TestContractAccountVerifier::verify(Hash const& accountContractID,
                                    uint256 const& payload,
                                    SCVec const& signatureArgs) const
{
    if (signatureArgs.size() != 1 || signatureArgs[0].type() != SCV_BYTES)
    {
        return false;
    }
    auto digest = contractAccountDigest(accountContractID, payload);
    auto const& sig = signatureArgs[0].bytes();
    return sig.size() == digest.size() &&
           std::equal(digest.begin(), digest.end(), sig.begin());
}

ContractAccountSigner
makeTestContractAccountSigner()
{
    return ContractAccountSigner([](SCAddress const& address,
                                    uint256 const& payload, SCVec& sigArgs) {
        sigArgs = makeTestContractAccountSignature(address.contractId(),
                                                   payload);
        return SorobanResultCode::SUCCESS;
    });
}

SwapScenario::SwapScenario()
    : a(getAccount("A"))
    , b(getAccount("B"))
    , swapContract(makeHash("swap"))
    , tokenA(makeHash("token a"))
    , tokenB(makeHash("token b"))
{
}

SCVec
SwapScenario::swapArgs() const
{
    SCVec args;
    args.emplace_back(makeAddressSCVal(makeAccountAddress(a.getPublicKey())));
    args.emplace_back(makeAddressSCVal(makeAccountAddress(b.getPublicKey())));
    args.emplace_back(makeBytesSCVal(tokenA));
    args.emplace_back(makeBytesSCVal(tokenB));
    args.emplace_back(makeI128SCVal(amountA));
    args.emplace_back(makeI128SCVal(amountB));
    args.emplace_back(makeI128SCVal(amountB));
    args.emplace_back(makeI128SCVal(amountA));
    return args;
}

AuthorizedInvocation
SwapScenario::invocationFor(SecretKey const& party) const
{
    bool isA = party == a;
    AuthorizedInvocationBuilder builder(swapContract, "swap", swapArgs());

    SCVec allowanceArgs;
    allowanceArgs.emplace_back(
        makeAddressSCVal(makeAccountAddress(party.getPublicKey())));
    allowanceArgs.emplace_back(
        makeAddressSCVal(makeContractAddress(swapContract)));
    allowanceArgs.emplace_back(makeI128SCVal(isA ? amountA : amountB));
    builder.addSubInvocation(AuthorizedInvocationBuilder::root(),
                             isA ? tokenA : tokenB, "increase_allowance",
                             allowanceArgs);
    return builder.getInvocation();
}
}
}
