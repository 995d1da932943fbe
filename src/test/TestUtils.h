#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "transactions/ContractAuthSigner.h"
#include "xdr/Stellar-transaction.h"
#include <string>

namespace soroban
{
namespace txtest
{

SecretKey getAccount(std::string const& name);

Hash makeHash(std::string const& seed);

Asset makeAsset(SecretKey const& issuer, std::string const& code);

// Custom accounts in tests sign by returning [Bytes(SHA256(accountID ||
// payload))]; the verifier accepts exactly that.
class TestContractAccountVerifier : public ContractAccountVerifier
{
  public:
    bool verify(Hash const& accountContractID, uint256 const& payload,
                SCVec const& signatureArgs) const override;
};

SCVec makeTestContractAccountSignature(Hash const& accountContractID,
                                       uint256 const& payload);
ContractAccountSigner makeTestContractAccountSigner();

// Two parties trading tokens through a swap contract. Each party authorizes
//   swap(a, b, token_a, token_b, amount_a, min_b_for_a, amount_b,
//        min_a_for_b)
//     └── increase_allowance(self, swap contract, amount) on its token
struct SwapScenario
{
    SecretKey a;
    SecretKey b;
    Hash swapContract;
    Hash tokenA;
    Hash tokenB;
    int64_t amountA{1000};
    int64_t amountB{5000};

    SwapScenario();

    SCVec swapArgs() const;
    AuthorizedInvocation invocationFor(SecretKey const& party) const;
};
}
}
