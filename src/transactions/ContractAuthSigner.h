#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "transactions/SorobanResult.h"
#include "xdr/Stellar-transaction.h"
#include <functional>
#include <vector>

namespace soroban
{

// Produces the signatureArgs of a ContractAuth for one kind of address.
// Signing may be slow or fail (e.g. an external hardware signer), so sign()
// reports a result code instead of assuming success.
class ContractAuthSigner
{
  public:
    virtual ~ContractAuthSigner() = default;

    virtual SCAddressType addressType() const = 0;

    virtual SorobanResultCode sign(SCAddress const& address,
                                   uint256 const& payload,
                                   SCVec& signatureArgs) const = 0;
};

// Stellar account signer. Produces
//   [ Vec[ Map{ public_key: Bytes(32), signature: Bytes(64) }, ... ] ]
// with one entry per key, sorted by public key. The account's own key comes
// first in the constructor; additional keys cover multisig accounts. Only
// the address of that account key can be signed for.
class Ed25519AccountSigner : public ContractAuthSigner
{
    std::vector<SecretKey> mKeys;

  public:
    explicit Ed25519AccountSigner(SecretKey const& accountKey,
                                  std::vector<SecretKey> additionalKeys = {});

    SCAddressType addressType() const override;
    SorobanResultCode sign(SCAddress const& address, uint256 const& payload,
                           SCVec& signatureArgs) const override;

    AccountID const& getAccountID() const;
};

// Custom account (contract address) signer. The payload format belongs to
// the account contract, so the caller provides the signing function.
class ContractAccountSigner : public ContractAuthSigner
{
  public:
    using SignFunction = std::function<SorobanResultCode(
        SCAddress const&, uint256 const&, SCVec&)>;

    explicit ContractAccountSigner(SignFunction fn);

    SCAddressType addressType() const override;
    SorobanResultCode sign(SCAddress const& address, uint256 const& payload,
                           SCVec& signatureArgs) const override;

  private:
    SignFunction mSign;
};

// Checks custom account signatures on behalf of the account contract.
class ContractAccountVerifier
{
  public:
    virtual ~ContractAccountVerifier() = default;

    virtual bool verify(Hash const& accountContractID, uint256 const& payload,
                        SCVec const& signatureArgs) const = 0;
};

SCVal makeAccountSignatureArgs(std::vector<SecretKey> const& keys,
                               uint256 const& payload);

// MALFORMED_INPUT when signatureArgs does not have the account format,
// SIGNATURE_INVALID when an entry does not verify or none of them is the
// account's own key.
SorobanResultCode verifyAccountSignatureArgs(AccountID const& account,
                                             uint256 const& payload,
                                             SCVec const& signatureArgs);
}
