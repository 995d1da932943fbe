#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/ContractAuthSigner.h"
#include "transactions/NonceTracker.h"
#include "transactions/SorobanResult.h"
#include "xdr/Stellar-transaction.h"
#include <optional>

namespace soroban
{

HashIDPreimage makeContractAuthPreimage(Hash const& networkID, uint64_t nonce,
                                        AuthorizedInvocation const& invocation);

// The 32 bytes an authorizing address signs.
uint256 getContractAuthPayload(Hash const& networkID, uint64_t nonce,
                               AuthorizedInvocation const& invocation);

AddressWithNonce makeAddressWithNonce(SCAddress const& address,
                                      uint64_t nonce);

// Assembles a ContractAuth. Without an address the transaction source
// authorizes the tree, signatureArgs stay empty and `signer` is not used.
// Otherwise `signer` must handle the address kind (UNSUPPORTED_ADDRESS_KIND)
// and its failures are returned unchanged. `auth` is written only on
// success.
SorobanResultCode
buildContractAuth(Hash const& networkID,
                  std::optional<AddressWithNonce> const& addressWithNonce,
                  AuthorizedInvocation const& invocation,
                  ContractAuthSigner const* signer, ContractAuth& auth);

// Recomputes the payload and checks signatureArgs in the format the address
// kind implies, then checks the nonce. Contract addresses need `verifier`.
// A tree that does not encode fails with the codec's code before any
// signature is looked at.
SorobanResultCode verifyContractAuth(ContractAuth const& auth,
                                     Hash const& networkID,
                                     uint64_t expectedNonce,
                                     ContractAccountVerifier const* verifier);

// Same, with the expected nonce read from `tracker` for
// (address, rootInvocation.contractID).
SorobanResultCode verifyContractAuth(ContractAuth const& auth,
                                     Hash const& networkID,
                                     NonceTracker const& tracker,
                                     ContractAccountVerifier const* verifier);
}
