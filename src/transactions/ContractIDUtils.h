#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "transactions/SorobanResult.h"
#include "xdr/Stellar-transaction.h"

namespace soroban
{

HashIDPreimage
makeSourceAccountContractIDPreimage(Hash const& networkID,
                                    AccountID const& sourceAccount,
                                    uint256 const& salt);
HashIDPreimage makeEd25519ContractIDPreimage(Hash const& networkID,
                                             uint256 const& ed25519,
                                             uint256 const& salt);
HashIDPreimage makeAssetContractIDPreimage(Hash const& networkID,
                                           Asset const& asset);

// The payload an Ed25519 key signs to create a contract under its own ID,
// without any on-chain account.
HashIDPreimage
makeCreateContractArgsPreimage(Hash const& networkID,
                               SCContractExecutable const& executable,
                               uint256 const& salt);

// ID of the built-in token contract for `asset`.
Hash getAssetContractID(Hash const& networkID, Asset const& asset);

// Resolves the ID a contract created from `args` by `sourceAccount` will
// have. Pure: identical inputs give identical IDs.
//
// Returns SCHEME_MISMATCH when the TOKEN executable is paired with anything
// but CONTRACT_ID_FROM_ASSET (or that scheme with a Wasm reference),
// SIGNATURE_INVALID when a FROM_ED25519_PUBLIC_KEY signature does not verify
// over the create-contract-args payload, and MALFORMED_INPUT for an invalid
// asset.
SorobanResultCode getContractID(Hash const& networkID,
                                AccountID const& sourceAccount,
                                CreateContractArgs const& args,
                                Hash& contractID);

// Builds FROM_ED25519_PUBLIC_KEY creation args signed by `key`.
CreateContractArgs
makeEd25519CreateContractArgs(SecretKey const& key, Hash const& networkID,
                              SCContractExecutable const& executable,
                              uint256 const& salt);
}
