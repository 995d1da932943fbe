#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/NetworkConfig.h"
#include "transactions/SorobanResult.h"
#include "xdr/Stellar-transaction.h"

namespace soroban
{

// Computes the minimal footprint of `op`: the executable of every invoked
// or created contract, uploaded and referenced Wasm code, the executable of
// every contract in every authorization tree and the nonce entry of every
// authorizing address. Keys are sorted and unique, and a key that is
// written is not also listed as read-only. `footprint` is written only on
// success.
SorobanResultCode buildFootprint(Hash const& networkID,
                                 AccountID const& sourceAccount,
                                 InvokeHostFunctionOp const& op,
                                 LedgerFootprint& footprint);

// Shape checks on a declared footprint: no duplicate keys, no key in both
// sets, only ACCOUNT / TRUSTLINE / CONTRACT_DATA / CONTRACT_CODE keys
// (MALFORMED_INPUT), keys within the network's key size limit
// (LIMIT_EXCEEDED).
SorobanResultCode checkFootprint(LedgerFootprint const& declared,
                                 SorobanNetworkConfig const& cfg);

// FOOTPRINT_INSUFFICIENT unless every computed read-write key is declared
// read-write and every computed read-only key is declared in either set.
SorobanResultCode checkFootprintCovers(LedgerFootprint const& declared,
                                       LedgerFootprint const& computed);

// Validates what a transaction declares against what `computed` requires
// and the network limits. `minRefundableFee` maps extended metadata bytes
// to the smallest acceptable refundable fee.
SorobanResultCode
validateSorobanTransactionData(SorobanTransactionData const& data,
                               LedgerFootprint const& computed,
                               SorobanNetworkConfig const& cfg,
                               MetaDataFeeFunction const& minRefundableFee);
SorobanResultCode
validateSorobanTransactionData(SorobanTransactionData const& data,
                               LedgerFootprint const& computed,
                               SorobanNetworkConfig const& cfg);

// Merges a suggested footprint (e.g. from preflight) with the computed
// one. Keys required read-write are moved out of the read-only set.
LedgerFootprint augmentFootprint(LedgerFootprint const& suggested,
                                 LedgerFootprint const& computed);
}
