#pragma once

// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"
#include "xdr/Stellar-contract.h"
#include "xdr/Stellar-ledger-entries.h"
#include "xdr/Stellar-transaction.h"
#include <string>
#include <vector>

namespace soroban
{

SCVal makeSymbolSCVal(std::string&& str);
SCVal makeSymbolSCVal(std::string const& str);
SCVal makeStringSCVal(std::string&& str);
SCVal makeU32SCVal(uint32_t u);
SCVal makeU64SCVal(uint64_t u);
SCVal makeI128SCVal(int64_t i);
SCVal makeBytesSCVal(ByteSlice const& bytes);
SCVal makeAddressSCVal(SCAddress const& address);
SCVal makeVecSCVal(std::vector<SCVal> elems);

SCAddress makeAccountAddress(AccountID const& accountID);
SCAddress makeContractAddress(Hash const& contractID);

// Ledger key holding a contract's executable reference.
LedgerKey getContractExecutableKey(Hash const& contractID);
// Ledger key holding uploaded Wasm code.
LedgerKey getContractCodeKey(Hash const& wasmHash);
// Ledger key holding the next nonce `address` must use when authorizing a
// tree rooted at `contractID`.
LedgerKey getNonceKey(Hash const& contractID, SCAddress const& address);

// Asset codes are ASCII alphanumerics right-padded with zero bytes; 4-byte
// codes hold 1-4 characters, 12-byte codes 5-12.
bool isAssetValid(Asset const& asset);

// Symbols hold at most SCSYMBOL_LIMIT characters from [A-Za-z0-9_].
bool isSymbolValid(std::string const& sym);

// Short printable form of an address for logs.
std::string addressAbbrev(SCAddress const& address);
}
