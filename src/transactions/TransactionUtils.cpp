// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/TransactionUtils.h"
#include "crypto/Hex.h"
#include <fmt/format.h>

namespace soroban
{

SCVal
makeSymbolSCVal(std::string&& str)
{
    SCVal val(SCV_SYMBOL);
    val.sym().assign(std::move(str));
    return val;
}

SCVal
makeSymbolSCVal(std::string const& str)
{
    SCVal val(SCV_SYMBOL);
    val.sym().assign(str);
    return val;
}

SCVal
makeStringSCVal(std::string&& str)
{
    SCVal val(SCV_STRING);
    val.str().assign(std::move(str));
    return val;
}

SCVal
makeU32SCVal(uint32_t u)
{
    SCVal val(SCV_U32);
    val.u32() = u;
    return val;
}

SCVal
makeU64SCVal(uint64_t u)
{
    SCVal val(SCV_U64);
    val.u64() = u;
    return val;
}

SCVal
makeI128SCVal(int64_t i)
{
    SCVal val(SCV_I128);
    val.i128().lo = static_cast<uint64_t>(i);
    val.i128().hi = i < 0 ? -1 : 0;
    return val;
}

SCVal
makeBytesSCVal(ByteSlice const& bytes)
{
    SCVal val(SCV_BYTES);
    val.bytes().assign(bytes.begin(), bytes.end());
    return val;
}

SCVal
makeAddressSCVal(SCAddress const& address)
{
    SCVal val(SCV_ADDRESS);
    val.address() = address;
    return val;
}

SCVal
makeVecSCVal(std::vector<SCVal> elems)
{
    SCVal val(SCV_VEC);
    val.vec().activate().assign(elems.begin(), elems.end());
    return val;
}

SCAddress
makeAccountAddress(AccountID const& accountID)
{
    SCAddress addr(SC_ADDRESS_TYPE_ACCOUNT);
    addr.accountId() = accountID;
    return addr;
}

SCAddress
makeContractAddress(Hash const& contractID)
{
    SCAddress addr(SC_ADDRESS_TYPE_CONTRACT);
    addr.contractId() = contractID;
    return addr;
}

LedgerKey
getContractExecutableKey(Hash const& contractID)
{
    LedgerKey key(CONTRACT_DATA);
    key.contractData().contractID = contractID;
    key.contractData().key.type(SCV_LEDGER_KEY_CONTRACT_EXECUTABLE);
    return key;
}

LedgerKey
getContractCodeKey(Hash const& wasmHash)
{
    LedgerKey key(CONTRACT_CODE);
    key.contractCode().hash = wasmHash;
    return key;
}

LedgerKey
getNonceKey(Hash const& contractID, SCAddress const& address)
{
    LedgerKey key(CONTRACT_DATA);
    key.contractData().contractID = contractID;
    key.contractData().key.type(SCV_LEDGER_KEY_NONCE);
    key.contractData().key.nonce_key().nonce_address = address;
    return key;
}

namespace
{
template <typename Code>
bool
isAssetCodeValid(Code const& code, size_t minChars)
{
    bool zeros = false;
    size_t charCount = 0;
    for (uint8_t b : code)
    {
        if (b == 0)
        {
            zeros = true;
        }
        else if (zeros)
        {
            // zeros can only be trailing
            return false;
        }
        else
        {
            bool alnum = (b >= '0' && b <= '9') || (b >= 'a' && b <= 'z') ||
                         (b >= 'A' && b <= 'Z');
            if (!alnum)
            {
                return false;
            }
            ++charCount;
        }
    }
    return charCount >= minChars;
}
}

bool
isAssetValid(Asset const& asset)
{
    switch (asset.type())
    {
    case ASSET_TYPE_NATIVE:
        return true;
    case ASSET_TYPE_CREDIT_ALPHANUM4:
        return isAssetCodeValid(asset.alphaNum4().assetCode, 1);
    case ASSET_TYPE_CREDIT_ALPHANUM12:
        return isAssetCodeValid(asset.alphaNum12().assetCode, 5);
    default:
        return false;
    }
}

bool
isSymbolValid(std::string const& sym)
{
    if (sym.size() > SCSYMBOL_LIMIT)
    {
        return false;
    }
    for (char c : sym)
    {
        bool ok = c == '_' || (c >= '0' && c <= '9') ||
                  (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (!ok)
        {
            return false;
        }
    }
    return true;
}

std::string
addressAbbrev(SCAddress const& address)
{
    switch (address.type())
    {
    case SC_ADDRESS_TYPE_ACCOUNT:
        return fmt::format(FMT_STRING("account:{}"),
                           hexAbbrev(address.accountId().ed25519()));
    case SC_ADDRESS_TYPE_CONTRACT:
        return fmt::format(FMT_STRING("contract:{}"),
                           hexAbbrev(address.contractId()));
    }
    return "unknown";
}
}
