// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/SorobanResourceUtils.h"
#include "crypto/Hex.h"
#include "crypto/SHA.h"
#include "transactions/AuthorizedInvocationBuilder.h"
#include "transactions/ContractIDUtils.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include "util/XDROperators.h"
#include <algorithm>
#include <set>
#include <xdrpp/marshal.h>

namespace soroban
{

namespace
{
class FootprintBuilder
{
    std::set<LedgerKey> mReadOnly;
    std::set<LedgerKey> mReadWrite;

  public:
    void
    addReadOnly(LedgerKey const& key)
    {
        mReadOnly.emplace(key);
    }

    void
    addReadWrite(LedgerKey const& key)
    {
        mReadWrite.emplace(key);
    }

    void
    add(LedgerFootprint const& fp)
    {
        mReadOnly.insert(fp.readOnly.begin(), fp.readOnly.end());
        mReadWrite.insert(fp.readWrite.begin(), fp.readWrite.end());
    }

    LedgerFootprint
    finish() const
    {
        LedgerFootprint fp;
        for (auto const& key : mReadOnly)
        {
            if (mReadWrite.find(key) == mReadWrite.end())
            {
                fp.readOnly.emplace_back(key);
            }
        }
        fp.readWrite.assign(mReadWrite.begin(), mReadWrite.end());
        return fp;
    }
};

SorobanResultCode
addInvokeContractKeys(SCVec const& args, FootprintBuilder& fb)
{
    if (args.size() < 2 || args[0].type() != SCV_BYTES ||
        args[0].bytes().size() != sizeof(Hash) ||
        args[1].type() != SCV_SYMBOL)
    {
        CLOG_DEBUG(Tx, "invoke args must start with a contract ID and a "
                       "function symbol");
        return SorobanResultCode::MALFORMED_INPUT;
    }
    Hash contractID;
    std::copy(args[0].bytes().begin(), args[0].bytes().end(),
              contractID.begin());
    fb.addReadOnly(getContractExecutableKey(contractID));
    return SorobanResultCode::SUCCESS;
}

void
addAuthKeys(ContractAuth const& auth, FootprintBuilder& fb)
{
    forEachAuthorizedInvocation(
        auth.rootInvocation, [&](AuthorizedInvocation const& inv, uint32_t) {
            fb.addReadOnly(getContractExecutableKey(inv.contractID));
        });
    if (auth.addressWithNonce)
    {
        fb.addReadWrite(getNonceKey(auth.rootInvocation.contractID,
                                    auth.addressWithNonce->address));
    }
}

bool
isFootprintKeyTypeAllowed(LedgerKey const& key)
{
    switch (key.type())
    {
    case ACCOUNT:
    case TRUSTLINE:
    case CONTRACT_DATA:
    case CONTRACT_CODE:
        return true;
    default:
        return false;
    }
}

bool
isCovered(xdr::xvector<LedgerKey> const& sortedSet, LedgerKey const& key)
{
    return std::binary_search(sortedSet.begin(), sortedSet.end(), key);
}

xdr::xvector<LedgerKey>
sortedKeys(xdr::xvector<LedgerKey> keys)
{
    std::sort(keys.begin(), keys.end());
    return keys;
}
}

SorobanResultCode
buildFootprint(Hash const& networkID, AccountID const& sourceAccount,
               InvokeHostFunctionOp const& op, LedgerFootprint& footprint)
{
    FootprintBuilder fb;
    for (auto const& fn : op.functions)
    {
        switch (fn.args.type())
        {
        case HOST_FUNCTION_TYPE_INVOKE_CONTRACT:
        {
            auto res = addInvokeContractKeys(fn.args.invokeContract(), fb);
            if (!isSuccess(res))
            {
                return res;
            }
            break;
        }
        case HOST_FUNCTION_TYPE_CREATE_CONTRACT:
        {
            auto const& args = fn.args.createContract();
            Hash contractID;
            auto res = getContractID(networkID, sourceAccount, args,
                                     contractID);
            if (!isSuccess(res))
            {
                return res;
            }
            fb.addReadWrite(getContractExecutableKey(contractID));
            if (args.source.type() == SCCONTRACT_EXECUTABLE_WASM_REF)
            {
                fb.addReadOnly(getContractCodeKey(args.source.wasm_id()));
            }
            break;
        }
        case HOST_FUNCTION_TYPE_UPLOAD_CONTRACT_WASM:
            fb.addReadWrite(
                getContractCodeKey(sha256(fn.args.uploadContractWasm().code)));
            break;
        default:
            return SorobanResultCode::MALFORMED_INPUT;
        }

        for (auto const& auth : fn.auth)
        {
            addAuthKeys(auth, fb);
        }
    }
    footprint = fb.finish();
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
checkFootprint(LedgerFootprint const& declared,
               SorobanNetworkConfig const& cfg)
{
    std::set<LedgerKey> seen;
    for (auto const* keys : {&declared.readOnly, &declared.readWrite})
    {
        for (auto const& key : *keys)
        {
            if (!isFootprintKeyTypeAllowed(key))
            {
                CLOG_DEBUG(Tx, "ledger key type {} not allowed in footprint",
                           static_cast<int>(key.type()));
                return SorobanResultCode::MALFORMED_INPUT;
            }
            if (!seen.emplace(key).second)
            {
                CLOG_DEBUG(Tx, "duplicate ledger key in footprint");
                return SorobanResultCode::MALFORMED_INPUT;
            }
            auto keySize = static_cast<uint32_t>(xdr::xdr_size(key));
            if (keySize > cfg.maxContractDataKeySizeBytes())
            {
                CLOG_DEBUG(Tx, "footprint key of {} bytes exceeds {}", keySize,
                           cfg.maxContractDataKeySizeBytes());
                return SorobanResultCode::LIMIT_EXCEEDED;
            }
        }
    }
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
checkFootprintCovers(LedgerFootprint const& declared,
                     LedgerFootprint const& computed)
{
    auto ro = sortedKeys(declared.readOnly);
    auto rw = sortedKeys(declared.readWrite);
    for (auto const& key : computed.readWrite)
    {
        if (!isCovered(rw, key))
        {
            CLOG_DEBUG(Tx, "read-write footprint is missing a {} key",
                       static_cast<int>(key.type()));
            return SorobanResultCode::FOOTPRINT_INSUFFICIENT;
        }
    }
    for (auto const& key : computed.readOnly)
    {
        if (!isCovered(ro, key) && !isCovered(rw, key))
        {
            CLOG_DEBUG(Tx, "footprint is missing a {} key",
                       static_cast<int>(key.type()));
            return SorobanResultCode::FOOTPRINT_INSUFFICIENT;
        }
    }
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
validateSorobanTransactionData(SorobanTransactionData const& data,
                               LedgerFootprint const& computed,
                               SorobanNetworkConfig const& cfg,
                               MetaDataFeeFunction const& minRefundableFee)
{
    if (data.refundableFee < 0)
    {
        CLOG_DEBUG(Tx, "negative refundable fee {}", data.refundableFee);
        return SorobanResultCode::MALFORMED_INPUT;
    }

    auto const& resources = data.resources;
    auto res = checkFootprint(resources.footprint, cfg);
    if (!isSuccess(res))
    {
        return res;
    }

    auto const& fp = resources.footprint;
    size_t readEntries = fp.readOnly.size() + fp.readWrite.size();
    if (resources.instructions > cfg.txMaxInstructions() ||
        resources.readBytes > cfg.txMaxReadBytes() ||
        resources.writeBytes > cfg.txMaxWriteBytes() ||
        resources.extendedMetaDataSizeBytes >
            cfg.txMaxExtendedMetaDataSizeBytes() ||
        readEntries > cfg.txMaxReadLedgerEntries() ||
        fp.readWrite.size() > cfg.txMaxWriteLedgerEntries())
    {
        CLOG_DEBUG(Tx,
                   "resources exceed network limits: instructions {}, read "
                   "bytes {}, write bytes {}, metadata bytes {}, entries {}/{}",
                   resources.instructions, resources.readBytes,
                   resources.writeBytes, resources.extendedMetaDataSizeBytes,
                   readEntries, fp.readWrite.size());
        return SorobanResultCode::LIMIT_EXCEEDED;
    }

    res = checkFootprintCovers(fp, computed);
    if (!isSuccess(res))
    {
        return res;
    }

    auto minFee = minRefundableFee(resources.extendedMetaDataSizeBytes);
    if (data.refundableFee < minFee)
    {
        CLOG_DEBUG(Tx, "refundable fee {} below minimum {}",
                   data.refundableFee, minFee);
        return SorobanResultCode::FEE_INSUFFICIENT;
    }
    return SorobanResultCode::SUCCESS;
}

SorobanResultCode
validateSorobanTransactionData(SorobanTransactionData const& data,
                               LedgerFootprint const& computed,
                               SorobanNetworkConfig const& cfg)
{
    return validateSorobanTransactionData(data, computed, cfg,
                                          cfg.metaDataFeeFunction());
}

LedgerFootprint
augmentFootprint(LedgerFootprint const& suggested,
                 LedgerFootprint const& computed)
{
    FootprintBuilder fb;
    fb.add(suggested);
    fb.add(computed);
    return fb.finish();
}
}
