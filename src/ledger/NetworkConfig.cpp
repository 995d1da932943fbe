// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/NetworkConfig.h"
#include <fmt/format.h>
#include <limits>
#include <stdexcept>
#include <string>

namespace soroban
{
namespace
{
uint32_t
readUint32(Json::Value const& v, std::string const& name)
{
    if (!v.isUInt())
    {
        throw std::invalid_argument(fmt::format(
            FMT_STRING("SOROBAN_LIMITS.{} must be a uint32"), name));
    }
    return v.asUInt();
}

int64_t
readNonNegativeInt64(Json::Value const& v, std::string const& name)
{
    if (!v.isInt64() || v.asInt64() < 0)
    {
        throw std::invalid_argument(fmt::format(
            FMT_STRING("SOROBAN_LIMITS.{} must be a non-negative int64"),
            name));
    }
    return v.asInt64();
}
}

SorobanNetworkConfig::SorobanNetworkConfig()
    : mTxMaxInstructions(std::numeric_limits<uint32_t>::max())
    , mTxMaxReadBytes(std::numeric_limits<uint32_t>::max())
    , mTxMaxWriteBytes(std::numeric_limits<uint32_t>::max())
    , mTxMaxReadLedgerEntries(std::numeric_limits<uint32_t>::max())
    , mTxMaxWriteLedgerEntries(std::numeric_limits<uint32_t>::max())
    , mTxMaxExtendedMetaDataSizeBytes(std::numeric_limits<uint32_t>::max())
    , mMaxContractDataKeySizeBytes(std::numeric_limits<uint32_t>::max())
{
}

SorobanNetworkConfig
SorobanNetworkConfig::fromJson(Json::Value const& limits)
{
    SorobanNetworkConfig cfg;
    if (limits.isNull())
    {
        return cfg;
    }
    if (!limits.isObject())
    {
        throw std::invalid_argument("SOROBAN_LIMITS must be an object");
    }

    for (auto const& name : limits.getMemberNames())
    {
        auto const& v = limits[name];
        if (name == "MAX_AUTH_INVOCATION_NODES")
        {
            cfg.mMaxAuthorizedInvocationNodes = readUint32(v, name);
        }
        else if (name == "MAX_AUTH_INVOCATION_DEPTH")
        {
            cfg.mMaxAuthorizedInvocationDepth = readUint32(v, name);
        }
        else if (name == "TX_MAX_INSTRUCTIONS")
        {
            cfg.mTxMaxInstructions = readUint32(v, name);
        }
        else if (name == "TX_MAX_READ_BYTES")
        {
            cfg.mTxMaxReadBytes = readUint32(v, name);
        }
        else if (name == "TX_MAX_WRITE_BYTES")
        {
            cfg.mTxMaxWriteBytes = readUint32(v, name);
        }
        else if (name == "TX_MAX_READ_LEDGER_ENTRIES")
        {
            cfg.mTxMaxReadLedgerEntries = readUint32(v, name);
        }
        else if (name == "TX_MAX_WRITE_LEDGER_ENTRIES")
        {
            cfg.mTxMaxWriteLedgerEntries = readUint32(v, name);
        }
        else if (name == "TX_MAX_EXTENDED_META_DATA_SIZE_BYTES")
        {
            cfg.mTxMaxExtendedMetaDataSizeBytes = readUint32(v, name);
        }
        else if (name == "MAX_CONTRACT_DATA_KEY_SIZE_BYTES")
        {
            cfg.mMaxContractDataKeySizeBytes = readUint32(v, name);
        }
        else if (name == "FEE_EXTENDED_META_DATA_1KB")
        {
            cfg.mFeeExtendedMetaData1KB = readNonNegativeInt64(v, name);
        }
        else
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("unknown SOROBAN_LIMITS key '{}'"), name));
        }
    }
    return cfg;
}

uint32_t
SorobanNetworkConfig::maxAuthorizedInvocationNodes() const
{
    return mMaxAuthorizedInvocationNodes;
}

uint32_t
SorobanNetworkConfig::maxAuthorizedInvocationDepth() const
{
    return mMaxAuthorizedInvocationDepth;
}

uint32_t
SorobanNetworkConfig::txMaxInstructions() const
{
    return mTxMaxInstructions;
}

uint32_t
SorobanNetworkConfig::txMaxReadBytes() const
{
    return mTxMaxReadBytes;
}

uint32_t
SorobanNetworkConfig::txMaxWriteBytes() const
{
    return mTxMaxWriteBytes;
}

uint32_t
SorobanNetworkConfig::txMaxReadLedgerEntries() const
{
    return mTxMaxReadLedgerEntries;
}

uint32_t
SorobanNetworkConfig::txMaxWriteLedgerEntries() const
{
    return mTxMaxWriteLedgerEntries;
}

uint32_t
SorobanNetworkConfig::txMaxExtendedMetaDataSizeBytes() const
{
    return mTxMaxExtendedMetaDataSizeBytes;
}

uint32_t
SorobanNetworkConfig::maxContractDataKeySizeBytes() const
{
    return mMaxContractDataKeySizeBytes;
}

int64_t
SorobanNetworkConfig::feeExtendedMetaData1KB() const
{
    return mFeeExtendedMetaData1KB;
}

int64_t
SorobanNetworkConfig::minRefundableFee(uint32_t extendedMetaDataSizeBytes) const
{
    if (extendedMetaDataSizeBytes == 0 || mFeeExtendedMetaData1KB == 0)
    {
        return 0;
    }
    // fee * bytes / 1024 split so that only the final sum can overflow
    auto const maxFee = std::numeric_limits<int64_t>::max();
    int64_t const bytes = extendedMetaDataSizeBytes;
    int64_t const perKB = mFeeExtendedMetaData1KB / 1024;
    int64_t const rem = mFeeExtendedMetaData1KB % 1024;
    int64_t const fromRem = (rem * bytes + 1023) / 1024;
    if (perKB > (maxFee - fromRem) / bytes)
    {
        return maxFee;
    }
    return perKB * bytes + fromRem;
}

MetaDataFeeFunction
SorobanNetworkConfig::metaDataFeeFunction() const
{
    auto self = *this;
    return [self](uint32_t bytes) { return self.minRefundableFee(bytes); };
}
}
