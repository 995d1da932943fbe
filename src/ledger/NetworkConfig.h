#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <functional>
#include <json/json.h>

namespace soroban
{

// Computes the minimum refundable fee for a given amount of extended
// metadata. Supplied by the fee collaborator; see
// SorobanNetworkConfig::metaDataFeeFunction for the network's linear rate.
using MetaDataFeeFunction = std::function<int64_t(uint32_t)>;

// Network-specific Soroban limits. These are configuration rather than
// constants: every network (and every protocol upgrade) may set them
// differently. A value of 0 for the invocation limits means "no limit";
// resource limits default to the widest representable value.
class SorobanNetworkConfig
{
  public:
    SorobanNetworkConfig();

    // Reads the SOROBAN_LIMITS object. Keys not present keep their
    // defaults. Throws std::invalid_argument on unknown keys or values of
    // the wrong type.
    static SorobanNetworkConfig fromJson(Json::Value const& limits);

    // Authorization tree limits
    uint32_t maxAuthorizedInvocationNodes() const;
    uint32_t maxAuthorizedInvocationDepth() const;

    // Transaction resource limits
    uint32_t txMaxInstructions() const;
    uint32_t txMaxReadBytes() const;
    uint32_t txMaxWriteBytes() const;
    uint32_t txMaxReadLedgerEntries() const;
    uint32_t txMaxWriteLedgerEntries() const;
    uint32_t txMaxExtendedMetaDataSizeBytes() const;
    uint32_t maxContractDataKeySizeBytes() const;

    // Fee per 1KB of extended metadata
    int64_t feeExtendedMetaData1KB() const;

    // ceil(bytes * feeExtendedMetaData1KB / 1024), saturating at INT64_MAX.
    int64_t minRefundableFee(uint32_t extendedMetaDataSizeBytes) const;
    MetaDataFeeFunction metaDataFeeFunction() const;

  private:
    uint32_t mMaxAuthorizedInvocationNodes{0};
    uint32_t mMaxAuthorizedInvocationDepth{0};

    uint32_t mTxMaxInstructions;
    uint32_t mTxMaxReadBytes;
    uint32_t mTxMaxWriteBytes;
    uint32_t mTxMaxReadLedgerEntries;
    uint32_t mTxMaxWriteLedgerEntries;
    uint32_t mTxMaxExtendedMetaDataSizeBytes;
    uint32_t mMaxContractDataKeySizeBytes;

    int64_t mFeeExtendedMetaData1KB{0};
};
}
