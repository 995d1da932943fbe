#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"
#include "xdr/Stellar-types.h"
#include <sodium.h>
#include <xdrpp/marshal.h>

namespace soroban
{

// Plain SHA256
uint256 sha256(ByteSlice const& bin);

// SHA256 in incremental mode, for large inputs.
class SHA256
{
    crypto_hash_sha256_state mState;
    bool mFinished;

  public:
    SHA256();
    void reset();
    void add(ByteSlice const& bin);
    uint256 finish();
};

// SHA256 of the XDR encoding of its argument. xdrpp checks declared bounds
// only when reading, so an over-long container is hashed as is; run values
// that come from outside through encodeXDR first.
template <typename T>
uint256
xdrSha256(T const& t)
{
    return sha256(xdr::xdr_to_opaque(t));
}
}
