// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SHA.h"
#include "crypto/SecretKey.h"
#include <stdexcept>

namespace soroban
{

// Plain SHA256
uint256
sha256(ByteSlice const& bin)
{
    PubKeyUtils::ensureSodiumInitialized();
    uint256 out;
    if (crypto_hash_sha256(out.data(), bin.data(), bin.size()) != 0)
    {
        throw std::runtime_error("error from crypto_hash_sha256");
    }
    return out;
}

SHA256::SHA256() : mFinished(false)
{
    reset();
}

void
SHA256::reset()
{
    PubKeyUtils::ensureSodiumInitialized();
    if (crypto_hash_sha256_init(&mState) != 0)
    {
        throw std::runtime_error("error from crypto_hash_sha256_init");
    }
    mFinished = false;
}

void
SHA256::add(ByteSlice const& bin)
{
    if (mFinished)
    {
        throw std::runtime_error("adding bytes to finished SHA256");
    }
    if (crypto_hash_sha256_update(&mState, bin.data(), bin.size()) != 0)
    {
        throw std::runtime_error("error from crypto_hash_sha256_update");
    }
}

uint256
SHA256::finish()
{
    uint256 out;
    static_assert(crypto_hash_sha256_BYTES == sizeof(out),
                  "unexpected crypto_hash_sha256_BYTES");
    if (mFinished)
    {
        throw std::runtime_error("finishing already-finished SHA256");
    }
    if (crypto_hash_sha256_final(&mState, out.data()) != 0)
    {
        throw std::runtime_error("error from crypto_hash_sha256_final");
    }
    mFinished = true;
    return out;
}
}
