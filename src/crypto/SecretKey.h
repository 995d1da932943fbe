#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"
#include "xdr/Stellar-types.h"
#include <array>
#include <string>

namespace soroban
{

class SecretKey
{
    using uint512 = xdr::opaque_array<64>;
    uint512 mSecretKey;
    PublicKey mPublicKey;

    SecretKey();

  public:
    ~SecretKey();
    SecretKey(SecretKey const&) = default;
    SecretKey& operator=(SecretKey const&) = default;

    // Get the public key portion of this secret key.
    PublicKey const& getPublicKey() const;

    // Produce a signature of `bin` using this secret key.
    Signature sign(ByteSlice const& bin) const;

    // Create a new, random secret key.
    static SecretKey random();

    // Deterministic key for tests; derived from SHA256(seed).
    static SecretKey pseudoRandomForTesting(std::string const& seed);

    // Decode a secret key from a 32-byte Ed25519 seed.
    static SecretKey fromSeed(ByteSlice const& seed);

    bool
    operator==(SecretKey const& rh) const
    {
        return mSecretKey == rh.mSecretKey;
    }
};

namespace PubKeyUtils
{
// Must be called before any other libsodium function; safe to call
// repeatedly and from multiple threads.
void ensureSodiumInitialized();

bool verifySig(PublicKey const& key, Signature const& signature,
               ByteSlice const& bin);

PublicKey fromEd25519(uint256 const& ed25519);
}
}
