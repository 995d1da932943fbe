// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "crypto/SHA.h"
#include <mutex>
#include <sodium.h>
#include <stdexcept>

namespace soroban
{

SecretKey::SecretKey()
{
    static_assert(crypto_sign_PUBLICKEYBYTES == sizeof(uint256),
                  "Unexpected public key length");
    static_assert(crypto_sign_SEEDBYTES == sizeof(uint256),
                  "Unexpected seed length");
    static_assert(crypto_sign_SECRETKEYBYTES == sizeof(uint512),
                  "Unexpected secret key length");
    static_assert(crypto_sign_BYTES == 64, "Unexpected signature length");
    mPublicKey.type(PUBLIC_KEY_TYPE_ED25519);
}

SecretKey::~SecretKey()
{
    sodium_memzero(mSecretKey.data(), mSecretKey.size());
}

PublicKey const&
SecretKey::getPublicKey() const
{
    return mPublicKey;
}

Signature
SecretKey::sign(ByteSlice const& bin) const
{
    Signature out(crypto_sign_BYTES, 0);
    if (crypto_sign_detached(out.data(), nullptr, bin.data(), bin.size(),
                             mSecretKey.data()) != 0)
    {
        throw std::runtime_error("error while signing");
    }
    return out;
}

SecretKey
SecretKey::random()
{
    PubKeyUtils::ensureSodiumInitialized();
    SecretKey sk;
    if (crypto_sign_keypair(sk.mPublicKey.ed25519().data(),
                            sk.mSecretKey.data()) != 0)
    {
        throw std::runtime_error("error generating random secret key");
    }
    return sk;
}

SecretKey
SecretKey::pseudoRandomForTesting(std::string const& seed)
{
    return fromSeed(sha256(seed));
}

SecretKey
SecretKey::fromSeed(ByteSlice const& seed)
{
    PubKeyUtils::ensureSodiumInitialized();
    if (seed.size() != crypto_sign_SEEDBYTES)
    {
        throw std::invalid_argument("seed does not match byte size");
    }
    SecretKey sk;
    if (crypto_sign_seed_keypair(sk.mPublicKey.ed25519().data(),
                                 sk.mSecretKey.data(), seed.data()) != 0)
    {
        throw std::runtime_error("error generating secret key from seed");
    }
    return sk;
}

namespace PubKeyUtils
{
void
ensureSodiumInitialized()
{
    static std::once_flag sInitFlag;
    std::call_once(sInitFlag, [] {
        if (sodium_init() < 0)
        {
            throw std::runtime_error("Could not initialize crypto");
        }
    });
}

bool
verifySig(PublicKey const& key, Signature const& signature,
          ByteSlice const& bin)
{
    ensureSodiumInitialized();
    if (key.type() != PUBLIC_KEY_TYPE_ED25519 ||
        signature.size() != crypto_sign_BYTES)
    {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), bin.data(),
                                       bin.size(),
                                       key.ed25519().data()) == 0;
}

PublicKey
fromEd25519(uint256 const& ed25519)
{
    PublicKey pk;
    pk.type(PUBLIC_KEY_TYPE_ED25519);
    pk.ed25519() = ed25519;
    return pk;
}
}
}
