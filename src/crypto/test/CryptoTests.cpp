// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/Hex.h"
#include "crypto/SHA.h"
#include "crypto/SecretKey.h"
#include "test/test.h"
#include "util/XDROperators.h"
#include <stdexcept>

using namespace soroban;

TEST_CASE("SHA256", "[crypto][sha]")
{
    REQUIRE(binToHex(sha256("")) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(binToHex(sha256("abc")) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    SHA256 hasher;
    hasher.add("a");
    hasher.add("bc");
    REQUIRE(hasher.finish() == sha256("abc"));

    hasher.reset();
    hasher.add("");
    REQUIRE(hasher.finish() == sha256(""));
}

TEST_CASE("hex tests", "[crypto][hex]")
{
    std::vector<uint8_t> bin{0x00, 0x01, 0xab, 0xff};
    REQUIRE(binToHex(bin) == "0001abff");
    REQUIRE(hexToBin("0001abff") == bin);
    REQUIRE(hexToBin("0001ABFF") == bin);
    REQUIRE(hexAbbrev(bin) == "0001ab");

    REQUIRE_THROWS_AS(hexToBin("0g"), std::invalid_argument);
    REQUIRE_THROWS_AS(hexToBin256("0001abff"), std::invalid_argument);

    auto h = sha256("abc");
    REQUIRE(hexToBin256(binToHex(h)) == h);
}

TEST_CASE("ed25519 keys and signatures", "[crypto][sign]")
{
    // RFC 8032, section 7.1, test 1
    auto seed = hexToBin256(
        "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    auto sk = SecretKey::fromSeed(seed);
    REQUIRE(binToHex(sk.getPublicKey().ed25519()) ==
            "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");

    auto sig = sk.sign(ByteSlice(nullptr, 0));
    REQUIRE(binToHex(sig) ==
            "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555"
            "fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
    REQUIRE(PubKeyUtils::verifySig(sk.getPublicKey(), sig,
                                   ByteSlice(nullptr, 0)));

    SECTION("signatures bind message and key")
    {
        auto msgSig = sk.sign("hello");
        REQUIRE(PubKeyUtils::verifySig(sk.getPublicKey(), msgSig, "hello"));
        REQUIRE(!PubKeyUtils::verifySig(sk.getPublicKey(), msgSig, "hellp"));

        auto other = SecretKey::random();
        REQUIRE(!(other == sk));
        REQUIRE(!PubKeyUtils::verifySig(other.getPublicKey(), msgSig,
                                        "hello"));

        Signature truncated = msgSig;
        truncated.pop_back();
        REQUIRE(!PubKeyUtils::verifySig(sk.getPublicKey(), truncated,
                                        "hello"));
    }
    SECTION("key construction")
    {
        REQUIRE(PubKeyUtils::fromEd25519(sk.getPublicKey().ed25519()) ==
                sk.getPublicKey());
        REQUIRE(SecretKey::pseudoRandomForTesting("x") ==
                SecretKey::fromSeed(sha256("x")));
        std::vector<uint8_t> shortSeed(31, 0);
        REQUIRE_THROWS_AS(SecretKey::fromSeed(shortSeed), std::invalid_argument);
    }
}
