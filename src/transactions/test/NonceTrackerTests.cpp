// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/TestUtils.h"
#include "test/test.h"
#include "transactions/ContractAuthUtils.h"
#include "transactions/NonceTracker.h"
#include "transactions/TransactionUtils.h"
#include <limits>

using namespace soroban;
using namespace soroban::txtest;

TEST_CASE("nonce tracker", "[tx][nonce]")
{
    InMemoryNonceStore store;
    NonceTracker tracker(store);

    auto a = makeAccountAddress(getAccount("A").getPublicKey());
    auto b = makeContractAddress(makeHash("custom account"));
    auto c1 = makeHash("c1");
    auto c2 = makeHash("c2");

    REQUIRE(tracker.next(a, c1) == 0);
    REQUIRE(store.size() == 0);

    SECTION("observe advances the stored nonce")
    {
        REQUIRE(tracker.observe(a, c1, 0) == SorobanResultCode::SUCCESS);
        REQUIRE(tracker.next(a, c1) == 1);
        REQUIRE(store.loadNonce(getNonceKey(c1, a)) == 1u);

        REQUIRE(tracker.observe(a, c1, 1) == SorobanResultCode::SUCCESS);
        REQUIRE(tracker.next(a, c1) == 2);
    }
    SECTION("next only reads")
    {
        REQUIRE(tracker.next(a, c1) == 0);
        REQUIRE(tracker.next(a, c1) == 0);
        REQUIRE(store.size() == 0);
    }
    SECTION("stale and future nonces are rejected")
    {
        REQUIRE(tracker.observe(a, c1, 0) == SorobanResultCode::SUCCESS);
        REQUIRE(tracker.observe(a, c1, 0) ==
                SorobanResultCode::NONCE_MISMATCH);
        REQUIRE(tracker.observe(a, c1, 5) ==
                SorobanResultCode::NONCE_MISMATCH);
        REQUIRE(tracker.next(a, c1) == 1);
    }
    SECTION("pairs are independent")
    {
        REQUIRE(tracker.observe(a, c1, 0) == SorobanResultCode::SUCCESS);
        REQUIRE(tracker.next(a, c2) == 0);
        REQUIRE(tracker.next(b, c1) == 0);
        REQUIRE(tracker.observe(b, c1, 0) == SorobanResultCode::SUCCESS);
        REQUIRE(store.size() == 2);
    }
    SECTION("nonces written by the ledger are honored")
    {
        store.storeNonce(getNonceKey(c2, b), 41);
        REQUIRE(tracker.next(b, c2) == 41);
        REQUIRE(tracker.observe(b, c2, 40) ==
                SorobanResultCode::NONCE_MISMATCH);
        REQUIRE(tracker.observe(b, c2, 41) == SorobanResultCode::SUCCESS);
    }
    SECTION("the stored nonce never wraps")
    {
        auto const top = std::numeric_limits<uint64_t>::max();
        store.storeNonce(getNonceKey(c1, a), top - 1);

        uint64_t nonce = 0;
        REQUIRE(tracker.nonceAfter(a, c1, 0, nonce) ==
                SorobanResultCode::SUCCESS);
        REQUIRE(nonce == top - 1);
        REQUIRE(tracker.nonceAfter(a, c1, 1, nonce) ==
                SorobanResultCode::LIMIT_EXCEEDED);
        REQUIRE(tracker.nonceAfter(a, c1, top, nonce) ==
                SorobanResultCode::LIMIT_EXCEEDED);
        REQUIRE(nonce == top - 1);

        REQUIRE(tracker.observe(a, c1, top - 1) == SorobanResultCode::SUCCESS);
        REQUIRE(tracker.next(a, c1) == top);
        REQUIRE(tracker.nonceAfter(a, c1, 0, nonce) ==
                SorobanResultCode::LIMIT_EXCEEDED);
        REQUIRE(tracker.observe(a, c1, top) ==
                SorobanResultCode::LIMIT_EXCEEDED);
        REQUIRE(tracker.next(a, c1) == top);
        REQUIRE(tracker.observe(a, c1, 0) == SorobanResultCode::NONCE_MISMATCH);
    }
}

TEST_CASE("nonce conflicts", "[tx][nonce]")
{
    auto a = makeAccountAddress(getAccount("A").getPublicKey());
    auto b = makeAccountAddress(getAccount("B").getPublicKey());
    auto c1 = makeHash("c1");
    auto c2 = makeHash("c2");

    auto makeAuth = [](SCAddress const& address, Hash const& contractID,
                       uint64_t nonce) {
        ContractAuth auth;
        auth.rootInvocation = makeAuthorizedInvocation(contractID, "f");
        auth.addressWithNonce.activate() =
            makeAddressWithNonce(address, nonce);
        return auth;
    };

    InvokeHostFunctionOp op;
    op.functions.emplace_back();
    op.functions.emplace_back();
    auto& first = op.functions[0].auth;
    auto& second = op.functions[1].auth;

    first.emplace_back(makeAuth(a, c1, 0));
    second.emplace_back(makeAuth(b, c1, 0));
    second.emplace_back(makeAuth(a, c2, 0));
    second.emplace_back(makeAuth(a, c1, 1));
    REQUIRE(checkNonceConflicts(op) == SorobanResultCode::SUCCESS);

    SECTION("invoker entries carry no nonce")
    {
        ContractAuth invoker;
        invoker.rootInvocation = makeAuthorizedInvocation(c1, "f");
        first.emplace_back(invoker);
        first.emplace_back(invoker);
        REQUIRE(checkNonceConflicts(op) == SorobanResultCode::SUCCESS);
    }
    SECTION("same pair and nonce across functions")
    {
        second.emplace_back(makeAuth(a, c1, 0));
        REQUIRE(checkNonceConflicts(op) == SorobanResultCode::NONCE_CONFLICT);
    }
    SECTION("same pair and nonce within a function")
    {
        first.emplace_back(makeAuth(a, c1, 0));
        REQUIRE(checkNonceConflicts(op) == SorobanResultCode::NONCE_CONFLICT);
    }
    SECTION("only the root contract keys the nonce")
    {
        auto auth = makeAuth(b, c2, 3);
        auth.rootInvocation.subInvocations.emplace_back(
            makeAuthorizedInvocation(c1, "g"));
        first.emplace_back(auth);
        second.emplace_back(makeAuth(b, c1, 3));
        REQUIRE(checkNonceConflicts(op) == SorobanResultCode::SUCCESS);
    }
}
