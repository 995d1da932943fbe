#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/NetworkConfig.h"
#include "transactions/SorobanResult.h"
#include "xdr/Stellar-transaction.h"
#include <string>
#include <utility>
#include <vector>

namespace soroban
{

// Assembles the require_auth call graph one address authorizes: the root is
// the top-level invocation, children are the calls made from within their
// parent's invocation context. Each node owns its children.
class AuthorizedInvocationBuilder
{
  public:
    // Child indices from the root; the empty path is the root itself.
    // Unlike a pointer into the tree, a path survives later appends.
    using NodeRef = std::vector<size_t>;

    AuthorizedInvocationBuilder(Hash const& contractID,
                                std::string const& functionName,
                                SCVec args = {});

    static NodeRef
    root()
    {
        return {};
    }

    // Appends a child under `parent` and returns its handle. Throws
    // std::out_of_range if `parent` does not name a node of this tree.
    NodeRef addSubInvocation(NodeRef const& parent, Hash const& contractID,
                             std::string const& functionName,
                             SCVec args = {});

    AuthorizedInvocation const& getInvocation() const;
    AuthorizedInvocation const& getNode(NodeRef const& ref) const;

  private:
    AuthorizedInvocation& resolve(NodeRef const& ref);

    AuthorizedInvocation mRoot;
};

AuthorizedInvocation makeAuthorizedInvocation(Hash const& contractID,
                                              std::string const& functionName,
                                              SCVec args = {});

// Checks every node: the function name is a valid symbol (MALFORMED_INPUT)
// and the tree stays within maxNodes / maxDepth, where 0 means unbounded
// (LIMIT_EXCEEDED). The root is at depth 1. Finally the whole tree must
// encode, so every argument value is within its XDR bounds at any nesting
// level; a failure returns the codec's code.
SorobanResultCode validateAuthorizedInvocation(AuthorizedInvocation const& root,
                                               uint32_t maxNodes,
                                               uint32_t maxDepth);
SorobanResultCode validateAuthorizedInvocation(AuthorizedInvocation const& root,
                                               SorobanNetworkConfig const& cfg);

uint32_t countAuthorizedInvocations(AuthorizedInvocation const& root);

// Pre-order walk with an explicit stack, so decoded trees of any depth are
// safe to visit. `f` receives (node, depth).
template <typename F>
void
forEachAuthorizedInvocation(AuthorizedInvocation const& root, F&& f)
{
    std::vector<std::pair<AuthorizedInvocation const*, uint32_t>> stack;
    stack.emplace_back(&root, 1);
    while (!stack.empty())
    {
        auto cur = stack.back();
        stack.pop_back();
        f(*cur.first, cur.second);
        auto const& subs = cur.first->subInvocations;
        for (auto it = subs.rbegin(); it != subs.rend(); ++it)
        {
            stack.emplace_back(&*it, cur.second + 1);
        }
    }
}
}
