// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/AuthorizedInvocationBuilder.h"
#include "crypto/Hex.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"
#include "util/XDRCodec.h"
#include <stdexcept>

namespace soroban
{
namespace
{
// Shared by the const and non-const lookups; Node is AuthorizedInvocation
// with or without const.
template <typename Node>
Node&
resolveNode(Node& root, AuthorizedInvocationBuilder::NodeRef const& ref)
{
    Node* node = &root;
    for (auto idx : ref)
    {
        if (idx >= node->subInvocations.size())
        {
            throw std::out_of_range("no such authorized invocation node");
        }
        node = &node->subInvocations[idx];
    }
    return *node;
}
}

AuthorizedInvocation
makeAuthorizedInvocation(Hash const& contractID,
                         std::string const& functionName, SCVec args)
{
    AuthorizedInvocation inv;
    inv.contractID = contractID;
    inv.functionName.assign(functionName);
    inv.args = std::move(args);
    return inv;
}

AuthorizedInvocationBuilder::AuthorizedInvocationBuilder(
    Hash const& contractID, std::string const& functionName, SCVec args)
    : mRoot(makeAuthorizedInvocation(contractID, functionName,
                                     std::move(args)))
{
}

AuthorizedInvocationBuilder::NodeRef
AuthorizedInvocationBuilder::addSubInvocation(NodeRef const& parent,
                                              Hash const& contractID,
                                              std::string const& functionName,
                                              SCVec args)
{
    auto& node = resolve(parent);
    node.subInvocations.emplace_back(
        makeAuthorizedInvocation(contractID, functionName, std::move(args)));
    NodeRef child(parent);
    child.emplace_back(node.subInvocations.size() - 1);
    return child;
}

AuthorizedInvocation const&
AuthorizedInvocationBuilder::getInvocation() const
{
    return mRoot;
}

AuthorizedInvocation const&
AuthorizedInvocationBuilder::getNode(NodeRef const& ref) const
{
    return resolveNode(mRoot, ref);
}

AuthorizedInvocation&
AuthorizedInvocationBuilder::resolve(NodeRef const& ref)
{
    return resolveNode(mRoot, ref);
}

uint32_t
countAuthorizedInvocations(AuthorizedInvocation const& root)
{
    uint32_t count = 0;
    forEachAuthorizedInvocation(
        root, [&](AuthorizedInvocation const&, uint32_t) { ++count; });
    return count;
}

SorobanResultCode
validateAuthorizedInvocation(AuthorizedInvocation const& root,
                             uint32_t maxNodes, uint32_t maxDepth)
{
    auto res = SorobanResultCode::SUCCESS;
    uint32_t nodes = 0;
    forEachAuthorizedInvocation(root, [&](AuthorizedInvocation const& inv,
                                          uint32_t depth) {
        if (!isSuccess(res))
        {
            return;
        }
        ++nodes;
        if (maxNodes != 0 && nodes > maxNodes)
        {
            CLOG_DEBUG(Auth, "authorized invocation tree exceeds {} nodes",
                       maxNodes);
            res = SorobanResultCode::LIMIT_EXCEEDED;
        }
        else if (maxDepth != 0 && depth > maxDepth)
        {
            CLOG_DEBUG(Auth, "authorized invocation tree exceeds depth {}",
                       maxDepth);
            res = SorobanResultCode::LIMIT_EXCEEDED;
        }
        else if (!isSymbolValid(inv.functionName))
        {
            CLOG_DEBUG(Auth, "invalid function name in invocation on {}",
                       hexAbbrev(inv.contractID));
            res = SorobanResultCode::MALFORMED_INPUT;
        }
    });
    if (!isSuccess(res))
    {
        return res;
    }

    // Argument values nest arbitrarily; the codec is what knows every
    // bound (bytes, strings, symbols, vectors and maps at any depth).
    std::vector<uint8_t> encoded;
    res = encodeXDR(root, encoded);
    if (!isSuccess(res))
    {
        CLOG_DEBUG(Auth, "invocation tree rooted at {} does not encode: {}",
                   hexAbbrev(root.contractID), toString(res));
    }
    return res;
}

SorobanResultCode
validateAuthorizedInvocation(AuthorizedInvocation const& root,
                             SorobanNetworkConfig const& cfg)
{
    return validateAuthorizedInvocation(root,
                                        cfg.maxAuthorizedInvocationNodes(),
                                        cfg.maxAuthorizedInvocationDepth());
}
}
