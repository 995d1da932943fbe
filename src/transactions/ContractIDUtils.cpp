// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/ContractIDUtils.h"
#include "crypto/Hex.h"
#include "crypto/SHA.h"
#include "transactions/TransactionUtils.h"
#include "util/Logging.h"

namespace soroban
{

HashIDPreimage
makeSourceAccountContractIDPreimage(Hash const& networkID,
                                    AccountID const& sourceAccount,
                                    uint256 const& salt)
{
    HashIDPreimage preImage;
    preImage.type(ENVELOPE_TYPE_CONTRACT_ID_FROM_SOURCE_ACCOUNT);
    preImage.sourceAccountContractID().networkID = networkID;
    preImage.sourceAccountContractID().sourceAccount = sourceAccount;
    preImage.sourceAccountContractID().salt = salt;
    return preImage;
}

HashIDPreimage
makeEd25519ContractIDPreimage(Hash const& networkID, uint256 const& ed25519,
                              uint256 const& salt)
{
    HashIDPreimage preImage;
    preImage.type(ENVELOPE_TYPE_CONTRACT_ID_FROM_ED25519);
    preImage.ed25519ContractID().networkID = networkID;
    preImage.ed25519ContractID().ed25519 = ed25519;
    preImage.ed25519ContractID().salt = salt;
    return preImage;
}

HashIDPreimage
makeAssetContractIDPreimage(Hash const& networkID, Asset const& asset)
{
    HashIDPreimage preImage;
    preImage.type(ENVELOPE_TYPE_CONTRACT_ID_FROM_ASSET);
    preImage.fromAsset().networkID = networkID;
    preImage.fromAsset().asset = asset;
    return preImage;
}

HashIDPreimage
makeCreateContractArgsPreimage(Hash const& networkID,
                               SCContractExecutable const& executable,
                               uint256 const& salt)
{
    HashIDPreimage preImage;
    preImage.type(ENVELOPE_TYPE_CREATE_CONTRACT_ARGS);
    preImage.createContractArgs().networkID = networkID;
    preImage.createContractArgs().source = executable;
    preImage.createContractArgs().salt = salt;
    return preImage;
}

Hash
getAssetContractID(Hash const& networkID, Asset const& asset)
{
    return xdrSha256(makeAssetContractIDPreimage(networkID, asset));
}

SorobanResultCode
getContractID(Hash const& networkID, AccountID const& sourceAccount,
              CreateContractArgs const& args, Hash& contractID)
{
    bool isToken = args.source.type() == SCCONTRACT_EXECUTABLE_TOKEN;
    auto const& id = args.contractID;

    switch (id.type())
    {
    case CONTRACT_ID_FROM_SOURCE_ACCOUNT:
        if (isToken)
        {
            CLOG_DEBUG(Tx, "token executable requires an asset contract ID");
            return SorobanResultCode::SCHEME_MISMATCH;
        }
        contractID = xdrSha256(makeSourceAccountContractIDPreimage(
            networkID, sourceAccount, id.salt()));
        return SorobanResultCode::SUCCESS;

    case CONTRACT_ID_FROM_ED25519_PUBLIC_KEY:
    {
        if (isToken)
        {
            CLOG_DEBUG(Tx, "token executable requires an asset contract ID");
            return SorobanResultCode::SCHEME_MISMATCH;
        }
        auto const& fromKey = id.fromEd25519PublicKey();
        auto payload = xdrSha256(makeCreateContractArgsPreimage(
            networkID, args.source, fromKey.salt));
        if (!PubKeyUtils::verifySig(PubKeyUtils::fromEd25519(fromKey.key),
                                    fromKey.signature, payload))
        {
            CLOG_DEBUG(Tx, "create-contract signature by {} does not verify",
                       hexAbbrev(fromKey.key));
            return SorobanResultCode::SIGNATURE_INVALID;
        }
        contractID = xdrSha256(
            makeEd25519ContractIDPreimage(networkID, fromKey.key, fromKey.salt));
        return SorobanResultCode::SUCCESS;
    }

    case CONTRACT_ID_FROM_ASSET:
        if (!isToken)
        {
            CLOG_DEBUG(Tx, "asset contract ID requires the token executable");
            return SorobanResultCode::SCHEME_MISMATCH;
        }
        if (!isAssetValid(id.asset()))
        {
            CLOG_DEBUG(Tx, "invalid asset in asset contract ID");
            return SorobanResultCode::MALFORMED_INPUT;
        }
        contractID = getAssetContractID(networkID, id.asset());
        return SorobanResultCode::SUCCESS;
    }

    CLOG_DEBUG(Tx, "unknown contract ID type {}", static_cast<int>(id.type()));
    return SorobanResultCode::MALFORMED_INPUT;
}

CreateContractArgs
makeEd25519CreateContractArgs(SecretKey const& key, Hash const& networkID,
                              SCContractExecutable const& executable,
                              uint256 const& salt)
{
    CreateContractArgs args;
    args.source = executable;
    args.contractID.type(CONTRACT_ID_FROM_ED25519_PUBLIC_KEY);
    auto& fromKey = args.contractID.fromEd25519PublicKey();
    fromKey.key = key.getPublicKey().ed25519();
    fromKey.salt = salt;
    fromKey.signature = key.sign(
        xdrSha256(makeCreateContractArgsPreimage(networkID, executable, salt)));
    return args;
}
}
