// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/SorobanResult.h"

namespace soroban
{

char const*
toString(SorobanResultCode code)
{
    switch (code)
    {
    case SorobanResultCode::SUCCESS:
        return "SUCCESS";
    case SorobanResultCode::MALFORMED_INPUT:
        return "MALFORMED_INPUT";
    case SorobanResultCode::SCHEME_MISMATCH:
        return "SCHEME_MISMATCH";
    case SorobanResultCode::SIGNATURE_INVALID:
        return "SIGNATURE_INVALID";
    case SorobanResultCode::NONCE_MISMATCH:
        return "NONCE_MISMATCH";
    case SorobanResultCode::NONCE_CONFLICT:
        return "NONCE_CONFLICT";
    case SorobanResultCode::LIMIT_EXCEEDED:
        return "LIMIT_EXCEEDED";
    case SorobanResultCode::FOOTPRINT_INSUFFICIENT:
        return "FOOTPRINT_INSUFFICIENT";
    case SorobanResultCode::FEE_INSUFFICIENT:
        return "FEE_INSUFFICIENT";
    case SorobanResultCode::UNSUPPORTED_ADDRESS_KIND:
        return "UNSUPPORTED_ADDRESS_KIND";
    }
    return "UNKNOWN";
}
}
