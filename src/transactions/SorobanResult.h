#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

namespace soroban
{

// Outcome of every build/validate step. None of the failures is transient:
// callers adjust their inputs and rebuild.
enum class SorobanResultCode
{
    SUCCESS = 0,
    // Codec-level shape violation, or a structure that cannot be interpreted.
    MALFORMED_INPUT,
    // Contract ID scheme paired with an incompatible executable.
    SCHEME_MISMATCH,
    SIGNATURE_INVALID,
    NONCE_MISMATCH,
    NONCE_CONFLICT,
    // Sequence, tree or resource bound overrun.
    LIMIT_EXCEEDED,
    FOOTPRINT_INSUFFICIENT,
    FEE_INSUFFICIENT,
    UNSUPPORTED_ADDRESS_KIND
};

char const* toString(SorobanResultCode code);

inline bool
isSuccess(SorobanResultCode code)
{
    return code == SorobanResultCode::SUCCESS;
}
}
