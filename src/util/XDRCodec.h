#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/SorobanResult.h"
#include "util/Logging.h"
#include <cstdint>
#include <string>
#include <vector>
#include <xdrpp/marshal.h>
#include <xdrpp/types.h>

namespace soroban
{

// Map an xdrpp marshaling failure to a result code: a container or string
// over its declared bound is LIMIT_EXCEEDED, anything else (unknown union
// discriminant, short or overlong input, bad padding) is MALFORMED_INPUT.
SorobanResultCode classifyXDRError(xdr::xdr_runtime_error const& e);

// Standard base64 of raw bytes, the form the submission path and the
// preflight service exchange XDR in.
std::string toBase64(std::vector<uint8_t> const& bin);
bool fromBase64(std::string const& b64, std::vector<uint8_t>& out);

template <typename T>
SorobanResultCode
encodeXDR(T const& t, std::vector<uint8_t>& out)
{
    try
    {
        auto bytes = xdr::xdr_to_opaque(t);
        // The reader is where xdrpp enforces declared bounds; read the
        // encoding back so an over-long container fails here rather than at
        // the network.
        T check;
        xdr::xdr_from_opaque(bytes, check);
        out.assign(bytes.begin(), bytes.end());
        return SorobanResultCode::SUCCESS;
    }
    catch (xdr::xdr_runtime_error const& e)
    {
        CLOG_DEBUG(Xdr, "XDR encode failed: {}", e.what());
        return classifyXDRError(e);
    }
}

// Decode exactly one value; trailing bytes are rejected. `out` is only
// written on success.
template <typename T>
SorobanResultCode
decodeXDR(std::vector<uint8_t> const& bytes, T& out)
{
    try
    {
        T tmp;
        xdr::xdr_from_opaque(bytes, tmp);
        out = std::move(tmp);
        return SorobanResultCode::SUCCESS;
    }
    catch (xdr::xdr_runtime_error const& e)
    {
        CLOG_DEBUG(Xdr, "XDR decode of {} bytes failed: {}", bytes.size(),
                   e.what());
        return classifyXDRError(e);
    }
}

template <typename T>
SorobanResultCode
encodeXDRBase64(T const& t, std::string& out)
{
    std::vector<uint8_t> bytes;
    auto res = encodeXDR(t, bytes);
    if (isSuccess(res))
    {
        out = toBase64(bytes);
    }
    return res;
}

template <typename T>
SorobanResultCode
decodeXDRBase64(std::string const& b64, T& out)
{
    std::vector<uint8_t> bytes;
    if (!fromBase64(b64, bytes))
    {
        CLOG_DEBUG(Xdr, "invalid base64 input of length {}", b64.size());
        return SorobanResultCode::MALFORMED_INPUT;
    }
    return decodeXDR(bytes, out);
}
}
