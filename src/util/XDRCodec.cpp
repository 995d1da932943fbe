// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/XDRCodec.h"
#include "crypto/SecretKey.h"
#include <cstring>
#include <sodium.h>

namespace soroban
{

SorobanResultCode
classifyXDRError(xdr::xdr_runtime_error const& e)
{
    // xdrpp reports both "length prefix above the declared bound" and
    // "input ran out" as xdr_overflow; only the former is a limit.
    if (dynamic_cast<xdr::xdr_overflow const*>(&e) != nullptr &&
        std::strstr(e.what(), "insufficient buffer") == nullptr)
    {
        return SorobanResultCode::LIMIT_EXCEEDED;
    }
    return SorobanResultCode::MALFORMED_INPUT;
}

std::string
toBase64(std::vector<uint8_t> const& bin)
{
    PubKeyUtils::ensureSodiumInitialized();
    auto const variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(bin.size(), variant), '\0');
    sodium_bin2base64(&out[0], out.size(), bin.data(), bin.size(), variant);
    // drop the trailing NUL sodium writes
    out.resize(out.size() - 1);
    return out;
}

bool
fromBase64(std::string const& b64, std::vector<uint8_t>& out)
{
    PubKeyUtils::ensureSodiumInitialized();
    std::vector<uint8_t> bin(b64.size() / 4 * 3 + 3);
    size_t binLen = 0;
    char const* end = nullptr;
    if (sodium_base642bin(bin.data(), bin.size(), b64.data(), b64.size(),
                          nullptr, &binLen, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != b64.data() + b64.size())
    {
        return false;
    }
    bin.resize(binLen);
    out = std::move(bin);
    return true;
}
}
