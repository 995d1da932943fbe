// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/Hex.h"
#include "crypto/SecretKey.h"
#include <algorithm>
#include <sodium.h>
#include <stdexcept>

namespace soroban
{

std::string
binToHex(ByteSlice const& bin)
{
    // NB: sodium_bin2hex needs room for trailing NUL byte.
    std::vector<char> hex(bin.size() * 2 + 1, '\0');
    if (sodium_bin2hex(hex.data(), hex.size(), bin.data(), bin.size()) !=
        hex.data())
    {
        throw std::runtime_error(
            "error in soroban::binToHex(std::vector<uint8_t>)");
    }
    return std::string(hex.begin(), hex.end() - 1);
}

std::string
hexAbbrev(ByteSlice const& bin)
{
    size_t sz = bin.size();
    if (sz > 3)
    {
        sz = 3;
    }
    return binToHex(ByteSlice(bin.data(), sz));
}

std::vector<uint8_t>
hexToBin(std::string const& hex)
{
    PubKeyUtils::ensureSodiumInitialized();
    std::vector<uint8_t> bin(hex.size() / 2, 0);
    size_t binLen = 0;
    char const* end = nullptr;
    if (sodium_hex2bin(bin.data(), bin.size(), hex.data(), hex.size(),
                       nullptr, &binLen, &end) != 0 ||
        end != hex.data() + hex.size())
    {
        throw std::invalid_argument("bad hex string");
    }
    bin.resize(binLen);
    return bin;
}

uint256
hexToBin256(std::string const& hex)
{
    uint256 out;
    auto bin = hexToBin(hex);
    if (bin.size() != out.size())
    {
        throw std::invalid_argument("wrong number of hex bytes when decoding "
                                    "uint256");
    }
    std::copy(bin.begin(), bin.end(), out.begin());
    return out;
}
}
