// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "crypto/SHA.h"
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace soroban
{
namespace
{
std::string
readString(Json::Value const& v, std::string const& name)
{
    if (!v.isString())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("{} must be a string"), name));
    }
    return v.asString();
}
}

Config::Config()
    : NETWORK_PASSPHRASE("Standalone Network ; February 2017")
    , LOG_LEVEL(LogLevel::LVL_INFO)
{
}

void
Config::load(std::string const& filename)
{
    std::ifstream in(filename);
    if (!in)
    {
        throw std::runtime_error(
            fmt::format(FMT_STRING("cannot open config file '{}'"), filename));
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs))
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("cannot parse config file '{}': {}"), filename, errs));
    }
    load(root);
}

void
Config::load(Json::Value const& root)
{
    if (!root.isObject())
    {
        throw std::invalid_argument("config root must be an object");
    }

    for (auto const& name : root.getMemberNames())
    {
        auto const& v = root[name];
        if (name == "NETWORK_PASSPHRASE")
        {
            NETWORK_PASSPHRASE = readString(v, name);
            if (NETWORK_PASSPHRASE.empty())
            {
                throw std::invalid_argument(
                    "NETWORK_PASSPHRASE must not be empty");
            }
        }
        else if (name == "LOG_LEVEL")
        {
            LOG_LEVEL = Logging::getLLfromString(readString(v, name));
        }
        else if (name == "LOG_PARTITIONS")
        {
            if (!v.isObject())
            {
                throw std::invalid_argument("LOG_PARTITIONS must be an object");
            }
            for (auto const& partition : v.getMemberNames())
            {
                if (std::find(Logging::kPartitionNames.begin(),
                              Logging::kPartitionNames.end(),
                              partition) == Logging::kPartitionNames.end())
                {
                    throw std::invalid_argument(fmt::format(
                        FMT_STRING("unknown log partition '{}'"), partition));
                }
                LOG_PARTITION_LEVELS[partition] = Logging::getLLfromString(
                    readString(v[partition], "LOG_PARTITIONS." + partition));
            }
        }
        else if (name == "LOG_FILE_PATH")
        {
            LOG_FILE_PATH = readString(v, name);
        }
        else if (name == "SOROBAN_LIMITS")
        {
            mSorobanConfig = SorobanNetworkConfig::fromJson(v);
        }
        else
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("unknown config key '{}'"), name));
        }
    }
}

void
Config::applyLogging() const
{
    if (!LOG_FILE_PATH.empty())
    {
        Logging::setLoggingToFile(LOG_FILE_PATH);
    }
    Logging::setLogLevel(LOG_LEVEL, nullptr);
    for (auto const& kv : LOG_PARTITION_LEVELS)
    {
        Logging::setLogLevel(kv.second, kv.first.c_str());
    }
}

SorobanNetworkConfig const&
Config::sorobanNetworkConfig() const
{
    return mSorobanConfig;
}

Hash
Config::networkID() const
{
    return sha256(NETWORK_PASSPHRASE);
}
}
