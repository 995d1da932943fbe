#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/NetworkConfig.h"
#include "util/Logging.h"
#include "xdr/Stellar-types.h"
#include <json/json.h>
#include <map>
#include <string>

namespace soroban
{

class Config
{
    SorobanNetworkConfig mSorobanConfig;

  public:
    Config();

    // Load from a JSON file / an already parsed document. Throws
    // std::invalid_argument on unknown keys or wrong types and
    // std::runtime_error if the file cannot be read or parsed.
    void load(std::string const& filename);
    void load(Json::Value const& root);

    // Sets global and per-partition log levels and the log file, if any.
    void applyLogging() const;

    SorobanNetworkConfig const& sorobanNetworkConfig() const;

    // SHA256 of NETWORK_PASSPHRASE; mixed into every contract ID and
    // authorization payload.
    Hash networkID() const;

    std::string NETWORK_PASSPHRASE;
    LogLevel LOG_LEVEL;
    std::map<std::string, LogLevel> LOG_PARTITION_LEVELS;
    std::string LOG_FILE_PATH;
};
}
