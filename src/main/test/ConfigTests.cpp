// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SHA.h"
#include "main/Config.h"
#include "test/test.h"
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

using namespace soroban;

TEST_CASE("config defaults", "[config]")
{
    Config cfg;
    REQUIRE(cfg.NETWORK_PASSPHRASE == "Standalone Network ; February 2017");
    REQUIRE(cfg.LOG_LEVEL == LogLevel::LVL_INFO);
    REQUIRE(cfg.networkID() == sha256(cfg.NETWORK_PASSPHRASE));

    auto const& soroban = cfg.sorobanNetworkConfig();
    REQUIRE(soroban.maxAuthorizedInvocationNodes() == 0);
    REQUIRE(soroban.maxAuthorizedInvocationDepth() == 0);
    REQUIRE(soroban.txMaxInstructions() ==
            std::numeric_limits<uint32_t>::max());
    REQUIRE(soroban.feeExtendedMetaData1KB() == 0);
    REQUIRE(soroban.minRefundableFee(1000000) == 0);
}

TEST_CASE("config from json", "[config]")
{
    Json::Value root;
    root["NETWORK_PASSPHRASE"] = "Test SDF Network ; September 2015";
    root["LOG_LEVEL"] = "DEBUG";
    root["LOG_PARTITIONS"]["Auth"] = "trace";
    root["SOROBAN_LIMITS"]["MAX_AUTH_INVOCATION_DEPTH"] = 8;
    root["SOROBAN_LIMITS"]["TX_MAX_WRITE_LEDGER_ENTRIES"] = 20;
    root["SOROBAN_LIMITS"]["FEE_EXTENDED_META_DATA_1KB"] = 500;

    Config cfg;
    cfg.load(root);
    REQUIRE(cfg.NETWORK_PASSPHRASE == "Test SDF Network ; September 2015");
    REQUIRE(cfg.networkID() == getTestConfig().networkID());
    REQUIRE(cfg.LOG_LEVEL == LogLevel::LVL_DEBUG);
    REQUIRE(cfg.LOG_PARTITION_LEVELS.at("Auth") == LogLevel::LVL_TRACE);

    auto const& soroban = cfg.sorobanNetworkConfig();
    REQUIRE(soroban.maxAuthorizedInvocationDepth() == 8);
    REQUIRE(soroban.maxAuthorizedInvocationNodes() == 0);
    REQUIRE(soroban.txMaxWriteLedgerEntries() == 20);
    REQUIRE(soroban.feeExtendedMetaData1KB() == 500);

    SECTION("unknown key")
    {
        Json::Value bad;
        bad["NETWORK_PASSPHRASE_TYPO"] = "x";
        REQUIRE_THROWS_AS(cfg.load(bad), std::invalid_argument);
    }
    SECTION("unknown limit")
    {
        Json::Value bad;
        bad["SOROBAN_LIMITS"]["TX_MAX_CPU"] = 1;
        REQUIRE_THROWS_AS(cfg.load(bad), std::invalid_argument);
    }
    SECTION("wrong types")
    {
        Json::Value bad;
        SECTION("passphrase")
        {
            bad["NETWORK_PASSPHRASE"] = 7;
        }
        SECTION("empty passphrase")
        {
            bad["NETWORK_PASSPHRASE"] = "";
        }
        SECTION("negative limit")
        {
            bad["SOROBAN_LIMITS"]["TX_MAX_READ_BYTES"] = -1;
        }
        SECTION("negative fee")
        {
            bad["SOROBAN_LIMITS"]["FEE_EXTENDED_META_DATA_1KB"] = -5;
        }
        SECTION("string limit")
        {
            bad["SOROBAN_LIMITS"]["TX_MAX_INSTRUCTIONS"] = "100";
        }
        SECTION("log level")
        {
            bad["LOG_LEVEL"] = "loud";
        }
        SECTION("log partition")
        {
            bad["LOG_PARTITIONS"]["Ledger"] = "info";
        }
        REQUIRE_THROWS_AS(cfg.load(bad), std::invalid_argument);
    }
}

TEST_CASE("config from file", "[config]")
{
    auto path = std::filesystem::temp_directory_path() /
                "soroban-txbuild-config-test.json";

    SECTION("valid file")
    {
        {
            std::ofstream out(path);
            out << R"({
                "NETWORK_PASSPHRASE": "Public Global Stellar Network ; September 2015",
                "SOROBAN_LIMITS": { "MAX_AUTH_INVOCATION_NODES": 16 }
            })";
        }
        Config cfg;
        cfg.load(path.string());
        REQUIRE(cfg.networkID() ==
                sha256("Public Global Stellar Network ; September 2015"));
        REQUIRE(cfg.sorobanNetworkConfig().maxAuthorizedInvocationNodes() ==
                16);
    }
    SECTION("unparsable file")
    {
        {
            std::ofstream out(path);
            out << "{ \"LOG_LEVEL\": ";
        }
        Config cfg;
        REQUIRE_THROWS_AS(cfg.load(path.string()), std::runtime_error);
    }
    SECTION("missing file")
    {
        std::filesystem::remove(path);
        Config cfg;
        REQUIRE_THROWS_AS(cfg.load(path.string()), std::runtime_error);
    }
    std::filesystem::remove(path);
}

TEST_CASE("refundable fee for extended metadata", "[config][fee]")
{
    Json::Value limits;
    limits["FEE_EXTENDED_META_DATA_1KB"] = 1000;
    auto cfg = SorobanNetworkConfig::fromJson(limits);

    REQUIRE(cfg.minRefundableFee(0) == 0);
    REQUIRE(cfg.minRefundableFee(1) == 1);
    REQUIRE(cfg.minRefundableFee(1024) == 1000);
    REQUIRE(cfg.minRefundableFee(1025) == 1001);
    REQUIRE(cfg.minRefundableFee(2048) == 2000);
    REQUIRE(cfg.metaDataFeeFunction()(2048) == 2000);

    SECTION("large rates")
    {
        auto const maxFee = std::numeric_limits<int64_t>::max();
        limits["FEE_EXTENDED_META_DATA_1KB"] = Json::Int64(maxFee);
        cfg = SorobanNetworkConfig::fromJson(limits);
        REQUIRE(cfg.minRefundableFee(1024) == maxFee);
        REQUIRE(cfg.minRefundableFee(512) == maxFee / 2 + 1);
        REQUIRE(cfg.minRefundableFee(1025) == maxFee);
        REQUIRE(cfg.minRefundableFee(std::numeric_limits<uint32_t>::max()) ==
                maxFee);
    }
}
