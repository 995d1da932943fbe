#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <array>
#include <fmt/format.h>
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>

namespace soroban
{

enum class LogLevel
{
    LVL_FATAL = 0,
    LVL_ERROR = 1,
    LVL_WARNING = 2,
    LVL_INFO = 3,
    LVL_DEBUG = 4,
    LVL_TRACE = 5
};

using LogPtr = std::shared_ptr<spdlog::logger>;

class Logging
{
    static std::recursive_mutex mLogMutex;
    static LogLevel mGlobalLogLevel;
    static std::map<std::string, LogLevel> mPartitionLogLevels;
    static std::shared_ptr<spdlog::sinks::sink> mSink;

    static LogPtr makeLogger(std::string const& name);

  public:
    static void init();
    static void deinit();
    static void setLoggingToFile(std::string const& filename);
    static void setLogLevel(LogLevel level, char const* partition);
    static LogLevel getLLfromString(std::string const& levelName);
    static LogLevel getLogLevel(std::string const& partition);
    static std::string getStringFromLL(LogLevel level);
    static spdlog::level::level_enum convertLogLevel(LogLevel level);
    static bool logDebug(std::string const& partition);
    static bool logTrace(std::string const& partition);

    static std::array<std::string const, 3> const kPartitionNames;

#define LOG_PARTITION(name) \
    static LogPtr name##LogPtr; \
    static LogPtr get##name##LogPtr();
#include "util/LogPartitions.def"
#undef LOG_PARTITION
};
}

#define GET_LOG(name) soroban::Logging::get##name##LogPtr()

#define LOG_CHECK(partition, level, action) \
    do \
    { \
        auto _lg = GET_LOG(partition); \
        if (_lg && _lg->should_log(level)) \
        { \
            action; \
        } \
    } while (false)

#define CLOG_TRACE(partition, f, ...) \
    LOG_CHECK(partition, spdlog::level::trace, \
              _lg->trace(fmt::format(FMT_STRING(f), ##__VA_ARGS__)))
#define CLOG_DEBUG(partition, f, ...) \
    LOG_CHECK(partition, spdlog::level::debug, \
              _lg->debug(fmt::format(FMT_STRING(f), ##__VA_ARGS__)))
#define CLOG_INFO(partition, f, ...) \
    LOG_CHECK(partition, spdlog::level::info, \
              _lg->info(fmt::format(FMT_STRING(f), ##__VA_ARGS__)))
#define CLOG_WARNING(partition, f, ...) \
    LOG_CHECK(partition, spdlog::level::warn, \
              _lg->warn(fmt::format(FMT_STRING(f), ##__VA_ARGS__)))
#define CLOG_ERROR(partition, f, ...) \
    LOG_CHECK(partition, spdlog::level::err, \
              _lg->error(fmt::format(FMT_STRING(f), ##__VA_ARGS__)))
#define CLOG_FATAL(partition, f, ...) \
    LOG_CHECK(partition, spdlog::level::critical, \
              _lg->critical(fmt::format(FMT_STRING(f), ##__VA_ARGS__)))
