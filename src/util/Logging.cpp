// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Logging.h"
#include <algorithm>
#include <cctype>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace soroban
{

std::array<std::string const, 3> const Logging::kPartitionNames = {
#define LOG_PARTITION(name) #name,
#include "util/LogPartitions.def"
#undef LOG_PARTITION
};

std::recursive_mutex Logging::mLogMutex;
LogLevel Logging::mGlobalLogLevel = LogLevel::LVL_INFO;
std::map<std::string, LogLevel> Logging::mPartitionLogLevels;
std::shared_ptr<spdlog::sinks::sink> Logging::mSink;

#define LOG_PARTITION(name) \
    LogPtr Logging::name##LogPtr = nullptr; \
    LogPtr Logging::get##name##LogPtr() \
    { \
        std::lock_guard<std::recursive_mutex> guard(mLogMutex); \
        if (!name##LogPtr) \
        { \
            name##LogPtr = makeLogger(#name); \
        } \
        return name##LogPtr; \
    }
#include "util/LogPartitions.def"
#undef LOG_PARTITION

LogPtr
Logging::makeLogger(std::string const& name)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (!mSink)
    {
        init();
    }
    auto logger = std::make_shared<spdlog::logger>(name, mSink);
    logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e [%n %l] %v");
    logger->set_level(convertLogLevel(getLogLevel(name)));
    return logger;
}

void
Logging::init()
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (!mSink)
    {
        mSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
}

void
Logging::deinit()
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
#define LOG_PARTITION(name) name##LogPtr = nullptr;
#include "util/LogPartitions.def"
#undef LOG_PARTITION
    mSink.reset();
}

void
Logging::setLoggingToFile(std::string const& filename)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename);
    // Loggers capture the sink at creation; rebuild them on next use.
#define LOG_PARTITION(name) name##LogPtr = nullptr;
#include "util/LogPartitions.def"
#undef LOG_PARTITION
}

void
Logging::setLogLevel(LogLevel level, char const* partition)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (partition)
    {
        auto it = std::find(kPartitionNames.begin(), kPartitionNames.end(),
                            std::string(partition));
        if (it == kPartitionNames.end())
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("unknown log partition '{}'"),
                            partition));
        }
        mPartitionLogLevels[partition] = level;
    }
    else
    {
        mGlobalLogLevel = level;
        mPartitionLogLevels.clear();
    }

    auto lvl = convertLogLevel(level);
#define LOG_PARTITION(name) \
    if ((!partition || std::string(partition) == #name) && name##LogPtr) \
    { \
        name##LogPtr->set_level(lvl); \
    }
#include "util/LogPartitions.def"
#undef LOG_PARTITION
}

LogLevel
Logging::getLLfromString(std::string const& levelName)
{
    std::string lower(levelName);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "fatal")
    {
        return LogLevel::LVL_FATAL;
    }
    if (lower == "error")
    {
        return LogLevel::LVL_ERROR;
    }
    if (lower == "warning")
    {
        return LogLevel::LVL_WARNING;
    }
    if (lower == "debug")
    {
        return LogLevel::LVL_DEBUG;
    }
    if (lower == "trace")
    {
        return LogLevel::LVL_TRACE;
    }
    if (lower == "info")
    {
        return LogLevel::LVL_INFO;
    }
    throw std::invalid_argument(
        fmt::format(FMT_STRING("unknown log level '{}'"), levelName));
}

LogLevel
Logging::getLogLevel(std::string const& partition)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    auto it = mPartitionLogLevels.find(partition);
    if (it != mPartitionLogLevels.end())
    {
        return it->second;
    }
    return mGlobalLogLevel;
}

std::string
Logging::getStringFromLL(LogLevel level)
{
    switch (level)
    {
    case LogLevel::LVL_FATAL:
        return "Fatal";
    case LogLevel::LVL_ERROR:
        return "Error";
    case LogLevel::LVL_WARNING:
        return "Warning";
    case LogLevel::LVL_INFO:
        return "Info";
    case LogLevel::LVL_DEBUG:
        return "Debug";
    case LogLevel::LVL_TRACE:
        return "Trace";
    }
    return "????";
}

spdlog::level::level_enum
Logging::convertLogLevel(LogLevel level)
{
    switch (level)
    {
    case LogLevel::LVL_FATAL:
        return spdlog::level::critical;
    case LogLevel::LVL_ERROR:
        return spdlog::level::err;
    case LogLevel::LVL_WARNING:
        return spdlog::level::warn;
    case LogLevel::LVL_INFO:
        return spdlog::level::info;
    case LogLevel::LVL_DEBUG:
        return spdlog::level::debug;
    case LogLevel::LVL_TRACE:
        return spdlog::level::trace;
    }
    return spdlog::level::info;
}

bool
Logging::logDebug(std::string const& partition)
{
    auto lvl = getLogLevel(partition);
    return lvl == LogLevel::LVL_DEBUG || lvl == LogLevel::LVL_TRACE;
}

bool
Logging::logTrace(std::string const& partition)
{
    return getLogLevel(partition) == LogLevel::LVL_TRACE;
}
}
