/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_LOG_HPP_
#define SEMVER_LOG_HPP_

#include "semver/common/config.hpp"
#include "semver/common/tools/enum.hpp"
#include "semver/common/tools/string.hpp"

/**
 * Creates log line for the module with specified level.
 */
#define LOG_MODULE_DBG(module) semver::Log(module, semver::LogLevelEnum::eDebug)
#define LOG_MODULE_INF(module) semver::Log(module, semver::LogLevelEnum::eInfo)
#define LOG_MODULE_WRN(module) semver::Log(module, semver::LogLevelEnum::eWarning)
#define LOG_MODULE_ERR(module) semver::Log(module, semver::LogLevelEnum::eError)

namespace semver {

/**
 * Max log line length.
 */
constexpr auto cLogLineLen = SEMVER_CONFIG_LOG_LINE_LEN;

/**
 * Log level types.
 */
class LogLevelType {
public:
    enum class Enum {
        eDebug,
        eInfo,
        eWarning,
        eError,
    };

    static const Array<const char* const> GetStrings()
    {
        static const char* const sLogLevelStrings[] = {"debug", "info", "warning", "error"};

        return Array<const char* const>(sLogLevelStrings, ArraySize(sLogLevelStrings));
    };
};

using LogLevelEnum = LogLevelType::Enum;
using LogLevel     = EnumStringer<LogLevelType>;

/**
 * Log line. Accumulates message and passes it to the log callback on destruction.
 */
class Log {
public:
    /**
     * Log callback.
     *
     * @param module log module name.
     * @param level log level.
     * @param message log message.
     */
    using Callback = void (*)(const char* module, LogLevel level, const String& message);

    /**
     * Creates log line.
     *
     * @param module log module name.
     * @param level log level.
     */
    Log(const char* module, LogLevel level)
        : mModule(module)
        , mLevel(level)
    {
    }

    Log(const Log&)            = delete;
    Log& operator=(const Log&) = delete;

    /**
     * Passes log line to the callback.
     */
    ~Log()
    {
        if (auto callback = GetCallback(); callback) {
            callback(mModule, mLevel, mMessage);
        }
    }

    /**
     * Sets log callback. Should be set before any log is issued from concurrent threads.
     *
     * @param callback log callback.
     */
    static void SetCallback(Callback callback) { GetCallback() = callback; }

    /**
     * Logs string.
     *
     * @param str string.
     * @return Log&.
     */
    Log& operator<<(const String& str)
    {
        mMessage += str;

        return *this;
    }

    /**
     * Logs C string.
     *
     * @param str C string.
     * @return Log&.
     */
    Log& operator<<(const char* str) { return *this << String(str); }

    /**
     * Logs integers.
     *
     * @param value integer value.
     * @return Log&.
     */
    Log& operator<<(int value) { return *this << static_cast<long long>(value); }
    Log& operator<<(long value) { return *this << static_cast<long long>(value); }
    Log& operator<<(unsigned value) { return *this << static_cast<unsigned long long>(value); }
    Log& operator<<(unsigned long value) { return *this << static_cast<unsigned long long>(value); }

    Log& operator<<(long long value)
    {
        if (value < 0) {
            mMessage += "-";

            return *this << (static_cast<unsigned long long>(-(value + 1)) + 1);
        }

        return *this << static_cast<unsigned long long>(value);
    }

    Log& operator<<(unsigned long long value)
    {
        StaticString<24> str;

        [[maybe_unused]] auto err = str.Convert(static_cast<uint64_t>(value));
        assert(err.IsNone());

        return *this << str;
    }

    /**
     * Logs error.
     *
     * @param err error.
     * @return Log&.
     */
    Log& operator<<(const Error& err)
    {
        StaticString<cMaxErrorStrLen> str;

        [[maybe_unused]] auto convertErr = str.Convert(err);
        assert(convertErr.IsNone());

        return *this << str;
    }

    /**
     * Logs enum value.
     *
     * @param value enum value.
     * @return Log&.
     */
    template <typename T>
    Log& operator<<(const EnumStringer<T>& value)
    {
        return *this << value.ToString();
    }

private:
    static Callback& GetCallback()
    {
        static Callback sCallback = nullptr;

        return sCallback;
    }

    const char*               mModule;
    LogLevel                  mLevel;
    StaticString<cLogLineLen> mMessage;
};

} // namespace semver

#endif
