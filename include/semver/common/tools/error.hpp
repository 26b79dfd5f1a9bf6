/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_ERROR_HPP_
#define SEMVER_ERROR_HPP_

#include <cstddef>

namespace semver {

/**
 * Error codes.
 */
class ErrorType {
public:
    enum class Enum {
        eNone,
        eFailed,
        eRuntime,
        eNoMemory,
        eOutOfRange,
        eNotFound,
        eInvalidArgument,
        eNumErrors,
    };

    /**
     * Returns error code text.
     *
     * @param err error code.
     * @return const char*.
     */
    static const char* ToString(Enum err)
    {
        static const char* const sErrorStrings[] = {
            "none",
            "failed",
            "runtime error",
            "not enough memory",
            "out of range",
            "not found",
            "invalid argument",
        };

        auto index = static_cast<size_t>(err);

        if (index >= sizeof(sErrorStrings) / sizeof(sErrorStrings[0])) {
            return "unknown";
        }

        return sErrorStrings[index];
    }
};

using ErrorEnum = ErrorType::Enum;

/**
 * Error instance.
 */
class Error {
public:
    // cppcheck-suppress noExplicitConstructor
    /**
     * Creates error instance.
     *
     * @param err error code.
     * @param message optional static error message.
     */
    Error(ErrorEnum err = ErrorEnum::eNone, const char* message = nullptr)
        : mErr(err)
        , mMessage(message)
    {
    }

    /**
     * Creates error instance from another error with new message.
     *
     * @param err source error.
     * @param message static error message.
     */
    Error(const Error& err, const char* message)
        : mErr(err.mErr)
        , mFileName(err.mFileName)
        , mLineNumber(err.mLineNumber)
        , mMessage(message)
    {
    }

    /**
     * Creates error instance from another error with location info.
     *
     * @param err source error.
     * @param fileName file name.
     * @param lineNumber line number.
     */
    Error(const Error& err, const char* fileName, int lineNumber)
        : mErr(err.mErr)
        , mFileName(fileName)
        , mLineNumber(lineNumber)
        , mMessage(err.mMessage)
    {
    }

    /**
     * Copy constructor.
     */
    Error(const Error& err) = default;

    /**
     * Assignment operator.
     */
    Error& operator=(const Error& err) = default;

    /**
     * Returns error code.
     *
     * @return ErrorEnum.
     */
    ErrorEnum Value() const { return mErr; }

    /**
     * Checks if error is none.
     *
     * @return bool.
     */
    bool IsNone() const { return mErr == ErrorEnum::eNone; }

    /**
     * Checks if error has specified code.
     *
     * @param err error code.
     * @return bool.
     */
    bool Is(ErrorEnum err) const { return mErr == err; }

    /**
     * Checks if error has the same code as another error.
     *
     * @param err error to check.
     * @return bool.
     */
    bool Is(const Error& err) const { return mErr == err.mErr; }

    /**
     * Returns error message or error code text if message is not set.
     *
     * @return const char*.
     */
    const char* Message() const { return mMessage ? mMessage : ErrorType::ToString(mErr); }

    /**
     * Returns file name where the error is wrapped.
     *
     * @return const char*.
     */
    const char* FileName() const { return mFileName; }

    /**
     * Returns line number where the error is wrapped.
     *
     * @return int.
     */
    int LineNumber() const { return mLineNumber; }

    /**
     * Compares errors by code.
     */
    bool operator==(const Error& err) const { return mErr == err.mErr; }
    bool operator!=(const Error& err) const { return !operator==(err); }
    bool operator==(ErrorEnum err) const { return mErr == err; }
    bool operator!=(ErrorEnum err) const { return !operator==(err); }

private:
    ErrorEnum   mErr        = ErrorEnum::eNone;
    const char* mFileName   = nullptr;
    int         mLineNumber = 0;
    const char* mMessage    = nullptr;
};

/**
 * Value with error.
 *
 * @tparam T value type.
 * @tparam E error type.
 */
template <typename T, typename E = Error>
struct RetWithError {
    // cppcheck-suppress noExplicitConstructor
    /**
     * Creates return value with error.
     *
     * @param value return value.
     * @param error error.
     */
    RetWithError(T value, const E& error = ErrorEnum::eNone)
        : mValue(value)
        , mError(error)
    {
    }

    /**
     * Compares return values.
     */
    bool operator==(const RetWithError& ret) const { return mValue == ret.mValue && mError == ret.mError; }
    bool operator!=(const RetWithError& ret) const { return !operator==(ret); }

    T mValue;
    E mError;
};

/**
 * Assigns RetWithError to separate value and error variables.
 *
 * @tparam T value type.
 * @tparam E error type.
 */
template <typename T, typename E = Error>
class TieHelper {
public:
    TieHelper(T& value, E& error)
        : mValue(value)
        , mError(error)
    {
    }

    template <typename V>
    void operator=(const RetWithError<V, E>& ret)
    {
        mValue = ret.mValue;
        mError = ret.mError;
    }

private:
    T& mValue;
    E& mError;
};

/**
 * Ties value and error variables.
 *
 * @param value value variable.
 * @param error error variable.
 * @return TieHelper<T, E>.
 */
template <typename T, typename E>
TieHelper<T, E> Tie(T& value, E& error)
{
    return TieHelper<T, E>(value, error);
}

} // namespace semver

/**
 * Wraps error with file name and line number.
 */
#define SEMVER_ERROR_WRAP(err) semver::Error(err, __FILE__, __LINE__)

#endif
