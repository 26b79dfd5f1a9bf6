/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_STRING_HPP_
#define SEMVER_STRING_HPP_

#include <cstdint>
#include <cstring>

#include "semver/common/tools/array.hpp"

namespace semver {

/**
 * Max length of error converted to string.
 */
constexpr auto cMaxErrorStrLen = 255;

/**
 * String instance.
 */
class String : public Array<char> {
public:
    /**
     * Creates empty string instance.
     */
    String() = default;

    // cppcheck-suppress noExplicitConstructor
    /**
     * Creates string instance over C string.
     *
     * @param str C string.
     */
    String(const char* str)
        : Array(str, strlen(str))
    {
    }

    /**
     * Creates string instance over C string with specified size.
     *
     * @param str C string.
     * @param size string size.
     */
    String(const char* str, size_t size)
        : Array(str, size)
    {
    }

    /**
     * Creates string instance from another string. Both instances point to the same memory.
     *
     * @param str another string.
     */
    String(const String& str) = default;

    /**
     * Assigns string content.
     *
     * @param str string to assign.
     * @return String&.
     */
    String& operator=(const String& str)
    {
        [[maybe_unused]] auto err = Assign(str);
        assert(err.IsNone());

        return *this;
    }

    /**
     * Assigns string content.
     *
     * @param str string to assign.
     * @return Error.
     */
    Error Assign(const String& str)
    {
        if (this == &str) {
            return ErrorEnum::eNone;
        }

        if (str.Size() > MaxSize()) {
            return ErrorEnum::eNoMemory;
        }

        if (!str.IsEmpty()) {
            memmove(Get(), str.Get(), str.Size());
        }

        SetSize(str.Size());
        Terminate();

        return ErrorEnum::eNone;
    }

    /**
     * Returns C string representation.
     *
     * @return const char*.
     */
    const char* CStr() const { return Get() ? Get() : ""; }

    /**
     * Clears string.
     */
    void Clear()
    {
        Array::Clear();
        Terminate();
    }

    /**
     * Resizes string.
     *
     * @param size new size.
     * @return Error.
     */
    Error Resize(size_t size)
    {
        if (auto err = Array::Resize(size); !err.IsNone()) {
            return err;
        }

        Terminate();

        return ErrorEnum::eNone;
    }

    /**
     * Appends string.
     *
     * @param str string to append.
     * @return Error.
     */
    Error Append(const String& str)
    {
        if (str.IsEmpty()) {
            return ErrorEnum::eNone;
        }

        if (auto err = Insert(end(), str.begin(), str.end()); !err.IsNone()) {
            return err;
        }

        Terminate();

        return ErrorEnum::eNone;
    }

    /**
     * Appends string operator. Result is truncated if there is not enough room.
     *
     * @param str string to append.
     * @return String&.
     */
    String& operator+=(const String& str)
    {
        auto size = semver::Min(str.Size(), MaxSize() - Size());

        [[maybe_unused]] auto err = Append(String(str.CStr(), size));
        assert(err.IsNone());

        return *this;
    }

    /**
     * Appends char.
     *
     * @param ch char to append.
     * @return Error.
     */
    Error Append(char ch)
    {
        if (auto err = PushBack(ch); !err.IsNone()) {
            return err;
        }

        Terminate();

        return ErrorEnum::eNone;
    }

    /**
     * Assigns substring of another string.
     *
     * @param str source string.
     * @param pos substring start position.
     * @param size substring size.
     * @return Error.
     */
    Error AssignSubstr(const String& str, size_t pos, size_t size)
    {
        if (pos > str.Size() || size > str.Size() - pos) {
            return ErrorEnum::eOutOfRange;
        }

        return Assign(String(str.CStr() + pos, size));
    }

    /**
     * Finds first occurrence of char starting from position.
     *
     * @param start start position.
     * @param ch char to find.
     * @return RetWithError<size_t> position or Size() with eNotFound error.
     */
    RetWithError<size_t> FindChar(size_t start, char ch) const
    {
        for (auto i = start; i < Size(); i++) {
            if ((*this)[i] == ch) {
                return i;
            }
        }

        return {Size(), ErrorEnum::eNotFound};
    }

    /**
     * Converts decimal string to uint64_t.
     *
     * @return RetWithError<uint64_t>.
     */
    RetWithError<uint64_t> ToUint64() const
    {
        if (IsEmpty()) {
            return {0, ErrorEnum::eInvalidArgument};
        }

        uint64_t value = 0;

        for (const auto ch : *this) {
            if (ch < '0' || ch > '9') {
                return {0, ErrorEnum::eInvalidArgument};
            }

            uint64_t digit = ch - '0';

            if (value > (UINT64_MAX - digit) / 10) {
                return {0, ErrorEnum::eOutOfRange};
            }

            value = value * 10 + digit;
        }

        return value;
    }

    /**
     * Converts uint64_t value to decimal string.
     *
     * @param value value to convert.
     * @return Error.
     */
    Error Convert(uint64_t value)
    {
        char digits[24];
        auto pos = sizeof(digits);

        do {
            digits[--pos] = '0' + static_cast<char>(value % 10);
            value /= 10;
        } while (value != 0);

        return Assign(String(&digits[pos], sizeof(digits) - pos));
    }

    /**
     * Converts error to string.
     *
     * @param err error to convert.
     * @return Error.
     */
    Error Convert(const Error& err)
    {
        Clear();

        *this += err.Message();

        if (err.FileName()) {
            char lineStr[16];
            auto pos        = sizeof(lineStr);
            auto lineNumber = err.LineNumber() < 0 ? 0 : err.LineNumber();

            do {
                lineStr[--pos] = '0' + static_cast<char>(lineNumber % 10);
                lineNumber /= 10;
            } while (lineNumber != 0);

            *this += " (";
            *this += err.FileName();
            *this += ":";
            *this += String(&lineStr[pos], sizeof(lineStr) - pos);
            *this += ")";
        }

        return ErrorEnum::eNone;
    }

    /**
     * Compares string with another one.
     *
     * @param str string to compare with.
     * @return int negative, zero or positive value.
     */
    int CompareTo(const String& str) const
    {
        auto size = semver::Min(Size(), str.Size());

        if (size != 0) {
            if (auto result = memcmp(CStr(), str.CStr(), size); result != 0) {
                return result < 0 ? -1 : 1;
            }
        }

        if (Size() < str.Size()) {
            return -1;
        }

        if (Size() > str.Size()) {
            return 1;
        }

        return 0;
    }

    /**
     * Comparison operators.
     */
    bool operator==(const String& str) const { return CompareTo(str) == 0; }
    bool operator!=(const String& str) const { return !operator==(str); }
    bool operator==(const char* cStr) const { return CompareTo(String(cStr)) == 0; }
    bool operator!=(const char* cStr) const { return !operator==(cStr); }
    bool operator<(const String& str) const { return CompareTo(str) < 0; }
    bool operator>(const String& str) const { return CompareTo(str) > 0; }

    friend bool operator==(const char* cStr, const String& str) { return str == cStr; }
    friend bool operator!=(const char* cStr, const String& str) { return str != cStr; }

protected:
    void SetBuffer(const Buffer& buffer, size_t maxSize)
    {
        Array::SetBuffer(buffer, maxSize);
        Terminate();
    }

private:
    void Terminate()
    {
        if (Get()) {
            Get()[Size()] = '\0';
        }
    }
};

/**
 * Static string instance.
 *
 * @tparam cMaxSize max static string size.
 */
template <size_t cMaxSize>
class StaticString : public String {
public:
    /**
     * Creates static string.
     */
    StaticString() { SetBuffer(mBuffer, cMaxSize); }

    /**
     * Creates static string from another static string.
     *
     * @param str string to create from.
     */
    StaticString(const StaticString& str)
        : String()
    {
        SetBuffer(mBuffer, cMaxSize);

        [[maybe_unused]] auto err = Assign(str);
        assert(err.IsNone());
    }

    // cppcheck-suppress noExplicitConstructor
    /**
     * Creates static string from another string.
     *
     * @param str string to create from.
     */
    StaticString(const String& str)
    {
        SetBuffer(mBuffer, cMaxSize);

        [[maybe_unused]] auto err = Assign(str);
        assert(err.IsNone());
    }

    // cppcheck-suppress noExplicitConstructor
    /**
     * Creates static string from C string.
     *
     * @param str C string.
     */
    StaticString(const char* str)
        : StaticString(String(str))
    {
    }

    /**
     * Assigns static string from another static string.
     *
     * @param str string to assign from.
     */
    StaticString& operator=(const StaticString& str)
    {
        String::operator=(str);

        return *this;
    }

    /**
     * Assigns static string from another string.
     *
     * @param str string to assign from.
     */
    StaticString& operator=(const String& str)
    {
        String::operator=(str);

        return *this;
    }

    /**
     * Assigns static string from C string.
     *
     * @param str C string.
     */
    StaticString& operator=(const char* str)
    {
        String::operator=(String(str));

        return *this;
    }

private:
    StaticBuffer<cMaxSize + 1> mBuffer;
};

} // namespace semver

#endif
