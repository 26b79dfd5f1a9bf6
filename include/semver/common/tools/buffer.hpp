/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_BUFFER_HPP_
#define SEMVER_BUFFER_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace semver {

/**
 * Buffer instance. Doesn't own the memory it points to.
 */
class Buffer {
public:
    /**
     * Creates empty buffer.
     */
    Buffer() = default;

    /**
     * Creates buffer over memory region.
     *
     * @param buffer memory region.
     * @param size memory region size.
     */
    Buffer(void* buffer, size_t size)
        : mBuffer(buffer)
        , mSize(size)
    {
    }

    /**
     * Returns pointer to buffer memory.
     *
     * @return void*.
     */
    void* Get() const { return mBuffer; }

    /**
     * Returns buffer size.
     *
     * @return size_t.
     */
    size_t Size() const { return mSize; }

protected:
    void SetBuffer(void* buffer, size_t size)
    {
        mBuffer = buffer;
        mSize   = size;
    }

private:
    void*  mBuffer = nullptr;
    size_t mSize   = 0;
};

/**
 * Static buffer instance.
 *
 * @tparam cSize buffer size.
 */
template <size_t cSize>
class StaticBuffer : public Buffer {
public:
    /**
     * Creates static buffer.
     */
    StaticBuffer() { Buffer::SetBuffer(mBuffer, cSize); }

    /**
     * Creates static buffer from another buffer.
     *
     * @param buffer buffer to copy from.
     */
    StaticBuffer(const StaticBuffer& buffer)
        : Buffer()
    {
        Buffer::SetBuffer(mBuffer, cSize);
        memcpy(mBuffer, buffer.Get(), cSize);
    }

    /**
     * Copies content of another buffer.
     *
     * @param buffer buffer to copy from.
     * @return StaticBuffer&.
     */
    StaticBuffer& operator=(const StaticBuffer& buffer)
    {
        if (this != &buffer) {
            memcpy(mBuffer, buffer.Get(), cSize);
        }

        return *this;
    }

private:
    alignas(std::max_align_t) uint8_t mBuffer[cSize];
};

} // namespace semver

#endif
