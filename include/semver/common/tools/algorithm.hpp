/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef SEMVER_ALGORITHM_HPP_
#define SEMVER_ALGORITHM_HPP_

#include <assert.h>

#include "semver/common/tools/error.hpp"

namespace semver {

/**
 * Default less than comparator, utilizing "<" operator.
 */
template <typename T>
struct LessThanComparator {
    bool operator()(const T& val1, const T& val2) const { return val1 < val2; }
};

/**
 * Algorithm interface.
 * @tparam T value type.
 * @tparam I iterator type.
 * @tparam CI const iterator type.
 */
template <typename T, typename I, typename CI>
class AlgorithmItf {
public:
    /**
     * Returns current container size.
     *
     * @return size_t.
     */
    virtual size_t Size() const = 0;

    /**
     * Returns maximum available container size.
     *
     * @return size_t.
     */
    virtual size_t MaxSize() const = 0;

    // Used for range based loop.
    virtual I  begin(void)       = 0;
    virtual I  end(void)         = 0;
    virtual CI begin(void) const = 0;
    virtual CI end(void) const   = 0;

    /**
     * Checks if container is empty.
     *
     * @return bool.
     */
    bool IsEmpty() const { return Size() == 0; }

    /**
     * Checks if container is full.
     *
     * @return bool.
     */
    bool IsFull() const { return Size() == MaxSize(); }

    /**
     * Returns container first const item.
     *
     * @return const T&.
     */
    const T& Front() const
    {
        assert(!IsEmpty());

        return *begin();
    }

    /**
     * Returns container last const item.
     *
     * @return const T&.
     */
    const T& Back() const
    {
        assert(!IsEmpty());

        auto it = end();

        return *(--it);
    }

    /**
     * Finds const element in container.
     *
     * @param value value to find.
     * @return CI.
     */
    CI Find(const T& value) const
    {
        for (auto it = begin(); it != end(); ++it) {
            if (*it == value) {
                return it;
            }
        }

        return end();
    }

    /**
     * Finds const element in container that match argument.
     *
     * @param match match function.
     * @return CI.
     */
    template <typename P>
    CI FindIf(P match) const
    {
        for (auto it = begin(); it != end(); ++it) {
            if (match(*it)) {
                return it;
            }
        }

        return end();
    }

    /**
     * Finds minimal element using provided comparator. The first one is returned if there are several equal minimal
     * elements.
     *
     * @param cmp less comparator.
     * @return CI.
     */
    template <typename Cmp = LessThanComparator<T>>
    CI Min(Cmp cmp = Cmp()) const
    {
        if (IsEmpty()) {
            return end();
        }

        auto min = begin();
        for (auto it = begin() + 1; it != end(); ++it) {
            if (cmp(*it, *min)) {
                min = it;
            }
        }

        return min;
    }

    /*
     * Sorts container items using sort function. Sorting is stable: items that are not less than each other keep
     * their relative order.
     *
     * @tparam Cmp comparator type.
     * @param cmp comparator.
     * @param tmpValue tmp value used for temporary storage.
     */
    template <typename Cmp = LessThanComparator<T>>
    void Sort(Cmp cmp, T& tmpValue)
    {
        if (IsEmpty()) {
            return;
        }

        for (auto it1 = begin() + 1; it1 != end(); it1++) {
            tmpValue = *it1;

            auto it2 = it1;

            for (; it2 != begin() && cmp(tmpValue, *(it2 - 1)); it2--) {
                *it2 = *(it2 - 1);
            }

            *it2 = tmpValue;
        }
    }

    /*
     * Sorts container items using sort function.
     *
     * @tparam Cmp comparator type.
     * @param cmp comparator.
     */
    template <typename Cmp = LessThanComparator<T>>
    void Sort(Cmp cmp = Cmp())
    {
        T tmpValue {};

        Sort(cmp, tmpValue);
    }

    /**
     * Sorts container items using default comparision operator with temporary storage.
     *
     * @param tmpValue temporary storage.
     */
    void Sort(T& tmpValue) { Sort(LessThanComparator<T>(), tmpValue); }
};

} // namespace semver

#endif
