// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

/*
Internal implementation details for EtwMetadata.h.
*/

#pragma once
#include <assert.h>
#include <stdlib.h>
#include <string.h>

namespace EtwMetaInternal
{
    /*
    Default constructor for Buffer<T>.
    Sets initial capacity to 0.
    */
    template<class T>
    constexpr
    Buffer<T>::Buffer() noexcept
        : m_pData(nullptr)
        , m_size(0)
        , m_capacity(0)
    {
        return;
    }

    template<class T>
    Buffer<T>::~Buffer() noexcept
    {
        free(m_pData);
    }

    template<class T>
    typename Buffer<T>::size_type
    Buffer<T>::size() const noexcept
    {
        return m_size;
    }

    template<class T>
    typename Buffer<T>::size_type
    Buffer<T>::capacity() const noexcept
    {
        return m_capacity;
    }

    template<class T>
    T const*
    Buffer<T>::data() const noexcept
    {
        return m_pData;
    }

    template<class T>
    T*
    Buffer<T>::data() noexcept
    {
        return m_pData;
    }

    template<class T>
    void
    Buffer<T>::clear() noexcept
    {
        m_size = 0;
    }

    template<class T>
    void
    Buffer<T>::resize_unchecked(size_type newSize) noexcept
    {
        assert(newSize <= m_capacity);
        m_size = newSize;
    }

    template<class T>
    bool
    Buffer<T>::reserve(
        size_type requiredCapacity,
        bool keepExistingData) noexcept
    {
        bool ok =
            requiredCapacity <= m_capacity ||
            Grow(requiredCapacity, keepExistingData);
        return ok;
    }

    template<class T>
    bool
    Buffer<T>::resize(
        size_type newSize,
        bool keepExistingData) noexcept
    {
        bool ok;

        if (newSize <= m_capacity ||
            Grow(newSize, keepExistingData))
        {
            m_size = newSize;
            ok = true;
        }
        else
        {
            ok = false;
        }

        return ok;
    }

    template<class T>
    bool
    Buffer<T>::Grow(
        size_type requiredCapacity,
        bool keepExistingData) noexcept
    {
        assert(m_capacity < requiredCapacity);
        assert(m_size <= m_capacity);

        bool ok;
        size_type newCapacity;
        T* pNewData;

        newCapacity = m_capacity != 0 ? m_capacity : 64;
        while (newCapacity < requiredCapacity)
        {
            if (newCapacity > MaxCapacity / 2u)
            {
                newCapacity = MaxCapacity;
                break;
            }

            newCapacity *= 2;
        }

        if (requiredCapacity > newCapacity)
        {
            ok = false;
            goto Done;
        }

        pNewData = static_cast<T*>(malloc(newCapacity * sizeof(T)));
        if (pNewData == nullptr)
        {
            ok = false;
            goto Done;
        }

        if (keepExistingData && m_size != 0)
        {
            memcpy(pNewData, m_pData, m_size * sizeof(T));
        }

        free(m_pData);
        m_pData = pNewData;
        m_capacity = newCapacity;
        ok = true;

    Done:

        return ok;
    }
}
// namespace EtwMetaInternal
