/// @file StableVector.hpp
/// @brief Segmented append-only vector whose elements never change address.
#pragma once

#include <Arbor/Primitives.hpp>

#include <memory>
#include <new>
#include <utility>
#include <vector>

namespace Arbor::Memory
{
    /// @brief Append-only sequence stored in fixed-size segments.
    ///
    /// Growing never relocates existing elements, so references returned by
    /// PushBack and operator[] stay valid until the element is popped or the
    /// container is cleared. Segments are kept across Clear for reuse.
    template<typename T, UIntSize SegmentSize = 256>
    class StableVector
    {
        static_assert(SegmentSize > 0, "SegmentSize must be positive");

    public:
        StableVector() = default;

        StableVector(const StableVector&)            = delete;
        StableVector& operator=(const StableVector&) = delete;

        StableVector(StableVector&& other) noexcept
            : m_segments(std::move(other.m_segments)), m_size(other.m_size)
        {
            other.m_size = 0;
        }

        StableVector& operator=(StableVector&& other) noexcept
        {
            if (this != &other)
            {
                Clear();
                m_segments   = std::move(other.m_segments);
                m_size       = other.m_size;
                other.m_size = 0;
            }
            return *this;
        }

        ~StableVector()
        {
            Clear();
        }

        template<typename... Args>
        T& EmplaceBack(Args&&... args)
        {
            const UIntSize segment = m_size / SegmentSize;
            if (segment == m_segments.size())
                m_segments.push_back(std::make_unique<Storage[]>(SegmentSize));
            T* slot = ::new (static_cast<void*>(m_segments[segment][m_size % SegmentSize].bytes)) T(std::forward<Args>(args)...);
            ++m_size;
            return *slot;
        }

        T& PushBack(const T& value) { return EmplaceBack(value); }

        void PopBack() noexcept
        {
            --m_size;
            Pointer(m_size)->~T();
        }

        [[nodiscard]] T& operator[](UIntSize index) noexcept { return *Pointer(index); }
        [[nodiscard]] const T& operator[](UIntSize index) const noexcept { return *Pointer(index); }

        [[nodiscard]] UIntSize Size() const noexcept { return m_size; }
        [[nodiscard]] bool IsEmpty() const noexcept { return m_size == 0; }
        [[nodiscard]] UIntSize Capacity() const noexcept { return m_segments.size() * SegmentSize; }

        /// @brief Destroy all elements. Allocated segments are retained.
        void Clear() noexcept
        {
            while (m_size > 0)
                PopBack();
        }

        /// @brief Destroy all elements and release every segment.
        void Release() noexcept
        {
            Clear();
            m_segments.clear();
        }

    private:
        struct alignas(T) Storage
        {
            std::byte bytes[sizeof(T)];
        };

        [[nodiscard]] T* Pointer(UIntSize index) const noexcept
        {
            Storage& storage = m_segments[index / SegmentSize][index % SegmentSize];
            return std::launder(reinterpret_cast<T*>(storage.bytes));
        }

        std::vector<std::unique_ptr<Storage[]>> m_segments;
        UIntSize                                m_size {0};
    };
}// namespace Arbor::Memory
