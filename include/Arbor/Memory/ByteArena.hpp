/// @file ByteArena.hpp
/// @brief Growing bump-pointer arena built from a chain of fixed-size slabs.
#pragma once

#include <Arbor/Memory/AllocatorConcept.hpp>
#include <Arbor/Memory/SystemAllocator.hpp>
#include <Arbor/Primitives.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <new>
#include <utility>

namespace Arbor::Memory
{
    /// @brief Position inside a ByteArena that can be rolled back to.
    struct ByteArenaMarker
    {
        void*    slab {nullptr};
        void*    ptr {nullptr};
        UIntSize used {0};
    };

    /// @brief Bump allocator that never moves what it handed out.
    ///
    /// When the current slab is exhausted a new one is chained in front of it, so
    /// earlier allocations stay where they are. Requests larger than the slab size
    /// get a dedicated slab. Deallocate is a no-op; memory is released by Rollback,
    /// Reset or destruction. Not thread-safe.
    template<AllocatorConcept Upstream = SystemAllocator>
    class ByteArena
    {
    public:
        using UpstreamAllocator = Upstream;

        explicit ByteArena(UIntSize slabBytes, Upstream upstream = {})
            : m_upstream(std::move(upstream)), m_slabBytes(std::max<UIntSize>(slabBytes, 64))
        {
        }

        ByteArena(const ByteArena&)            = delete;
        ByteArena& operator=(const ByteArena&) = delete;

        ByteArena(ByteArena&& other) noexcept
            : m_upstream(std::move(other.m_upstream)), m_slabBytes(other.m_slabBytes), m_head(other.m_head),
              m_current(other.m_current), m_end(other.m_end), m_used(other.m_used), m_reserved(other.m_reserved)
        {
            other.m_head = nullptr;
            other.m_current = other.m_end = nullptr;
            other.m_used = other.m_reserved = 0;
        }

        ByteArena& operator=(ByteArena&& other) noexcept
        {
            if (this != &other)
            {
                ReleaseAll();
                m_upstream   = std::move(other.m_upstream);
                m_slabBytes  = other.m_slabBytes;
                m_head       = other.m_head;
                m_current    = other.m_current;
                m_end        = other.m_end;
                m_used       = other.m_used;
                m_reserved   = other.m_reserved;
                other.m_head = nullptr;
                other.m_current = other.m_end = nullptr;
                other.m_used = other.m_reserved = 0;
            }
            return *this;
        }

        ~ByteArena()
        {
            ReleaseAll();
        }

        /// @brief Returns nullptr for size 0 or when the upstream allocator fails.
        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            if (size == 0)
                return nullptr;
            if (alignment == 0)
                alignment = 1;

            if (void* p = BumpInCurrent(size, alignment))
                return p;

            if (!PushSlab(std::max(m_slabBytes, size + alignment)))
                return nullptr;
            return BumpInCurrent(size, alignment);
        }

        void Deallocate(void*, UIntSize, UIntSize) noexcept
        { /* no-op */
        }

        template<typename T>
        [[nodiscard]] T* AllocateArray(UIntSize count) noexcept
        {
            if (count == 0)
                return nullptr;
            return static_cast<T*>(Allocate(sizeof(T) * count, alignof(T)));
        }

        /// @brief Bytes handed out so far, excluding alignment padding.
        [[nodiscard]] UIntSize Used() const noexcept { return m_used; }
        /// @brief Bytes currently held from upstream, including slab headers.
        [[nodiscard]] UIntSize Reserved() const noexcept { return m_reserved; }
        [[nodiscard]] UIntSize SlabBytes() const noexcept { return m_slabBytes; }

        [[nodiscard]] UIntSize SlabCount() const noexcept
        {
            UIntSize count = 0;
            for (Slab* s = m_head; s; s = s->previous)
                ++count;
            return count;
        }

        [[nodiscard]] bool Owns(const void* p) const noexcept
        {
            auto addr = reinterpret_cast<const std::byte*>(p);
            for (Slab* s = m_head; s; s = s->previous)
            {
                if (addr >= s->Begin() && addr < s->Begin() + s->capacity)
                    return true;
            }
            return false;
        }

        [[nodiscard]] ByteArenaMarker Mark() const noexcept
        {
            return {m_head, m_current, m_used};
        }

        /// @brief Drop everything allocated after the marker. Slabs chained since are released.
        void Rollback(ByteArenaMarker marker) noexcept
        {
            while (m_head && m_head != marker.slab)
                PopSlab();
            if (!m_head)
            {
                m_current = m_end = nullptr;
                m_used            = 0;
                return;
            }
            m_current = static_cast<std::byte*>(marker.ptr);
            m_end     = m_head->Begin() + m_head->capacity;
            m_used    = marker.used;
        }

        /// @brief Forget all allocations. The oldest slab is kept for reuse.
        void Reset() noexcept
        {
            while (m_head && m_head->previous)
                PopSlab();
            if (m_head)
            {
                m_current = m_head->Begin();
                m_end     = m_head->Begin() + m_head->capacity;
            }
            m_used = 0;
        }

    private:
        struct alignas(std::max_align_t) Slab
        {
            Slab*    previous {nullptr};
            UIntSize capacity {0};

            [[nodiscard]] std::byte* Begin() noexcept { return reinterpret_cast<std::byte*>(this + 1); }
        };

        [[nodiscard]] void* BumpInCurrent(UIntSize size, UIntSize alignment) noexcept
        {
            if (!m_current)
                return nullptr;
            const auto currentAddr = reinterpret_cast<std::uintptr_t>(m_current);
            const auto aligned     = (currentAddr + (alignment - 1)) & ~(static_cast<std::uintptr_t>(alignment) - 1);
            const auto padding     = static_cast<UIntSize>(aligned - currentAddr);
            const auto remaining   = static_cast<UIntSize>(m_end - m_current);
            if (padding > remaining || size > remaining - padding)
                return nullptr;
            std::byte* userPtr = reinterpret_cast<std::byte*>(aligned);
            m_current          = userPtr + size;
            m_used += size;
            return userPtr;
        }

        bool PushSlab(UIntSize capacity) noexcept
        {
            void* memory = m_upstream.Allocate(sizeof(Slab) + capacity, alignof(Slab));
            if (!memory)
                return false;
            Slab* slab     = ::new (memory) Slab {m_head, capacity};
            m_head         = slab;
            m_current      = slab->Begin();
            m_end          = slab->Begin() + capacity;
            m_reserved += sizeof(Slab) + capacity;
            return true;
        }

        void PopSlab() noexcept
        {
            Slab* slab = m_head;
            m_head     = slab->previous;
            m_reserved -= sizeof(Slab) + slab->capacity;
            m_upstream.Deallocate(slab, sizeof(Slab) + slab->capacity, alignof(Slab));
        }

        void ReleaseAll() noexcept
        {
            while (m_head)
                PopSlab();
            m_current = m_end = nullptr;
            m_used = m_reserved = 0;
        }

        [[no_unique_address]] Upstream m_upstream {};
        UIntSize   m_slabBytes {0};
        Slab*      m_head {nullptr};
        std::byte* m_current {nullptr};
        std::byte* m_end {nullptr};
        UIntSize   m_used {0};
        UIntSize   m_reserved {0};
    };
}// namespace Arbor::Memory
