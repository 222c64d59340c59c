/// @file SystemAllocator.hpp
/// @brief Default slab source: the global aligned operator new.
#pragma once

#include <Arbor/Primitives.hpp>

#include <new>

namespace Arbor::Memory
{
    /// @brief Stateless allocator over `::operator new`. Alignment must be a power of two.
    struct SystemAllocator
    {
        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            if (size == 0)
                return nullptr;
            if (alignment <= __STDCPP_DEFAULT_NEW_ALIGNMENT__)
                return ::operator new(size, std::nothrow);
            return ::operator new(size, std::align_val_t {alignment}, std::nothrow);
        }

        void Deallocate(void* block, UIntSize size, UIntSize alignment) noexcept
        {
            if (!block)
                return;
            if (alignment <= __STDCPP_DEFAULT_NEW_ALIGNMENT__)
                ::operator delete(block, size);
            else
                ::operator delete(block, size, std::align_val_t {alignment});
        }
    };
}// namespace Arbor::Memory
