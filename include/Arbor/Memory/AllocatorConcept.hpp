/// @file AllocatorConcept.hpp
/// @brief Requirements on the upstream allocator that supplies arena slabs.
#pragma once

#include <Arbor/Primitives.hpp>

#include <concepts>

namespace Arbor::Memory
{
    /// Allocate returns nullptr on failure instead of throwing. Deallocate receives
    /// the same size and alignment that were passed to Allocate.
    template<class A>
    concept AllocatorConcept = requires(A& allocator, UIntSize bytes, UIntSize alignment, void* block) {
        { allocator.Allocate(bytes, alignment) } -> std::same_as<void*>;
        { allocator.Deallocate(block, bytes, alignment) } noexcept;
    };
}// namespace Arbor::Memory
