/// @file Primitives.hpp
/// @brief Fixed-width aliases used across Arbor.
#pragma once

#include <cstddef>
#include <cstdint>

namespace Arbor
{
    using UInt8  = std::uint8_t;
    using UInt16 = std::uint16_t;
    using UInt32 = std::uint32_t;
    using UInt64 = std::uint64_t;

    using F64 = double;

    /// @brief Sizes, counts and indices.
    using UIntSize = std::size_t;
}// namespace Arbor
