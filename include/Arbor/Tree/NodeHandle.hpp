/// @file NodeHandle.hpp
/// @brief Arena-scoped node references.
#pragma once

#include <Arbor/Primitives.hpp>

#include <cstddef>
#include <functional>

namespace Arbor::Tree
{
    /// @brief Identity of one arena generation: 24-bit arena id, 8-bit generation.
    ///
    /// Arena ids are process-unique (never 0) and the generation advances on
    /// every reset, so a handle can be checked against the arena it is used with.
    /// An arena whose generation would wrap takes a fresh id instead.
    class RegionId
    {
    public:
        static constexpr UInt32 kGenerationBits = 8;
        static constexpr UInt32 kMaxArenaId     = (1u << (32 - kGenerationBits)) - 1;
        static constexpr UInt8  kMaxGeneration  = 0xFFu;

        constexpr RegionId() noexcept = default;
        constexpr RegionId(UInt32 arenaId, UInt8 generation) noexcept
            : m_value(((arenaId & kMaxArenaId) << kGenerationBits) | generation)
        {
        }

        [[nodiscard]] constexpr UInt32 ArenaId() const noexcept { return m_value >> kGenerationBits; }
        [[nodiscard]] constexpr UInt8 Generation() const noexcept { return static_cast<UInt8>(m_value & 0xFFu); }
        [[nodiscard]] constexpr UInt32 Value() const noexcept { return m_value; }
        [[nodiscard]] constexpr bool IsValid() const noexcept { return ArenaId() != 0; }

        constexpr bool operator==(const RegionId&) const noexcept = default;

    private:
        UInt32 m_value {0};
    };

    /// @brief Reference to a node slot in one arena generation. Carries no ownership.
    ///
    /// Two handles are equal iff they name the same slot of the same arena
    /// generation. A default-constructed handle is null and never resolves.
    class NodeHandle
    {
    public:
        constexpr NodeHandle() noexcept = default;
        constexpr NodeHandle(RegionId region, UInt32 slot) noexcept
            : m_slot(slot), m_region(region)
        {
        }

        [[nodiscard]] constexpr UInt32 Slot() const noexcept { return m_slot; }
        [[nodiscard]] constexpr RegionId Region() const noexcept { return m_region; }
        [[nodiscard]] constexpr bool IsNull() const noexcept { return !m_region.IsValid(); }

        constexpr bool operator==(const NodeHandle&) const noexcept = default;

    private:
        UInt32   m_slot {0};
        RegionId m_region {};
    };
}// namespace Arbor::Tree

template<>
struct std::hash<Arbor::Tree::NodeHandle>
{
    std::size_t operator()(const Arbor::Tree::NodeHandle& handle) const noexcept
    {
        return std::hash<Arbor::UInt64> {}((static_cast<Arbor::UInt64>(handle.Region().Value()) << 32) | handle.Slot());
    }
};
