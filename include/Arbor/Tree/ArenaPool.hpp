/// @file ArenaPool.hpp
/// @brief Thread-safe pool that recycles reset arenas across requests.
#pragma once

#include <Arbor/Config.hpp>
#include <Arbor/Defines.hpp>
#include <Arbor/Tree/Arena.hpp>

#include <memory>

namespace Arbor::Tree
{
    struct ArenaPoolOptions
    {
        UIntSize     maxIdleArenas {ARBOR_POOL_MAX_IDLE};
        UInt32       maxGenerations {ARBOR_POOL_MAX_GENERATIONS};///< Resets before an arena is retired.
        ArenaOptions arena {};
    };

    /// @brief Shared ownership of a pooled arena.
    ///
    /// When the last reference goes away (including references held by arenas
    /// that adopted it) the arena is reset and returned to its pool. Leases may
    /// outlive the pool; they are then simply destroyed.
    using ArenaLease = std::shared_ptr<Arena>;

    class ARBOR_API ArenaPool final
    {
    public:
        explicit ArenaPool(ArenaPoolOptions options = {});
        ~ArenaPool();

        ArenaPool(const ArenaPool&)            = delete;
        ArenaPool& operator=(const ArenaPool&) = delete;
        ArenaPool(ArenaPool&&)                 = delete;
        ArenaPool& operator=(ArenaPool&&)      = delete;

        /// @brief An empty arena, reusing an idle one when available.
        [[nodiscard]] ArenaLease Acquire();

        /// @brief Give up the caller's reference. Equivalent to resetting the lease.
        void Release(ArenaLease&& lease) noexcept;

        /// @brief Destroy all idle arenas.
        void Clear() noexcept;

        [[nodiscard]] UIntSize IdleCount() const noexcept;
        [[nodiscard]] UIntSize CreatedCount() const noexcept;
        [[nodiscard]] UIntSize RetiredCount() const noexcept;
        [[nodiscard]] const ArenaPoolOptions& Options() const noexcept;

    private:
        struct State;

        /// Runs when the last lease reference is dropped, possibly on another thread.
        static void Recycle(const std::weak_ptr<State>& weakState, Arena* raw) noexcept;

        std::shared_ptr<State> m_state;
    };
}// namespace Arbor::Tree
