#include <Arbor/Tree/ArenaPool.hpp>

#include <Arbor/Diagnostics/Contract.hpp>
#include <Arbor/Diagnostics/Log.hpp>

#include <mutex>
#include <new>
#include <vector>

namespace Arbor::Tree
{
    struct ArenaPool::State
    {
        explicit State(ArenaPoolOptions poolOptions)
            : options(poolOptions)
        {
        }

        const ArenaPoolOptions              options;
        mutable std::mutex                  mutex;
        std::vector<std::unique_ptr<Arena>> idle;
        UIntSize                            created {0};
        UIntSize                            retired {0};
    };

    ArenaPool::ArenaPool(ArenaPoolOptions options)
        : m_state(std::make_shared<State>(options))
    {
        if (options.maxGenerations == 0 || options.maxGenerations > RegionId::kMaxGeneration)
            Diagnostics::ContractViolation("ArenaPool: maxGenerations must be between 1 and 255");
    }

    ArenaPool::~ArenaPool()
    {
        Clear();
    }

    ArenaLease ArenaPool::Acquire()
    {
        std::unique_ptr<Arena> arena;
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (!m_state->idle.empty())
            {
                arena = std::move(m_state->idle.back());
                m_state->idle.pop_back();
            }
            else
            {
                ++m_state->created;
            }
        }
        if (!arena)
            arena = std::make_unique<Arena>(m_state->options.arena);

        std::weak_ptr<State> weakState = m_state;
        return ArenaLease(arena.release(), [weakState](Arena* raw) { Recycle(weakState, raw); });
    }

    void ArenaPool::Release(ArenaLease&& lease) noexcept
    {
        lease.reset();
    }

    void ArenaPool::Clear() noexcept
    {
        std::vector<std::unique_ptr<Arena>> idle;
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            idle.swap(m_state->idle);
        }
    }

    UIntSize ArenaPool::IdleCount() const noexcept
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->idle.size();
    }

    UIntSize ArenaPool::CreatedCount() const noexcept
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->created;
    }

    UIntSize ArenaPool::RetiredCount() const noexcept
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->retired;
    }

    const ArenaPoolOptions& ArenaPool::Options() const noexcept
    {
        return m_state->options;
    }

    void ArenaPool::Recycle(const std::weak_ptr<State>& weakState, Arena* raw) noexcept
    {
        std::unique_ptr<Arena> arena(raw);
        auto                   state = weakState.lock();
        if (!state)
            return;

        // Resetting may release adopted arenas, whose own leases re-enter this pool.
        arena->Reset();

        if (arena->Generation() >= state->options.maxGenerations)
        {
            Diagnostics::Log(Diagnostics::LogLevel::Debug, "ArenaPool", "retiring arena {} after {} generations",
                             arena->Region().ArenaId(), arena->Generation());
            std::lock_guard<std::mutex> lock(state->mutex);
            ++state->retired;
            return;
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->idle.size() >= state->options.maxIdleArenas)
            return;
        try
        {
            state->idle.push_back(std::move(arena));
        }
        catch (const std::bad_alloc&)
        {
            // The arena is destroyed with its unique_ptr.
        }
    }
}// namespace Arbor::Tree
