#include <Arbor/Tree/Arena.hpp>

#include <Arbor/Diagnostics/Contract.hpp>

#include <atomic>
#include <cstring>
#include <format>
#include <new>

namespace Arbor::Tree
{
    namespace
    {
        std::atomic<UInt32> g_nextArenaId {1};

        [[nodiscard]] UInt32 NextArenaId() noexcept
        {
            while (true)
            {
                const UInt32 id = g_nextArenaId.fetch_add(1, std::memory_order_relaxed) & RegionId::kMaxArenaId;
                if (id != 0)
                    return id;
            }
        }

        [[nodiscard]] std::string DescribeHandle(NodeHandle handle)
        {
            return std::format("handle {}@{}.{}", handle.Slot(), handle.Region().ArenaId(), handle.Region().Generation());
        }
    }// namespace

    Arena::Arena(ArenaOptions options)
        : m_options(options), m_arenaId(NextArenaId()), m_payload(options.slabBytes)
    {
    }

    Arena::~Arena() = default;

    const Arena* Arena::OwnerOf(NodeHandle handle) const noexcept
    {
        const RegionId region = handle.Region();
        if (region.ArenaId() == m_arenaId)
        {
            if (region.Generation() == m_generation && handle.Slot() < m_nodes.Size())
                return this;
            return nullptr;
        }
        for (const auto& dependency: m_dependencies)
        {
            if (const Arena* owner = dependency->OwnerOf(handle))
                return owner;
        }
        return nullptr;
    }

    bool Arena::OwnsPayload(const void* p) const noexcept
    {
        if (m_payload.Owns(p))
            return true;
        for (const auto& dependency: m_dependencies)
        {
            if (dependency->OwnsPayload(p))
                return true;
        }
        return false;
    }

    bool Arena::KeepsFragment(const SerializedFragment* fragment) const noexcept
    {
        for (const auto& kept: m_fragments)
        {
            if (kept.get() == fragment)
                return true;
        }
        for (const auto& dependency: m_dependencies)
        {
            if (dependency->KeepsFragment(fragment))
                return true;
        }
        return false;
    }

    bool Arena::IsValid(NodeHandle handle) const noexcept
    {
        return OwnerOf(handle) != nullptr;
    }

    bool Arena::DependsOn(const Arena& other) const noexcept
    {
        for (const auto& dependency: m_dependencies)
        {
            if (dependency.get() == &other || dependency->DependsOn(other))
                return true;
        }
        return false;
    }

    Expected<void> Arena::CheckChildren(std::span<const NodeHandle> children) const
    {
        for (UIntSize i = 0; i < children.size(); ++i)
        {
            if (OwnerOf(children[i]))
                continue;
            Error err = MakeError(ErrorCode::InvalidHandle, "", "",
                                  std::format("child {} does not resolve in arena {}.{}", DescribeHandle(children[i]),
                                              m_arenaId, m_generation));
            err.index = i;
            return std::unexpected(std::move(err));
        }
        return {};
    }

    std::string_view Arena::StoreString(std::string_view text)
    {
        if (text.empty() || OwnsPayload(text.data()))
            return text;
        char* memory = m_payload.AllocateArray<char>(text.size());
        if (!memory)
            throw std::bad_alloc();
        std::memcpy(memory, text.data(), text.size());
        return {memory, text.size()};
    }

    std::span<const NodeHandle> Arena::StoreChildren(std::span<const NodeHandle> children)
    {
        if (children.empty() || OwnsPayload(children.data()))
            return children;
        NodeHandle* memory = m_payload.AllocateArray<NodeHandle>(children.size());
        if (!memory)
            throw std::bad_alloc();
        std::uninitialized_copy(children.begin(), children.end(), memory);
        return {memory, children.size()};
    }

    std::span<const Attribute> Arena::StoreAttributes(std::span<const Attribute> attributes)
    {
        if (attributes.empty() || OwnsPayload(attributes.data()))
            return attributes;
        Attribute* memory = m_payload.AllocateArray<Attribute>(attributes.size());
        if (!memory)
            throw std::bad_alloc();
        for (UIntSize i = 0; i < attributes.size(); ++i)
            ::new (static_cast<void*>(memory + i)) Attribute {StoreString(attributes[i].name), StoreString(attributes[i].value)};
        return {memory, attributes.size()};
    }

    Expected<NodeHandle> Arena::Allocate(const Node& node)
    {
        if (m_nodes.Size() >= m_options.maxNodes)
            return Fail(ErrorCode::CapacityExceeded, node.tag ? std::string_view {node.tag->name} : std::string_view {}, "",
                        std::format("arena is full ({} nodes)", m_options.maxNodes));

        switch (node.kind)
        {
            case NodeKind::Element:
                if (!node.tag)
                    Diagnostics::ContractViolation("Arena::Allocate: element node without tag");
                for (UIntSize i = 0; i < node.attributes.size(); ++i)
                {
                    for (UIntSize j = 0; j < i; ++j)
                    {
                        if (node.attributes[i].name != node.attributes[j].name)
                            continue;
                        return Fail(ErrorCode::DuplicateAttribute, node.tag->name, node.attributes[i].name,
                                    std::format("attribute '{}' given twice on <{}>", node.attributes[i].name,
                                                node.tag->name));
                    }
                }
                [[fallthrough]];
            case NodeKind::Fragment: {
                auto checked = CheckChildren(node.children);
                if (!checked)
                {
                    if (node.tag)
                        checked.error().tag = node.tag->name;
                    return std::unexpected(std::move(checked.error()));
                }
                break;
            }
            case NodeKind::PreSerialized:
                if (!node.serialized || !KeepsFragment(node.serialized))
                    Diagnostics::ContractViolation("Arena::Allocate: pre-serialized node without a kept fragment");
                break;
            case NodeKind::Text:
                break;
        }

        const auto marker = m_payload.Mark();
        Node       stored = node;
        try
        {
            stored.attributes = StoreAttributes(node.attributes);
            stored.children   = StoreChildren(node.children);
            if (node.kind == NodeKind::Text)
                stored.text = StoreString(node.text);
            m_nodes.PushBack(stored);
        }
        catch (const std::bad_alloc&)
        {
            m_payload.Rollback(marker);
            throw;
        }
        return NodeHandle(Region(), static_cast<UInt32>(m_nodes.Size() - 1));
    }

    Expected<NodeHandle> Arena::AllocateText(std::string_view text)
    {
        return Allocate(Node::MakeText(text));
    }

    Expected<NodeHandle> Arena::AllocateFragment(std::span<const NodeHandle> children)
    {
        return Allocate(Node::MakeFragment(children));
    }

    Expected<NodeHandle> Arena::AllocatePreSerialized(std::shared_ptr<const SerializedFragment> fragment)
    {
        if (!fragment)
            Diagnostics::ContractViolation("Arena::AllocatePreSerialized: null fragment");

        Node node;
        node.kind       = NodeKind::PreSerialized;
        node.tag        = nullptr;
        node.serialized = fragment.get();
        node.text       = fragment->html;

        const bool added = !KeepsFragment(fragment.get());
        if (added)
            m_fragments.push_back(fragment);
        auto handle = Allocate(node);
        if (!handle && added)
            m_fragments.pop_back();
        return handle;
    }

    const Node& Arena::Resolve(NodeHandle handle, const std::source_location& location) const
    {
        const Arena* owner = OwnerOf(handle);
        if (!owner)
        {
            Diagnostics::ContractViolation(
                    std::format("{} is not valid in arena {}.{}", DescribeHandle(handle), m_arenaId, m_generation), location);
        }
        return owner->m_nodes[handle.Slot()];
    }

    NodeView Arena::View(NodeHandle handle, const std::source_location& location) const
    {
        return NodeView(*this, handle, Resolve(handle, location));
    }

    Expected<NodeView> Arena::TryResolve(NodeHandle handle) const
    {
        const Arena* owner = OwnerOf(handle);
        if (!owner)
            return Fail(ErrorCode::InvalidHandle, "", "",
                        std::format("{} is not valid in arena {}.{}", DescribeHandle(handle), m_arenaId, m_generation));
        return NodeView(*this, handle, owner->m_nodes[handle.Slot()]);
    }

    Expected<void> Arena::Adopt(std::shared_ptr<const Arena> source)
    {
        if (!source)
            Diagnostics::ContractViolation("Arena::Adopt: null arena");
        if (source.get() == this || source->DependsOn(*this))
            return Fail(ErrorCode::DependencyCycle, "", "",
                        std::format("arena {} cannot adopt arena {}: it would depend on itself", m_arenaId,
                                    source->m_arenaId));
        if (DependsOn(*source))
            return {};
        m_dependencies.push_back(std::move(source));
        return {};
    }

    void Arena::Reset() noexcept
    {
        m_nodes.Clear();
        m_payload.Reset();
        m_fragments.clear();
        m_dependencies.clear();
        if (m_generation == RegionId::kMaxGeneration)
        {
            // Stamps from the wrapped generations would match again under the old id.
            m_arenaId    = NextArenaId();
            m_generation = 0;
            return;
        }
        ++m_generation;
    }
}// namespace Arbor::Tree
