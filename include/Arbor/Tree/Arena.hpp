/// @file Arena.hpp
/// @brief Append-only node store addressed by NodeHandle, released as a unit.
#pragma once

#include <Arbor/Config.hpp>
#include <Arbor/Core/Error.hpp>
#include <Arbor/Defines.hpp>
#include <Arbor/Memory/ByteArena.hpp>
#include <Arbor/Memory/StableVector.hpp>
#include <Arbor/Tree/Node.hpp>
#include <Arbor/Tree/NodeHandle.hpp>

#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <string_view>
#include <vector>

namespace Arbor::Tree
{
    struct ArenaOptions
    {
        UInt32   maxNodes {ARBOR_DEFAULT_MAX_NODES};
        UIntSize slabBytes {ARBOR_DEFAULT_SLAB_BYTES};
    };

    class NodeView;

    /// @brief Region allocator for document nodes.
    ///
    /// Nodes are appended and never modified or freed individually. A node may
    /// only reference children that already exist: earlier slots of this arena,
    /// or nodes of arenas this one has adopted. The handle graph is therefore
    /// acyclic. Reset invalidates every handle issued so far.
    ///
    /// An arena is confined to one thread while it is being built. Once shared
    /// through Adopt it must no longer be appended to or reset.
    ///
    /// Handle errors: Resolve and View treat a stale or foreign handle as a
    /// contract violation. TryResolve and the allocation functions report it
    /// as ErrorCode::InvalidHandle.
    class ARBOR_API Arena
    {
    public:
        explicit Arena(ArenaOptions options = {});
        ~Arena();

        Arena(const Arena&)            = delete;
        Arena& operator=(const Arena&) = delete;
        Arena(Arena&&)                 = delete;
        Arena& operator=(Arena&&)      = delete;

        /// @brief Append a node. Attribute, child and text payload is copied into the arena
        ///        unless it already lives in this arena or an adopted one.
        ///
        /// Fails with CapacityExceeded, DuplicateAttribute or InvalidHandle (a child that
        /// does not resolve here). Nothing is allocated on failure.
        [[nodiscard]] Expected<NodeHandle> Allocate(const Node& node);

        [[nodiscard]] Expected<NodeHandle> AllocateText(std::string_view text);
        [[nodiscard]] Expected<NodeHandle> AllocateFragment(std::span<const NodeHandle> children);
        [[nodiscard]] Expected<NodeHandle> AllocatePreSerialized(std::shared_ptr<const SerializedFragment> fragment);

        [[nodiscard]] const Node& Resolve(NodeHandle handle,
                                          const std::source_location& location = std::source_location::current()) const;
        [[nodiscard]] NodeView View(NodeHandle handle,
                                    const std::source_location& location = std::source_location::current()) const;
        [[nodiscard]] Expected<NodeView> TryResolve(NodeHandle handle) const;
        [[nodiscard]] bool IsValid(NodeHandle handle) const noexcept;

        /// @brief Keep `source` alive for as long as this arena's current generation,
        ///        and make its handles resolvable here.
        ///
        /// Fails with DependencyCycle if `source` is this arena or depends on it.
        Expected<void> Adopt(std::shared_ptr<const Arena> source);

        /// @brief True if `other` was adopted, directly or transitively.
        [[nodiscard]] bool DependsOn(const Arena& other) const noexcept;
        [[nodiscard]] UIntSize DependencyCount() const noexcept { return m_dependencies.size(); }

        /// @brief Drop all nodes and dependencies and advance the generation.
        void Reset() noexcept;

        [[nodiscard]] RegionId Region() const noexcept { return RegionId(m_arenaId, m_generation); }
        [[nodiscard]] UInt8 Generation() const noexcept { return m_generation; }
        [[nodiscard]] UInt32 Size() const noexcept { return static_cast<UInt32>(m_nodes.Size()); }
        [[nodiscard]] bool IsEmpty() const noexcept { return m_nodes.IsEmpty(); }
        [[nodiscard]] UIntSize PayloadBytes() const noexcept { return m_payload.Used(); }
        [[nodiscard]] UIntSize ReservedBytes() const noexcept { return m_payload.Reserved(); }
        [[nodiscard]] const ArenaOptions& Options() const noexcept { return m_options; }

    private:
        [[nodiscard]] const Arena* OwnerOf(NodeHandle handle) const noexcept;
        [[nodiscard]] bool OwnsPayload(const void* p) const noexcept;
        [[nodiscard]] bool KeepsFragment(const SerializedFragment* fragment) const noexcept;
        [[nodiscard]] Expected<void> CheckChildren(std::span<const NodeHandle> children) const;

        std::string_view StoreString(std::string_view text);
        std::span<const NodeHandle> StoreChildren(std::span<const NodeHandle> children);
        std::span<const Attribute> StoreAttributes(std::span<const Attribute> attributes);

        ArenaOptions m_options;
        UInt32       m_arenaId {0};
        UInt8        m_generation {0};

        Memory::StableVector<Node, ARBOR_NODE_SEGMENT_SIZE>   m_nodes;
        Memory::ByteArena<>                                   m_payload;
        std::vector<std::shared_ptr<const SerializedFragment>> m_fragments;
        std::vector<std::shared_ptr<const Arena>>             m_dependencies;
    };

    /// @brief A resolved node together with the arena it was resolved through.
    class NodeView
    {
    public:
        NodeView(const Arena& arena, NodeHandle handle, const Node& node) noexcept
            : m_arena(&arena), m_handle(handle), m_node(&node)
        {
        }

        [[nodiscard]] NodeHandle Handle() const noexcept { return m_handle; }
        [[nodiscard]] const Arena& Owner() const noexcept { return *m_arena; }
        [[nodiscard]] const Node& Raw() const noexcept { return *m_node; }
        [[nodiscard]] NodeKind Kind() const noexcept { return m_node->kind; }

        [[nodiscard]] bool IsElement() const noexcept { return m_node->kind == NodeKind::Element; }
        [[nodiscard]] bool IsText() const noexcept { return m_node->kind == NodeKind::Text; }
        [[nodiscard]] bool IsPreSerialized() const noexcept { return m_node->kind == NodeKind::PreSerialized; }
        [[nodiscard]] bool IsFragment() const noexcept { return m_node->kind == NodeKind::Fragment; }

        /// @brief Element tag, or the outer tag of a pre-serialized element. nullptr otherwise.
        [[nodiscard]] const Schema::TagMeta* Tag() const noexcept
        {
            if (m_node->kind == NodeKind::PreSerialized)
                return m_node->serialized ? m_node->serialized->outer : nullptr;
            return m_node->tag;
        }

        [[nodiscard]] std::string_view TagName() const noexcept
        {
            const Schema::TagMeta* tag = Tag();
            return tag ? std::string_view {tag->name} : std::string_view {};
        }

        [[nodiscard]] bool HasTag(std::string_view name) const noexcept
        {
            return IsElement() && m_node->tag->name == name;
        }

        [[nodiscard]] std::span<const Attribute> Attributes() const noexcept { return m_node->attributes; }
        [[nodiscard]] std::span<const NodeHandle> Children() const noexcept { return m_node->children; }
        [[nodiscard]] std::string_view Text() const noexcept { return m_node->text; }

        [[nodiscard]] std::optional<std::string_view> FindAttribute(std::string_view name) const noexcept
        {
            for (const Attribute& attribute: m_node->attributes)
            {
                if (attribute.name == name)
                    return attribute.value;
            }
            return std::nullopt;
        }

        [[nodiscard]] UIntSize ChildCount() const noexcept { return m_node->children.size(); }

        [[nodiscard]] NodeView Child(UIntSize index) const { return m_arena->View(m_node->children[index]); }

    private:
        const Arena* m_arena;
        NodeHandle   m_handle;
        const Node*  m_node;
    };
}// namespace Arbor::Tree
