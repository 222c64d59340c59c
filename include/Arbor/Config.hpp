/// @file Config.hpp
/// @brief Compile-time defaults for arenas, the arena pool and construction tracing.
#pragma once

// Upper bound on nodes a single arena will hand out before reporting CapacityExceeded.
#ifndef ARBOR_DEFAULT_MAX_NODES
#define ARBOR_DEFAULT_MAX_NODES (1u << 22)
#endif

// Size of each payload slab (attributes, child lists, text bytes).
#ifndef ARBOR_DEFAULT_SLAB_BYTES
#define ARBOR_DEFAULT_SLAB_BYTES (16u * 1024u)
#endif

// Node slots per segment of the node table.
#ifndef ARBOR_NODE_SEGMENT_SIZE
#define ARBOR_NODE_SEGMENT_SIZE 512u
#endif

// Arenas reset more often than this are retired instead of pooled.
#ifndef ARBOR_POOL_MAX_GENERATIONS
#define ARBOR_POOL_MAX_GENERATIONS 20u
#endif

#ifndef ARBOR_POOL_MAX_IDLE
#define ARBOR_POOL_MAX_IDLE 64u
#endif

// Name of the diagnostic attribute that carries the construction site.
#ifndef ARBOR_TRACE_ATTRIBUTE
#define ARBOR_TRACE_ATTRIBUTE "title"
#endif

#if ARBOR_POOL_MAX_GENERATIONS > 255
#error "ARBOR_POOL_MAX_GENERATIONS must fit in the 8-bit region generation"
#endif
