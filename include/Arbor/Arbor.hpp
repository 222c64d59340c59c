/// @file Arbor.hpp
/// @brief Convenience header pulling in the public Arbor API.
#pragma once

#include <Arbor/Config.hpp>
#include <Arbor/Core/Error.hpp>
#include <Arbor/Diagnostics/Contract.hpp>
#include <Arbor/Diagnostics/Log.hpp>
#include <Arbor/Html/Builder.hpp>
#include <Arbor/Html/Serializer.hpp>
#include <Arbor/Html/SoftPre.hpp>
#include <Arbor/Html/Tags.hpp>
#include <Arbor/Html/Transform.hpp>
#include <Arbor/Runtime.hpp>
#include <Arbor/Schema/SchemaDatabase.hpp>
#include <Arbor/Schema/SchemaLoader.hpp>
#include <Arbor/Tree/Arena.hpp>
#include <Arbor/Tree/ArenaPool.hpp>
