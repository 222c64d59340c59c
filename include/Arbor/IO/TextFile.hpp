/// @file TextFile.hpp
/// @brief Whole-file reads used for loading schema data.
#pragma once

#include <Arbor/Defines.hpp>
#include <Arbor/Primitives.hpp>

#include <expected>
#include <string>

namespace Arbor::IO
{
    struct FileError
    {
        std::string path {};
        int         systemCode {0};///< errno value, 0 for argument errors.
        std::string message {};
    };

    /// @brief Read the complete contents of a regular file.
    [[nodiscard]] ARBOR_API std::expected<std::string, FileError> ReadTextFile(const std::string& path);
}// namespace Arbor::IO
