/// @file Contract.hpp
/// @brief Reporting of programming errors (contract violations).
#pragma once

#include <Arbor/Defines.hpp>

#include <source_location>
#include <string_view>

namespace Arbor::Diagnostics
{
    /// @brief Called on a contract violation. If the handler returns, the process aborts.
    using ContractViolationHandler = void (*)(std::string_view message, const std::source_location& location);

    /// @brief Install a handler and return the previous one. nullptr restores the default
    ///        (log at error level, then abort).
    ARBOR_API ContractViolationHandler SetContractViolationHandler(ContractViolationHandler handler) noexcept;

    [[noreturn]] ARBOR_API void ContractViolation(std::string_view message,
                                                  const std::source_location& location = std::source_location::current());
}// namespace Arbor::Diagnostics
