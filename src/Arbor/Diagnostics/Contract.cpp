#include <Arbor/Diagnostics/Contract.hpp>

#include <Arbor/Diagnostics/Log.hpp>

#include <atomic>
#include <cstdlib>

namespace Arbor::Diagnostics
{
    namespace
    {
        std::atomic<ContractViolationHandler> g_handler {nullptr};
    }// namespace

    ContractViolationHandler SetContractViolationHandler(ContractViolationHandler handler) noexcept
    {
        return g_handler.exchange(handler);
    }

    void ContractViolation(std::string_view message, const std::source_location& location)
    {
        if (auto handler = g_handler.load())
            handler(message, location);

        Log(LogLevel::Error, "Contract", "{} ({}:{} in {})", message, location.file_name(), location.line(),
            location.function_name());
        std::abort();
    }
}// namespace Arbor::Diagnostics
