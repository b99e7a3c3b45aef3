#include "deadline/log.hpp"

#include <atomic>
#include <cstdlib>
#include <string_view>

namespace deadline
{
namespace
{

bool initial_trace_enabled()
{
   const char* env = std::getenv("DEADLINE_TRACE");
   return env && std::string_view(env) != "" && std::string_view(env) != "0";
}

std::atomic<bool>& trace_flag()
{
   static std::atomic<bool> flag = initial_trace_enabled();
   return flag;
}

} // namespace

// =================================================================================================

bool trace_enabled() noexcept { return trace_flag().load(std::memory_order_relaxed); }

void set_trace_enabled(bool enabled) noexcept
{
   trace_flag().store(enabled, std::memory_order_relaxed);
}

// =================================================================================================

} // namespace deadline
