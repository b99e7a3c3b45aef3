#pragma once
#include <format>
#include <print>
#include <utility>

namespace deadline
{

// =================================================================================================

/// Tracing of task lifecycle events. Initially enabled if \c DEADLINE_TRACE is set to non-zero.
bool trace_enabled() noexcept;
void set_trace_enabled(bool enabled) noexcept;

/// Prints one trace line to stdout if tracing is enabled.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
   if (trace_enabled())
      std::println(fmt, std::forward<Args>(args)...);
}

// =================================================================================================

} // namespace deadline
