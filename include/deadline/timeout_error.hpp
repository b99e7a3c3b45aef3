#pragma once
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>

namespace deadline
{

/// Identity of one bounded task. Zero is never assigned to a task.
using TaskId = std::uint64_t;

/// Returns a process-unique, non-zero task id.
TaskId next_task_id() noexcept;

/// Formats \p duration in the coarsest unit that represents it exactly, e.g. "50ms" or "3s".
std::string describe(std::chrono::nanoseconds duration);

// =================================================================================================

/**
 * Raised when a deadline elapses before the bounded work completes.
 *
 * The error remembers which invocation raised it, by \c TaskId. Two timeouts with identical
 * durations from different invocations never compare as the same source. This is what lets
 * \c run_with_deadline_or_none() tell its own timeout apart from an enclosing one.
 *
 * The error code is always \c errc::timed_out, so code that only looks at error codes treats
 * it like any other timeout.
 */
class TimeoutError : public boost::system::system_error
{
public:
   /// Creates a timeout not associated with any invocation. It is never translated to "none".
   explicit TimeoutError(std::string description);

   /// Creates the timeout raised by task \p source after \p timeout has elapsed.
   TimeoutError(std::chrono::nanoseconds timeout, TaskId source);

   /// Creates the timeout for a zero deadline, which expires before any work is started.
   static TimeoutError immediate(TaskId source);

   const std::string& description() const noexcept { return description_; }
   std::chrono::nanoseconds timeout() const noexcept { return timeout_; }
   TaskId source() const noexcept { return source_; }

   /// True if this error was raised by the task with identity \p task.
   bool raised_by(TaskId task) const noexcept { return source_ != 0 && source_ == task; }

private:
   TimeoutError(std::string description, std::chrono::nanoseconds timeout, TaskId source);

   std::string description_;
   std::chrono::nanoseconds timeout_{};
   TaskId source_ = 0;
};

// -------------------------------------------------------------------------------------------------

/// True if \p ep holds a \c TimeoutError raised by \p task.
bool is_timeout_of(const std::exception_ptr& ep, TaskId task);

} // namespace deadline
