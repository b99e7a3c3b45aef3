#include "deadline/timeout_error.hpp"

#include <atomic>
#include <format>

namespace deadline
{

// =================================================================================================

TaskId next_task_id() noexcept
{
   static std::atomic<TaskId> counter = 0;
   return ++counter;
}

std::string describe(std::chrono::nanoseconds duration)
{
   using namespace std::chrono;
   if (duration == duration.zero())
      return "0ms";
   if (duration % hours(1) == duration.zero())
      return std::format("{}h", duration_cast<hours>(duration).count());
   if (duration % minutes(1) == duration.zero())
      return std::format("{}min", duration_cast<minutes>(duration).count());
   if (duration % seconds(1) == duration.zero())
      return std::format("{}s", duration_cast<seconds>(duration).count());
   if (duration % milliseconds(1) == duration.zero())
      return std::format("{}ms", duration_cast<milliseconds>(duration).count());
   if (duration % microseconds(1) == duration.zero())
      return std::format("{}us", duration_cast<microseconds>(duration).count());
   return std::format("{}ns", duration.count());
}

// =================================================================================================

TimeoutError::TimeoutError(std::string description)
   : TimeoutError(std::move(description), std::chrono::nanoseconds::zero(), 0)
{
}

TimeoutError::TimeoutError(std::chrono::nanoseconds timeout, TaskId source)
   : TimeoutError(std::format("Timed out waiting for {}", describe(timeout)), timeout, source)
{
}

TimeoutError TimeoutError::immediate(TaskId source)
{
   return TimeoutError("Timed out immediately", std::chrono::nanoseconds::zero(), source);
}

TimeoutError::TimeoutError(std::string description, std::chrono::nanoseconds timeout,
                           TaskId source)
   : boost::system::system_error(boost::system::errc::make_error_code(boost::system::errc::timed_out),
                                 description),
     description_(std::move(description)), timeout_(timeout), source_(source)
{
}

// -------------------------------------------------------------------------------------------------

bool is_timeout_of(const std::exception_ptr& ep, TaskId task)
{
   if (!ep)
      return false;

   try
   {
      std::rethrow_exception(ep);
   }
   catch (const TimeoutError& ex)
   {
      return ex.raised_by(task);
   }
   catch (...)
   {
      return false; // any other error is not ours to interpret
   }
}

// =================================================================================================

} // namespace deadline
