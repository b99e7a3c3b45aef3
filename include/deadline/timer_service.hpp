#pragma once
#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace deadline
{

// =================================================================================================

/**
 * Registration of a one-shot callback with a \c TimerService.
 *
 * Disposing is idempotent and may happen from any thread, also after the callback has fired or
 * concurrently with it. A callback that is already running is not waited for; callbacks must
 * tolerate firing after their owner lost interest.
 */
class TimerBinding
{
public:
   virtual ~TimerBinding() = default;
   virtual void dispose() = 0;
};

using TimerHandle = std::shared_ptr<TimerBinding>;

// -------------------------------------------------------------------------------------------------

/// The time source that bounded tasks register their deadline with.
class TimerService
{
public:
   using duration = std::chrono::steady_clock::duration;

   virtual ~TimerService() = default;

   /// Invokes \p on_fire once, no earlier than \p delay from now, unless disposed before.
   virtual TimerHandle schedule(duration delay, std::function<void()> on_fire) = 0;
};

// =================================================================================================

/**
 * Timer service backed by an \c asio::steady_timer per registration.
 *
 * Callbacks are invoked on \p executor. The service object itself may be destroyed right after
 * scheduling, each handle keeps its timer alive until it either fired or was disposed.
 */
class SteadyTimerService : public TimerService
{
public:
   explicit SteadyTimerService(boost::asio::any_io_executor executor)
      : executor_(std::move(executor))
   {
   }

   TimerHandle schedule(duration delay, std::function<void()> on_fire) override;

private:
   boost::asio::any_io_executor executor_;
};

// =================================================================================================

} // namespace deadline
