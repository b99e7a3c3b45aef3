#include "deadline/timer_service.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>

namespace asio = boost::asio;
using boost::system::error_code;

namespace deadline
{
namespace
{

// =================================================================================================

class SteadyTimerBinding : public TimerBinding,
                           public std::enable_shared_from_this<SteadyTimerBinding>
{
public:
   explicit SteadyTimerBinding(asio::any_io_executor executor) : timer(std::move(executor)) {}

   void arm(TimerService::duration delay, std::function<void()> on_fire)
   {
      timer.expires_after(delay);
      timer.async_wait([self = shared_from_this(), on_fire = std::move(on_fire)](error_code ec)
      {
         // A fire consumes the binding just like disposing does, only the first one counts.
         if (ec || self->disposed.exchange(true))
            return;
         on_fire();
      });
   }

   void dispose() override
   {
      if (disposed.exchange(true))
         return;

      // The timer object itself must only be touched from its executor.
      asio::dispatch(timer.get_executor(), [self = shared_from_this()] { self->timer.cancel(); });
   }

private:
   asio::steady_timer timer;
   std::atomic<bool> disposed = false;
};

// =================================================================================================

} // namespace

TimerHandle SteadyTimerService::schedule(duration delay, std::function<void()> on_fire)
{
   auto binding = std::make_shared<SteadyTimerBinding>(executor_);
   binding->arm(delay, std::move(on_fire));
   return binding;
}

} // namespace deadline
