#include "deadline/runner.hpp"

#include "deadline/log.hpp"

#include <chrono>
#include <print>
#include <thread>
#include <vector>

namespace deadline
{

// =================================================================================================

std::size_t run_stepwise(boost::asio::io_context& context)
{
   using namespace std::chrono;
   std::size_t steps = 0;
   auto last = steady_clock::now();
   while (context.run_one())
   {
      auto now = steady_clock::now();
      auto elapsed = duration_cast<milliseconds>(now - last);
      if (elapsed >= 100ms)
         std::println("\x1b[1;31mstep {}: handler blocked for {}\x1b[0m", steps, elapsed);
      else
         trace("step {}: +{}", steps, elapsed);
      last = now;
      ++steps;
   }
   return steps;
}

// -------------------------------------------------------------------------------------------------

int run(boost::asio::io_context& context, const RunOptions& options)
{
   if (options.debug)
   {
      run_stepwise(context);
      return 0;
   }

   std::vector<std::jthread> workers;
   workers.reserve(options.threads);
   for (std::size_t i = 0; i < options.threads; ++i)
      workers.emplace_back([&context] { context.run(); });

   context.run();
   return 0;
}

// =================================================================================================

} // namespace deadline
