#include "deadline/asio-deadline.hpp"
#include "deadline/program_options.hpp"

#include <boost/program_options.hpp>

#include <print>

namespace po = boost::program_options;

using deadline::RunOptions;
using deadline::run_with_deadline;
using deadline::run_with_deadline_or_none;

// =================================================================================================

/// Sleeps for \p duration, then returns 42.
awaitable<int> work(std::chrono::milliseconds duration)
{
   std::println("work: sleeping for {}...", duration);
   co_await sleep(duration);
   std::println("work: sleeping for {}... done", duration);
   co_return 42;
}

awaitable<void> demo(std::chrono::milliseconds timeout, std::chrono::milliseconds duration,
                     bool or_none)
{
   if (or_none)
   {
      auto result = co_await run_with_deadline_or_none(timeout, [=] { return work(duration); });
      if (result)
         std::println("demo: result={}", *result);
      else
         std::println("demo: none, timed out after {}", timeout);
   }
   else
   {
      auto result = co_await run_with_deadline(timeout, [=] { return work(duration); });
      std::println("demo: result={}", result);
   }
}

// =================================================================================================

int main(int argc, char* argv[])
{
   long timeout = 50;
   long duration = 10;
   bool or_none = false;

   po::options_description desc("Deadline");
   desc.add_options() //
      ("timeout", po::value<long>(&timeout)->default_value(timeout)->value_name("MS"),
       "deadline in milliseconds, may be zero or negative") //
      ("work", po::value<long>(&duration)->default_value(duration)->value_name("MS"),
       "duration of the work in milliseconds") //
      ("or-none", po::bool_switch(&or_none), "return 'none' on timeout instead of throwing");

   RunOptions options;
   if (auto exit_code = deadline::parse_command_line(argc, argv, desc, options))
      return *exit_code;

   io_context context;
   co_spawn(make_strand(context),
            demo(std::chrono::milliseconds(timeout), std::chrono::milliseconds(duration), or_none),
            log_exception("demo"));
   return deadline::run(context, options);
}

// =================================================================================================
