#include "deadline/program_options.hpp"

#include "deadline/log.hpp"

#include <boost/program_options.hpp>

#include <sys/ioctl.h>
#include <unistd.h>

#include <iostream>
#include <print>

namespace po = boost::program_options;

namespace deadline
{
namespace
{

// =================================================================================================

size_t get_terminal_width(size_t fallback = 80)
{
   struct winsize ws;
   if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
      return ws.ws_col;

   return fallback;
}

} // namespace

// -------------------------------------------------------------------------------------------------

std::optional<int> parse_command_line(int argc, char* argv[], po::options_description& desc,
                                      RunOptions& options)
{
   po::options_description common("Usage", get_terminal_width(120));
   common.add_options() //
      ("help,h", "produce help message") //
      ("debug,d", po::bool_switch(&options.debug)->default_value(options.debug),
       "run the io_context step by step (single-threaded, for testing only)") //
      ("trace", po::bool_switch(&options.trace)->default_value(options.trace),
       "trace the lifecycle of every deadline") //
      ("threads,t",
       po::value<std::size_t>(&options.threads)->default_value(options.threads)->value_name("N"),
       "number of extra threads that should run the io_context");
   common.add(desc);

   po::variables_map vm;
   try
   {
      po::store(po::parse_command_line(argc, argv, common), vm);
      po::notify(vm);
   }
   catch (const po::error& ex)
   {
      std::println(std::cerr, "ERROR: {}", ex.what());
      return 1;
   }

   if (vm.count("help"))
   {
      common.print(std::cout);
      return 0;
   }

   if (options.debug && options.threads > 0)
   {
      std::println(std::cerr, "ERROR: debug output works single-threaded only");
      return 1;
   }

   if (options.trace)
      set_trace_enabled(true);

   return std::nullopt;
}

// =================================================================================================

} // namespace deadline
