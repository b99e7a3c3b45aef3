#pragma once
#include <boost/asio/io_context.hpp>

#include <cstddef>

namespace deadline
{

// =================================================================================================

/// How to run an \c io_context, see \c run().
struct RunOptions
{
   bool debug = false;
   bool trace = false;
   std::size_t threads = 0;
};

/**
 * Runs \p context one handler at a time until it runs out of work and returns the number of
 * handlers executed.
 *
 * Each step is traced (see \c trace_enabled()). Steps that took 100ms or longer are reported in
 * any case, as that usually means a handler blocked the thread while deadlines were pending.
 */
std::size_t run_stepwise(boost::asio::io_context& context);

/// Runs \p context as configured by \p options, using the calling thread plus extra threads.
int run(boost::asio::io_context& context, const RunOptions& options);

// =================================================================================================

} // namespace deadline
