#pragma once
#include "deadline/outcome.hpp"
#include "deadline/runner.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <exception>
#include <type_traits>
#include <utility>

// =================================================================================================

/**
 * Runs \p awaitable to completion on a private IO context and returns its outcome: the value, or
 * the exception it failed with. Scenario tests can check for a timeout without any try/catch.
 */
template <typename T>
deadline::Outcome<T> run_sync(boost::asio::awaitable<T> awaitable)
{
   deadline::Outcome<T> outcome = std::unexpected(std::exception_ptr{});

   boost::asio::io_context context;
   boost::asio::co_spawn(context, [&]() -> boost::asio::awaitable<void>
   {
      try
      {
         if constexpr (std::is_void_v<T>)
         {
            co_await std::move(awaitable);
            outcome.emplace();
         }
         else
            outcome = co_await std::move(awaitable);
      }
      catch (...)
      {
         outcome = std::unexpected(std::current_exception());
      }
   }, boost::asio::detached);

   deadline::run_stepwise(context);
   return outcome;
}

// =================================================================================================
