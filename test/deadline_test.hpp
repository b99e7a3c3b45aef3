#pragma once
#include "deadline/asio-deadline.hpp"
#include "deadline/runner.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <functional>

// =================================================================================================

/**
 * Base fixture: runs the coroutine stored in \c test on a fresh IO context after the test body
 * has set up its expectations, and reports the outcome to \c on_complete().
 */
class DeadlineTest : public testing::Test
{
protected:
   auto token()
   {
      return [this](const std::exception_ptr& ep) { on_complete(code(ep)); };
   }

   void TearDown() override
   {
      if (test)
         co_spawn(executor, std::move(test), token());
      runDebug();
   }

   MOCK_METHOD(void, on_complete, (error_code ec), ());

   static error_code make_error(boost::system::errc::errc_t error)
   {
      return boost::system::errc::make_error_code(error);
   }

   std::function<awaitable<void>()> test;

private:
   io_context context;

protected:
   any_io_executor executor{context.get_executor()};
   void run() { context.run(); }
   void runDebug() { deadline::run_stepwise(context); }
};

// =================================================================================================
