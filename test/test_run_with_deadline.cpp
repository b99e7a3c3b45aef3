#include "deadline_test.hpp"

#include <boost/scope/scope_exit.hpp>

#include <stdexcept>

using boost::scope::make_scope_exit;
using deadline::async_run_with_deadline;
using deadline::run_with_deadline;
using deadline::TimeoutError;

using namespace ::testing;
namespace errc = boost::system::errc;

// =================================================================================================

class RunWithDeadline : public DeadlineTest
{
};

// -------------------------------------------------------------------------------------------------

TEST_F(RunWithDeadline, WHEN_work_completes_in_time_THEN_returns_result)
{
   test = [this]() -> awaitable<void>
   {
      auto result = co_await run_with_deadline(50ms, []() -> awaitable<int>
      {
         co_await sleep(10ms);
         co_return 42;
      });
      EXPECT_EQ(result, 42);
   };

   EXPECT_CALL(*this, on_complete(error_code{}));
}

TEST_F(RunWithDeadline, WHEN_work_completes_without_suspending_THEN_returns_result)
{
   test = [this]() -> awaitable<void>
   {
      auto result = co_await run_with_deadline(50ms, []() -> awaitable<std::string>
      {
         co_return "done";
      });
      EXPECT_EQ(result, "done");
   };

   EXPECT_CALL(*this, on_complete(error_code{}));
}

TEST_F(RunWithDeadline, WHEN_void_work_completes_in_time_THEN_returns)
{
   test = [this]() -> awaitable<void>
   {
      bool done = false;
      co_await run_with_deadline(50ms, [&]() -> awaitable<void>
      {
         co_await yield();
         done = true;
      });
      EXPECT_TRUE(done);
   };

   EXPECT_CALL(*this, on_complete(error_code{}));
}

// -------------------------------------------------------------------------------------------------

TEST_F(RunWithDeadline, WHEN_deadline_elapses_THEN_throws_timeout)
{
   test = [this]() -> awaitable<void>
   {
      co_await run_with_deadline(10ms, []() -> awaitable<int>
      {
         co_await sleep(50ms);
         co_return 42;
      });
      ADD_FAILURE() << "not reached";
   };

   EXPECT_CALL(*this, on_complete(make_error(errc::timed_out)));
}

TEST_F(RunWithDeadline, WHEN_deadline_elapses_THEN_timeout_describes_deadline)
{
   test = [this]() -> awaitable<void>
   {
      try
      {
         co_await run_with_deadline(10ms, []() -> awaitable<void> { co_await sleep(1s); });
         ADD_FAILURE() << "not reached";
      }
      catch (const TimeoutError& ex)
      {
         EXPECT_EQ(ex.description(), "Timed out waiting for 10ms");
         EXPECT_EQ(ex.timeout(), 10ms);
         EXPECT_NE(ex.source(), 0u);
      }
   };

   EXPECT_CALL(*this, on_complete(error_code{}));
}

/**
 * The work is cancelled on timeout, so its coroutine frame is destroyed long before the sleep
 * would have finished.
 */
TEST_F(RunWithDeadline, WHEN_deadline_elapses_THEN_work_is_cancelled)
{
   test = [this]() -> awaitable<void>
   {
      bool destroyed = false;
      auto t0 = std::chrono::steady_clock::now();
      auto [ep] = co_await co_spawn(executor, run_with_deadline(10ms, [&]() -> awaitable<void>
      {
         auto scope_exit = make_scope_exit([&] { destroyed = true; });
         co_await sleep(10s);
      }), as_tuple(use_awaitable));
      EXPECT_EQ(code(ep), make_error(errc::timed_out));
      EXPECT_TRUE(destroyed);
      EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
   };

   EXPECT_CALL(*this, on_complete(error_code{}));
}

/**
 * Once the deadline has fired, the timeout is what the caller gets. Even if the work catches the
 * cancellation and returns a perfectly fine value.
 */
TEST_F(RunWithDeadline, WHEN_work_suppresses_cancellation_THEN_still_throws_timeout)
{
   test = [this]() -> awaitable<void>
   {
      bool suppressed = false;
      auto [ep, result] = co_await co_spawn(executor, run_with_deadline(10ms, [&]() -> awaitable<int>
      {
         try
         {
            co_await sleep(1s);
         }
         catch (const system_error&)
         {
            suppressed = true;
         }
         co_return 7;
      }), as_tuple(use_awaitable));
      EXPECT_TRUE(suppressed);
      EXPECT_EQ(code(ep), make_error(errc::timed_out));
   };

   EXPECT_CALL(*this, on_complete(error_code{}));
}

// -------------------------------------------------------------------------------------------------

TEST_F(RunWithDeadline, WHEN_work_fails_THEN_error_is_propagated_unchanged)
{
   test = [this]() -> awaitable<void>
   {
      try
      {
         co_await run_with_deadline(50ms, []() -> awaitable<int>
         {
            co_await yield();
            throw std::runtime_error("boom");
         });
         ADD_FAILURE() << "not reached";
      }
      catch (const std::runtime_error& ex)
      {
         EXPECT_STREQ(ex.what(), "boom");
      }
   };

   EXPECT_CALL(*this, on_complete(error_code{}));
}

// -------------------------------------------------------------------------------------------------

TEST_F(RunWithDeadline, WHEN_timeout_is_zero_THEN_times_out_without_starting_work)
{
   test = [this]() -> awaitable<void>
   {
      bool started = false;
      try
      {
         co_await run_with_deadline(0ms, [&]() -> awaitable<int>
         {
            started = true;
            co_return 42;
         });
         ADD_FAILURE() << "not reached";
      }
      catch (const TimeoutError& ex)
      {
         EXPECT_EQ(ex.description(), "Timed out immediately");
      }
      EXPECT_FALSE(started);
   };

   EXPECT_CALL(*this, on_complete(error_code{}));
}

TEST_F(RunWithDeadline, WHEN_timeout_is_negative_THEN_throws_invalid_argument)
{
   test = [this]() -> awaitable<void>
   {
      bool started = false;
      co_await run_with_deadline(-1ms, [&]() -> awaitable<int>
      {
         started = true;
         co_return 42;
      });
      ADD_FAILURE() << "not reached";
   };

   EXPECT_CALL(*this, on_complete(make_error(errc::invalid_argument)));
}

TEST_F(RunWithDeadline, WHEN_async_with_negative_timeout_THEN_initiation_throws)
{
   bool started = false;
   auto work = [&]() -> awaitable<int>
   {
      started = true;
      co_return 42;
   };
   EXPECT_THROW(async_run_with_deadline(executor, -5ms, work, detached), std::invalid_argument);
   EXPECT_FALSE(started);
}

// -------------------------------------------------------------------------------------------------

TEST_F(RunWithDeadline, WHEN_async_with_callback_THEN_completes_once_with_result)
{
   size_t completions = 0;
   async_run_with_deadline(executor, 50ms, []() -> awaitable<int>
   {
      co_await sleep(1ms);
      co_return 42;
   }, [&](std::exception_ptr ep, int result)
   {
      ++completions;
      EXPECT_FALSE(ep);
      EXPECT_EQ(result, 42);
   });
   runDebug();
   EXPECT_EQ(completions, 1);
}

/// A handler must never be invoked from within the initiating function.
TEST_F(RunWithDeadline, WHEN_work_completes_inline_THEN_handler_is_not_invoked_inline)
{
   size_t completions = 0;
   post(executor, [&]
   {
      async_run_with_deadline(executor, 50ms, []() -> awaitable<int> { co_return 42; },
                              [&](std::exception_ptr, int) { ++completions; });
      EXPECT_EQ(completions, 0);
   });
   runDebug();
   EXPECT_EQ(completions, 1);
}

// -------------------------------------------------------------------------------------------------

/// An inner timeout does not affect an outer deadline.
TEST_F(RunWithDeadline, WHEN_inner_deadline_elapses_THEN_outer_continues)
{
   test = [this]() -> awaitable<void>
   {
      auto result = co_await run_with_deadline(1s, []() -> awaitable<int>
      {
         try
         {
            co_await run_with_deadline(10ms, []() -> awaitable<void> { co_await sleep(1s); });
         }
         catch (const TimeoutError&)
         {
            co_return -1;
         }
         co_return 0;
      });
      EXPECT_EQ(result, -1);
   };

   EXPECT_CALL(*this, on_complete(error_code{}));
}

/// Cancelling the caller cancels the work, passing through the work's error.
TEST_F(RunWithDeadline, WHEN_parent_is_cancelled_THEN_work_is_cancelled)
{
   cancellation_signal signal;
   co_spawn(executor, []() -> awaitable<void>
   {
      co_await run_with_deadline(1s, []() -> awaitable<int>
      {
         co_await sleep(10s);
         co_return 42;
      });
      ADD_FAILURE() << "not reached";
   }, bind_cancellation_slot(signal.slot(), token()));

   steady_timer timer(executor, 10ms);
   timer.async_wait([&](error_code) { signal.emit(cancellation_type::terminal); });

   EXPECT_CALL(*this, on_complete(make_system_error(errc::operation_canceled)));
   runDebug();
}

// =================================================================================================
