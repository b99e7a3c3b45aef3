#pragma once
#include "deadline/bounded_task.hpp"
#include "deadline/concepts.hpp"
#include "deadline/outcome.hpp"
#include "deadline/timeout_error.hpp"
#include "deadline/timer_service.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace deadline
{

namespace asio = boost::asio; // NOLINT(misc-unused-alias-decls)

// =================================================================================================

namespace detail
{

/// Validates \p timeout and converts it to the steady clock's resolution.
template <typename Rep, typename Period>
std::chrono::steady_clock::duration checked_timeout(std::chrono::duration<Rep, Period> timeout)
{
   if (timeout < timeout.zero())
      throw std::invalid_argument(std::format("Timeout {} cannot be negative", timeout));
   return std::chrono::ceil<std::chrono::steady_clock::duration>(timeout);
}

/**
 * Creates the task and moves its start onto the task's executor. When initiated from a coroutine
 * running there already, \c dispatch runs the start inline.
 */
template <typename Translator>
struct initiate_bounded_task
{
   template <typename Handler, typename F>
   void operator()(Handler handler, asio::any_io_executor executor, TimerService* timers,
                   std::chrono::steady_clock::duration timeout, F work) const
   {
      using task_type = BoundedTask<Translator, std::decay_t<Handler>>;
      auto task = std::make_shared<task_type>(timeout, std::move(executor), std::move(handler));

      auto ex = task->get_executor();
      asio::dispatch(ex, [task = std::move(task), timers, work = std::move(work)]() mutable
      {
         if (task->get_timeout() == task_type::duration::zero())
            task->expire_immediately();
         else if (timers)
            task->start(*timers, std::move(work));
         else
         {
            SteadyTimerService steady(task->get_executor());
            task->start(steady, std::move(work));
         }
      });
   }
};

template <typename Translator, typename CompletionToken, typename F>
auto async_bounded(asio::any_io_executor executor, TimerService* timers,
                   std::chrono::steady_clock::duration timeout, F&& work,
                   CompletionToken&& token)
{
   return asio::async_initiate<CompletionToken, typename Translator::signature>(
      initiate_bounded_task<Translator>{}, token, std::move(executor), timers, timeout,
      std::forward<F>(work));
}

} // namespace detail

// =================================================================================================

/**
 * Runs \p work on \p executor and cancels it if it hasn't completed after \p timeout.
 *
 * Completes with the work's result or error. If the deadline elapses first, the work's scope is
 * cancelled ('terminal') and the operation completes with a \c TimeoutError. This also happens
 * when the work catches the cancellation and returns normally: once the deadline has fired, the
 * timeout is the outcome, no matter what the work does afterwards.
 *
 * A zero \p timeout completes with a \c TimeoutError right away, without starting the work.
 * A negative \p timeout throws \c std::invalid_argument from this function.
 *
 * The completion handler's associated cancellation slot acts as parent scope. Cancellation
 * arriving there is forwarded to the work.
 *
 * Completion signature: <tt>void(std::exception_ptr, T)</tt>, or <tt>void(std::exception_ptr)</tt>
 * for void work.
 */
template <CallableAwaitable F, typename Rep, typename Period,
          typename CompletionToken = asio::default_completion_token_t<asio::any_io_executor>>
   requires asio::completion_token_for<
      CompletionToken, typename RaiseOnTimeout<awaitable_result_t<F>>::signature>
auto async_run_with_deadline(asio::any_io_executor executor, TimerService& timers,
                             std::chrono::duration<Rep, Period> timeout, F&& work,
                             CompletionToken&& token = {})
{
   return detail::async_bounded<RaiseOnTimeout<awaitable_result_t<F>>>(
      std::move(executor), &timers, detail::checked_timeout(timeout), std::forward<F>(work),
      std::forward<CompletionToken>(token));
}

/// Same as above, with the deadline tracked by a \c steady_timer on \p executor.
template <CallableAwaitable F, typename Rep, typename Period,
          typename CompletionToken = asio::default_completion_token_t<asio::any_io_executor>>
   requires asio::completion_token_for<
      CompletionToken, typename RaiseOnTimeout<awaitable_result_t<F>>::signature>
auto async_run_with_deadline(asio::any_io_executor executor,
                             std::chrono::duration<Rep, Period> timeout, F&& work,
                             CompletionToken&& token = {})
{
   return detail::async_bounded<RaiseOnTimeout<awaitable_result_t<F>>>(
      std::move(executor), nullptr, detail::checked_timeout(timeout), std::forward<F>(work),
      std::forward<CompletionToken>(token));
}

// -------------------------------------------------------------------------------------------------

/**
 * Like \c async_run_with_deadline(), but completes with \c std::nullopt if this very deadline
 * elapsed first.
 *
 * Only a \c TimeoutError raised by this invocation is translated. A \c TimeoutError from any other
 * deadline, e.g. an enclosing one, is passed through as error, as is the cancellation of an
 * enclosing scope.
 *
 * Completion signature: <tt>void(std::exception_ptr, std::optional<T>)</tt>, with
 * \c std::monostate standing in for \c T for void work.
 */
template <CallableAwaitable F, typename Rep, typename Period,
          typename CompletionToken = asio::default_completion_token_t<asio::any_io_executor>>
   requires asio::completion_token_for<
      CompletionToken, typename NoneOnTimeout<awaitable_result_t<F>>::signature>
auto async_run_with_deadline_or_none(asio::any_io_executor executor, TimerService& timers,
                                     std::chrono::duration<Rep, Period> timeout, F&& work,
                                     CompletionToken&& token = {})
{
   return detail::async_bounded<NoneOnTimeout<awaitable_result_t<F>>>(
      std::move(executor), &timers, detail::checked_timeout(timeout), std::forward<F>(work),
      std::forward<CompletionToken>(token));
}

template <CallableAwaitable F, typename Rep, typename Period,
          typename CompletionToken = asio::default_completion_token_t<asio::any_io_executor>>
   requires asio::completion_token_for<
      CompletionToken, typename NoneOnTimeout<awaitable_result_t<F>>::signature>
auto async_run_with_deadline_or_none(asio::any_io_executor executor,
                                     std::chrono::duration<Rep, Period> timeout, F&& work,
                                     CompletionToken&& token = {})
{
   return detail::async_bounded<NoneOnTimeout<awaitable_result_t<F>>>(
      std::move(executor), nullptr, detail::checked_timeout(timeout), std::forward<F>(work),
      std::forward<CompletionToken>(token));
}

// =================================================================================================

/**
 * Coroutine version of \c async_run_with_deadline(), running \p work on the current executor.
 *
 * The calling coroutine's cancellation state is the parent scope. A negative \p timeout is
 * reported as \c std::invalid_argument when this awaitable is awaited.
 */
template <CallableAwaitable F, typename Rep, typename Period>
asio::awaitable<awaitable_result_t<F>> run_with_deadline(std::chrono::duration<Rep, Period> timeout,
                                                         F work)
{
   auto executor = co_await asio::this_coro::executor;
   co_return co_await async_run_with_deadline(std::move(executor), timeout, std::move(work),
                                              asio::use_awaitable);
}

template <CallableAwaitable F, typename Rep, typename Period>
asio::awaitable<awaitable_result_t<F>> run_with_deadline(TimerService& timers,
                                                         std::chrono::duration<Rep, Period> timeout,
                                                         F work)
{
   auto executor = co_await asio::this_coro::executor;
   co_return co_await async_run_with_deadline(std::move(executor), timers, timeout,
                                              std::move(work), asio::use_awaitable);
}

// -------------------------------------------------------------------------------------------------

/// Coroutine version of \c async_run_with_deadline_or_none().
template <CallableAwaitable F, typename Rep, typename Period>
asio::awaitable<typename NoneOnTimeout<awaitable_result_t<F>>::value_type>
run_with_deadline_or_none(std::chrono::duration<Rep, Period> timeout, F work)
{
   auto executor = co_await asio::this_coro::executor;
   co_return co_await async_run_with_deadline_or_none(std::move(executor), timeout,
                                                      std::move(work), asio::use_awaitable);
}

template <CallableAwaitable F, typename Rep, typename Period>
asio::awaitable<typename NoneOnTimeout<awaitable_result_t<F>>::value_type>
run_with_deadline_or_none(TimerService& timers, std::chrono::duration<Rep, Period> timeout, F work)
{
   auto executor = co_await asio::this_coro::executor;
   co_return co_await async_run_with_deadline_or_none(std::move(executor), timers, timeout,
                                                      std::move(work), asio::use_awaitable);
}

// =================================================================================================

} // namespace deadline
