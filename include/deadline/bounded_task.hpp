#pragma once
#include "deadline/bounded_task_state.hpp"
#include "deadline/formatters.hpp"
#include "deadline/log.hpp"
#include "deadline/outcome.hpp"
#include "deadline/timeout_error.hpp"
#include "deadline/timer_service.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_cancellation_slot.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

namespace deadline
{

namespace asio = boost::asio; // NOLINT(misc-unused-alias-decls)

// =================================================================================================

/**
 * Cancellation scope around a unit of work that is subject to a deadline.
 *
 * The task is the target of competing events: its timer firing (\c on_fire), terminal
 * cancellation of the parent scope (\c on_parent_cancelled) and the work completing
 * (\c on_work_finished). The atomic \c TaskState decides which one wins:
 *
 *    Active --on_fire--> CancellingFromTimeout --on_work_finished--> Completed
 *    Active --on_parent_cancelled--> CancellingFromParent --on_work_finished--> Completed
 *    Active --on_work_finished--> Completed
 *
 * Whatever happens, the timer handle is disposed exactly once and \p Handler is invoked exactly
 * once. Once the timer has won, the final outcome is this task's \c TimeoutError, even if the
 * work suppressed the cancellation and produced a value or some other error.
 *
 * Cancellation of the parent scope (the handler's associated cancellation slot) is forwarded
 * into the child scope unchanged. The work then fails with whatever error its suspension points
 * raise, which is passed through as-is. A parent that cancelled first keeps its cancellation even
 * if the timer fires before the work got to observe it.
 *
 * The timer handle, the child signal and the handler are only accessed on the task's executor,
 * which must not run handlers concurrently (single-threaded \c io_context or strand). Hence
 * \c start() and \c expire_immediately() must be called on that executor. Only the timer
 * callback may arrive from a foreign thread.
 */
template <typename Translator, typename Handler>
class BoundedTask : public std::enable_shared_from_this<BoundedTask<Translator, Handler>>
{
public:
   using work_type = typename Translator::work_type;
   using duration = std::chrono::steady_clock::duration;
   using handler_executor_type = asio::associated_executor_t<Handler, asio::any_io_executor>;

   BoundedTask(duration timeout, asio::any_io_executor executor, Handler handler)
      : id_(next_task_id()), timeout_(timeout), executor_(std::move(executor)),
        handler_(std::move(handler)),
        work_guard_(asio::make_work_guard(asio::get_associated_executor(handler_, executor_)))
   {
   }

   BoundedTask(const BoundedTask&) = delete;
   BoundedTask& operator=(const BoundedTask&) = delete;

   TaskId id() const noexcept { return id_; }
   TaskState state() const noexcept { return state_.load(); }
   duration get_timeout() const noexcept { return timeout_; }
   const asio::any_io_executor& get_executor() const noexcept { return executor_; }

   /**
    * Arms the deadline and starts \p work in the child scope.
    *
    * The timer is registered and the parent scope is linked before the work is spawned, so
    * that neither a fire nor a parent cancellation can get lost. \c co_spawn dispatches, hence
    * the work starts inline if we are already running on the task's executor.
    */
   template <typename F>
   void start(TimerService& timers, F&& work)
   {
      starting_ = true;
      trace("deadline#{}: armed, {}", id_, describe(timeout_));

      timer_ = timers.schedule(timeout_, [weak = this->weak_from_this()]
      {
         if (auto self = weak.lock())
            self->on_fire();
      });

      auto slot = asio::get_associated_cancellation_slot(handler_);
      if (slot.is_connected())
         slot.assign([weak = this->weak_from_this()](asio::cancellation_type type)
         {
            if (auto self = weak.lock())
               self->on_parent_cancelled(type);
         });

      asio::co_spawn(executor_, std::forward<F>(work),
                     asio::bind_cancellation_slot(scope_.slot(), completion()));
      starting_ = false;
   }

   /// Completes with an immediate timeout, without registering a timer or starting any work.
   void expire_immediately()
   {
      state_.store(TaskState::Completed);
      trace("deadline#{}: timed out immediately", id_);
      deliver(std::unexpected(std::make_exception_ptr(TimeoutError::immediate(id_))), true);
   }

   /// Timer callback. Only the first call while still active has an effect.
   void on_fire()
   {
      auto expected = TaskState::Active;
      if (!state_.compare_exchange_strong(expected, TaskState::CancellingFromTimeout))
      {
         trace("deadline#{}: fire ignored, state {}", id_, expected);
         return;
      }

      asio::dispatch(executor_, [self = this->shared_from_this()]
      {
         trace("deadline#{}: fired after {}", self->id_, describe(self->timeout_));
         self->release_timer();
         if (self->state() != TaskState::Completed)
            self->scope_.emit(asio::cancellation_type::terminal);
      });
   }

   /**
    * Parent scope callback. Terminal cancellation claims the task, so that a later fire of the
    * timer can no longer turn the parent's cancellation into this task's timeout.
    */
   void on_parent_cancelled(asio::cancellation_type type)
   {
      if ((type & asio::cancellation_type::terminal) != asio::cancellation_type::none)
      {
         auto expected = TaskState::Active;
         state_.compare_exchange_strong(expected, TaskState::CancellingFromParent);
      }

      asio::dispatch(executor_, [self = this->shared_from_this(), type]
      {
         trace("deadline#{}: parent cancelled ({}), state {}", self->id_, type, self->state());
         if (self->state() != TaskState::Completed)
            self->scope_.emit(type);
      });
   }

   /// Completion of the work, with a value or an error. Delivers the final outcome exactly once.
   void on_work_finished(Outcome<work_type> outcome)
   {
      auto previous = state_.exchange(TaskState::Completed);
      if (previous == TaskState::Completed)
         return;

      release_timer();
      if (previous == TaskState::CancellingFromTimeout)
         outcome = std::unexpected(std::make_exception_ptr(TimeoutError(timeout_, id_)));

      trace("deadline#{}: completed after {}", id_, previous);
      deliver(std::move(outcome), starting_);
   }

private:
   auto completion()
   {
      if constexpr (std::is_void_v<work_type>)
         return [self = this->shared_from_this()](std::exception_ptr ep)
         {
            if (ep)
               self->on_work_finished(std::unexpected(std::move(ep)));
            else
               self->on_work_finished(Outcome<work_type>{});
         };
      else
         return [self = this->shared_from_this()](std::exception_ptr ep, work_type value)
         {
            if (ep)
               self->on_work_finished(std::unexpected(std::move(ep)));
            else
               self->on_work_finished(Outcome<work_type>{std::move(value)});
         };
   }

   void release_timer()
   {
      if (auto timer = std::exchange(timer_, nullptr))
         timer->dispose();
   }

   /// Hands \p outcome to the handler on its executor. Never invokes it from within \c start().
   void deliver(Outcome<work_type> outcome, bool from_initiation)
   {
      auto slot = asio::get_associated_cancellation_slot(handler_);
      if (slot.is_connected())
         slot.clear();

      auto ex = asio::get_associated_executor(handler_, executor_);
      auto function = Translator::bind(std::move(handler_), std::move(outcome), id_);
      if (from_initiation)
         asio::post(ex, std::move(function));
      else
         asio::dispatch(ex, std::move(function));
      work_guard_.reset();
   }

   const TaskId id_;
   const duration timeout_;
   asio::any_io_executor executor_;
   Handler handler_;
   asio::executor_work_guard<handler_executor_type> work_guard_;

   asio::cancellation_signal scope_;
   TimerHandle timer_;
   std::atomic<TaskState> state_ = TaskState::Active;
   bool starting_ = false;
};

// =================================================================================================

} // namespace deadline
