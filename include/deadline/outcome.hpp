#pragma once
#include "deadline/timeout_error.hpp"

#include <exception>
#include <expected>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace deadline
{

// =================================================================================================

/// The value type used to carry a result of \p T, with \c std::monostate standing in for void.
template <typename T>
using result_value_t = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

/// What the bounded work produced: a value, or the error it failed with.
template <typename T>
using Outcome = std::expected<result_value_t<T>, std::exception_ptr>;

// =================================================================================================

/**
 * Terminal interpretation for \c run_with_deadline(): every outcome reaches the caller unchanged,
 * including a \c TimeoutError.
 */
template <typename T>
struct RaiseOnTimeout
{
   using work_type = T;
   using signature = std::conditional_t<std::is_void_v<T>, void(std::exception_ptr),
                                        void(std::exception_ptr, T)>;

   /// Returns a nullary callable that completes \p handler with \p outcome.
   template <typename Handler>
   static auto bind(Handler handler, Outcome<T> outcome, TaskId)
   {
      return [handler = std::move(handler), outcome = std::move(outcome)]() mutable
      {
         if constexpr (std::is_void_v<T>)
            std::move(handler)(outcome ? std::exception_ptr{} : outcome.error());
         else if (outcome)
            std::move(handler)(std::exception_ptr{}, std::move(*outcome));
         else
            std::move(handler)(outcome.error(), T{});
      };
   }
};

// -------------------------------------------------------------------------------------------------

/**
 * Terminal interpretation for \c run_with_deadline_or_none(): a \c TimeoutError raised by the
 * very same task becomes \c std::nullopt. Everything else, a timeout of an enclosing deadline
 * included, is passed through.
 */
template <typename T>
struct NoneOnTimeout
{
   using work_type = T;
   using value_type = std::optional<result_value_t<T>>;
   using signature = void(std::exception_ptr, value_type);

   template <typename Handler>
   static auto bind(Handler handler, Outcome<T> outcome, TaskId self)
   {
      return [handler = std::move(handler), outcome = std::move(outcome), self]() mutable
      {
         if (outcome)
            std::move(handler)(std::exception_ptr{}, value_type{std::move(*outcome)});
         else if (is_timeout_of(outcome.error(), self))
            std::move(handler)(std::exception_ptr{}, value_type{});
         else
            std::move(handler)(outcome.error(), value_type{});
      };
   }
};

// =================================================================================================

} // namespace deadline
