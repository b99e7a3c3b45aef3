#pragma once
#include <boost/asio/awaitable.hpp>

#include <concepts>
#include <functional>
#include <type_traits>

namespace deadline
{

// =================================================================================================

namespace detail
{
template <typename T>
struct is_awaitable_impl : std::false_type
{
};

template <typename R, typename Executor>
struct is_awaitable_impl<boost::asio::awaitable<R, Executor>> : std::true_type
{
};

template <typename T>
inline constexpr bool is_awaitable_v = is_awaitable_impl<std::remove_cvref_t<T>>::value;
} // namespace detail

/**
 * Concept: a type that is an `asio::awaitable<...>` (after removing cv/ref).
 */
template <typename T>
concept AwaitableOf = detail::is_awaitable_v<T>;

/**
 * Concept: a callable that, when invoked with no arguments, returns an `asio::awaitable<...>`.
 */
template <typename F>
concept CallableAwaitable = std::invocable<F> && AwaitableOf<std::invoke_result_t<F>>;

/// The result type \c T of the \c awaitable<T> returned by callable \p F.
template <CallableAwaitable F>
using awaitable_result_t = typename std::invoke_result_t<F>::value_type;

// =================================================================================================

} // namespace deadline
