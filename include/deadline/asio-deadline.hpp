#pragma once
#include "deadline/formatters.hpp"
#include "deadline/log.hpp"
#include "deadline/timeout_error.hpp"
#include "deadline/with_deadline.hpp"

#include <boost/asio.hpp>

#include <exception>
#include <ostream>
#include <print>
#include <stdexcept>
#include <string>

namespace asio = boost::asio; // NOLINT(misc-unused-alias-decls)
using namespace asio;

using boost::system::error_code;
using boost::system::system_error;

using namespace std::chrono_literals;

// =================================================================================================

inline error_code code(const std::exception_ptr& ptr)
{
   if (!ptr)
      return {};
   else
   {
      try
      {
         std::rethrow_exception(ptr);
      }
      catch (multiple_exceptions& mex)
      {
         return code(mex.first_exception());
      }
      catch (system_error& ex)
      {
         return ex.code();
      }
      catch (std::invalid_argument&)
      {
         return make_error_code(boost::system::errc::invalid_argument);
      }
   }
}

inline std::string what(const error_code ec) { return ec.message(); }

inline std::string what(const std::exception_ptr& ptr)
{
   if (!ptr)
      return "Success(ep)";
   else
   {
      try
      {
         std::rethrow_exception(ptr);
      }
      catch (multiple_exceptions& ex)
      {
         return what(ex.first_exception());
      }
      catch (deadline::TimeoutError& ex)
      {
         return ex.description();
      }
      catch (boost::system::system_error& ex)
      {
         return ex.code().message();
      }
      catch (std::exception& ex)
      {
         return ex.what();
      }
   }
}

/// Completion handler printing the outcome of an operation, prefixed with \p prefix.
template <typename... Args>
constexpr auto log_exception(std::string prefix)
{
   return [prefix = std::move(prefix)](const std::exception_ptr& ptr, Args&&... args)
   {
      std::println("{}: {}", prefix, what(ptr));
      (std::println("{}:   result={}", prefix, std::forward<Args>(args)), ...);
   };
}

inline auto make_system_error(boost::system::errc::errc_t error)
{
   return boost::system::error_code(error, boost::system::system_category());
}

// =================================================================================================

inline awaitable<void> yield() { co_await post(co_await this_coro::executor); }

inline awaitable<void> sleep(steady_timer::duration timeout)
{
   steady_timer timer(co_await this_coro::executor);
   timer.expires_after(timeout);
   co_await timer.async_wait();
}

// =================================================================================================

namespace std
{
inline void PrintTo(const std::exception_ptr& ep, std::ostream* os) { *os << what(ep); } // NOLINT
} // namespace std

// =================================================================================================
