#pragma once
#include "deadline/bounded_task_state.hpp"

#include <boost/asio/cancellation_type.hpp>

#include <format>
#include <string_view>
#include <utility>

// =================================================================================================

template <>
struct std::formatter<boost::asio::cancellation_type> : std::formatter<std::string_view>
{
   auto format(boost::asio::cancellation_type type, auto& ctx) const
   {
      using enum boost::asio::cancellation_type;

      if (type == none)
         return std::formatter<std::string_view>::format("none", ctx);

      if (type == all)
         return std::formatter<std::string_view>::format("all", ctx);

      bool first = true;
      auto append_if = [&](boost::asio::cancellation_type flag, std::string_view name)
      {
         if ((type & flag) == flag)
         {
            std::format_to(ctx.out(), "{}{}", first ? "" : "|", name);
            first = false;
            type = type & ~flag;
         }
      };

      append_if(terminal, "terminal");
      append_if(partial, "partial");
      append_if(total, "total");

      if (type != none)
         std::format_to(ctx.out(), "{}0x{:x}", first ? "" : "|", std::to_underlying(type));

      return ctx.out();
   }
};

// -------------------------------------------------------------------------------------------------

template <>
struct std::formatter<deadline::TaskState> : std::formatter<std::string_view>
{
   auto format(deadline::TaskState state, auto& ctx) const
   {
      return std::formatter<std::string_view>::format(to_string(state), ctx);
   }
};

// =================================================================================================
