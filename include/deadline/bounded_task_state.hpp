#pragma once
#include <cstdint>
#include <string_view>

namespace deadline
{

/// Completion state of a bounded task. Transitions only move forward.
enum class TaskState : std::uint8_t
{
   Active,
   CancellingFromTimeout,
   CancellingFromParent,
   Completed
};

inline std::string_view to_string(TaskState state)
{
   switch (state)
   {
   case TaskState::Active:
      return "Active";
   case TaskState::CancellingFromTimeout:
      return "CancellingFromTimeout";
   case TaskState::CancellingFromParent:
      return "CancellingFromParent";
   case TaskState::Completed:
      return "Completed";
   }
   return "Unknown";
}

} // namespace deadline
