// Ticket: 0002_workout_dispatch

#include "ftk-core/src/Dispatch/WorkoutDispatcher.hpp"

#include <functional>
#include <map>

#include <spdlog/spdlog.h>

#include "ftk-core/src/Workout/RaceWalking.hpp"
#include "ftk-core/src/Workout/Running.hpp"
#include "ftk-core/src/Workout/Swimming.hpp"
#include "ftk-core/src/Workout/WorkoutErrors.hpp"

namespace ftk_core::workout_dispatcher
{

namespace
{

struct WorkoutEntry
{
  std::size_t arity;
  std::function<std::unique_ptr<Workout>(std::span<const double>)> create;
};

// Payload length has been checked against arity before create() is called
const std::map<std::string_view, WorkoutEntry>& workoutTable()
{
  static const std::map<std::string_view, WorkoutEntry> table{
    {kSwimmingCode,
     {5,
      [](std::span<const double> p) -> std::unique_ptr<Workout>
      { return std::make_unique<Swimming>(p[0], p[1], p[2], p[3], p[4]); }}},
    {kRunningCode,
     {3,
      [](std::span<const double> p) -> std::unique_ptr<Workout>
      { return std::make_unique<Running>(p[0], p[1], p[2]); }}},
    {kRaceWalkingCode,
     {4,
      [](std::span<const double> p) -> std::unique_ptr<Workout>
      { return std::make_unique<RaceWalking>(p[0], p[1], p[2], p[3]); }}}};
  return table;
}

const WorkoutEntry& findEntry(std::string_view code)
{
  const auto& table = workoutTable();
  auto it = table.find(code);
  if (it == table.end())
  {
    throw UnknownWorkoutKind{std::string{code}};
  }
  return it->second;
}

}  // namespace

std::unique_ptr<Workout> resolveWorkout(std::string_view code,
                                        std::span<const double> payload)
{
  const WorkoutEntry& entry = findEntry(code);
  if (payload.size() != entry.arity)
  {
    throw ArityMismatch{std::string{code}, entry.arity, payload.size()};
  }

  auto workout = entry.create(payload);
  spdlog::debug("Resolved workout code '{}' to {} ({} values)",
                code,
                workout->getKindName(),
                payload.size());
  return workout;
}

std::size_t expectedArity(std::string_view code)
{
  return findEntry(code).arity;
}

std::vector<std::string> recognizedCodes()
{
  std::vector<std::string> codes;
  codes.reserve(workoutTable().size());
  for (const auto& item : workoutTable())
  {
    codes.emplace_back(item.first);
  }
  return codes;
}

}  // namespace ftk_core::workout_dispatcher
