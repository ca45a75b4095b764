// Ticket: 0002_workout_dispatch

#ifndef FTK_CORE_DISPATCH_WORKOUT_DISPATCHER_HPP
#define FTK_CORE_DISPATCH_WORKOUT_DISPATCHER_HPP

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ftk-core/src/Workout/Workout.hpp"

namespace ftk_core::workout_dispatcher
{

/**
 * @brief Selects and constructs a workout from a tracker package
 *
 * A package is an activity code plus an ordered payload of numbers that maps
 * positionally onto the constructor of the selected workout kind:
 *
 *   "SWM" -> Swimming    (action, duration, weight, poolLength, poolLaps)
 *   "RUN" -> Running     (action, duration, weight)
 *   "WLK" -> RaceWalking (action, duration, weight, height)
 *
 * Codes are case-sensitive. The code table is immutable after first use.
 *
 * Thread safety: Stateless functions, thread-safe
 * Error handling: Throws UnknownWorkoutKind for codes outside the table and
 * ArityMismatch for payloads of the wrong length
 */

constexpr std::string_view kSwimmingCode = "SWM";
constexpr std::string_view kRunningCode = "RUN";
constexpr std::string_view kRaceWalkingCode = "WLK";

/**
 * @brief Construct the workout described by a package
 * @param code Activity code
 * @param payload Positional constructor values
 * @return Newly constructed workout, owned by the caller
 * @throws UnknownWorkoutKind if code is not recognized
 * @throws ArityMismatch if payload.size() differs from expectedArity(code)
 */
[[nodiscard]] std::unique_ptr<Workout> resolveWorkout(
  std::string_view code,
  std::span<const double> payload);

/**
 * @brief Number of positional values a code expects
 * @throws UnknownWorkoutKind if code is not recognized
 */
[[nodiscard]] std::size_t expectedArity(std::string_view code);

/**
 * @brief All recognized activity codes, sorted
 */
[[nodiscard]] std::vector<std::string> recognizedCodes();

}  // namespace ftk_core::workout_dispatcher

#endif  // FTK_CORE_DISPATCH_WORKOUT_DISPATCHER_HPP
