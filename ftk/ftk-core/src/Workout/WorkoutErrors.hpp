#ifndef FTK_CORE_WORKOUT_ERRORS_HPP
#define FTK_CORE_WORKOUT_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace ftk_core
{

/**
 * @brief Thrown by the dispatcher when an activity code is not recognized
 *
 * Carries the offending code for diagnostic display.
 */
class UnknownWorkoutKind : public std::invalid_argument
{
public:
  explicit UnknownWorkoutKind(std::string code)
    : std::invalid_argument{"Unknown workout kind: '" + code + "'"},
      code_{std::move(code)}
  {
  }

  [[nodiscard]] const std::string& code() const noexcept
  {
    return code_;
  }

private:
  std::string code_;
};

/**
 * @brief Thrown by the dispatcher when a payload does not have exactly the
 * number of positional values the selected workout kind expects
 */
class ArityMismatch : public std::invalid_argument
{
public:
  ArityMismatch(std::string code, std::size_t expected, std::size_t actual)
    : std::invalid_argument{"Workout kind '" + code + "' expects " +
                            std::to_string(expected) + " values, got " +
                            std::to_string(actual)},
      code_{std::move(code)},
      expected_{expected},
      actual_{actual}
  {
  }

  [[nodiscard]] const std::string& code() const noexcept
  {
    return code_;
  }

  [[nodiscard]] std::size_t expected() const noexcept
  {
    return expected_;
  }

  [[nodiscard]] std::size_t actual() const noexcept
  {
    return actual_;
  }

private:
  std::string code_;
  std::size_t expected_;
  std::size_t actual_;
};

/**
 * @brief Division by zero inside a workout formula (zero duration or height)
 *
 * Terminates the computation of the offending record only.
 */
class ArithmeticFault : public std::domain_error
{
public:
  using std::domain_error::domain_error;
};

}  // namespace ftk_core

#endif  // FTK_CORE_WORKOUT_ERRORS_HPP
