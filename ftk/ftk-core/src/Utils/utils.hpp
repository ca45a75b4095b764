#ifndef FTK_CORE_UTILS_HPP
#define FTK_CORE_UTILS_HPP

#include <cmath>
#include <concepts>

namespace ftk_core
{

// Helper function for comparing doubles with tolerance
constexpr double TOLERANCE = 1e-10;

template <std::floating_point T>
bool almostEqual(T a, T b, double tolerance = TOLERANCE)
{
  return std::abs(a - b) < tolerance;
}

/**
 * @brief Floating-point floor division
 *
 * Rounds the quotient toward negative infinity (-0.5 floors to -1), matching
 * the integer-style division used by the calorie tables.
 *
 * @param numerator Dividend
 * @param denominator Divisor
 * @return Largest integral value not greater than numerator / denominator
 * @throws ArithmeticFault if denominator is zero
 */
double floorDivide(double numerator, double denominator);

}  // namespace ftk_core

#endif  // FTK_CORE_UTILS_HPP
