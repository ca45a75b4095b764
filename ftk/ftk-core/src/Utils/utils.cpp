#include "ftk-core/src/Utils/utils.hpp"

#include <cmath>

#include "ftk-core/src/Workout/WorkoutErrors.hpp"

namespace ftk_core
{

double floorDivide(double numerator, double denominator)
{
  if (denominator == 0.0)
  {
    throw ArithmeticFault{"floorDivide: division by zero"};
  }

  // fmod keeps the remainder exact, so (numerator - mod) / denominator is an
  // integral value up to rounding
  double mod = std::fmod(numerator, denominator);
  double div = (numerator - mod) / denominator;
  if (mod != 0.0)
  {
    if ((denominator < 0.0) != (mod < 0.0))
    {
      div -= 1.0;
    }
  }

  if (div == 0.0)
  {
    return std::copysign(0.0, numerator / denominator);
  }

  double floorDiv = std::floor(div);
  if (div - floorDiv > 0.5)
  {
    floorDiv += 1.0;
  }
  return floorDiv;
}

}  // namespace ftk_core
