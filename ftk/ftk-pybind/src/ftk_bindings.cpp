// Main pybind11 module entry point for ftk_tracker

#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations for submodule binding functions
void bind_summary(py::module_& m);
void bind_workouts(py::module_& m);

/**
 * @brief Python module: ftk_tracker
 *
 * Workout summary computation from tracker packages.
 *
 * Usage:
 *   import ftk_tracker
 *   workout = ftk_tracker.resolve_workout("RUN", [15000, 1, 75])
 *   print(ftk_tracker.render_message(workout.build_summary()))
 */
PYBIND11_MODULE(ftk_tracker, m)
{
  m.doc() = "Fitness tracker workout summaries";

  // Summary first: Workout.build_summary returns it
  bind_summary(m);

  bind_workouts(m);

  m.attr("__version__") = "1.0.0";
}
