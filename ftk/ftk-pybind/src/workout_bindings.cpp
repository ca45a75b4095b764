// Python bindings for the workout model and the dispatcher

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>
#include <vector>

#include "ftk-core/src/Dispatch/WorkoutDispatcher.hpp"
#include "ftk-core/src/Workout/RaceWalking.hpp"
#include "ftk-core/src/Workout/Running.hpp"
#include "ftk-core/src/Workout/Swimming.hpp"
#include "ftk-core/src/Workout/Workout.hpp"
#include "ftk-core/src/Workout/WorkoutErrors.hpp"

namespace py = pybind11;

void bind_workouts(py::module_& m)
{
  // UnknownWorkoutKind is a KeyError on the Python side, ArityMismatch a
  // ValueError, ArithmeticFault a ZeroDivisionError
  py::register_exception<ftk_core::UnknownWorkoutKind>(
    m, "UnknownWorkoutKind", PyExc_KeyError);
  py::register_exception<ftk_core::ArityMismatch>(
    m, "ArityMismatch", PyExc_ValueError);
  py::register_exception<ftk_core::ArithmeticFault>(
    m, "ArithmeticFault", PyExc_ZeroDivisionError);

  py::class_<ftk_core::Workout>(m, "Workout")
    .def("compute_distance_km", &ftk_core::Workout::computeDistanceKm)
    .def("compute_mean_speed_kmh", &ftk_core::Workout::computeMeanSpeedKmh)
    .def("compute_calories_kcal", &ftk_core::Workout::computeCaloriesKcal)
    .def("build_summary", &ftk_core::Workout::buildSummary)
    .def_property_readonly("kind_name",
                           [](const ftk_core::Workout& workout)
                           { return std::string{workout.getKindName()}; })
    .def_property_readonly("action_count",
                           &ftk_core::Workout::getActionCount)
    .def_property_readonly("duration_hours",
                           &ftk_core::Workout::getDurationHours)
    .def_property_readonly("weight_kg", &ftk_core::Workout::getWeightKg);

  py::class_<ftk_core::Running, ftk_core::Workout>(m, "Running")
    .def(py::init<double, double, double>(),
         py::arg("action"),
         py::arg("duration"),
         py::arg("weight"));

  py::class_<ftk_core::RaceWalking, ftk_core::Workout>(m, "RaceWalking")
    .def(py::init<double, double, double, double>(),
         py::arg("action"),
         py::arg("duration"),
         py::arg("weight"),
         py::arg("height"))
    .def_property_readonly("height_cm", &ftk_core::RaceWalking::getHeightCm);

  py::class_<ftk_core::Swimming, ftk_core::Workout>(m, "Swimming")
    .def(py::init<double, double, double, double, double>(),
         py::arg("action"),
         py::arg("duration"),
         py::arg("weight"),
         py::arg("length_pool"),
         py::arg("count_pool"))
    .def_property_readonly("pool_length_m",
                           &ftk_core::Swimming::getPoolLengthM)
    .def_property_readonly("pool_laps_count",
                           &ftk_core::Swimming::getPoolLapsCount);

  m.def(
    "resolve_workout",
    [](const std::string& code, const std::vector<double>& payload)
    { return ftk_core::workout_dispatcher::resolveWorkout(code, payload); },
    py::arg("code"),
    py::arg("payload"),
    "Construct the workout described by an activity code and its payload");

  m.def(
    "expected_arity",
    [](const std::string& code)
    { return ftk_core::workout_dispatcher::expectedArity(code); },
    py::arg("code"));

  m.def("recognized_codes", &ftk_core::workout_dispatcher::recognizedCodes);
}
