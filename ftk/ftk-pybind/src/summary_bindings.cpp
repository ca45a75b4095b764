// Python bindings for Summary, SummaryRecord and message rendering

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ftk-core/src/Summary/Summary.hpp"
#include "ftk-core/src/Summary/SummaryFormatter.hpp"
#include "ftk-core/src/Summary/SummaryTransfer.hpp"
#include "ftk-transfer/src/RecordFormat.hpp"
#include "ftk-transfer/src/SummaryRecord.hpp"

namespace py = pybind11;

void bind_summary(py::module_& m)
{
  py::class_<ftk_transfer::SummaryRecord>(m, "SummaryRecord")
    .def(py::init<>())
    .def_readonly("training_type", &ftk_transfer::SummaryRecord::training_type)
    .def_readonly("duration", &ftk_transfer::SummaryRecord::duration)
    .def_readonly("distance", &ftk_transfer::SummaryRecord::distance)
    .def_readonly("speed", &ftk_transfer::SummaryRecord::speed)
    .def_readonly("calories", &ftk_transfer::SummaryRecord::calories);

  py::class_<ftk_core::Summary>(m, "Summary")
    .def_readonly("workout_kind_name", &ftk_core::Summary::workoutKindName)
    .def_readonly("duration_hours", &ftk_core::Summary::durationHours)
    .def_readonly("distance_km", &ftk_core::Summary::distanceKm)
    .def_readonly("mean_speed_kmh", &ftk_core::Summary::meanSpeedKmh)
    .def_readonly("calories_kcal", &ftk_core::Summary::caloriesKcal)
    .def("to_record",
         [](const ftk_core::Summary& summary)
         { return ftk_core::toRecord(summary); })
    .def("__str__", &ftk_core::renderMessage);

  m.def("render_message",
        &ftk_core::renderMessage,
        py::arg("summary"),
        "Render a summary into the fixed human-readable message");

  m.def(
    "format_record_fields",
    [](const ftk_transfer::SummaryRecord& record)
    { return ftk_transfer::formatRecordFields(record); },
    py::arg("record"),
    "Render a summary record as name=value pairs");
}
