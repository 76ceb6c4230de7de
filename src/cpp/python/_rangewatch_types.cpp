#include <nanobind/nanobind.h>
#include <nanobind/operators.h>
#include <nanobind/stl/string.h>

#include <rangewatch/types/change_event.h>
#include <rangewatch/types/range_definition.h>
#include <rangewatch/util/string_utils.h>

namespace nb = nanobind;
using namespace nb::literals;

void export_types(nb::module_ &m) {
    using namespace rangewatch;

    nb::class_<RangeDefinition>(m, "RangeDefinition")
            .def(nb::init<>())
            .def("__init__",
                 [](RangeDefinition *self, std::string alias, std::string query, std::string suffix, bool overlapping) {
                     new(self) RangeDefinition{std::move(alias), std::move(query), std::move(suffix), overlapping};
                 },
                 "alias"_a, "query"_a, "suffix"_a = "", "overlapping"_a = false)
            .def_rw("alias", &RangeDefinition::alias)
            .def_rw("query", &RangeDefinition::query)
            .def_rw("suffix", &RangeDefinition::suffix)
            .def_rw("overlapping", &RangeDefinition::overlapping)
            .def(nb::self == nb::self)
            .def("__str__", [](const RangeDefinition &self) { return to_string(self); })
            .def("__repr__", [](const RangeDefinition &self) { return to_string(self); });

    nb::class_<ChangeEvent>(m, "ChangeEvent")
            .def(nb::init<>())
            .def("__init__",
                 [](ChangeEvent *self, std::string query, bool matches, std::string alias, std::string suffix) {
                     new(self) ChangeEvent{std::move(query), matches, std::move(alias), std::move(suffix)};
                 },
                 "query"_a, "matches"_a, "alias"_a = "", "suffix"_a = "")
            .def_rw("query", &ChangeEvent::query)
            .def_rw("matches", &ChangeEvent::matches)
            .def_rw("alias", &ChangeEvent::alias)
            .def_rw("suffix", &ChangeEvent::suffix)
            .def_prop_ro("has_alias", &ChangeEvent::has_alias)
            .def("with_range", &ChangeEvent::with_range, "range"_a)
            .def(nb::self == nb::self)
            .def("__str__", [](const ChangeEvent &self) { return to_string(self); })
            .def("__repr__", [](const ChangeEvent &self) { return to_string(self); });
}
