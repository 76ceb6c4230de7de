#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <rangewatch/registry/breakpoint_registry.h>
#include <rangewatch/registry/breakpoint_tools.h>

#include <fmt/format.h>

namespace nb = nanobind;
using namespace nb::literals;

void export_registry(nb::module_ &m) {
    using namespace rangewatch;

    m.def("derive_suffix", &derive_suffix, "alias"_a);
    m.def("validate_suffixes", &validate_suffixes, "ranges"_a);
    m.def("merge_by_alias", &merge_by_alias, "defaults"_a, "custom"_a = RangeDefinitions{});

    nb::class_<BreakPointRegistry>(m, "BreakPointRegistry")
            .def(nb::init<>())
            .def(nb::init<RangeDefinitions>(), "ranges"_a)
            .def_static("build", &BreakPointRegistry::build, "defaults"_a, "custom"_a = RangeDefinitions{},
                        "required_aliases"_a = std::vector<std::string>{})
            .def_prop_ro("items", &BreakPointRegistry::items)
            .def("__len__", &BreakPointRegistry::size)
            .def("find_by_alias", &BreakPointRegistry::find_by_alias, "alias"_a, nb::rv_policy::reference_internal)
            .def("find_by_query", &BreakPointRegistry::find_by_query, "query"_a, nb::rv_policy::reference_internal)
            .def("find", &BreakPointRegistry::find, "alias_or_query"_a, nb::rv_policy::reference_internal)
            .def("resolve_query", &BreakPointRegistry::resolve_query, "alias_or_query"_a)
            .def("index_of", &BreakPointRegistry::index_of, "query"_a)
            .def_prop_ro("overlapping_ranges", &BreakPointRegistry::overlapping_ranges)
            .def_prop_ro("queries", &BreakPointRegistry::queries)
            .def("__repr__", [](const BreakPointRegistry &self) {
                return fmt::format("BreakPointRegistry@{:p}[size={}]", static_cast<const void *>(&self), self.size());
            });
}
