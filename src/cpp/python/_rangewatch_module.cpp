/*
 * The entry point into the python _rangewatch module exposing the C++ engine to python.
 *
 * Objects that hold references to their collaborators (MatchQuery, RangeMonitor, RangeService, ...) keep the
 * python wrappers of those collaborators alive, the C++ side never owns them.
 */
#include <nanobind/nanobind.h>

#include <rangewatch/util/errors.h>

namespace nb = nanobind;

void export_types(nb::module_ &);

void export_registry(nb::module_ &);

void export_runtime(nb::module_ &);

NB_MODULE(_rangewatch, m) {
    m.doc() = "The rangewatch breakpoint matching and change coalescing engine";

    nb::exception<rangewatch::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

    export_types(m);
    export_registry(m);
    export_runtime(m);
}
