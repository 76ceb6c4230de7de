/*
 * Expose the runtime (evaluators, schedulers, monitor and service) to python
 */
#include <nanobind/nanobind.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <rangewatch/runtime/flush_scheduler.h>
#include <rangewatch/runtime/match_query.h>
#include <rangewatch/runtime/mock_query_evaluator.h>
#include <rangewatch/runtime/observable_ranges.h>
#include <rangewatch/runtime/observers/change_trace.h>
#include <rangewatch/runtime/range_monitor.h>
#include <rangewatch/runtime/viewport_query_evaluator.h>

#include <fmt/format.h>

namespace nb = nanobind;
using namespace nb::literals;

void export_runtime(nb::module_ &m) {
    using namespace rangewatch;

    nb::class_<QueryResult>(m, "QueryResult").def_ro("matches", &QueryResult::matches);

    nb::class_<QueryEvaluator>(m, "QueryEvaluator")
            .def("evaluate", &QueryEvaluator::evaluate, "query"_a);

    nb::class_<QueryEvaluatorBase, QueryEvaluator>(m, "QueryEvaluatorBase")
            .def("listener_count", &QueryEvaluatorBase::listener_count, "query"_a)
            .def("has_listeners", &QueryEvaluatorBase::has_listeners, "query"_a)
            .def_prop_ro("subscribed_queries", &QueryEvaluatorBase::subscribed_queries);

    nb::class_<MockQueryEvaluator, QueryEvaluatorBase>(m, "MockQueryEvaluator")
            .def(nb::init<>())
            .def(nb::init<const BreakPointRegistry &>(), "registry"_a, nb::keep_alive<1, 2>())
            .def("activate", &MockQueryEvaluator::activate, "alias_or_query"_a, "exclusive"_a = true)
            .def("deactivate", &MockQueryEvaluator::deactivate, "alias_or_query"_a)
            .def("clear_all", &MockQueryEvaluator::clear_all)
            .def_prop_ro("active_queries", &MockQueryEvaluator::active_queries);

    nb::class_<Viewport>(m, "Viewport")
            .def(nb::init<>())
            .def("__init__", [](Viewport *self, int width, int height, std::string media_type) {
                new(self) Viewport{width, height, std::move(media_type)};
            }, "width"_a, "height"_a, "media_type"_a = "screen")
            .def_rw("width", &Viewport::width)
            .def_rw("height", &Viewport::height)
            .def_rw("media_type", &Viewport::media_type)
            .def_prop_ro("is_portrait", &Viewport::is_portrait);

    nb::class_<ViewportQueryEvaluator, QueryEvaluatorBase>(m, "ViewportQueryEvaluator")
            .def(nb::init<Viewport>(), "viewport"_a = Viewport{})
            .def_prop_ro("viewport", &ViewportQueryEvaluator::viewport)
            .def("resize", &ViewportQueryEvaluator::resize, "width"_a, "height"_a)
            .def("set_media_type", &ViewportQueryEvaluator::set_media_type, "media_type"_a)
            .def("set_viewport", &ViewportQueryEvaluator::set_viewport, "viewport"_a);

    nb::class_<MatchQuery>(m, "MatchQuery")
            .def(nb::init<QueryEvaluator &>(), "evaluator"_a, nb::keep_alive<1, 2>())
            .def("is_active", &MatchQuery::is_active, "query"_a)
            .def("register_query", &MatchQuery::register_query, "query"_a, "callback"_a)
            .def("unregister_query", &MatchQuery::unregister_query, "query"_a, "listener_id"_a)
            .def("is_registered", &MatchQuery::is_registered, "query"_a)
            .def("listener_count", &MatchQuery::listener_count, "query"_a)
            .def_prop_ro("registered_queries", &MatchQuery::registered_queries);

    nb::enum_<ScheduleMode>(m, "ScheduleMode")
            .value("IMMEDIATE", ScheduleMode::IMMEDIATE)
            .value("DEFERRED", ScheduleMode::DEFERRED);

    nb::class_<FlushScheduler>(m, "FlushScheduler")
            .def_prop_ro("mode", &FlushScheduler::mode);

    nb::class_<ImmediateScheduler, FlushScheduler>(m, "ImmediateScheduler").def(nb::init<>());

    nb::class_<DeferredScheduler, FlushScheduler>(m, "DeferredScheduler")
            .def(nb::init<>())
            .def("run_pending", &DeferredScheduler::run_pending)
            .def_prop_ro("pending", &DeferredScheduler::pending)
            .def("__bool__", [](const DeferredScheduler &self) { return static_cast<bool>(self); });

    nb::class_<Subscription>(m, "Subscription")
            .def("unsubscribe", &Subscription::unsubscribe)
            .def_prop_ro("is_active", &Subscription::is_active);

    nb::class_<ChangeStream>(m, "ChangeStream")
            .def("filter", &ChangeStream::filter, "predicate"_a)
            .def("map", &ChangeStream::map, "mapper"_a)
            .def("subscribe", &ChangeStream::subscribe, "callback"_a);

    nb::class_<ChangeObserver>(m, "ChangeObserver");

    nb::class_<ChangeTrace, ChangeObserver>(m, "ChangeTrace")
            .def(nb::init<const std::optional<std::string> &, bool, bool, bool>(), "filter"_a = nb::none(),
                 "raw"_a = true, "flush"_a = true, "emit"_a = true)
            .def_static("set_use_logger", &ChangeTrace::set_use_logger, "value"_a);

    nb::class_<RangeMonitor>(m, "RangeMonitor")
            .def(nb::init<const BreakPointRegistry &, MatchQuery &, FlushScheduler &>(), "breakpoints"_a,
                 "match_query"_a, "scheduler"_a, nb::keep_alive<1, 2>(), nb::keep_alive<1, 3>(),
                 nb::keep_alive<1, 4>())
            .def_prop_ro("breakpoints", &RangeMonitor::breakpoints)
            .def("is_active", &RangeMonitor::is_active, "alias_or_query"_a)
            .def_prop_ro("active", &RangeMonitor::active, nb::rv_policy::reference_internal)
            .def_prop_ro("active_overlaps", &RangeMonitor::active_overlaps)
            .def("observe", [](RangeMonitor &self, const std::optional<std::string> &alias_or_query) {
                return alias_or_query ? self.observe(*alias_or_query) : self.observe();
            }, "alias_or_query"_a = nb::none())
            .def("subscribe", &RangeMonitor::subscribe, "callback"_a)
            .def("add_observer", &RangeMonitor::add_observer, "observer"_a, nb::keep_alive<1, 2>())
            .def("remove_observer", &RangeMonitor::remove_observer, "observer"_a)
            .def("__repr__", [](const RangeMonitor &self) {
                return fmt::format("RangeMonitor@{:p}[breakpoints={}]", static_cast<const void *>(&self),
                                   self.breakpoints().size());
            });

    nb::class_<ObservableRanges>(m, "ObservableRanges")
            .def("is_active", &ObservableRanges::is_active, "alias_or_query"_a)
            .def("as_observable", &ObservableRanges::as_observable)
            .def("subscribe", &ObservableRanges::subscribe, "next"_a);

    nb::class_<RangeService, ObservableRanges>(m, "RangeService")
            .def(nb::init<RangeMonitor &>(), "monitor"_a, nb::keep_alive<1, 2>());
}
