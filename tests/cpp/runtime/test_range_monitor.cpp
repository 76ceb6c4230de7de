#include <catch2/catch_test_macros.hpp>

#include <rangewatch/runtime/mock_query_evaluator.h>
#include <rangewatch/runtime/range_monitor.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace rangewatch;

namespace {

struct Recorder {
    std::vector<ChangeEvent> events;

    ChangeCallback callback() {
        return [this](const ChangeEvent &event) { events.push_back(event); };
    }
};

BreakPointRegistry small_registry() {
    return BreakPointRegistry{{{"sm", "Q1"}, {"gt-sm", "Q2", "", true}}};
}

template<typename Scheduler>
struct MonitorFixture {
    explicit MonitorFixture(BreakPointRegistry r = small_registry()) : registry{std::move(r)} {}

    BreakPointRegistry registry;
    MockQueryEvaluator evaluator{registry};
    MatchQuery adapter{evaluator};
    Scheduler scheduler;
    RangeMonitor monitor{registry, adapter, scheduler};
};

struct CountingObserver : ChangeObserver {
    void on_raw_change(const ChangeEvent &) override { ++raw; }
    void on_emit(const ChangeEvent &) override { ++emitted; }

    int raw{0};
    int emitted{0};
};

}  // namespace

// ============================================================================
// Coalescing through the monitor
// ============================================================================

TEST_CASE("RangeMonitor announces only the highest priority range of a burst", "[range_monitor]") {
    MonitorFixture<DeferredScheduler> f;
    Recorder recorder;
    auto subscription = f.monitor.subscribe(recorder.callback());

    f.evaluator.activate("Q1", false);
    f.evaluator.activate("Q2", false);
    CHECK(recorder.events.empty());
    f.scheduler.run_pending();

    REQUIRE(recorder.events.size() == 1);
    CHECK(recorder.events[0] == ChangeEvent{"Q1", true, "sm", "Sm"});
}

TEST_CASE("RangeMonitor announces the deactivation before the next activation", "[range_monitor]") {
    MonitorFixture<DeferredScheduler> f;
    Recorder recorder;

    f.evaluator.activate("Q1", false);
    f.scheduler.run_pending();

    auto subscription = f.monitor.subscribe(recorder.callback());
    f.evaluator.deactivate("Q1");
    f.evaluator.activate("Q2", false);
    f.scheduler.run_pending();

    REQUIRE(recorder.events.size() == 2);
    CHECK(recorder.events[0] == ChangeEvent{"Q1", false, "sm", "Sm"});
    CHECK(recorder.events[1] == ChangeEvent{"Q2", true, "gt-sm", "GtSm"});
}

TEST_CASE("RangeMonitor with an immediate scheduler follows every transition", "[range_monitor]") {
    MonitorFixture<ImmediateScheduler> f;
    Recorder recorder;
    auto subscription = f.monitor.subscribe(recorder.callback());

    f.evaluator.activate("sm");
    f.evaluator.activate("gt-sm");

    REQUIRE(recorder.events.size() == 3);
    CHECK(recorder.events[0] == ChangeEvent{"Q1", true, "sm", "Sm"});
    CHECK(recorder.events[1] == ChangeEvent{"Q1", false, "sm", "Sm"});
    CHECK(recorder.events[2] == ChangeEvent{"Q2", true, "gt-sm", "GtSm"});
}

TEST_CASE("RangeMonitor registers a query shared by several aliases once", "[range_monitor]") {
    MonitorFixture<ImmediateScheduler> f{
        BreakPointRegistry{{{"tablet", "Q-tablet"}, {"tablet.landscape", "Q-tablet"}, {"web", "Q-web"}}}};
    Recorder recorder;
    auto subscription = f.monitor.subscribe(recorder.callback());

    CHECK(f.adapter.listener_count("Q-tablet") == 1);
    f.evaluator.activate("Q-tablet");

    REQUIRE(recorder.events.size() == 1);
    CHECK(recorder.events[0].alias == "tablet");
    CHECK(recorder.events[0].suffix == "Tablet");
}

TEST_CASE("RangeMonitor created while a range is active announces it in the first flush", "[range_monitor]") {
    auto registry = small_registry();
    MockQueryEvaluator evaluator{registry};
    MatchQuery adapter{evaluator};
    DeferredScheduler scheduler;
    evaluator.activate("sm");

    RangeMonitor monitor{registry, adapter, scheduler};
    Recorder recorder;
    auto subscription = monitor.subscribe(recorder.callback());
    scheduler.run_pending();

    REQUIRE(recorder.events.size() == 1);
    CHECK(recorder.events[0] == ChangeEvent{"Q1", true, "sm", "Sm"});
}

// ============================================================================
// Current state
// ============================================================================

TEST_CASE("RangeMonitor active prefers non-overlapping ranges", "[range_monitor]") {
    MonitorFixture<DeferredScheduler> f;
    CHECK(f.monitor.active() == nullptr);
    CHECK(f.monitor.active_overlaps().empty());

    f.evaluator.activate("Q2", false);
    REQUIRE(f.monitor.active() != nullptr);
    CHECK(f.monitor.active()->alias == "gt-sm");

    f.evaluator.activate("Q1", false);
    CHECK(f.monitor.active()->alias == "sm");

    auto overlaps = f.monitor.active_overlaps();
    REQUIRE(overlaps.size() == 1);
    CHECK(overlaps[0].alias == "gt-sm");
}

TEST_CASE("RangeMonitor active falls back to the lowest priority overlapping range", "[range_monitor]") {
    MonitorFixture<DeferredScheduler> f{BreakPointRegistry{
        {{"gt-xs", "Q-gt-xs", "", true}, {"sm", "Q-sm"}, {"gt-sm", "Q-gt-sm", "", true}}}};

    f.evaluator.activate("gt-xs", false);
    f.evaluator.activate("gt-sm", false);

    REQUIRE(f.monitor.active() != nullptr);
    CHECK(f.monitor.active()->alias == "gt-sm");

    auto overlaps = f.monitor.active_overlaps();
    REQUIRE(overlaps.size() == 2);
    CHECK(overlaps[0].alias == "gt-xs");
    CHECK(overlaps[1].alias == "gt-sm");
}

TEST_CASE("RangeMonitor is_active resolves aliases and literal queries", "[range_monitor]") {
    MonitorFixture<DeferredScheduler> f;
    f.evaluator.activate("Q1");

    CHECK(f.monitor.is_active("sm"));
    CHECK(f.monitor.is_active("Q1"));
    CHECK_FALSE(f.monitor.is_active("gt-sm"));
    CHECK_FALSE(f.monitor.is_active("unknown"));
    CHECK_FALSE(f.monitor.is_active(""));

    CHECK(f.monitor.breakpoints().size() == 2);
    CHECK(&f.monitor.registry() == &f.registry);
}

// ============================================================================
// observe
// ============================================================================

TEST_CASE("RangeMonitor observe by alias filters to that range", "[range_monitor]") {
    MonitorFixture<ImmediateScheduler> f;
    Recorder all, sm_only, by_query;

    auto s1 = f.monitor.observe().subscribe(all.callback());
    auto s2 = f.monitor.observe("sm").subscribe(sm_only.callback());
    auto s3 = f.monitor.observe("Q2").subscribe(by_query.callback());

    f.evaluator.activate("sm");
    f.evaluator.activate("gt-sm");

    CHECK(all.events.size() == 3);
    REQUIRE(sm_only.events.size() == 2);
    CHECK(sm_only.events[0].matches);
    CHECK_FALSE(sm_only.events[1].matches);
    REQUIRE(by_query.events.size() == 1);
    CHECK(by_query.events[0].alias == "gt-sm");

    // An empty name observes everything
    Recorder empty_name;
    auto s4 = f.monitor.observe("").subscribe(empty_name.callback());
    f.evaluator.activate("sm");
    CHECK(empty_name.events.size() == 2);
}

TEST_CASE("RangeMonitor observe registers an ad-hoc query on first subscription", "[range_monitor]") {
    MonitorFixture<DeferredScheduler> f;
    f.evaluator.activate("print", false);

    auto stream = f.monitor.observe("print");
    CHECK_FALSE(f.adapter.is_registered("print"));

    Recorder recorder;
    auto subscription = stream.subscribe(recorder.callback());
    CHECK(f.adapter.is_registered("print"));

    // The current state arrives straight away, without an alias and without waiting for a flush
    REQUIRE(recorder.events.size() == 1);
    CHECK(recorder.events[0] == ChangeEvent{"print", true});

    f.evaluator.deactivate("print");
    REQUIRE(recorder.events.size() == 2);
    CHECK(recorder.events[1] == ChangeEvent{"print", false});
    CHECK(f.scheduler.pending() == 0);

    // A second subscription does not register the query again
    auto again = stream.subscribe([](const ChangeEvent &) {});
    CHECK(f.adapter.listener_count("print") == 1);
}

TEST_CASE("RangeMonitor observe labels events with the alias that was observed", "[range_monitor]") {
    MonitorFixture<ImmediateScheduler> f{
        BreakPointRegistry{{{"tablet", "Q-tablet"}, {"tablet.landscape", "Q-tablet"}, {"web", "Q-web"}}}};
    Recorder all, landscape, tablet;

    auto s1 = f.monitor.subscribe(all.callback());
    auto s2 = f.monitor.observe("tablet.landscape").subscribe(landscape.callback());
    auto s3 = f.monitor.observe("tablet").subscribe(tablet.callback());

    f.evaluator.activate("Q-tablet");

    REQUIRE(landscape.events.size() == 1);
    CHECK(landscape.events[0] == ChangeEvent{"Q-tablet", true, "tablet.landscape", "TabletLandscape"});
    REQUIRE(tablet.events.size() == 1);
    CHECK(tablet.events[0] == ChangeEvent{"Q-tablet", true, "tablet", "Tablet"});
    // The unfiltered stream keeps the highest priority alias
    REQUIRE(all.events.size() == 1);
    CHECK(all.events[0].alias == "tablet");
}

TEST_CASE("RangeMonitor observe gives each new subscriber the current state", "[range_monitor]") {
    MonitorFixture<ImmediateScheduler> f;
    Recorder all;
    auto s1 = f.monitor.subscribe(all.callback());

    f.evaluator.activate("sm");
    REQUIRE(all.events.size() == 1);

    Recorder first, second, inactive;
    auto s2 = f.monitor.observe("sm").subscribe(first.callback());
    auto s3 = f.monitor.observe("Q1").subscribe(second.callback());
    auto s4 = f.monitor.observe("gt-sm").subscribe(inactive.callback());

    REQUIRE(first.events.size() == 1);
    CHECK(first.events[0] == ChangeEvent{"Q1", true, "sm", "Sm"});
    REQUIRE(second.events.size() == 1);
    CHECK(second.events[0] == ChangeEvent{"Q1", true, "sm", "Sm"});
    CHECK(inactive.events.empty());

    // The replay goes to the new subscribers only
    CHECK(all.events.size() == 1);
}

TEST_CASE("RangeMonitor observe replays an active ad-hoc query to later subscribers", "[range_monitor]") {
    MonitorFixture<DeferredScheduler> f;
    f.evaluator.activate("print", false);

    auto stream = f.monitor.observe("print");
    Recorder first, second;
    auto s1 = stream.subscribe(first.callback());
    auto s2 = stream.subscribe(second.callback());

    REQUIRE(first.events.size() == 1);
    REQUIRE(second.events.size() == 1);
    CHECK(second.events[0] == ChangeEvent{"print", true});
    CHECK(f.adapter.listener_count("print") == 1);
}

TEST_CASE("RangeMonitor ad-hoc stream outliving the monitor is harmless", "[range_monitor]") {
    auto registry = small_registry();
    MockQueryEvaluator evaluator{registry};
    MatchQuery adapter{evaluator};
    ImmediateScheduler scheduler;
    ChangeStream stream;
    {
        RangeMonitor monitor{registry, adapter, scheduler};
        stream = monitor.observe("print");
    }
    auto subscription = stream.subscribe([](const ChangeEvent &) {});
    CHECK_FALSE(subscription.is_active());
    CHECK_FALSE(adapter.is_registered("print"));
}

// ============================================================================
// Lifetime and observers
// ============================================================================

TEST_CASE("Destroying RangeMonitor detaches its adapter listeners", "[range_monitor]") {
    auto registry = small_registry();
    MockQueryEvaluator evaluator{registry};
    MatchQuery adapter{evaluator};
    DeferredScheduler scheduler;
    {
        RangeMonitor monitor{registry, adapter, scheduler};
        auto subscription = monitor.observe("print").subscribe([](const ChangeEvent &) {});
        CHECK(adapter.registered_queries().size() == 3);

        // Leave a flush queued behind the monitor
        evaluator.activate("sm");
    }
    CHECK(adapter.registered_queries().empty());
    CHECK(evaluator.subscribed_queries().empty());
    CHECK(scheduler.run_pending() == 1);
}

TEST_CASE("RangeMonitor reports raw and emitted events to observers", "[range_monitor][observer]") {
    MonitorFixture<DeferredScheduler> f;
    CountingObserver observer;
    f.monitor.add_observer(&observer);

    f.evaluator.activate("Q1", false);
    f.evaluator.activate("Q2", false);
    f.scheduler.run_pending();

    CHECK(observer.raw == 2);
    CHECK(observer.emitted == 1);

    f.monitor.remove_observer(&observer);
    f.evaluator.clear_all();
    f.scheduler.run_pending();
    CHECK(observer.raw == 2);
}
