#include <catch2/catch_test_macros.hpp>

#include <rangewatch/runtime/mock_query_evaluator.h>
#include <rangewatch/runtime/observable_ranges.h>
#include <rangewatch/runtime/range_monitor.h>

#include <string>
#include <vector>

using namespace rangewatch;

namespace {

struct ServiceFixture {
    BreakPointRegistry registry{{{"xs", "Q0"}, {"sm", "Q1"}, {"gt-sm", "Q2", "", true}}};
    MockQueryEvaluator evaluator{registry};
    MatchQuery adapter{evaluator};
    ImmediateScheduler scheduler;
    RangeMonitor monitor{registry, adapter, scheduler};
    RangeService service{monitor};
};

std::vector<std::string> aliases(const std::vector<ChangeEvent> &events) {
    std::vector<std::string> result;
    for (const auto &event : events) { result.push_back(event.alias); }
    return result;
}

}  // namespace

TEST_CASE("RangeService delivers activations only, in order", "[observable_ranges]") {
    ServiceFixture f;
    std::vector<ChangeEvent> events;
    auto subscription = f.service.subscribe([&events](const ChangeEvent &e) { events.push_back(e); });

    f.evaluator.activate("xs");
    f.evaluator.activate("sm");
    f.evaluator.activate("gt-sm");
    f.evaluator.clear_all();

    CHECK(aliases(events) == std::vector<std::string>{"xs", "sm", "gt-sm"});
    for (const auto &event : events) { CHECK(event.matches); }
}

TEST_CASE("RangeService as_observable composes with further filters", "[observable_ranges]") {
    ServiceFixture f;
    std::vector<ChangeEvent> events;
    auto subscription = f.service.as_observable()
                            .filter([](const ChangeEvent &e) { return e.alias == "gt-sm"; })
                            .subscribe([&events](const ChangeEvent &e) { events.push_back(e); });

    f.evaluator.activate("sm");
    f.evaluator.activate("gt-sm");
    f.evaluator.activate("sm");

    REQUIRE(events.size() == 1);
    CHECK(events[0] == ChangeEvent{"Q2", true, "gt-sm", "GtSm"});
}

TEST_CASE("RangeService is_active delegates to the monitor", "[observable_ranges]") {
    ServiceFixture f;
    ObservableRanges &ranges = f.service;

    CHECK_FALSE(ranges.is_active("sm"));
    f.evaluator.activate("sm");
    CHECK(ranges.is_active("sm"));
    CHECK(ranges.is_active("Q1"));
    CHECK_FALSE(ranges.is_active("xs"));
}

TEST_CASE("RangeService subscription stops after unsubscribe", "[observable_ranges]") {
    ServiceFixture f;
    int received{0};
    auto subscription = f.service.subscribe([&received](const ChangeEvent &) { ++received; });

    f.evaluator.activate("xs");
    subscription.unsubscribe();
    f.evaluator.activate("sm");

    CHECK(received == 1);
}
