#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <rangewatch/runtime/mock_query_evaluator.h>
#include <rangewatch/runtime/observers/change_trace.h>
#include <rangewatch/runtime/range_monitor.h>

#include <optional>
#include <sstream>
#include <string>

using namespace rangewatch;
using Catch::Matchers::ContainsSubstring;

namespace {

struct TraceFixture {
    BreakPointRegistry registry{{{"sm", "Q1"}, {"gt-sm", "Q2", "", true}}};
    MockQueryEvaluator evaluator{registry};
    MatchQuery adapter{evaluator};
    DeferredScheduler scheduler;
    RangeMonitor monitor{registry, adapter, scheduler};
    std::ostringstream out;
};

}  // namespace

TEST_CASE("ChangeTrace logs raw transitions, flushes and emitted events", "[change_trace][observer]") {
    TraceFixture f;
    ChangeTrace trace{std::nullopt, true, true, true, &f.out};
    f.monitor.add_observer(&trace);

    f.evaluator.activate("Q1", false);
    f.evaluator.activate("Q2", false);
    f.scheduler.run_pending();

    auto text = f.out.str();
    CHECK_THAT(text, ContainsSubstring("[rangewatch] raw ChangeEvent[activate query='Q1']"));
    CHECK_THAT(text, ContainsSubstring("[rangewatch] raw ChangeEvent[activate query='Q2']"));
    CHECK_THAT(text, ContainsSubstring("[rangewatch] flush begin: 0 deactivation(s), 2 activation(s) queued"));
    CHECK_THAT(text, ContainsSubstring("[rangewatch] emit ChangeEvent[activate sm(Sm) query='Q1']"));
    CHECK_THAT(text, ContainsSubstring("[rangewatch] flush end: 1 emitted"));
    CHECK_FALSE(text.find("emit ChangeEvent[activate gt-sm") != std::string::npos);
}

TEST_CASE("ChangeTrace filter limits event lines to matching queries or aliases", "[change_trace][observer]") {
    TraceFixture f;
    ChangeTrace trace{std::string{"gt-sm"}, true, false, true, &f.out};
    f.monitor.add_observer(&trace);

    f.evaluator.activate("sm");
    f.scheduler.run_pending();
    f.evaluator.activate("gt-sm");
    f.scheduler.run_pending();

    auto text = f.out.str();
    // Raw events carry no alias yet, so they are filtered out by query text
    CHECK(text.find("raw") == std::string::npos);
    CHECK(text.find("flush") == std::string::npos);
    CHECK(text.find("sm(Sm)") == std::string::npos);
    CHECK_THAT(text, ContainsSubstring("emit ChangeEvent[activate gt-sm(GtSm) query='Q2']"));
}

TEST_CASE("ChangeTrace with everything disabled writes nothing", "[change_trace][observer]") {
    TraceFixture f;
    ChangeTrace trace{std::nullopt, false, false, false, &f.out};
    f.monitor.add_observer(&trace);

    f.evaluator.activate("sm");
    f.scheduler.run_pending();

    CHECK(f.out.str().empty());
}
