#include <catch2/catch_test_macros.hpp>

#include <rangewatch/runtime/flush_scheduler.h>

#include <stdexcept>
#include <vector>

using namespace rangewatch;

TEST_CASE("ImmediateScheduler runs the task before schedule returns", "[scheduler]") {
    ImmediateScheduler scheduler;
    int runs{0};
    scheduler.schedule([&runs] { ++runs; });
    CHECK(runs == 1);
    CHECK(scheduler.mode() == ScheduleMode::IMMEDIATE);

    // An empty task is ignored
    scheduler.schedule({});
    CHECK(runs == 1);
}

TEST_CASE("DeferredScheduler holds tasks until run_pending", "[scheduler]") {
    DeferredScheduler scheduler;
    std::vector<int> order;

    scheduler.schedule([&order] { order.push_back(1); });
    scheduler.schedule([&order] { order.push_back(2); });

    CHECK(order.empty());
    CHECK(scheduler.pending() == 2);
    CHECK(static_cast<bool>(scheduler));

    CHECK(scheduler.run_pending() == 2);
    CHECK(order == std::vector<int>{1, 2});
    CHECK(scheduler.pending() == 0);
    CHECK_FALSE(static_cast<bool>(scheduler));
    CHECK(scheduler.mode() == ScheduleMode::DEFERRED);
}

TEST_CASE("DeferredScheduler leaves tasks scheduled during a turn for the next turn", "[scheduler]") {
    DeferredScheduler scheduler;
    std::vector<int> order;

    scheduler.schedule([&] {
        order.push_back(1);
        scheduler.schedule([&order] { order.push_back(2); });
    });

    CHECK(scheduler.run_pending() == 1);
    CHECK(order == std::vector<int>{1});
    CHECK(scheduler.pending() == 1);

    CHECK(scheduler.run_pending() == 1);
    CHECK(order == std::vector<int>{1, 2});
    CHECK(scheduler.run_pending() == 0);
}

TEST_CASE("DeferredScheduler keeps the rest of a turn when a task throws", "[scheduler][errors]") {
    DeferredScheduler scheduler;
    std::vector<int> order;

    scheduler.schedule([&order] { order.push_back(1); });
    scheduler.schedule([] { throw std::runtime_error("boom"); });
    scheduler.schedule([&order] { order.push_back(3); });

    CHECK_THROWS_AS(scheduler.run_pending(), std::runtime_error);
    CHECK(order == std::vector<int>{1});
    REQUIRE(scheduler.pending() == 1);

    scheduler.run_pending();
    CHECK(order == std::vector<int>{1, 3});
}

TEST_CASE("make_scheduler builds the requested mode", "[scheduler]") {
    auto immediate = make_scheduler(ScheduleMode::IMMEDIATE);
    auto deferred = make_scheduler(ScheduleMode::DEFERRED);
    REQUIRE(immediate != nullptr);
    REQUIRE(deferred != nullptr);
    CHECK(immediate->mode() == ScheduleMode::IMMEDIATE);
    CHECK(deferred->mode() == ScheduleMode::DEFERRED);
    CHECK(dynamic_cast<DeferredScheduler *>(deferred.get()) != nullptr);
}
