/**
 * @file placement_scheduler_test.cpp
 * @brief Unit tests for greedy work item placement
 */

#include <studyplan/scheduling/free_slot_generator.hpp>
#include <studyplan/scheduling/placement_scheduler.hpp>

#include "support/time_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace studyplan::core;
using namespace studyplan::scheduling;
using namespace studyplan::test;
using namespace std::chrono_literals;

namespace {

auto make_request(std::size_t position,
                  std::optional<double> hours,
                  std::optional<time_point> preferred = std::nullopt) -> work_item_request {
    work_item_request request;
    request.title = "Item " + std::to_string(position);
    request.estimated_hours = hours;
    request.preferred_start = preferred;
    request.position = position;
    return request;
}

auto three_weeks() -> std::vector<free_slot> {
    free_slot_generator generator{scheduler_config{}, local_zone::utc()};
    return generator.generate({}, default_now());
}

}  // namespace

// =============================================================================
// Basic Placement
// =============================================================================

TEST_CASE("placement_scheduler: trivial inputs", "[scheduling][placement]") {
    placement_scheduler scheduler{scheduler_config{}, local_zone::utc()};

    SECTION("no requests yields an empty result") {
        auto result = scheduler.schedule({}, three_weeks(), plan_context{}, default_now());
        CHECK(result.scheduled.empty());
        CHECK(result.unscheduled.empty());
        CHECK(result.all_scheduled());
    }

    SECTION("no free slots leaves every request unscheduled in order") {
        std::vector<work_item_request> requests{make_request(0, 1.0), make_request(1, 2.0)};

        auto result = scheduler.schedule(requests, {}, plan_context{}, default_now());

        CHECK(result.scheduled.empty());
        REQUIRE(result.unscheduled.size() == 2);
        CHECK(result.unscheduled[0].position == 0);
        CHECK(result.unscheduled[1].position == 1);
        CHECK_FALSE(result.all_scheduled());
    }
}

TEST_CASE("placement_scheduler: single day", "[scheduling][placement]") {
    placement_scheduler scheduler{scheduler_config{}, local_zone::utc()};
    const auto monday = oct(19, 9);

    SECTION("hinted item lands at its hint") {
        auto result = scheduler.schedule({make_request(0, 2.0, monday)},
                                         {oct_range(19, 9, 0, 21, 0)},
                                         plan_context{}, default_now());

        REQUIRE(result.scheduled.size() == 1);
        CHECK(result.scheduled[0].interval == oct_range(19, 9, 0, 11, 0));
        CHECK(result.all_scheduled());
    }

    SECTION("three items separated by the buffer") {
        std::vector<work_item_request> requests{make_request(0, 2.0, monday),
                                                make_request(1, 2.0, monday),
                                                make_request(2, 2.0, monday)};

        auto result = scheduler.schedule(requests, {oct_range(19, 9, 0, 21, 0)},
                                         plan_context{}, default_now());

        REQUIRE(result.scheduled.size() == 3);
        CHECK(result.scheduled[0].interval == oct_range(19, 9, 0, 11, 0));
        CHECK(result.scheduled[1].interval == oct_range(19, 11, 30, 13, 30));
        CHECK(result.scheduled[2].interval == oct_range(19, 14, 0, 16, 0));
    }

    SECTION("item longer than every slot is unscheduled") {
        auto result = scheduler.schedule({make_request(0, 6.0)},
                                         {oct_range(19, 9, 0, 14, 0)},
                                         plan_context{}, default_now());

        CHECK(result.scheduled.empty());
        REQUIRE(result.unscheduled.size() == 1);
        CHECK(result.unscheduled[0].title == "Item 0");
    }

    SECTION("failed items keep their order and do not block later ones") {
        std::vector<work_item_request> requests{make_request(0, 6.0), make_request(1, 2.0),
                                                make_request(2, 6.0), make_request(3, 2.0)};

        auto result = scheduler.schedule(requests, {oct_range(19, 9, 0, 14, 0)},
                                         plan_context{}, default_now());

        REQUIRE(result.scheduled.size() == 2);
        CHECK(result.scheduled[0].position == 1);
        CHECK(result.scheduled[0].interval == oct_range(19, 9, 0, 11, 0));
        CHECK(result.scheduled[1].position == 3);
        CHECK(result.scheduled[1].interval == oct_range(19, 11, 30, 13, 30));

        REQUIRE(result.unscheduled.size() == 2);
        CHECK(result.unscheduled[0].position == 0);
        CHECK(result.unscheduled[1].position == 2);
    }
}

// =============================================================================
// Ranking
// =============================================================================

TEST_CASE("placement_scheduler: candidate ranking", "[scheduling][placement]") {
    placement_scheduler scheduler{scheduler_config{}, local_zone::utc()};

    SECTION("lighter days win over closer slots") {
        std::vector<work_item_request> requests{make_request(0, 2.0, oct(19, 9)),
                                                make_request(1, 2.0, oct(19, 9))};

        auto result = scheduler.schedule(requests, three_weeks(), plan_context{},
                                         default_now());

        REQUIRE(result.scheduled.size() == 2);
        CHECK(result.scheduled[0].interval == oct_range(19, 9, 0, 11, 0));
        CHECK(result.scheduled[1].interval == oct_range(20, 9, 0, 11, 0));
    }

    SECTION("slots at or after the target beat earlier ones") {
        auto result = scheduler.schedule(
            {make_request(0, 1.0, oct(19, 13))},
            {oct_range(19, 9, 0, 12, 0), oct_range(19, 14, 0, 21, 0)},
            plan_context{}, default_now());

        REQUIRE(result.scheduled.size() == 1);
        CHECK(result.scheduled[0].interval == oct_range(19, 14, 0, 15, 0));
    }

    SECTION("closest slot after the target wins") {
        auto result = scheduler.schedule(
            {make_request(0, 1.0, oct(19, 9))},
            {oct_range(22, 9, 0, 21, 0), oct_range(20, 9, 0, 21, 0)},
            plan_context{}, default_now());

        REQUIRE(result.scheduled.size() == 1);
        CHECK(result.scheduled[0].interval == oct_range(20, 9, 0, 10, 0));
    }

    SECTION("earlier slot is used when nothing follows the target") {
        auto result = scheduler.schedule(
            {make_request(0, 1.0, oct(25, 9))},
            {oct_range(19, 9, 0, 21, 0), oct_range(20, 9, 0, 21, 0)},
            plan_context{}, default_now());

        REQUIRE(result.scheduled.size() == 1);
        CHECK(result.scheduled[0].interval == oct_range(20, 9, 0, 10, 0));
    }

    SECTION("rank_candidates orders by after-flag then load then distance") {
        slot_queue queue{{oct_range(19, 9, 0, 21, 0), oct_range(20, 9, 0, 21, 0),
                          oct_range(21, 9, 0, 21, 0)}};
        std::vector<scheduled_assignment> placed{
            scheduled_assignment{"a", oct_range(20, 9, 0, 10, 0), {}, {}, 0}};

        auto order = scheduler.rank_candidates(queue, placed, oct(20, 8));

        REQUIRE(order.size() == 3);
        CHECK(order[0] == 2);
        CHECK(order[1] == 1);
        CHECK(order[2] == 0);
    }
}

// =============================================================================
// Target Times
// =============================================================================

TEST_CASE("placement_scheduler: target times", "[scheduling][placement]") {
    placement_scheduler scheduler{scheduler_config{}, local_zone::utc()};
    const auto now = default_now();

    SECTION("preferred start wins") {
        auto request = make_request(2, 1.0, oct(25, 10));
        CHECK(scheduler.target_time(request, 3, oct(23, 8), now) == oct(25, 10));
    }

    SECTION("items spread evenly up to the deadline") {
        CHECK(scheduler.target_time(make_request(0, 1.0), 3, oct(23, 8), now) == now);
        CHECK(scheduler.target_time(make_request(1, 1.0), 3, oct(23, 8), now) == oct(21, 8));
        CHECK(scheduler.target_time(make_request(2, 1.0), 3, oct(23, 8), now) == oct(23, 8));
    }

    SECTION("short deadline spreads over one day") {
        CHECK(scheduler.target_time(make_request(1, 1.0), 2, oct(19, 12), now) == oct(20, 8));
    }

    SECTION("past deadline spreads over one day") {
        CHECK(scheduler.target_time(make_request(1, 1.0), 2, oct(10, 12), now) == oct(20, 8));
    }

    SECTION("single item with a deadline targets now") {
        CHECK(scheduler.target_time(make_request(0, 1.0), 1, oct(23, 8), now) == now);
    }

    SECTION("without a deadline one item per day") {
        CHECK(scheduler.target_time(make_request(0, 1.0), 3, std::nullopt, now) == now);
        CHECK(scheduler.target_time(make_request(4, 1.0), 5, std::nullopt, now) == oct(23, 8));
    }
}

TEST_CASE("placement_scheduler: deadline spreading", "[scheduling][placement]") {
    placement_scheduler scheduler{scheduler_config{}, local_zone::utc()};

    SECTION("items spread across the days before the deadline") {
        plan_context context;
        context.deadline = oct(23, 8);
        std::vector<work_item_request> requests{make_request(0, 1.0), make_request(1, 1.0),
                                                make_request(2, 1.0)};

        auto result = scheduler.schedule(requests, three_weeks(), context, default_now());

        REQUIRE(result.scheduled.size() == 3);
        CHECK(result.scheduled[0].interval == oct_range(19, 9, 0, 10, 0));
        CHECK(result.scheduled[1].interval == oct_range(21, 9, 0, 10, 0));
        CHECK(result.scheduled[2].interval == oct_range(23, 9, 0, 10, 0));
    }

    SECTION("short deadline still moves the second item to tomorrow") {
        plan_context context;
        context.deadline = oct(19, 12);
        std::vector<work_item_request> requests{make_request(0, 1.0), make_request(1, 1.0)};

        auto result = scheduler.schedule(requests, three_weeks(), context, default_now());

        REQUIRE(result.scheduled.size() == 2);
        CHECK(result.scheduled[0].interval == oct_range(19, 9, 0, 10, 0));
        CHECK(result.scheduled[1].interval == oct_range(20, 9, 0, 10, 0));
    }

    SECTION("without a deadline items go one per day") {
        std::vector<work_item_request> requests{make_request(0, 1.0), make_request(1, 1.0),
                                                make_request(2, 1.0)};

        auto result = scheduler.schedule(requests, three_weeks(), plan_context{},
                                         default_now());

        REQUIRE(result.scheduled.size() == 3);
        CHECK(result.scheduled[0].interval == oct_range(19, 9, 0, 10, 0));
        CHECK(result.scheduled[1].interval == oct_range(20, 9, 0, 10, 0));
        CHECK(result.scheduled[2].interval == oct_range(21, 9, 0, 10, 0));
    }
}

// =============================================================================
// Overlap Defense
// =============================================================================

TEST_CASE("placement_scheduler: overlapping free slots", "[scheduling][placement]") {
    placement_scheduler scheduler{scheduler_config{}, local_zone::utc()};

    SECTION("duplicate slot cannot double-book") {
        std::vector<work_item_request> requests{make_request(0, 2.0, oct(19, 9)),
                                                make_request(1, 2.0, oct(19, 9))};

        auto result = scheduler.schedule(
            requests, {oct_range(19, 9, 0, 21, 0), oct_range(19, 9, 0, 21, 0)},
            plan_context{}, default_now());

        REQUIRE(result.scheduled.size() == 2);
        CHECK(result.scheduled[0].interval == oct_range(19, 9, 0, 11, 0));
        CHECK(result.scheduled[1].interval == oct_range(19, 11, 30, 13, 30));
    }

    SECTION("item with only conflicting candidates is unscheduled") {
        std::vector<work_item_request> requests{make_request(0, 2.0, oct(19, 9)),
                                                make_request(1, 2.0, oct(19, 9))};

        auto result = scheduler.schedule(
            requests, {oct_range(19, 9, 0, 11, 30), oct_range(19, 9, 0, 11, 30)},
            plan_context{}, default_now());

        REQUIRE(result.scheduled.size() == 1);
        REQUIRE(result.unscheduled.size() == 1);
        CHECK(result.unscheduled[0].position == 1);
    }

    SECTION("conflicts honours the buffer on both sides") {
        std::vector<scheduled_assignment> placed{
            scheduled_assignment{"a", oct_range(19, 11, 0, 12, 0), {}, {}, 0}};

        CHECK(scheduler.conflicts(oct_range(19, 12, 0, 13, 0), placed));
        CHECK(scheduler.conflicts(oct_range(19, 9, 45, 10, 45), placed));
        CHECK_FALSE(scheduler.conflicts(oct_range(19, 12, 30, 13, 0), placed));
        CHECK_FALSE(scheduler.conflicts(oct_range(19, 9, 30, 10, 30), placed));
    }
}

// =============================================================================
// Output Records
// =============================================================================

TEST_CASE("placement_scheduler: durations", "[scheduling][placement]") {
    placement_scheduler scheduler{scheduler_config{}, local_zone::utc()};
    const std::vector<free_slot> slots{oct_range(19, 9, 0, 21, 0)};

    auto place = [&](std::optional<double> hours) {
        auto result = scheduler.schedule({make_request(0, hours, oct(19, 9))}, slots,
                                         plan_context{}, default_now());
        REQUIRE(result.scheduled.size() == 1);
        return result.scheduled[0].interval;
    };

    CHECK(place(10.0) == oct_range(19, 9, 0, 15, 0));
    CHECK(place(0.1) == oct_range(19, 9, 0, 9, 30));
    CHECK(place(std::nullopt) == oct_range(19, 9, 0, 11, 0));
    CHECK(place(std::numeric_limits<double>::quiet_NaN()) == oct_range(19, 9, 0, 11, 0));
}

TEST_CASE("placement_scheduler: assignment fields", "[scheduling][placement]") {
    placement_scheduler scheduler{scheduler_config{}, local_zone::utc()};

    plan_context context;
    context.parent_title = "Essay";
    context.category = "HIST101";

    auto request = make_request(0, 1.0, oct(19, 9));
    request.title = "Outline";
    request.focus = "Library";

    auto untitled = make_request(1, 1.0, oct(20, 9));
    untitled.title.clear();

    auto result = scheduler.schedule({request, untitled}, three_weeks(), context,
                                     default_now());

    REQUIRE(result.scheduled.size() == 2);
    CHECK(result.scheduled[0].title == "Essay: Outline");
    CHECK(result.scheduled[0].focus == std::optional<std::string>{"Library"});
    CHECK(result.scheduled[0].category == std::optional<std::string>{"HIST101"});
    CHECK(result.scheduled[0].position == 0);
    CHECK(result.scheduled[1].title == "Essay: Subtask");
    CHECK_FALSE(result.scheduled[1].focus.has_value());
}

TEST_CASE("placement_scheduler: invariants", "[scheduling][placement]") {
    placement_scheduler scheduler{scheduler_config{}, local_zone::utc()};
    free_slot_generator generator{scheduler_config{}, local_zone::utc()};

    std::vector<busy_interval> busy{oct_range(19, 10, 0, 11, 0), oct_range(20, 13, 0, 17, 0),
                                    oct_range(21, 9, 0, 19, 0)};
    auto slots = generator.generate(busy, default_now());

    std::vector<work_item_request> requests;
    for (std::size_t i = 0; i < 12; ++i) {
        requests.push_back(make_request(i, 0.5 + static_cast<double>(i % 5)));
    }
    plan_context context;
    context.deadline = oct(24, 23, 59);

    auto result = scheduler.schedule(requests, slots, context, default_now());

    SECTION("every request is accounted for exactly once") {
        CHECK(result.scheduled.size() + result.unscheduled.size() == requests.size());
    }

    SECTION("placements are separated by the buffer") {
        for (std::size_t i = 0; i < result.scheduled.size(); ++i) {
            for (std::size_t j = i + 1; j < result.scheduled.size(); ++j) {
                const auto& a = result.scheduled[i].interval;
                const auto& b = result.scheduled[j].interval;
                CHECK((a.end + 30min <= b.start || b.end + 30min <= a.start));
            }
        }
    }

    SECTION("placements avoid busy time and stay in working hours") {
        for (const auto& assignment : result.scheduled) {
            for (const auto& interval : busy) {
                CHECK_FALSE(assignment.interval.overlaps(interval));
            }
            const auto day = std::chrono::floor<std::chrono::days>(assignment.interval.start);
            CHECK(assignment.interval.start >= day + 9h);
            CHECK(assignment.interval.end <= day + 21h);
        }
    }

    SECTION("output preserves request order") {
        for (std::size_t i = 1; i < result.scheduled.size(); ++i) {
            CHECK(result.scheduled[i - 1].position < result.scheduled[i].position);
        }
    }

    SECTION("same inputs give the same result") {
        auto again = scheduler.schedule(requests, slots, context, default_now());
        REQUIRE(again.scheduled.size() == result.scheduled.size());
        for (std::size_t i = 0; i < again.scheduled.size(); ++i) {
            CHECK(again.scheduled[i].interval == result.scheduled[i].interval);
        }
    }
}
