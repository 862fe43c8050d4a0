#include "engine/Errors.hpp"
#include "engine/HandlerRegistry.hpp"
#include "engine/ScheduleManager.hpp"
#include "engine/TimeConverter.hpp"

#include "TestSupport.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using gt::engine::PartialTimeSpec;
using gt::engine::ScheduleManager;
using gt::engine::Unit;
using gt::test::FakeTimerHost;
using gt::test::ManualGameClock;
using gt::test::MemoryScheduleStore;

namespace
{

constexpr std::int64_t kHour = 3600;
constexpr std::int64_t kDay = 86400;
constexpr std::int64_t kYear = 29030400;

struct Fixture
{
    explicit Fixture(std::int64_t now, double speed = 1.0)
        : units(gt::engine::UnitTable::configure({}, speed)),
          converter(units), clock(now, speed)
    {
        handlers.add("record",
                     [this](std::string const &args) { calls.push_back(args); });
        handlers.add("fail", [](std::string const &)
                     { throw std::runtime_error("handler exploded"); });
    }

    std::unique_ptr<ScheduleManager> make_manager()
    {
        return std::make_unique<ScheduleManager>(converter, clock, timers,
                                                 handlers, &store);
    }

    gt::engine::UnitTable units;
    gt::engine::TimeConverter converter;
    ManualGameClock clock;
    FakeTimerHost timers;
    gt::engine::HandlerRegistry handlers;
    MemoryScheduleStore store;
    std::vector<std::string> calls;
};

} // namespace

TEST_CASE("schedule arms a timer for the next occurrence")
{
    Fixture f(5 * kHour);
    auto manager = f.make_manager();

    auto handle =
        manager->schedule("record", "wake", {{"hour", 2}, {"min", 30}});
    CHECK(handle.delay_seconds == doctest::Approx(77400.0));
    CHECK(handle.fire_at == kDay + 2 * kHour + 30 * 60);
    REQUIRE(f.timers.timers().size() == 1);
    CHECK(f.timers.last().delay_seconds == doctest::Approx(77400.0));

    CHECK(manager->size() == 1);
    CHECK(manager->status_of(handle.id) == ScheduleManager::EntryStatus::Armed);
    CHECK(manager->delay_of(handle.id).value() == doctest::Approx(77400.0));
    auto state = manager->state_of(handle.id);
    REQUIRE(state);
    CHECK(state->handler == "record");
    CHECK(state->args == "wake");
    PartialTimeSpec const expected{{Unit::Hour, 2}, {Unit::Minute, 30}};
    CHECK(state->target == expected);
    CHECK_FALSE(state->repeat);

    // Live entries are checkpointed.
    CHECK(f.store.load(handle.id) == state);
}

TEST_CASE("speed factor shortens the real delay")
{
    Fixture f(kHour, 2.0);
    auto manager = f.make_manager();
    auto handle = manager->schedule("record", "", {{"min", 10}});
    CHECK(handle.delay_seconds == doctest::Approx(300.0));
}

TEST_CASE("rejected schedules leave nothing behind")
{
    Fixture f(0);
    auto manager = f.make_manager();

    CHECK_THROWS_AS(manager->schedule("missing", "", {{"hour", 1}}),
                    gt::engine::UnknownHandlerError);
    CHECK_THROWS_AS(manager->schedule("record", "", {{"fortnight", 1}}),
                    gt::engine::UnknownUnitError);
    CHECK_THROWS_AS(manager->schedule("record", "", {{"hour", -2}}),
                    gt::engine::InvalidTargetError);
    CHECK_THROWS_AS(
        manager->schedule("record", "", {{"year", 400000000000LL}}),
        gt::engine::InvalidTargetError);

    CHECK(manager->size() == 0);
    CHECK(f.timers.timers().empty());
    CHECK(f.store.size() == 0);
}

TEST_CASE("a year that already passed cannot be scheduled")
{
    Fixture f(5 * kYear + kHour);
    auto manager = f.make_manager();

    CHECK_THROWS_AS(
        manager->schedule("record", "", PartialTimeSpec{{Unit::Year, 2}}, true),
        gt::engine::InvalidTargetError);
    CHECK(manager->size() == 0);
    CHECK(f.timers.timers().empty());
    CHECK(f.store.size() == 0);
    CHECK(f.store.saves == 0);

    // The rejected call did not use up an id.
    CHECK(manager->schedule("record", "", {{"hour", 2}}).id == 1);
}

TEST_CASE("a repeating entry with no further occurrence finishes")
{
    Fixture f(100);
    auto manager = f.make_manager();
    auto handle =
        manager->schedule("record", "new year", PartialTimeSpec{{Unit::Year, 0}},
                          true);
    CHECK(handle.fire_at == kYear + 100);

    f.clock.set(kYear + 100);
    CHECK(f.timers.fire_last());
    CHECK(f.calls == std::vector<std::string>{"new year"});
    CHECK(manager->size() == 0);
    CHECK_FALSE(manager->status_of(handle.id));
    CHECK(f.timers.active_count() == 0);
    CHECK(f.timers.timers().size() == 1);
    CHECK(f.store.size() == 0);
}

TEST_CASE("resume drops entries whose target is behind the clock")
{
    Fixture f(5 * kYear);
    gt::engine::ScheduleState stale;
    stale.entry_id = 3;
    stale.handler = "record";
    stale.target = PartialTimeSpec{{Unit::Year, 2}};
    stale.repeat = true;
    stale.needs_recompute = true;
    f.store.save(stale);

    gt::engine::ScheduleState hourly = stale;
    hourly.entry_id = 4;
    hourly.target = PartialTimeSpec{{Unit::Hour, 1}};
    f.store.save(hourly);

    auto manager = f.make_manager();
    CHECK(manager->on_resume() == 1);
    CHECK(manager->size() == 1);
    CHECK_FALSE(manager->state_of(3));
    CHECK_FALSE(f.store.load(3));
    CHECK(manager->delay_of(4).value() == doctest::Approx(3600.0));
    CHECK(f.timers.active_count() == 1);
}

TEST_CASE("one-shot entries fire once and are forgotten")
{
    Fixture f(5 * kHour);
    auto manager = f.make_manager();
    auto handle = manager->schedule("record", "once", {{"hour", 7}});

    f.clock.set(7 * kHour);
    CHECK(f.timers.fire_last());
    CHECK(f.calls == std::vector<std::string>{"once"});
    CHECK(manager->size() == 0);
    CHECK_FALSE(manager->state_of(handle.id));
    CHECK(f.store.size() == 0);
    CHECK(f.timers.active_count() == 0);
}

TEST_CASE("repeating entries re-arm from the live clock")
{
    Fixture f(kHour);
    auto manager = f.make_manager();
    auto handle = manager->schedule("record", "tick", {{"min", 10}}, true);
    CHECK(handle.fire_at == kHour + 600);

    SUBCASE("on time")
    {
        f.clock.set(kHour + 600);
        CHECK(f.timers.fire_last());
        CHECK(f.calls.size() == 1);
        CHECK(manager->status_of(handle.id) ==
              ScheduleManager::EntryStatus::Armed);
        CHECK(manager->delay_of(handle.id).value() == doctest::Approx(3600.0));
        CHECK(f.timers.last().delay_seconds == doctest::Approx(3600.0));
    }
    SUBCASE("woken a little early")
    {
        f.clock.set(kHour + 590);
        CHECK(f.timers.fire_last());
        // The occurrence that just fired is not scheduled again.
        CHECK(manager->delay_of(handle.id).value() == doctest::Approx(3610.0));
    }
    SUBCASE("woken late")
    {
        // Unnamed smaller units keep their live value.
        f.clock.set(kHour + 660);
        CHECK(f.timers.fire_last());
        CHECK(manager->delay_of(handle.id).value() == doctest::Approx(3540.0));
    }

    CHECK(f.timers.active_count() == 1);
    CHECK(manager->size() == 1);
}

TEST_CASE("cancel is idempotent and silences in-flight fires")
{
    Fixture f(0);
    auto manager = f.make_manager();
    auto handle = manager->schedule("record", "x", {{"hour", 1}}, true);
    auto timer = f.timers.last().handle;

    CHECK(manager->cancel(handle.id));
    CHECK_FALSE(manager->cancel(handle.id));
    CHECK_FALSE(manager->cancel(999));
    CHECK(f.timers.active_count() == 0);
    CHECK(f.store.size() == 0);

    f.clock.set(kHour);
    f.timers.invoke(timer);
    CHECK(f.calls.empty());
    CHECK(f.timers.timers().size() == 1);
}

TEST_CASE("handlers may cancel their own repeating entry")
{
    Fixture f(0);
    auto manager = f.make_manager();
    gt::engine::EntryId id = 0;
    f.handlers.add("stop", [&](std::string const &) { manager->cancel(id); });
    id = manager->schedule("stop", "", {{"min", 5}}, true).id;

    f.clock.set(300);
    CHECK(f.timers.fire_last());
    CHECK(manager->size() == 0);
    CHECK(f.timers.active_count() == 0);
}

TEST_CASE("suspend and resume recompute against the live clock")
{
    Fixture f(5 * kHour);
    auto manager = f.make_manager();
    auto handle = manager->schedule("record", "", {{"hour", 2}, {"min", 30}});
    auto first_timer = f.timers.last().handle;

    manager->on_suspend_notice();
    CHECK(f.timers.active_count() == 0);
    CHECK(manager->status_of(handle.id) ==
          ScheduleManager::EntryStatus::PendingArm);
    auto checkpoint = f.store.load(handle.id);
    REQUIRE(checkpoint);
    CHECK(checkpoint->needs_recompute);

    // Downtime: the game clock moved on by five hours.
    f.clock.set(10 * kHour);
    CHECK(manager->on_resume() == 1);
    CHECK(manager->delay_of(handle.id).value() ==
          doctest::Approx(static_cast<double>(kDay + 9000 - 10 * kHour)));
    CHECK(f.timers.active_count() == 1);
    CHECK_FALSE(f.store.load(handle.id)->needs_recompute);

    // The timer armed before the suspend is stale.
    f.timers.invoke(first_timer);
    CHECK(f.calls.empty());
    CHECK(manager->size() == 1);

    // A second resume has nothing left to arm.
    CHECK(manager->on_resume() == 0);
}

TEST_CASE("a restarted manager restores checkpointed entries")
{
    Fixture f(5 * kHour);
    gt::engine::EntryId id = 0;
    {
        auto manager = f.make_manager();
        id = manager->schedule("record", "persisted", {{"hour", 7}}, true).id;
        manager->on_suspend_notice();
    }
    REQUIRE(f.store.size() == 1);

    f.clock.set(6 * kHour);
    auto manager = f.make_manager();
    CHECK(manager->size() == 0);
    CHECK(manager->on_resume() == 1);
    CHECK(manager->delay_of(id).value() == doctest::Approx(static_cast<double>(kHour)));

    auto next = manager->schedule("record", "new", {{"min", 1}});
    CHECK(next.id > id);

    f.clock.set(7 * kHour);
    f.timers.fire(f.timers.timers()[f.timers.timers().size() - 2].handle);
    CHECK(f.calls == std::vector<std::string>{"persisted"});
}

TEST_CASE("entries with unregistered handlers stay checkpointed")
{
    Fixture f(0);
    gt::engine::ScheduleState orphan;
    orphan.entry_id = 4;
    orphan.handler = "gone";
    orphan.target = PartialTimeSpec{{Unit::Hour, 1}};
    orphan.needs_recompute = true;
    f.store.save(orphan);

    auto manager = f.make_manager();
    CHECK(manager->on_resume() == 0);
    CHECK(manager->size() == 0);
    CHECK(f.store.load(4));

    // Ids are not reused.
    CHECK(manager->schedule("record", "", {{"hour", 1}}).id == 5);
}

TEST_CASE("a failing handler surfaces as CallbackError and keeps repeating")
{
    Fixture f(0);
    auto manager = f.make_manager();
    auto handle = manager->schedule("fail", "", {{"min", 1}}, true);

    f.clock.set(60);
    try
    {
        f.timers.fire_last();
        FAIL("expected CallbackError");
    }
    catch (gt::engine::CallbackError const &ex)
    {
        CHECK(ex.entry_id() == handle.id);
        CHECK_THROWS_WITH_AS(std::rethrow_if_nested(ex), "handler exploded",
                             std::runtime_error);
    }

    CHECK(manager->status_of(handle.id) == ScheduleManager::EntryStatus::Armed);
    CHECK(f.timers.active_count() == 1);
    CHECK(manager->delay_of(handle.id).value() == doctest::Approx(3600.0));
}

TEST_CASE("a handler throwing a non-standard type still re-arms")
{
    Fixture f(0);
    f.handlers.add("odd", [](std::string const &) { throw 42; });
    auto manager = f.make_manager();
    auto handle = manager->schedule("odd", "", {{"min", 1}}, true);

    f.clock.set(60);
    try
    {
        f.timers.fire_last();
        FAIL("expected CallbackError");
    }
    catch (gt::engine::CallbackError const &ex)
    {
        CHECK(ex.entry_id() == handle.id);
        CHECK_THROWS_AS(std::rethrow_if_nested(ex), int);
    }

    CHECK(manager->status_of(handle.id) == ScheduleManager::EntryStatus::Armed);
    CHECK(f.timers.active_count() == 1);
    CHECK(manager->delay_of(handle.id).value() == doctest::Approx(3600.0));
}

TEST_CASE("destroying the manager disarms its timers")
{
    Fixture f(0);
    {
        auto manager = f.make_manager();
        manager->schedule("record", "", {{"hour", 1}});
        manager->schedule("record", "", {{"hour", 2}}, true);
        CHECK(f.timers.active_count() == 2);
    }
    CHECK(f.timers.active_count() == 0);
    // Entries stay checkpointed for the next start.
    CHECK(f.store.size() == 2);
}
