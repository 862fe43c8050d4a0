#include "app/DaemonMain.hpp"
#include "app/DaemonSupport.hpp"
#include "engine/HandlerRegistry.hpp"
#include "engine/PersistenceManager.hpp"
#include "engine/ScheduleManager.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/StateStore.hpp"

#include "TestSupport.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using gt::engine::UnitComponents;

namespace
{

constexpr std::int64_t kYear = 29030400;

// Runs daemon_main with its own data directory, configuration and state
// database so nothing touches the user's files.
class DaemonHarness
{
  public:
    explicit DaemonHarness(std::string const &name) : temp_(name)
    {
        if (auto const *previous = std::getenv("XDG_DATA_HOME"))
        {
            previous_data_home_ = previous;
        }
        ::setenv("XDG_DATA_HOME", temp_.path().c_str(), 1);
        write_config("{}");
    }

    ~DaemonHarness()
    {
        if (previous_data_home_)
        {
            ::setenv("XDG_DATA_HOME", previous_data_home_->c_str(), 1);
        }
        else
        {
            ::unsetenv("XDG_DATA_HOME");
        }
    }

    DaemonHarness(DaemonHarness const &) = delete;
    DaemonHarness &operator=(DaemonHarness const &) = delete;

    void write_config(std::string const &payload) const
    {
        std::ofstream out(config_path(), std::ios::trunc);
        out << payload;
    }

    std::filesystem::path config_path() const
    {
        return temp_.path() / "gametime.json";
    }
    std::filesystem::path state_path() const
    {
        return temp_.path() / "state.db";
    }

    int run(std::vector<std::string> args) const
    {
        std::vector<char *> argv;
        std::string program = "gametimed";
        argv.push_back(program.data());
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        int code = gt::app::daemon_main(static_cast<int>(argv.size() - 1),
                                        argv.data());
        gt::log::set_min_level('W');
        return code;
    }

    // Runs with the harness configuration and state plus `extra`.
    int run_with_state(std::vector<std::string> extra) const
    {
        std::vector<std::string> args = {"--config", config_path().string(),
                                         "--state", state_path().string()};
        args.insert(args.end(), extra.begin(), extra.end());
        return run(std::move(args));
    }

    std::vector<gt::storage::PersistedSchedule> schedules() const
    {
        gt::storage::Database db(state_path());
        REQUIRE(db.is_valid());
        return db.load_schedules();
    }

  private:
    gt::test::TempDir temp_;
    std::optional<std::string> previous_data_home_;
};

} // namespace

TEST_CASE("command-line targets parse into unit components")
{
    using gt::app::parse_target;
    CHECK(parse_target("hour=2,min=30") ==
          UnitComponents{{"hour", 2}, {"min", 30}});
    CHECK(parse_target("years=1") == UnitComponents{{"years", 1}});
    // Range checks belong to the scheduler.
    CHECK(parse_target("hour=-1") == UnitComponents{{"hour", -1}});

    CHECK_FALSE(parse_target(""));
    CHECK_FALSE(parse_target("hour"));
    CHECK_FALSE(parse_target("=3"));
    CHECK_FALSE(parse_target("hour=two"));
    CHECK_FALSE(parse_target("hour=2x"));
    CHECK_FALSE(parse_target("hour=2,,min=1"));
    CHECK_FALSE(parse_target("year=99999999999999999999"));
}

TEST_CASE("the clock origin is stored on first start and reused")
{
    gt::test::TempDir temp("gametime-origin");
    auto db_path = temp.path() / "state.db";
    gt::engine::ClockSettings settings;

    std::chrono::system_clock::time_point first;
    {
        gt::engine::PersistenceManager persistence(db_path);
        REQUIRE(persistence.is_valid());
        first = gt::app::resolve_origin(settings, persistence);
        auto stored = persistence.get_setting(gt::app::kOriginSettingKey);
        REQUIRE(stored);
        CHECK(*stored ==
              std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                 first.time_since_epoch())
                                 .count()));
    }

    gt::engine::PersistenceManager persistence(db_path);
    REQUIRE(persistence.is_valid());
    CHECK(gt::app::resolve_origin(settings, persistence) == first);

    SUBCASE("a configured origin wins and is not stored")
    {
        settings.origin = 1700000000;
        auto origin = gt::app::resolve_origin(settings, persistence);
        CHECK(origin.time_since_epoch() == std::chrono::seconds(1700000000));
        CHECK(gt::app::resolve_origin(gt::engine::ClockSettings{}, persistence) ==
              first);
    }
    SUBCASE("an unreadable stored origin is replaced")
    {
        REQUIRE(persistence.set_setting(gt::app::kOriginSettingKey, "soon"));
        auto origin = gt::app::resolve_origin(settings, persistence);
        CHECK(origin >= first);
        CHECK(persistence.get_setting(gt::app::kOriginSettingKey) !=
              std::string("soon"));
    }
}

TEST_CASE("a command-line entry restored on restart is not scheduled twice")
{
    gt::engine::UnitTable units;
    gt::engine::TimeConverter converter(units);
    gt::test::ManualGameClock clock(5 * 3600);
    gt::test::FakeTimerHost timers;
    gt::engine::HandlerRegistry handlers;
    handlers.add("announce", [](std::string const &) {});
    gt::test::MemoryScheduleStore store;
    UnitComponents const target = {{"hour", 6}};

    {
        gt::engine::ScheduleManager manager(converter, clock, timers, handlers,
                                            &store);
        manager.on_resume();
        auto handle = gt::app::schedule_unless_present(manager, "announce",
                                                       "bell", target, true);
        REQUIRE(handle);
        CHECK(handle->delay_seconds == doctest::Approx(3600.0));
        manager.on_suspend_notice();
    }

    gt::engine::ScheduleManager manager(converter, clock, timers, handlers,
                                        &store);
    CHECK(manager.on_resume() == 1);
    CHECK_FALSE(gt::app::schedule_unless_present(manager, "announce", "bell",
                                                 target, true));
    CHECK(manager.size() == 1);
    CHECK(store.size() == 1);

    // Anything that differs is a new request.
    CHECK(gt::app::schedule_unless_present(manager, "announce", "bell", target,
                                           false));
    CHECK(gt::app::schedule_unless_present(manager, "announce", "gong", target,
                                           true));
    CHECK(gt::app::schedule_unless_present(manager, "announce", "bell",
                                           {{"hour", 7}}, true));
    CHECK(manager.size() == 4);
}

TEST_CASE("game time reads largest unit first")
{
    gt::engine::UnitTable units;
    CHECK(gt::app::describe_game_time(units, 86400 + 2 * 3600 + 30 * 60) ==
          "1 day 2 hour 30 min 0 sec");
    CHECK(gt::app::describe_game_time(units, 0) == "0 sec");
}

TEST_CASE("daemon rejects bad usage with exit status 2")
{
    DaemonHarness daemon("gametime-daemon-usage");

    CHECK(daemon.run({"--help"}) == 0);
    CHECK(daemon.run({"--version"}) == 0);
    CHECK(daemon.run({"--bogus"}) == 2);
    CHECK(daemon.run({"--state"}) == 2);
    CHECK(daemon.run({"--config", "/nonexistent/gametime.json"}) == 2);

    daemon.write_config(R"({"speedFactor": -1})");
    CHECK(daemon.run_with_state({}) == 2);
}

TEST_CASE("daemon rejects bad targets with exit status 2")
{
    DaemonHarness daemon("gametime-daemon-targets");

    CHECK(daemon.run_with_state({"--at", "hour"}) == 2);
    CHECK(daemon.run_with_state({"--at", "hour=-1"}) == 2);
    CHECK(daemon.run_with_state({"--at", "fortnight=1"}) == 2);
    CHECK(daemon.run_with_state({"--at", "year=400000000000"}) == 2);

    // Year 2 is long gone once the clock starts in year 5.
    daemon.write_config(std::format(R"({{"epochOffset": {}}})",
                                    5 * kYear + 3600));
    CHECK(daemon.run_with_state({"--at", "year=2", "--repeat"}) == 2);

    CHECK(daemon.schedules().empty());
}

TEST_CASE("daemon keeps one entry per --at request across restarts")
{
    DaemonHarness daemon("gametime-daemon-restart");
    // The loop exits straight away; every run starts, schedules, checkpoints
    // and stops.
    gt::runtime::request_shutdown();

    std::vector<std::string> const at = {"--at", "hour=6", "--message", "bell",
                                         "--repeat"};
    CHECK(daemon.run_with_state(at) == 0);
    CHECK(daemon.run_with_state(at) == 0);
    CHECK(daemon.run_with_state(at) == 0);

    auto rows = daemon.schedules();
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].handler == "announce");
    CHECK(rows[0].args == "bell");
    CHECK(rows[0].target == "{\"hour\":6}");
    CHECK(rows[0].repeat);
    CHECK(rows[0].needs_recompute);

    CHECK(daemon.run_with_state({"--at", "hour=6", "--message", "gong"}) == 0);
    CHECK(daemon.schedules().size() == 2);

    gt::storage::Database db(daemon.state_path());
    REQUIRE(db.is_valid());
    CHECK(db.get_setting(gt::app::kOriginSettingKey));
}
