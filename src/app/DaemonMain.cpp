#include "app/DaemonMain.hpp"

#include "app/DaemonSupport.hpp"
#include "engine/ClockSettings.hpp"
#include "engine/Errors.hpp"
#include "engine/GameClock.hpp"
#include "engine/HandlerRegistry.hpp"
#include "engine/PersistenceManager.hpp"
#include "engine/ScheduleManager.hpp"
#include "engine/TimeConverter.hpp"
#include "engine/TimerService.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace
{

struct Options
{
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> state_path;
    std::optional<std::string> at;
    std::string message;
    bool repeat = false;
    bool verbose = false;
    bool help = false;
    bool version = false;
};

void print_usage()
{
    gt::log::print_status(
        "usage: gametimed [--config PATH] [--state PATH] [--verbose] "
        "[--version]\n"
        "                 [--at UNIT=VALUE[,UNIT=VALUE...] [--message TEXT] "
        "[--repeat]]\n"
        "\n"
        "  --at       schedule an announcement, e.g. --at hour=2,min=30\n"
        "  --repeat   repeat the announcement every time the target recurs");
}

std::optional<Options> parse_options(int argc, char *argv[])
{
    Options options;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        auto next = [&]() -> std::optional<std::string>
        {
            if (i + 1 >= argc)
            {
                GT_LOG_ERROR("{} expects a value", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        if (arg == "--config")
        {
            auto value = next();
            if (!value)
                return std::nullopt;
            options.config_path = *value;
        }
        else if (arg == "--state")
        {
            auto value = next();
            if (!value)
                return std::nullopt;
            options.state_path = *value;
        }
        else if (arg == "--at")
        {
            options.at = next();
            if (!options.at)
                return std::nullopt;
        }
        else if (arg == "--message")
        {
            auto value = next();
            if (!value)
                return std::nullopt;
            options.message = *value;
        }
        else if (arg == "--repeat")
        {
            options.repeat = true;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            options.verbose = true;
        }
        else if (arg == "--version")
        {
            options.version = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            options.help = true;
        }
        else
        {
            GT_LOG_ERROR("unknown argument {}", arg);
            return std::nullopt;
        }
    }
    return options;
}

} // namespace

namespace gt::app
{

int daemon_main(int argc, char *argv[])
{
    try
    {
        auto options = parse_options(argc, argv);
        if (!options || options->help)
        {
            print_usage();
            return options ? 0 : 2;
        }
        if (options->version)
        {
            gt::log::print_status("{}", gt::version::kDisplayVersion);
            return 0;
        }
        gt::log::set_min_level(options->verbose ? 'D' : 'I');

        std::signal(SIGINT, [](int) { gt::runtime::request_shutdown(); });
        std::signal(SIGTERM, [](int) { gt::runtime::request_shutdown(); });
        std::signal(SIGHUP, [](int) { gt::runtime::request_reload(); });

        GT_LOG_INFO("{} starting", gt::version::kDisplayVersion);
        auto root = gt::utils::data_root();
        gt::engine::ClockSettings settings;
        auto config_path = options->config_path.value_or(root / "gametime.json");
        std::error_code ec;
        if (options->config_path || std::filesystem::exists(config_path, ec))
        {
            settings = gt::engine::load_clock_settings(config_path);
        }
        auto const units = settings.build_unit_table();
        gt::engine::TimeConverter converter(units);

        auto state_path = options->state_path.value_or(settings.state_path);
        if (state_path.empty())
        {
            state_path = root / "gametime.db";
        }
        gt::engine::PersistenceManager persistence(state_path);
        if (!persistence.is_valid())
        {
            GT_LOG_ERROR("state database {} unavailable; schedules will not "
                         "survive a restart",
                         state_path.string());
        }

        gt::engine::SystemGameClock clock(resolve_origin(settings, persistence),
                                          settings.epoch_offset,
                                          units.speed_factor());
        GT_LOG_INFO("game clock at {} (speed factor {})",
                    describe_game_time(units, clock.current_game_seconds()),
                    units.speed_factor());

        gt::engine::HandlerRegistry handlers;
        handlers.add("announce", [](std::string const &args)
                     { GT_LOG_INFO("announce: {}", args); });
        handlers.add("log-time",
                     [&units, &clock](std::string const &)
                     {
                         GT_LOG_INFO("game time is {}",
                                     describe_game_time(
                                         units, clock.current_game_seconds()));
                     });

        gt::engine::TimerService timers;
        gt::engine::ScheduleManager manager(
            converter, clock, timers, handlers,
            persistence.is_valid() ? &persistence : nullptr);
        manager.on_resume();

        if (options->at)
        {
            auto target = parse_target(*options->at);
            if (!target)
            {
                GT_LOG_ERROR("cannot parse target \"{}\"", *options->at);
                return 2;
            }
            auto handler = options->message.empty() ? "log-time" : "announce";
            // A restart restores the entry this option created last time.
            auto handle = schedule_unless_present(
                manager, handler, options->message, *target, options->repeat);
            if (handle)
            {
                GT_LOG_INFO(
                    "entry {} fires in {}", handle->id,
                    gt::engine::format_breakdown(
                        gt::engine::TimeConverter::breakdown(
                            static_cast<std::int64_t>(handle->delay_seconds),
                            gt::engine::real_divisor_ladder()),
                        {"years", "months", "weeks", "days", "hours", "mins",
                         "secs"}));
            }
        }

        while (!gt::runtime::should_shutdown())
        {
            if (gt::runtime::take_reload_request())
            {
                GT_LOG_INFO("reload requested");
                manager.on_suspend_notice();
                manager.on_resume();
            }
            auto now = gt::engine::TimerService::Clock::now();
            timers.tick(now);
            auto wait = std::min<std::chrono::milliseconds>(
                timers.time_until_next_task(now), settings.tick_interval);
            std::this_thread::sleep_for(wait);
        }

        manager.on_suspend_notice();
        GT_LOG_INFO("shutdown complete");
        return 0;
    }
    catch (gt::engine::ConfigError const &ex)
    {
        GT_LOG_ERROR("configuration error: {}", ex.what());
        return 2;
    }
    catch (gt::engine::UnknownUnitError const &ex)
    {
        GT_LOG_ERROR("{}", ex.what());
        return 2;
    }
    catch (gt::engine::InvalidTargetError const &ex)
    {
        GT_LOG_ERROR("invalid target: {}", ex.what());
        return 2;
    }
    catch (std::exception const &ex)
    {
        GT_LOG_ERROR("fatal: {}", ex.what());
        return 1;
    }
}

} // namespace gt::app
