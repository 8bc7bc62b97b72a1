#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "common.hpp"
#include "config.hpp"
#include "duration.hpp"
#include "gaps.hpp"
#include "lifeblocks.hpp"
#include "openrouter.hpp"
#include "retimer.hpp"
#include "scheduler.hpp"
#include "secrets.hpp"
#include "todoist.hpp"

namespace {

struct Options {
    std::string command;
    std::vector<std::string> args;
    std::string config_path;
    LogLevel log_level = LOG_INFO;
    int interval = 0;
    unsigned port = 0;
};

// ─────────────────────────────────────
void PrintUsage() {
    std::cerr << "usage: retimer [--log debug|info|off] [--config PATH] <command>\n"
                 "\n"
                 "commands:\n"
                 "  run                                   one scheduling pass\n"
                 "  daemon [--interval N] [--port P]      pass every N minutes\n"
                 "  gaps                                  free time left today\n"
                 "  estimate <title> [description]        duration estimate\n"
                 "  blocks list\n"
                 "  blocks add-weekly <mon,tue,...> <HH:MM> <HH:MM> [label]\n"
                 "  blocks add-once <YYYY-MM-DD> <HH:MM> <HH:MM> [label]\n"
                 "  blocks remove <weekly|once> <index>\n"
                 "  login <todoist|openrouter> <key>\n"
                 "  done <task-id>\n";
}

// ─────────────────────────────────────
bool ParseArgs(int argc, char **argv, Options &opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> const char * { return i + 1 < argc ? argv[++i] : nullptr; };

        if (arg == "--log") {
            const char *v = next();
            if (!v) {
                return false;
            }
            const std::string level = v;
            if (level == "debug") {
                opts.log_level = LOG_DEBUG;
            } else if (level == "off") {
                opts.log_level = LOG_OFF;
            } else {
                opts.log_level = LOG_INFO;
            }
        } else if (arg == "--config") {
            const char *v = next();
            if (!v) {
                return false;
            }
            opts.config_path = v;
        } else if (arg == "--interval") {
            const char *v = next();
            if (!v) {
                return false;
            }
            opts.interval = std::atoi(v);
        } else if (arg == "--port") {
            const char *v = next();
            if (!v) {
                return false;
            }
            opts.port = static_cast<unsigned>(std::atoi(v));
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }
    return !opts.command.empty();
}

// ─────────────────────────────────────
void SetLogLevel(LogLevel level) {
    if (level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}

// ─────────────────────────────────────
std::vector<std::string> SplitDays(const std::string &value) {
    std::vector<std::string> days;
    std::string current;
    for (char c : value) {
        if (c == ',') {
            days.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    days.push_back(current);
    return LifeBlocks::NormalizeDays(days);
}

// ─────────────────────────────────────
int BlocksCommand(const Config &config, const std::vector<std::string> &args) {
    LifeBlocks blocks = LifeBlocks::Load(config.life_blocks_path);
    const std::string sub = args.empty() ? "list" : args[0];

    if (sub == "list") {
        std::cout << blocks.ToJson().dump(2) << "\n";
        return 0;
    }

    if (sub == "add-weekly" || sub == "add-once") {
        if (args.size() < 4) {
            PrintUsage();
            return 2;
        }
        auto start = ParseClock(args[2]);
        auto end = ParseClock(args[3]);
        const std::string label = args.size() > 4 ? args[4] : "";
        if (!start || !end || *end <= *start) {
            std::cerr << "invalid time range " << args[2] << "-" << args[3] << "\n";
            return 2;
        }
        if (sub == "add-weekly") {
            blocks.AddWeekly({SplitDays(args[1]), *start, *end, label});
        } else {
            auto date = ParseDate(args[1]);
            if (!date) {
                std::cerr << "invalid date " << args[1] << "\n";
                return 2;
            }
            blocks.AddOneOff({*date, *start, *end, label});
        }
        blocks.Save(config.life_blocks_path);
        return 0;
    }

    if (sub == "remove" && args.size() >= 3) {
        const size_t index = static_cast<size_t>(std::strtoul(args[2].c_str(), nullptr, 10));
        const bool removed =
            args[1] == "weekly" ? blocks.RemoveWeekly(index) : blocks.RemoveOneOff(index);
        if (!removed) {
            std::cerr << "no " << args[1] << " block at index " << index << "\n";
            return 1;
        }
        blocks.Save(config.life_blocks_path);
        return 0;
    }

    PrintUsage();
    return 2;
}

// ─────────────────────────────────────
int LoginCommand(const std::vector<std::string> &args) {
    if (args.size() < 2 || (args[0] != "todoist" && args[0] != "openrouter")) {
        PrintUsage();
        return 2;
    }
    Secrets secrets;
    const std::string key = args[0] == "todoist" ? "todoist_api_key" : "openrouter_key";
    if (!secrets.SaveSecret(key, args[1])) {
        std::cerr << "could not store the key in the keyring\n";
        return 1;
    }
    spdlog::info("Stored {} key", args[0]);
    return 0;
}

// ─────────────────────────────────────
int Dispatch(const Options &opts, Config &config) {
    if (opts.command == "daemon") {
        if (opts.interval > 0) {
            config.daemon.pass_interval_minutes = opts.interval;
        }
        if (opts.port > 0) {
            config.daemon.port = opts.port;
        }
        Retimer retimer(config, opts.log_level);
        retimer.RunForever();
        return 0;
    }
    if (opts.command == "blocks") {
        return BlocksCommand(config, opts.args);
    }
    if (opts.command == "login") {
        return LoginCommand(opts.args);
    }

    Secrets secrets;
    const char *proxy = std::getenv("OPENROUTER_PROXY");
    OpenRouter openrouter(secrets.LoadSecretOrEnv("openrouter_key", "OPENROUTER_KEY"),
                          proxy && *proxy ? proxy : OPENROUTER_DEFAULT_URL);
    DurationEstimator estimator(config.scheduler, &openrouter);

    if (opts.command == "estimate") {
        if (opts.args.empty()) {
            PrintUsage();
            return 2;
        }
        const std::string description = opts.args.size() > 1 ? opts.args[1] : "";
        const DurationEstimate est = estimator.Estimate(opts.args[0], description);
        std::cout << est.minutes << "m" << (est.user_specified ? " (from description)" : "")
                  << "\n";
        return 0;
    }

    TodoistClient todoist(secrets.LoadSecretOrEnv("todoist_api_key", "TODOIST_KEY"));

    if (opts.command == "done") {
        if (opts.args.empty()) {
            PrintUsage();
            return 2;
        }
        todoist.CompleteTask(opts.args[0]);
        return 0;
    }

    const LifeBlocks blocks = LifeBlocks::Load(config.life_blocks_path);
    SlotScheduler scheduler(todoist, estimator, &openrouter, blocks, config.scheduler);

    if (opts.command == "run") {
        const PassReport report = scheduler.Run();
        std::cout << report.ToJson().dump(2) << "\n";
        return report.failed_writes > 0 ? 1 : 0;
    }
    if (opts.command == "gaps") {
        for (const auto &gap : scheduler.PreviewGaps(NowLocal())) {
            std::cout << FormatClock(gap.start) << " - " << FormatClock(gap.end) << " ("
                      << gap.Minutes() << "m available)\n";
        }
        return 0;
    }

    PrintUsage();
    return 2;
}

} // namespace

int main(int argc, char **argv) {
    Options opts;
    if (!ParseArgs(argc, argv, opts)) {
        PrintUsage();
        return 2;
    }
    SetLogLevel(opts.log_level);

    try {
        Config config = LoadConfig(opts.config_path.empty() ? GetConfigPath()
                                                            : std::filesystem::path(opts.config_path));
        return Dispatch(opts, config);
    } catch (const UnschedulableError &e) {
        spdlog::error("Could not place task {}: {}", e.TaskId(), e.what());
        std::cout << e.Report().ToJson().dump(2) << "\n";
        return 3;
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
