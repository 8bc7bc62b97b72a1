#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "json.hpp"

namespace {

// ─────────────────────────────────────
std::filesystem::path XdgDir(const char *xdg_env, const char *home_suffix) {
    const char *xdg = std::getenv(xdg_env);
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "retimer";
    }
    const char *home = std::getenv("HOME");
    if (!home || !*home) {
        throw std::runtime_error("HOME environment variable not set");
    }
    return std::filesystem::path(home) / home_suffix / "retimer";
}

// ─────────────────────────────────────
void ApplySchedulerKeys(const nlohmann::json &j, SchedulerConfig &s) {
    JsonParse parse;
    s.interval_minutes = parse.GetInt(j, "interval_minutes", s.interval_minutes);
    if (s.interval_minutes <= 0 || 60 % s.interval_minutes != 0) {
        spdlog::warn("interval_minutes must divide 60, using {}", INTERVAL_MINUTES);
        s.interval_minutes = INTERVAL_MINUTES;
    }

    const std::string sleep = parse.GetString(j, "sleep_time", "");
    if (!sleep.empty()) {
        if (auto clock = ParseClock(sleep)) {
            s.sleep_time = *clock;
        } else {
            spdlog::warn("Invalid sleep_time '{}', keeping {}", sleep, FormatClock(s.sleep_time));
        }
    }

    s.weekday_start_hour = parse.GetInt(j, "weekday_start_hour", s.weekday_start_hour);
    s.weekend_start_hour = parse.GetInt(j, "weekend_start_hour", s.weekend_start_hour);
    s.default_duration = parse.GetInt(j, "default_duration", s.default_duration);
    s.min_duration = parse.GetInt(j, "min_duration", s.min_duration);
    s.occupancy_fallback = parse.GetInt(j, "occupancy_fallback", s.occupancy_fallback);
    s.lead_minutes = parse.GetInt(j, "lead_minutes", s.lead_minutes);
    s.search_ceiling = parse.GetInt(j, "search_ceiling", s.search_ceiling);
    s.auto_priority = parse.GetBool(j, "auto_priority", s.auto_priority);
    s.carry_overdue_date_only =
        parse.GetBool(j, "carry_overdue_date_only", s.carry_overdue_date_only);
    s.skip_label = parse.GetString(j, "skip_label", s.skip_label);
    s.test_label = parse.GetString(j, "test_label", s.test_label);
}

} // namespace

// ─────────────────────────────────────
std::filesystem::path GetConfigPath() {
    return XdgDir("XDG_CONFIG_HOME", ".config") / "config.json";
}

// ─────────────────────────────────────
std::filesystem::path GetDataDir() {
    std::filesystem::path dir = XdgDir("XDG_DATA_HOME", ".local/share");
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("cannot create data directory " + dir.string() + ": " +
                                 ec.message());
    }
    return dir;
}

// ─────────────────────────────────────
Config ConfigFromJson(const std::string &body) {
    Config config;
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Config is not valid JSON ({}), using defaults", e.what());
        return config;
    }
    if (!j.is_object()) {
        spdlog::warn("Config root is not an object, using defaults");
        return config;
    }

    ApplySchedulerKeys(j, config.scheduler);

    JsonParse parse;
    config.daemon.pass_interval_minutes =
        std::max(1, parse.GetInt(j, "pass_interval_minutes", config.daemon.pass_interval_minutes));
    config.daemon.port =
        static_cast<unsigned>(parse.GetInt(j, "port", static_cast<int>(config.daemon.port)));
    return config;
}

// ─────────────────────────────────────
Config LoadConfig(const std::filesystem::path &path) {
    Config config;
    std::ifstream file(path);
    if (file.is_open()) {
        std::string body((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        config = ConfigFromJson(body);
        spdlog::info("Config loaded: {}", path.string());
    } else {
        spdlog::info("No config at {}, using defaults", path.string());
    }

    config.data_dir = GetDataDir();
    config.life_blocks_path = config.data_dir / "life_blocks.json";
    return config;
}
