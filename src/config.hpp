#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "common.hpp"

#define INTERVAL_MINUTES 5
#define MIN_DURATION 5      // minutes
#define DEFAULT_DURATION 30 // minutes, when no keyword matches
#define SEARCH_CEILING 10000

struct SchedulerConfig {
    int interval_minutes = INTERVAL_MINUTES;
    std::chrono::minutes sleep_time{20 * 60 + 45};
    int weekday_start_hour = 15;
    int weekend_start_hour = 9;

    int default_duration = DEFAULT_DURATION;
    int min_duration = MIN_DURATION;
    // Occupancy of a same-day task with neither marker nor AI estimate
    int occupancy_fallback = 10;

    int lead_minutes = 60;
    int search_ceiling = SEARCH_CEILING;

    bool auto_priority = true;
    bool carry_overdue_date_only = true;

    std::string skip_label = "#dontchangetime";
    std::string test_label = "#testnotification";
};

struct DaemonConfig {
    int pass_interval_minutes = 5;
    unsigned port = 7717;
};

struct Config {
    SchedulerConfig scheduler;
    DaemonConfig daemon;
    std::filesystem::path data_dir;
    std::filesystem::path life_blocks_path;
};

std::filesystem::path GetConfigPath();
std::filesystem::path GetDataDir();

Config LoadConfig(const std::filesystem::path &path);
Config ConfigFromJson(const std::string &body);
