#pragma once

#include <chrono>
#include <optional>
#include <string>

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

// Wall-clock instants in the user's zone. Every slot lives on this minute grid.
using LocalTime = std::chrono::local_time<std::chrono::minutes>;
using LocalSeconds = std::chrono::local_time<std::chrono::seconds>;
using LocalDate = std::chrono::local_days;

LocalSeconds NowLocal();
LocalDate DateOf(LocalTime t);
std::chrono::minutes TimeOfDay(LocalTime t);
bool IsWeekend(LocalDate d);
std::string WeekdaySlug(LocalDate d);

LocalTime RoundUpToInterval(LocalSeconds t, int interval_minutes);
LocalTime FloorToInterval(LocalTime t, int interval_minutes);

std::optional<LocalDate> ParseDate(const std::string &value);
std::optional<std::chrono::minutes> ParseClock(const std::string &value);
std::optional<LocalTime> ParseDatetime(const std::string &value);

std::string FormatDate(LocalDate d);
std::string FormatClock(LocalTime t);
std::string FormatClock(std::chrono::minutes time_of_day);
std::string FormatDatetime(LocalTime t);
