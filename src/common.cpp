#include "common.hpp"

#include <cctype>
#include <cstdio>

// ─────────────────────────────────────
LocalSeconds NowLocal() {
    const auto now = std::chrono::system_clock::now();
    const auto local = std::chrono::current_zone()->to_local(now);
    return std::chrono::floor<std::chrono::seconds>(local);
}

// ─────────────────────────────────────
LocalDate DateOf(LocalTime t) {
    return std::chrono::floor<std::chrono::days>(t);
}

// ─────────────────────────────────────
std::chrono::minutes TimeOfDay(LocalTime t) {
    return t - DateOf(t);
}

// ─────────────────────────────────────
bool IsWeekend(LocalDate d) {
    const std::chrono::weekday wd{d};
    return wd == std::chrono::Saturday || wd == std::chrono::Sunday;
}

// ─────────────────────────────────────
std::string WeekdaySlug(LocalDate d) {
    static const char *slugs[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};
    const std::chrono::weekday wd{d};
    return slugs[wd.c_encoding()];
}

// ─────────────────────────────────────
LocalTime RoundUpToInterval(LocalSeconds t, int interval_minutes) {
    // Seconds are dropped first, then the minute is pushed up to the next grid line.
    const auto minute = std::chrono::floor<std::chrono::minutes>(t);
    const auto hour = std::chrono::floor<std::chrono::hours>(minute);
    const int into = static_cast<int>((minute - hour).count());
    const int steps = (into + interval_minutes - 1) / interval_minutes;
    return LocalTime{hour.time_since_epoch()} + std::chrono::minutes(steps * interval_minutes);
}

// ─────────────────────────────────────
LocalTime FloorToInterval(LocalTime t, int interval_minutes) {
    const auto day = DateOf(t);
    const int into = static_cast<int>(TimeOfDay(t).count());
    return LocalTime{day.time_since_epoch()} +
           std::chrono::minutes((into / interval_minutes) * interval_minutes);
}

// ─────────────────────────────────────
std::optional<LocalDate> ParseDate(const std::string &value) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (std::sscanf(value.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3) {
        return std::nullopt;
    }
    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m},
                                          std::chrono::day{d}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return LocalDate{std::chrono::sys_days{ymd}.time_since_epoch()};
}

// ─────────────────────────────────────
std::optional<std::chrono::minutes> ParseClock(const std::string &value) {
    std::string trimmed;
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            trimmed.push_back(c);
        }
    }
    int h = -1;
    int m = -1;
    char tail = '\0';
    if (std::sscanf(trimmed.c_str(), "%d:%d%c", &h, &m, &tail) != 2) {
        return std::nullopt;
    }
    if (h < 0 || h > 23 || m < 0 || m > 59) {
        return std::nullopt;
    }
    return std::chrono::hours(h) + std::chrono::minutes(m);
}

// ─────────────────────────────────────
std::optional<LocalTime> ParseDatetime(const std::string &value) {
    auto date = ParseDate(value);
    if (!date) {
        return std::nullopt;
    }

    const auto t = value.find('T');
    if (t == std::string::npos) {
        return std::nullopt;
    }

    int h = 0;
    int m = 0;
    int s = 0;
    if (std::sscanf(value.c_str() + t + 1, "%2d:%2d:%2d", &h, &m, &s) < 2) {
        return std::nullopt;
    }
    if (h < 0 || h > 23 || m < 0 || m > 59) {
        return std::nullopt;
    }

    const auto wall = LocalTime{date->time_since_epoch()} + std::chrono::hours(h) +
                      std::chrono::minutes(m);

    // Fixed-timezone tasks come back in UTC.
    if (!value.empty() && value.back() == 'Z') {
        const std::chrono::sys_time<std::chrono::minutes> utc{wall.time_since_epoch()};
        return std::chrono::floor<std::chrono::minutes>(
            std::chrono::current_zone()->to_local(utc));
    }
    return wall;
}

// ─────────────────────────────────────
std::string FormatDate(LocalDate d) {
    const std::chrono::year_month_day ymd{d};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return buf;
}

// ─────────────────────────────────────
std::string FormatClock(std::chrono::minutes time_of_day) {
    const int total = static_cast<int>(time_of_day.count());
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", (total / 60) % 24, total % 60);
    return buf;
}

// ─────────────────────────────────────
std::string FormatClock(LocalTime t) {
    return FormatClock(TimeOfDay(t));
}

// ─────────────────────────────────────
std::string FormatDatetime(LocalTime t) {
    return FormatDate(DateOf(t)) + "T" + FormatClock(t) + ":00";
}
