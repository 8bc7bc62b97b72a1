#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common.hpp"

struct OneOffBlock {
    LocalDate date;
    std::chrono::minutes start;
    std::chrono::minutes end;
    std::string label;
};

struct WeeklyBlock {
    std::vector<std::string> days; // "mon", "tue", ...
    std::chrono::minutes start;
    std::chrono::minutes end;
    std::string label;
};

// User-declared windows in which nothing may be scheduled.
class LifeBlocks {
  public:
    LifeBlocks() = default;

    static LifeBlocks Load(const std::filesystem::path &path);
    static LifeBlocks FromJson(const nlohmann::json &state);
    nlohmann::json ToJson() const;
    void Save(const std::filesystem::path &path) const;

    void AddOneOff(OneOffBlock block);
    void AddWeekly(WeeklyBlock block);
    bool RemoveOneOff(size_t index);
    bool RemoveWeekly(size_t index);

    const std::vector<OneOffBlock> &OneOff() const {
        return m_OneOff;
    }
    const std::vector<WeeklyBlock> &Weekly() const {
        return m_Weekly;
    }

    std::set<LocalTime> SlotsForDate(LocalDate date, int interval_minutes) const;

    static std::vector<std::string> NormalizeDays(const std::vector<std::string> &days);

  private:
    std::vector<OneOffBlock> m_OneOff;
    std::vector<WeeklyBlock> m_Weekly;
};
