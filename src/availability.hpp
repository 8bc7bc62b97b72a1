#pragma once

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "duration.hpp"
#include "lifeblocks.hpp"
#include "task.hpp"

// Which slots of one day are taken. Rebuilt from scratch every time the store changes.
class AvailabilityModel {
  public:
    AvailabilityModel(const SchedulerConfig &config, const LifeBlocks &life_blocks, LocalDate today);

    // Merges today's life blocks and the placements of today's timed tasks.
    // `resolved` caches per-task occupancy minutes across rebuilds within a pass.
    void Build(const std::vector<Task> &tasks, DurationEstimator &estimator,
               std::unordered_map<std::string, int> &resolved);

    void Occupy(const std::string &owner, LocalTime start, int num_blocks, bool recurring);
    // Frees everything `owner` occupies, except slots someone else also holds
    void Release(const std::string &owner);

    bool IsOccupied(LocalTime t) const;
    bool IsRecurring(LocalTime t) const;
    bool InEnvelope(LocalTime t) const;
    bool IsLegal(LocalTime t) const;
    bool IsRangeAvailable(LocalTime start, int num_blocks) const;

    LocalDate Today() const {
        return m_Today;
    }
    LocalTime EndOfDay() const;
    std::chrono::minutes Interval() const {
        return std::chrono::minutes(m_Config.interval_minutes);
    }

    const std::map<LocalTime, int> &Occupied() const {
        return m_Occupied;
    }
    const std::set<LocalTime> &Recurring() const {
        return m_Recurring;
    }

  private:
    const std::set<LocalTime> &LifeBlockSlots(LocalDate date) const;

    const SchedulerConfig &m_Config;
    const LifeBlocks &m_LifeBlocks;
    LocalDate m_Today;

    std::map<LocalTime, int> m_Occupied; // slot -> number of holders
    std::set<LocalTime> m_Recurring;
    std::unordered_map<std::string, std::vector<LocalTime>> m_Owned;
    mutable std::map<LocalDate, std::set<LocalTime>> m_LifeBlockCache;
};
