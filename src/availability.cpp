#include "availability.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
AvailabilityModel::AvailabilityModel(const SchedulerConfig &config, const LifeBlocks &life_blocks,
                                     LocalDate today)
    : m_Config(config), m_LifeBlocks(life_blocks), m_Today(today) {}

// ─────────────────────────────────────
void AvailabilityModel::Build(const std::vector<Task> &tasks, DurationEstimator &estimator,
                              std::unordered_map<std::string, int> &resolved) {
    m_Occupied.clear();
    m_Recurring.clear();
    m_Owned.clear();

    for (const auto &slot : LifeBlockSlots(m_Today)) {
        m_Occupied[slot] += 1;
    }

    for (const auto &task : tasks) {
        if (task.completed || task.HasLabel(m_Config.skip_label)) {
            continue;
        }
        // Date-only tasks hold no time of day
        if (!task.due || task.IsDateOnly() || task.due->date != m_Today) {
            continue;
        }

        int minutes = 0;
        auto it = resolved.find(task.id);
        if (it != resolved.end()) {
            minutes = it->second;
        } else if (auto user = estimator.ParseDurationFromDescription(task.description)) {
            minutes = *user;
        } else if (auto ai = estimator.EstimateWithAi(task.content, task.description)) {
            minutes = *ai;
        } else {
            minutes = m_Config.occupancy_fallback;
        }
        resolved[task.id] = minutes;

        const LocalTime start = FloorToInterval(task.due->Instant(), m_Config.interval_minutes);
        Occupy(task.id, start, estimator.NumBlocks(minutes), task.due->is_recurring);
    }

    spdlog::info("Blocked {} slots ({} recurring)", m_Occupied.size(), m_Recurring.size());
}

// ─────────────────────────────────────
void AvailabilityModel::Occupy(const std::string &owner, LocalTime start, int num_blocks,
                               bool recurring) {
    auto &owned = m_Owned[owner];
    for (int j = 0; j < num_blocks; ++j) {
        const LocalTime slot = start + Interval() * j;
        m_Occupied[slot] += 1;
        owned.push_back(slot);
        if (recurring) {
            m_Recurring.insert(slot);
        }
    }
}

// ─────────────────────────────────────
void AvailabilityModel::Release(const std::string &owner) {
    auto it = m_Owned.find(owner);
    if (it == m_Owned.end()) {
        return;
    }
    for (const auto &slot : it->second) {
        auto occ = m_Occupied.find(slot);
        if (occ == m_Occupied.end()) {
            continue;
        }
        if (--occ->second <= 0) {
            m_Occupied.erase(occ);
        }
    }
    m_Owned.erase(it);
}

// ─────────────────────────────────────
bool AvailabilityModel::IsOccupied(LocalTime t) const {
    return m_Occupied.count(t) > 0;
}

// ─────────────────────────────────────
bool AvailabilityModel::IsRecurring(LocalTime t) const {
    return m_Recurring.count(t) > 0;
}

// ─────────────────────────────────────
bool AvailabilityModel::InEnvelope(LocalTime t) const {
    const LocalDate date = DateOf(t);
    const auto clock = TimeOfDay(t);
    const int start_hour = IsWeekend(date) ? m_Config.weekend_start_hour : m_Config.weekday_start_hour;

    if (clock >= m_Config.sleep_time || clock < std::chrono::hours(start_hour)) {
        return false;
    }
    return LifeBlockSlots(date).count(t) == 0;
}

// ─────────────────────────────────────
bool AvailabilityModel::IsLegal(LocalTime t) const {
    return !IsOccupied(t) && InEnvelope(t);
}

// ─────────────────────────────────────
bool AvailabilityModel::IsRangeAvailable(LocalTime start, int num_blocks) const {
    for (int j = 0; j < num_blocks; ++j) {
        const LocalTime t = start + Interval() * j;
        if (!IsLegal(t) || IsRecurring(t)) {
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────
LocalTime AvailabilityModel::EndOfDay() const {
    return LocalTime{m_Today.time_since_epoch()} + m_Config.sleep_time;
}

// ─────────────────────────────────────
const std::set<LocalTime> &AvailabilityModel::LifeBlockSlots(LocalDate date) const {
    auto it = m_LifeBlockCache.find(date);
    if (it == m_LifeBlockCache.end()) {
        it = m_LifeBlockCache
                 .emplace(date, m_LifeBlocks.SlotsForDate(date, m_Config.interval_minutes))
                 .first;
    }
    return it->second;
}
