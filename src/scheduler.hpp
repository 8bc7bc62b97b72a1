#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "availability.hpp"
#include "config.hpp"
#include "duration.hpp"
#include "gaps.hpp"
#include "lifeblocks.hpp"
#include "task.hpp"

struct Placement {
    std::string task_id;
    std::string content;
    LocalTime start;
    int minutes = 0;
    bool written = false;
};

struct PassReport {
    int prioritized = 0;
    int rescheduled = 0;
    int candidates = 0;
    int placed = 0;
    int skipped = 0;
    int failed_writes = 0;
    std::vector<Placement> placements;
    std::string unschedulable_task; // set when the pass stopped on a task with no room

    nlohmann::json ToJson() const;
};

// The forward search ran out of steps: the day (and the days after it) have no room left.
class UnschedulableError : public std::runtime_error {
  public:
    UnschedulableError(std::string task_id, const std::string &what)
        : std::runtime_error(what), m_TaskId(std::move(task_id)) {}

    const std::string &TaskId() const {
        return m_TaskId;
    }

    // What the pass did before it stopped
    const PassReport &Report() const {
        return m_Report;
    }
    void SetReport(PassReport report) {
        m_Report = std::move(report);
    }

  private:
    std::string m_TaskId;
    PassReport m_Report;
};

class SlotScheduler {
  public:
    SlotScheduler(TaskStore &store, DurationEstimator &estimator, AiEstimator *ai,
                  const LifeBlocks &life_blocks, const SchedulerConfig &config);

    PassReport Run();
    PassReport Run(LocalSeconds now);

    // Fetch and build only; nothing is written
    std::vector<Gap> PreviewGaps(LocalSeconds now);

    LocalTime SearchStart(LocalSeconds now) const;

  private:
    void BeginPass(LocalSeconds now);
    void FetchTasks();
    int ApplyAutoPriorities();
    void BuildAvailability();
    int RescheduleOverdueRecurring();
    std::vector<Task> SelectCandidates();
    bool IsCurrentSlotValid(const Task &task, int minutes) const;
    void PlaceCandidates(const std::vector<Task> &candidates, LocalSeconds now,
                         PassReport &report);

    LocalTime FindAvailableSlot(const Task &task, LocalTime start, int num_blocks) const;
    std::optional<LocalTime> FindAvailableSlotForDate(LocalTime start, int num_blocks,
                                                      LocalDate date) const;

    TaskStore &m_Store;
    DurationEstimator &m_Estimator;
    AiEstimator *m_Ai;
    const LifeBlocks &m_LifeBlocks;
    const SchedulerConfig &m_Config;

    // Per-pass state
    LocalDate m_Today;
    std::vector<Task> m_Tasks;
    std::unique_ptr<AvailabilityModel> m_Model;
    std::unordered_map<std::string, int> m_OccupancyMinutes;
    std::unordered_map<std::string, DurationEstimate> m_Confirmed;
};
