#include "scheduler.hpp"

#include <algorithm>

// ─────────────────────────────────────
nlohmann::json PassReport::ToJson() const {
    nlohmann::json out{
        {"prioritized", prioritized},
        {"rescheduled", rescheduled},
        {"candidates", candidates},
        {"placed", placed},
        {"skipped", skipped},
        {"failed_writes", failed_writes},
        {"placements", nlohmann::json::array()},
    };
    if (!unschedulable_task.empty()) {
        out["unschedulable_task"] = unschedulable_task;
    }
    for (const auto &p : placements) {
        out["placements"].push_back({
            {"task_id", p.task_id},
            {"content", p.content},
            {"start", FormatDatetime(p.start)},
            {"minutes", p.minutes},
            {"written", p.written},
        });
    }
    return out;
}

// ─────────────────────────────────────
SlotScheduler::SlotScheduler(TaskStore &store, DurationEstimator &estimator, AiEstimator *ai,
                             const LifeBlocks &life_blocks, const SchedulerConfig &config)
    : m_Store(store), m_Estimator(estimator), m_Ai(ai), m_LifeBlocks(life_blocks),
      m_Config(config) {}

// ─────────────────────────────────────
LocalTime SlotScheduler::SearchStart(LocalSeconds now) const {
    const LocalTime lead =
        RoundUpToInterval(now + std::chrono::minutes(m_Config.lead_minutes), m_Config.interval_minutes);
    const LocalTime now_rounded = RoundUpToInterval(now, m_Config.interval_minutes);
    return std::max(lead, now_rounded);
}

// ─────────────────────────────────────
void SlotScheduler::BeginPass(LocalSeconds now) {
    m_Today = std::chrono::floor<std::chrono::days>(now);
    m_Tasks.clear();
    m_Model.reset();
    m_OccupancyMinutes.clear();
    m_Confirmed.clear();
}

// ─────────────────────────────────────
PassReport SlotScheduler::Run() {
    return Run(NowLocal());
}

// ─────────────────────────────────────
PassReport SlotScheduler::Run(LocalSeconds now) {
    PassReport report;
    BeginPass(now);

    spdlog::info("Fetching tasks...");
    FetchTasks();

    if (m_Config.auto_priority) {
        report.prioritized = ApplyAutoPriorities();
    }

    spdlog::info("Building blocked time map for {}...", FormatDate(m_Today));
    BuildAvailability();

    report.rescheduled = RescheduleOverdueRecurring();
    if (report.rescheduled > 0) {
        spdlog::info("Rescheduled {} overdue recurring tasks, refreshing task list",
                     report.rescheduled);
        FetchTasks();
        BuildAvailability();
    }

    std::vector<Task> candidates = SelectCandidates();
    report.candidates = static_cast<int>(candidates.size());
    spdlog::info("{} task(s) need a new time", candidates.size());

    try {
        PlaceCandidates(candidates, now, report);
    } catch (UnschedulableError &e) {
        report.unschedulable_task = e.TaskId();
        e.SetReport(report);
        throw;
    }

    spdlog::info("Pass done: placed={}, skipped={}, failed_writes={}", report.placed,
                 report.skipped, report.failed_writes);
    return report;
}

// ─────────────────────────────────────
std::vector<Gap> SlotScheduler::PreviewGaps(LocalSeconds now) {
    BeginPass(now);
    FetchTasks();
    BuildAvailability();
    GapFinder finder(*m_Model);
    return finder.FindGaps(SearchStart(now));
}

// ─────────────────────────────────────
void SlotScheduler::FetchTasks() {
    std::vector<Task> all = m_Store.ListTasks();
    m_Tasks.clear();
    for (auto &task : all) {
        if (task.HasLabel(m_Config.test_label)) {
            continue;
        }
        m_Tasks.push_back(std::move(task));
    }
    spdlog::debug("Fetched {} tasks ({} after filtering)", all.size(), m_Tasks.size());
}

// ─────────────────────────────────────
int SlotScheduler::ApplyAutoPriorities() {
    if (!m_Ai || !m_Ai->IsConfigured()) {
        return 0;
    }

    int updated = 0;
    for (auto &task : m_Tasks) {
        if (task.completed || task.priority != 1) {
            continue;
        }
        auto priority = m_Ai->EstimatePriority(task.content, task.description);
        if (!priority) {
            continue;
        }

        TaskUpdate update;
        update.priority = *priority;
        try {
            m_Store.UpdateTask(task.id, update);
            task.priority = *priority;
            updated += 1;
            spdlog::info("Priority of '{}' set to {}", task.content, *priority);
        } catch (const std::exception &e) {
            spdlog::error("Failed to set priority of '{}': {}", task.content, e.what());
        }
    }
    return updated;
}

// ─────────────────────────────────────
void SlotScheduler::BuildAvailability() {
    m_Model = std::make_unique<AvailabilityModel>(m_Config, m_LifeBlocks, m_Today);
    m_Model->Build(m_Tasks, m_Estimator, m_OccupancyMinutes);
}

// ─────────────────────────────────────
int SlotScheduler::RescheduleOverdueRecurring() {
    int rescheduled = 0;
    for (const auto &task : m_Tasks) {
        if (task.completed || !task.IsRecurring() || task.due->date >= m_Today) {
            continue;
        }
        if (task.due->recurrence.empty()) {
            spdlog::warn("Recurring task '{}' has no recurrence text, leaving it", task.content);
            continue;
        }

        // The store's recurrence engine moves the date forward; the pattern is kept.
        TaskUpdate update;
        update.due_string = task.due->recurrence;
        try {
            m_Store.UpdateTask(task.id, update);
            rescheduled += 1;
            spdlog::info("Rescheduled recurring '{}' ({}) from {}", task.content,
                         task.due->recurrence, FormatDate(task.due->date));
        } catch (const std::exception &e) {
            spdlog::error("Failed to reschedule '{}': {}", task.content, e.what());
        }
    }
    return rescheduled;
}

// ─────────────────────────────────────
bool SlotScheduler::IsCurrentSlotValid(const Task &task, int minutes) const {
    if (!task.due || task.due->date < m_Today || task.IsDateOnly()) {
        return false;
    }

    const LocalTime start = FloorToInterval(task.due->Instant(), m_Config.interval_minutes);
    const int num_blocks = m_Estimator.NumBlocks(minutes);
    for (int j = 0; j < num_blocks; ++j) {
        const LocalTime t = start + m_Model->Interval() * j;
        // Overlap with ordinary tasks is fine: a task running long keeps its time
        if (!m_Model->InEnvelope(t) || m_Model->IsRecurring(t)) {
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────
std::vector<Task> SlotScheduler::SelectCandidates() {
    std::vector<Task> candidates;
    for (const auto &task : m_Tasks) {
        if (task.completed || task.HasLabel(m_Config.skip_label)) {
            continue;
        }
        if (!task.due) {
            candidates.push_back(task);
            continue;
        }
        if (task.due->is_recurring) {
            continue;
        }

        if (task.due->date < m_Today) {
            candidates.push_back(task);
        } else if (task.due->date == m_Today) {
            auto user = m_Estimator.ParseDurationFromDescription(task.description);
            if (!user) {
                continue;
            }
            m_Confirmed[task.id] = DurationEstimate{*user, true};
            if (!IsCurrentSlotValid(task, *user)) {
                candidates.push_back(task);
            }
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Task &a, const Task &b) { return a.priority > b.priority; });
    return candidates;
}

// ─────────────────────────────────────
LocalTime SlotScheduler::FindAvailableSlot(const Task &task, LocalTime start,
                                           int num_blocks) const {
    LocalTime t = start;
    for (int i = 0; i < m_Config.search_ceiling; ++i) {
        if (m_Model->IsRangeAvailable(t, num_blocks)) {
            return t;
        }
        t += m_Model->Interval();
    }
    throw UnschedulableError(task.id, "no free slot for '" + task.content + "' within " +
                                          std::to_string(m_Config.search_ceiling) +
                                          " steps from " + FormatDatetime(start));
}

// ─────────────────────────────────────
std::optional<LocalTime> SlotScheduler::FindAvailableSlotForDate(LocalTime start, int num_blocks,
                                                                 LocalDate date) const {
    LocalTime t = start;
    for (int i = 0; i < m_Config.search_ceiling; ++i) {
        if (DateOf(t) != date) {
            return std::nullopt;
        }
        if (m_Model->IsRangeAvailable(t, num_blocks)) {
            return t;
        }
        t += m_Model->Interval();
    }
    return std::nullopt;
}

// ─────────────────────────────────────
void SlotScheduler::PlaceCandidates(const std::vector<Task> &candidates, LocalSeconds now,
                                    PassReport &report) {
    const LocalTime search_start = SearchStart(now);
    GapFinder finder(*m_Model);
    std::vector<Gap> gaps = finder.FindGaps(search_start);

    spdlog::info("Found {} gap(s) in today's schedule from {}", gaps.size(),
                 FormatClock(search_start));
    for (const auto &gap : gaps) {
        spdlog::debug("  {} - {} ({}m available)", FormatClock(gap.start), FormatClock(gap.end),
                      gap.Minutes());
    }

    for (const auto &task : candidates) {
        DurationEstimate estimate;
        auto confirmed = m_Confirmed.find(task.id);
        if (confirmed != m_Confirmed.end()) {
            estimate = confirmed->second;
        } else {
            estimate = m_Estimator.Estimate(task.content, task.description);
        }
        const int num_blocks = m_Estimator.NumBlocks(estimate.minutes);
        spdlog::info("Task '{}': {} minutes ({} blocks)", task.content, estimate.minutes,
                     num_blocks);

        bool today_only = false;
        if (task.IsDateOnly()) {
            LocalDate target = task.due->date;
            if (target < m_Today && m_Config.carry_overdue_date_only) {
                target = m_Today;
            }
            if (target != m_Today) {
                spdlog::info("  date-only task for {}, not placing today", FormatDate(target));
                report.skipped += 1;
                continue;
            }
            today_only = true;
        }

        // The task is moving: its old slots no longer count against it.
        m_Model->Release(task.id);

        std::optional<LocalTime> slot = finder.Fits(gaps, num_blocks);
        if (slot) {
            spdlog::info("  filling gap at {}", FormatClock(*slot));
        } else if (today_only) {
            slot = FindAvailableSlotForDate(search_start, num_blocks, m_Today);
            if (!slot) {
                spdlog::info("  no room left today, leaving it");
                report.skipped += 1;
                continue;
            }
        } else {
            slot = FindAvailableSlot(task, search_start, num_blocks);
        }
        finder.Consume(gaps, *slot, num_blocks);
        m_Model->Occupy(task.id, *slot, num_blocks, false);

        TaskUpdate update;
        update.due_datetime = *slot;
        if (!estimate.user_specified) {
            std::string description =
                m_Estimator.AddDurationMarker(task.description, estimate.minutes);
            if (description != task.description) {
                update.description = description;
            }
        }

        Placement placement{task.id, task.content, *slot, estimate.minutes, false};
        try {
            m_Store.UpdateTask(task.id, update);
            placement.written = true;
            report.placed += 1;
            spdlog::info("  scheduled {} - {}", FormatDatetime(*slot),
                         FormatClock(*slot + std::chrono::minutes(estimate.minutes)));
        } catch (const std::exception &e) {
            report.failed_writes += 1;
            spdlog::error("  failed to write '{}': {}", task.content, e.what());
        }
        report.placements.push_back(placement);
    }
}
