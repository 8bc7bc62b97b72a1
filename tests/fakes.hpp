#pragma once

#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common.hpp"
#include "duration.hpp"
#include "task.hpp"

inline LocalDate Day(int y, unsigned m, unsigned d) {
    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m},
                                          std::chrono::day{d}};
    return LocalDate{std::chrono::sys_days{ymd}.time_since_epoch()};
}

inline LocalTime At(LocalDate day, int h, int m) {
    return LocalTime{day.time_since_epoch()} + std::chrono::hours(h) + std::chrono::minutes(m);
}

inline LocalSeconds AtSeconds(LocalDate day, int h, int m, int s) {
    return LocalSeconds{day.time_since_epoch()} + std::chrono::hours(h) +
           std::chrono::minutes(m) + std::chrono::seconds(s);
}

inline Task MakeTask(const std::string &id, const std::string &content,
                     const std::string &description = "", int priority = 1) {
    Task t;
    t.id = id;
    t.content = content;
    t.description = description;
    t.priority = priority;
    return t;
}

inline TaskDue TimedDue(LocalTime when, bool recurring = false, std::string recurrence = "") {
    TaskDue due;
    due.date = DateOf(when);
    due.time = TimeOfDay(when);
    due.is_recurring = recurring;
    due.recurrence = std::move(recurrence);
    return due;
}

inline TaskDue DateDue(LocalDate date) {
    TaskDue due;
    due.date = date;
    return due;
}

// In-memory task store. Submitting a recurrence string moves the task to its next
// occurrence on or after `today`, keeping it recurring.
class FakeTaskStore : public TaskStore {
  public:
    explicit FakeTaskStore(LocalDate today) : today(today) {}

    std::vector<Task> ListTasks() override {
        ++list_calls;
        return tasks;
    }

    void UpdateTask(const std::string &id, const TaskUpdate &update) override {
        updates.emplace_back(id, update);
        if (failing_ids.count(id)) {
            throw std::runtime_error("todoist request failed: 500");
        }
        Task *task = Find(id);
        if (!task) {
            throw std::runtime_error("task not found");
        }

        if (update.due_string) {
            TaskDue due = task->due.value_or(TaskDue{});
            due.date = NextOccurrence(*update.due_string);
            due.is_recurring = true;
            due.recurrence = *update.due_string;
            task->due = due;
        }
        if (update.due_datetime) {
            TaskDue due = task->due.value_or(TaskDue{});
            due.date = DateOf(*update.due_datetime);
            due.time = TimeOfDay(*update.due_datetime);
            task->due = due;
        }
        if (update.description) {
            task->description = *update.description;
        }
        if (update.priority) {
            task->priority = *update.priority;
        }
    }

    void CompleteTask(const std::string &id) override {
        Task *task = Find(id);
        if (!task) {
            throw std::runtime_error("task not found");
        }
        task->completed = true;
    }

    Task *Find(const std::string &id) {
        for (auto &t : tasks) {
            if (t.id == id) {
                return &t;
            }
        }
        return nullptr;
    }

    std::vector<TaskUpdate> UpdatesFor(const std::string &id) const {
        std::vector<TaskUpdate> out;
        for (const auto &u : updates) {
            if (u.first == id) {
                out.push_back(u.second);
            }
        }
        return out;
    }

    LocalDate today;
    std::vector<Task> tasks;
    std::vector<std::pair<std::string, TaskUpdate>> updates;
    std::set<std::string> failing_ids;
    int list_calls = 0;

  private:
    LocalDate NextOccurrence(const std::string &recurrence) const {
        LocalDate d = today;
        if (recurrence == "every weekday") {
            while (IsWeekend(d)) {
                d += std::chrono::days(1);
            }
        }
        return d;
    }
};

class FakeAi : public AiEstimator {
  public:
    bool IsConfigured() const override {
        return configured;
    }

    std::optional<int> EstimateMinutes(const std::string &, const std::string &, int,
                                       int) override {
        ++minute_calls;
        return minutes;
    }

    std::optional<int> EstimatePriority(const std::string &, const std::string &) override {
        ++priority_calls;
        return priority;
    }

    bool configured = true;
    std::optional<int> minutes;
    std::optional<int> priority;
    int minute_calls = 0;
    int priority_calls = 0;
};
