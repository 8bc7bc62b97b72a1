#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common.hpp"

struct TaskDue {
    LocalDate date;
    std::optional<std::chrono::minutes> time; // empty for date-only tasks
    bool is_recurring = false;
    std::string recurrence;

    // Date-only dues resolve to midnight.
    LocalTime Instant() const;
};

struct Task {
    std::string id;
    std::string content;
    std::string description;
    std::optional<TaskDue> due;
    int priority = 1;
    bool completed = false;
    std::vector<std::string> labels;

    bool HasLabel(const std::string &label) const;
    bool IsDateOnly() const;
    bool IsRecurring() const;
};

struct TaskUpdate {
    std::optional<LocalTime> due_datetime;
    std::optional<std::string> due_string;
    std::optional<std::string> description;
    std::optional<int> priority;

    bool Empty() const;
};

// Remote source of truth for tasks. Implementations throw std::runtime_error on failure.
class TaskStore {
  public:
    virtual ~TaskStore() = default;

    virtual std::vector<Task> ListTasks() = 0;
    virtual void UpdateTask(const std::string &id, const TaskUpdate &update) = 0;
    virtual void CompleteTask(const std::string &id) = 0;
};
