#include "task.hpp"

#include <algorithm>

// ─────────────────────────────────────
LocalTime TaskDue::Instant() const {
    LocalTime t{date.time_since_epoch()};
    if (time) {
        t += *time;
    }
    return t;
}

// ─────────────────────────────────────
bool Task::HasLabel(const std::string &label) const {
    if (label.empty()) {
        return false;
    }
    return std::find(labels.begin(), labels.end(), label) != labels.end();
}

// ─────────────────────────────────────
bool Task::IsDateOnly() const {
    return due.has_value() && !due->time.has_value();
}

// ─────────────────────────────────────
bool Task::IsRecurring() const {
    return due.has_value() && due->is_recurring;
}

// ─────────────────────────────────────
bool TaskUpdate::Empty() const {
    return !due_datetime && !due_string && !description && !priority;
}
