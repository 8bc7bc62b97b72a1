#include "gaps.hpp"

#include <algorithm>

// ─────────────────────────────────────
GapFinder::GapFinder(const AvailabilityModel &model) : m_Model(model) {}

// ─────────────────────────────────────
std::vector<Gap> GapFinder::FindGaps(LocalTime start) const {
    std::vector<Gap> gaps;
    const LocalTime end_of_day = m_Model.EndOfDay();
    const auto interval = m_Model.Interval();
    if (start >= end_of_day) {
        return gaps;
    }

    const auto &occupied = m_Model.Occupied();
    auto it = occupied.lower_bound(start);
    auto last = occupied.lower_bound(end_of_day);
    if (it == last) {
        gaps.push_back({start, end_of_day});
        return gaps;
    }

    if (it->first > start) {
        gaps.push_back({start, it->first});
    }

    while (it != last) {
        // Walk to the end of this contiguous run
        LocalTime run_end = it->first;
        ++it;
        while (it != last && it->first == run_end + interval) {
            run_end = it->first;
            ++it;
        }

        const LocalTime free_from = run_end + interval;
        if (it != last) {
            if (it->first > free_from) {
                gaps.push_back({free_from, it->first});
            }
        } else if (free_from < end_of_day) {
            gaps.push_back({free_from, end_of_day});
        }
    }

    return gaps;
}

// ─────────────────────────────────────
std::optional<LocalTime> GapFinder::Fits(const std::vector<Gap> &gaps, int num_blocks) const {
    const int required = num_blocks * static_cast<int>(m_Model.Interval().count());
    for (const auto &gap : gaps) {
        if (gap.Minutes() < required) {
            continue;
        }
        if (m_Model.IsRangeAvailable(gap.start, num_blocks)) {
            return gap.start;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────
void GapFinder::Consume(std::vector<Gap> &gaps, LocalTime start, int num_blocks) const {
    auto it = std::find_if(gaps.begin(), gaps.end(),
                           [&](const Gap &g) { return g.start <= start && start < g.end; });
    if (it == gaps.end()) {
        return;
    }

    const LocalTime used_until = start + m_Model.Interval() * num_blocks;
    if (start > it->start) {
        // Placement inside the gap leaves a head that is still free
        Gap tail{used_until, it->end};
        it->end = start;
        if (tail.start < tail.end) {
            gaps.insert(it + 1, tail);
        }
        return;
    }

    it->start = used_until;
    if (it->start >= it->end) {
        gaps.erase(it);
    }
}
