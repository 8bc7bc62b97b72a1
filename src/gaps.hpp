#pragma once

#include <optional>
#include <vector>

#include "availability.hpp"

struct Gap {
    LocalTime start;
    LocalTime end;

    int Minutes() const {
        return static_cast<int>((end - start).count());
    }
};

class GapFinder {
  public:
    explicit GapFinder(const AvailabilityModel &model);

    // Free intervals of today in [start, end of day), with busy runs coalesced
    std::vector<Gap> FindGaps(LocalTime start) const;

    // First gap that can hold `num_blocks` legal, non-recurring slots from its start
    std::optional<LocalTime> Fits(const std::vector<Gap> &gaps, int num_blocks) const;

    // Shrinks the gap starting at `start` past the consumed blocks
    void Consume(std::vector<Gap> &gaps, LocalTime start, int num_blocks) const;

  private:
    const AvailabilityModel &m_Model;
};
