#pragma once

#include <optional>
#include <string>

#include "config.hpp"

// Remote estimation backend. Implementations never throw: any failure is an empty result.
class AiEstimator {
  public:
    virtual ~AiEstimator() = default;

    virtual bool IsConfigured() const = 0;
    virtual std::optional<int> EstimateMinutes(const std::string &title,
                                               const std::string &description, int interval,
                                               int min_minutes) = 0;
    virtual std::optional<int> EstimatePriority(const std::string &title,
                                                const std::string &description) = 0;
};

struct DurationEstimate {
    int minutes = 0;
    bool user_specified = false;
};

class DurationEstimator {
  public:
    DurationEstimator(const SchedulerConfig &config, AiEstimator *ai);

    // marker -> AI -> keywords. Always produces a duration.
    DurationEstimate Estimate(const std::string &title, const std::string &description);

    std::optional<int> ParseDurationFromDescription(const std::string &description) const;
    std::string AddDurationMarker(const std::string &description, int minutes) const;
    std::optional<int> EstimateWithAi(const std::string &title, const std::string &description);
    int EstimateHeuristic(const std::string &title, const std::string &description) const;

    int RoundToInterval(int minutes) const;
    int NumBlocks(int minutes) const;
    bool HasAi() const;

  private:
    const SchedulerConfig &m_Config;
    AiEstimator *m_Ai;
};
