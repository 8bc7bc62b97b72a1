#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "duration.hpp"

#define OPENROUTER_DEFAULT_URL "https://openrouter.ai/api/v1"
#define OPENROUTER_MODEL "moonshotai/kimi-k2-5"

class OpenRouter : public AiEstimator {
  public:
    OpenRouter(std::string api_key, std::string base_url = OPENROUTER_DEFAULT_URL);

    bool IsConfigured() const override;
    std::optional<int> EstimateMinutes(const std::string &title, const std::string &description,
                                       int interval, int min_minutes) override;
    std::optional<int> EstimatePriority(const std::string &title,
                                        const std::string &description) override;

    // First integer in the reply text
    static std::optional<int> FirstNumber(const std::string &text);

  private:
    std::optional<std::string> Complete(const std::string &system, const std::string &prompt,
                                        int max_tokens, double temperature);

    std::string m_ApiKey;
    std::string m_Host;
    std::string m_PathPrefix;
};
