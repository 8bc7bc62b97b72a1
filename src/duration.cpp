#include "duration.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

#include <spdlog/spdlog.h>

namespace {
const std::regex kDurationPattern(R"((\d+)m\b)");

const char *kQuickKeywords[] = {"check", "quick",   "brief",  "short",  "email",
                                "text",  "call",    "review", "confirm", "verify",
                                "remind", "note",   "list"};
const char *kMediumKeywords[] = {"read",   "watch",  "install", "setup", "configure", "update",
                                 "change", "cancel", "make",    "create", "write"};
const char *kLongKeywords[] = {"build", "develop", "implement", "research", "study",
                               "learn", "clean",   "organize",  "project",  "essay"};

constexpr int kQuickMinutes = 10;
constexpr int kMediumMinutes = 25;
constexpr int kLongMinutes = 45;

template <size_t N>
bool ContainsAny(const std::string &text, const char *(&keywords)[N]) {
    for (const char *kw : keywords) {
        if (text.find(kw) != std::string::npos) {
            return true;
        }
    }
    return false;
}
} // namespace

// ─────────────────────────────────────
DurationEstimator::DurationEstimator(const SchedulerConfig &config, AiEstimator *ai)
    : m_Config(config), m_Ai(ai) {}

// ─────────────────────────────────────
bool DurationEstimator::HasAi() const {
    return m_Ai && m_Ai->IsConfigured();
}

// ─────────────────────────────────────
int DurationEstimator::RoundToInterval(int minutes) const {
    // nearbyint rounds half to even, same as the estimates already stored in descriptions
    const double steps = std::nearbyint(static_cast<double>(minutes) / m_Config.interval_minutes);
    const int rounded = static_cast<int>(steps) * m_Config.interval_minutes;
    return std::max(m_Config.min_duration, rounded);
}

// ─────────────────────────────────────
int DurationEstimator::NumBlocks(int minutes) const {
    const int interval = m_Config.interval_minutes;
    return std::max(1, (minutes + interval - 1) / interval);
}

// ─────────────────────────────────────
std::optional<int> DurationEstimator::ParseDurationFromDescription(
    const std::string &description) const {
    if (description.empty()) {
        return std::nullopt;
    }

    std::optional<int> last;
    for (auto it = std::sregex_iterator(description.begin(), description.end(), kDurationPattern);
         it != std::sregex_iterator(); ++it) {
        const std::string digits = (*it)[1].str();
        if (digits.size() > 6) {
            continue;
        }
        last = std::stoi(digits);
    }

    if (!last) {
        return std::nullopt;
    }
    return RoundToInterval(*last);
}

// ─────────────────────────────────────
std::string DurationEstimator::AddDurationMarker(const std::string &description,
                                                 int minutes) const {
    const std::string marker = std::to_string(minutes) + "m";
    if (description.empty()) {
        return marker;
    }

    if (std::regex_search(description, kDurationPattern)) {
        return std::regex_replace(description, kDurationPattern, marker,
                                  std::regex_constants::format_first_only);
    }

    std::string out = description + " " + marker;
    const auto first = out.find_first_not_of(" \t\r\n");
    return first == std::string::npos ? marker : out.substr(first);
}

// ─────────────────────────────────────
std::optional<int> DurationEstimator::EstimateWithAi(const std::string &title,
                                                     const std::string &description) {
    if (!HasAi()) {
        return std::nullopt;
    }
    auto minutes =
        m_Ai->EstimateMinutes(title, description, m_Config.interval_minutes, m_Config.min_duration);
    if (!minutes) {
        return std::nullopt;
    }
    return RoundToInterval(*minutes);
}

// ─────────────────────────────────────
int DurationEstimator::EstimateHeuristic(const std::string &title,
                                         const std::string &description) const {
    std::string text = title + " " + description;
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ContainsAny(text, kQuickKeywords)) {
        return kQuickMinutes;
    }
    if (ContainsAny(text, kMediumKeywords)) {
        return kMediumMinutes;
    }
    if (ContainsAny(text, kLongKeywords)) {
        return kLongMinutes;
    }
    return m_Config.default_duration;
}

// ─────────────────────────────────────
DurationEstimate DurationEstimator::Estimate(const std::string &title,
                                             const std::string &description) {
    if (auto user = ParseDurationFromDescription(description)) {
        spdlog::debug("Using user-specified duration: {} minutes", *user);
        return {*user, true};
    }

    if (auto ai = EstimateWithAi(title, description)) {
        spdlog::debug("Using AI estimate: {} minutes", *ai);
        return {*ai, false};
    }

    const int heuristic = EstimateHeuristic(title, description);
    spdlog::debug("Using heuristic estimate: {} minutes", heuristic);
    return {heuristic, false};
}
