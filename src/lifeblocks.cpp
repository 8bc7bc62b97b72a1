#include "lifeblocks.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "json.hpp"

namespace {

// ─────────────────────────────────────
void ExpandBlock(LocalDate date, std::chrono::minutes start, std::chrono::minutes end,
                 int interval_minutes, std::set<LocalTime> &out) {
    if (end <= start) {
        return;
    }
    const LocalTime day{date.time_since_epoch()};
    // Off-grid starts snap down so block slots compare equal to task slots
    for (auto t = FloorToInterval(day + start, interval_minutes); t < day + end; t += std::chrono::minutes(interval_minutes)) {
        out.insert(t);
    }
}

} // namespace

// ─────────────────────────────────────
std::vector<std::string> LifeBlocks::NormalizeDays(const std::vector<std::string> &days) {
    std::vector<std::string> cleaned;
    for (const auto &day : days) {
        std::string slug;
        for (char c : day) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                slug.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
        }
        if (slug.empty()) {
            continue;
        }
        cleaned.push_back(slug.substr(0, 3));
    }
    return cleaned;
}

// ─────────────────────────────────────
LifeBlocks LifeBlocks::FromJson(const nlohmann::json &state) {
    LifeBlocks blocks;
    if (!state.is_object()) {
        spdlog::warn("Life blocks: expected an object, got {}", state.type_name());
        return blocks;
    }

    JsonParse parse;
    if (state.contains("one_off") && state["one_off"].is_array()) {
        for (const auto &entry : state["one_off"]) {
            auto date = ParseDate(parse.GetString(entry, "date", ""));
            auto start = ParseClock(parse.GetString(entry, "start", ""));
            auto end = ParseClock(parse.GetString(entry, "end", ""));
            if (!date || !start || !end) {
                spdlog::warn("Life blocks: skipping invalid one-off entry {}", entry.dump());
                continue;
            }
            blocks.m_OneOff.push_back({*date, *start, *end, parse.GetString(entry, "label", "")});
        }
    }

    if (state.contains("weekly") && state["weekly"].is_array()) {
        for (const auto &entry : state["weekly"]) {
            auto start = ParseClock(parse.GetString(entry, "start", ""));
            auto end = ParseClock(parse.GetString(entry, "end", ""));
            if (!start || !end) {
                spdlog::warn("Life blocks: skipping invalid weekly entry {}", entry.dump());
                continue;
            }
            const nlohmann::json days =
                entry.is_object() && entry.contains("days") ? entry["days"] : nlohmann::json();
            blocks.m_Weekly.push_back({NormalizeDays(parse.JsonArray2String(days)), *start, *end,
                                       parse.GetString(entry, "label", "")});
        }
    }

    return blocks;
}

// ─────────────────────────────────────
LifeBlocks LifeBlocks::Load(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::debug("No life blocks at {}", path.string());
        return LifeBlocks();
    }

    std::string body((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    try {
        LifeBlocks blocks = FromJson(nlohmann::json::parse(body));
        spdlog::debug("Loaded {} one-off and {} weekly life blocks", blocks.m_OneOff.size(),
                      blocks.m_Weekly.size());
        return blocks;
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Life blocks file {} is not valid JSON: {}", path.string(), e.what());
        return LifeBlocks();
    }
}

// ─────────────────────────────────────
nlohmann::json LifeBlocks::ToJson() const {
    nlohmann::json state{{"one_off", nlohmann::json::array()}, {"weekly", nlohmann::json::array()}};
    for (const auto &b : m_OneOff) {
        state["one_off"].push_back({{"date", FormatDate(b.date)},
                                    {"start", FormatClock(b.start)},
                                    {"end", FormatClock(b.end)},
                                    {"label", b.label}});
    }
    for (const auto &b : m_Weekly) {
        state["weekly"].push_back({{"days", b.days},
                                   {"start", FormatClock(b.start)},
                                   {"end", FormatClock(b.end)},
                                   {"label", b.label}});
    }
    return state;
}

// ─────────────────────────────────────
void LifeBlocks::Save(const std::filesystem::path &path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("unable to write life blocks: " + path.string());
    }
    file << ToJson().dump(2);
    spdlog::info("Life blocks saved: {}", path.string());
}

// ─────────────────────────────────────
void LifeBlocks::AddOneOff(OneOffBlock block) {
    m_OneOff.push_back(std::move(block));
}

// ─────────────────────────────────────
void LifeBlocks::AddWeekly(WeeklyBlock block) {
    block.days = NormalizeDays(block.days);
    m_Weekly.push_back(std::move(block));
}

// ─────────────────────────────────────
bool LifeBlocks::RemoveOneOff(size_t index) {
    if (index >= m_OneOff.size()) {
        return false;
    }
    m_OneOff.erase(m_OneOff.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

// ─────────────────────────────────────
bool LifeBlocks::RemoveWeekly(size_t index) {
    if (index >= m_Weekly.size()) {
        return false;
    }
    m_Weekly.erase(m_Weekly.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

// ─────────────────────────────────────
std::set<LocalTime> LifeBlocks::SlotsForDate(LocalDate date, int interval_minutes) const {
    std::set<LocalTime> slots;
    for (const auto &b : m_OneOff) {
        if (b.date == date) {
            ExpandBlock(date, b.start, b.end, interval_minutes, slots);
        }
    }

    const std::string slug = WeekdaySlug(date);
    for (const auto &b : m_Weekly) {
        if (std::find(b.days.begin(), b.days.end(), slug) != b.days.end()) {
            ExpandBlock(date, b.start, b.end, interval_minutes, slots);
        }
    }
    return slots;
}
