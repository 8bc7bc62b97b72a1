#include <httplib.h>

#include "openrouter.hpp"

#include <cctype>

// ─────────────────────────────────────
OpenRouter::OpenRouter(std::string api_key, std::string base_url) : m_ApiKey(std::move(api_key)) {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }

    // "https://host[:port]/prefix" -> host part and path prefix
    const auto scheme = base_url.find("://");
    const auto path_at = base_url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (path_at == std::string::npos) {
        m_Host = base_url;
    } else {
        m_Host = base_url.substr(0, path_at);
        m_PathPrefix = base_url.substr(path_at);
    }
}

// ─────────────────────────────────────
bool OpenRouter::IsConfigured() const {
    return !m_ApiKey.empty();
}

// ─────────────────────────────────────
std::optional<int> OpenRouter::FirstNumber(const std::string &text) {
    size_t i = 0;
    while (i < text.size() && !std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    if (i == text.size()) {
        return std::nullopt;
    }
    size_t j = i;
    while (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j]))) {
        ++j;
    }
    if (j - i > 6) {
        return std::nullopt;
    }
    return std::stoi(text.substr(i, j - i));
}

// ─────────────────────────────────────
std::optional<std::string> OpenRouter::Complete(const std::string &system,
                                                const std::string &prompt, int max_tokens,
                                                double temperature) {
    if (!IsConfigured()) {
        return std::nullopt;
    }

    httplib::Client client(m_Host);
    client.set_default_headers({
        {"Authorization", "Bearer " + m_ApiKey},
        {"HTTP-Referer", "https://retimer.local"},
        {"X-Title", "Retimer"},
    });
    client.set_connection_timeout(3, 0);
    client.set_read_timeout(10, 0);
    client.set_write_timeout(10, 0);

    nlohmann::json body{
        {"model", OPENROUTER_MODEL},
        {"messages",
         nlohmann::json::array({
             {{"role", "system"}, {"content", system}},
             {{"role", "user"}, {"content", prompt}},
         })},
        {"max_tokens", max_tokens},
        {"temperature", temperature},
    };

    auto res = client.Post(m_PathPrefix + "/chat/completions", body.dump(), "application/json");
    if (!res) {
        spdlog::debug("OpenRouter request failed: {}", httplib::to_string(res.error()));
        return std::nullopt;
    }
    if (res->status != 200) {
        spdlog::debug("OpenRouter returned HTTP {}", res->status);
        return std::nullopt;
    }

    try {
        auto j = nlohmann::json::parse(res->body);
        return j.at("choices").at(0).at("message").at("content").get<std::string>();
    } catch (const nlohmann::json::exception &e) {
        spdlog::debug("OpenRouter reply not understood: {}", e.what());
        return std::nullopt;
    }
}

// ─────────────────────────────────────
std::optional<int> OpenRouter::EstimateMinutes(const std::string &title,
                                               const std::string &description, int interval,
                                               int min_minutes) {
    const std::string prompt =
        "Task: " + title + "\nDescription: " + description +
        "\n\nEstimate how many minutes this task will take. Reply with ONLY a number (in "
        "minutes).\nGive a LOW estimate - assume optimal conditions with no interruptions or "
        "complications.\nIt's better to underestimate than overestimate.\nRound to the nearest " +
        std::to_string(interval) + " minutes. Minimum " + std::to_string(min_minutes) +
        " minutes.";

    auto reply = Complete(
        "You are a task duration estimator. Reply with only a number (minutes).", prompt, 50, 0.3);
    if (!reply) {
        return std::nullopt;
    }

    auto minutes = FirstNumber(*reply);
    if (!minutes) {
        spdlog::debug("OpenRouter duration reply has no number: '{}'", *reply);
        return std::nullopt;
    }
    spdlog::debug("OpenRouter estimate for '{}': {} minutes", title, *minutes);
    return minutes;
}

// ─────────────────────────────────────
std::optional<int> OpenRouter::EstimatePriority(const std::string &title,
                                                const std::string &description) {
    const std::string prompt = "Task: " + title + "\nDescription: " + description +
                               "\n\nDecide if this task is urgent or time-sensitive.\n"
                               "Reply with ONLY one number:\n"
                               "- 4 for urgent (Todoist P1)\n"
                               "- 2 for normal (Todoist P3)\n"
                               "Never reply with 3.";

    auto reply =
        Complete("You assign Todoist priorities. Reply only with 4 or 2.", prompt, 10, 0.2);
    if (!reply) {
        return std::nullopt;
    }

    auto value = FirstNumber(*reply);
    if (!value || (*value != 2 && *value != 4)) {
        return std::nullopt;
    }
    return value;
}
