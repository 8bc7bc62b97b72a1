#include <httplib.h>

#include "todoist.hpp"
#include "json.hpp"

#include <stdexcept>

namespace {
constexpr const char *kHost = "api.todoist.com";
constexpr int kPageLimit = 200;
constexpr size_t kMaxTasks = 2000;
constexpr int kMaxPages = 50;

// ─────────────────────────────────────
void ConfigureClient(httplib::SSLClient &client, const std::string &api_key) {
    client.enable_server_certificate_verification(true);
    client.set_default_headers({
        {"Authorization", "Bearer " + api_key},
    });
    client.set_connection_timeout(TODOIST_CONNECT_TIMEOUT, 0);
    client.set_read_timeout(TODOIST_IO_TIMEOUT, 0);
    client.set_write_timeout(TODOIST_IO_TIMEOUT, 0);
}
} // namespace

// ─────────────────────────────────────
TodoistClient::TodoistClient(std::string api_key) : m_ApiKey(std::move(api_key)) {
    if (m_ApiKey.empty()) {
        throw std::runtime_error("missing todoist api key");
    }
}

// ─────────────────────────────────────
std::vector<Task> TodoistClient::ListTasks() {
    httplib::SSLClient client(kHost, 443);
    ConfigureClient(client, m_ApiKey);

    std::vector<Task> tasks;
    std::string cursor;
    for (int page = 0; page < kMaxPages; ++page) {
        httplib::Params params{{"limit", std::to_string(kPageLimit)}};
        if (!cursor.empty()) {
            params.emplace("cursor", cursor);
        }

        auto res = client.Get("/api/v1/tasks", params, httplib::Headers{});
        if (!res) {
            throw std::runtime_error("todoist request failed: " + httplib::to_string(res.error()));
        }
        if (res->status < 200 || res->status >= 300) {
            throw std::runtime_error("todoist request failed: " + std::to_string(res->status));
        }

        nlohmann::json payload = nlohmann::json::parse(res->body);
        for (const auto &obj : ExtractResults(payload)) {
            if (!obj.is_object()) {
                continue;
            }
            tasks.push_back(NormalizeTask(obj));
        }

        if (tasks.size() >= kMaxTasks) {
            spdlog::warn("Todoist: stopping at {} tasks", tasks.size());
            break;
        }

        JsonParse parse;
        cursor = payload.is_object() ? parse.GetString(payload, "next_cursor", "") : "";
        if (cursor.empty()) {
            break;
        }
    }

    spdlog::debug("Todoist: fetched {} tasks", tasks.size());
    return tasks;
}

// ─────────────────────────────────────
void TodoistClient::UpdateTask(const std::string &id, const TaskUpdate &update) {
    if (update.Empty()) {
        return;
    }
    Post("/api/v1/tasks/" + id, UpdateBody(update));
    spdlog::debug("Todoist: updated task {}", id);
}

// ─────────────────────────────────────
void TodoistClient::CompleteTask(const std::string &id) {
    Post("/api/v1/tasks/" + id + "/close", nlohmann::json::object());
    spdlog::info("Todoist: completed task {}", id);
}

// ─────────────────────────────────────
void TodoistClient::Post(const std::string &path, const nlohmann::json &body) {
    httplib::SSLClient client(kHost, 443);
    ConfigureClient(client, m_ApiKey);

    auto res = client.Post(path, body.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("todoist request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw std::runtime_error("todoist request failed: " + std::to_string(res->status) + " " +
                                 res->body);
    }
}

// ─────────────────────────────────────
nlohmann::json TodoistClient::ExtractResults(const nlohmann::json &payload) {
    if (payload.is_array()) {
        return payload;
    }
    if (payload.is_object()) {
        if (payload.contains("results") && payload["results"].is_array()) {
            return payload["results"];
        }
        if (payload.contains("items") && payload["items"].is_array()) {
            return payload["items"];
        }
    }
    return nlohmann::json::array();
}

// ─────────────────────────────────────
std::optional<TaskDue> TodoistClient::NormalizeDue(const nlohmann::json &due) {
    if (!due.is_object()) {
        return std::nullopt;
    }

    JsonParse parse;
    std::string date = parse.GetString(due, "datetime", "");
    if (date.empty()) {
        date = parse.GetString(due, "date", "");
    }
    if (date.empty()) {
        return std::nullopt;
    }

    TaskDue out;
    if (auto when = ParseDatetime(date)) {
        out.date = DateOf(*when);
        out.time = TimeOfDay(*when);
    } else if (auto day = ParseDate(date)) {
        out.date = *day;
    } else {
        spdlog::warn("Todoist: unparsable due date '{}'", date);
        return std::nullopt;
    }

    out.is_recurring = parse.GetBool(due, "is_recurring", false);
    out.recurrence = parse.GetString(due, "string", "");
    return out;
}

// ─────────────────────────────────────
Task TodoistClient::NormalizeTask(const nlohmann::json &obj) {
    JsonParse parse;
    Task task;

    if (obj.contains("id") && obj["id"].is_number_integer()) {
        task.id = std::to_string(obj["id"].get<long long>());
    } else {
        task.id = parse.GetString(obj, "id", "");
    }
    task.content = parse.GetString(obj, "content", "");
    task.description = parse.GetString(obj, "description", "");
    task.priority = parse.GetInt(obj, "priority", 1);
    task.labels = parse.JsonArray2String(obj.contains("labels") ? obj["labels"]
                                                                : nlohmann::json::array());

    const bool checked = parse.GetBool(obj, "checked", false) ||
                         parse.GetBool(obj, "is_completed", false);
    const bool has_completed_at = obj.contains("completed_at") && !obj["completed_at"].is_null();
    task.completed = checked || has_completed_at;

    if (obj.contains("due")) {
        task.due = NormalizeDue(obj["due"]);
    }
    return task;
}

// ─────────────────────────────────────
nlohmann::json TodoistClient::UpdateBody(const TaskUpdate &update) {
    nlohmann::json body = nlohmann::json::object();
    if (update.due_datetime) {
        body["due_datetime"] = FormatDatetime(*update.due_datetime);
    }
    if (update.due_string) {
        body["due_string"] = *update.due_string;
    }
    if (update.description) {
        body["description"] = *update.description;
    }
    if (update.priority) {
        body["priority"] = *update.priority;
    }
    return body;
}
