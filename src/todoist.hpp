#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "task.hpp"

#define TODOIST_CONNECT_TIMEOUT 3 // seconds
#define TODOIST_IO_TIMEOUT 10     // seconds, read and write

class TodoistClient : public TaskStore {
  public:
    explicit TodoistClient(std::string api_key);

    std::vector<Task> ListTasks() override;
    void UpdateTask(const std::string &id, const TaskUpdate &update) override;
    void CompleteTask(const std::string &id) override;

    static Task NormalizeTask(const nlohmann::json &obj);
    static nlohmann::json UpdateBody(const TaskUpdate &update);

  private:
    static std::optional<TaskDue> NormalizeDue(const nlohmann::json &due);
    static nlohmann::json ExtractResults(const nlohmann::json &payload);
    void Post(const std::string &path, const nlohmann::json &body);

    std::string m_ApiKey;
};
