#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

class JsonParse {
  public:
    int GetInt(const nlohmann::json &j, const std::string &key, int fallback);
    bool GetBool(const nlohmann::json &j, const std::string &key, bool fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);
    std::vector<std::string> JsonArray2String(const nlohmann::json &arr);
};
