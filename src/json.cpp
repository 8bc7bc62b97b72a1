#include "json.hpp"

// ─────────────────────────────────────
int JsonParse::GetInt(const nlohmann::json &j, const std::string &key, int fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (j.at(key).is_number_integer()) {
        return j.at(key).get<int>();
    }
    if (j.at(key).is_number()) {
        int val = static_cast<int>(j.at(key).get<double>());
        spdlog::debug("JsonParse: Converted double to int for key '{}': {}", key, val);
        return val;
    }
    spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
bool JsonParse::GetBool(const nlohmann::json &j, const std::string &key, bool fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (j.at(key).is_boolean()) {
        return j.at(key).get<bool>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a boolean, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback '{}'", key, fallback);
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    if (!j.at(key).is_null()) {
        spdlog::warn("JsonParse: Key '{}' is not a string, using fallback '{}'", key, fallback);
    }
    return fallback;
}

// ─────────────────────────────────────
std::vector<std::string> JsonParse::JsonArray2String(const nlohmann::json &arr) {
    std::vector<std::string> out;
    if (!arr.is_array()) {
        if (!arr.is_null()) {
            spdlog::warn("JsonParse: Expected array, got {}", arr.type_name());
        }
        return out;
    }
    for (const auto &v : arr) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        } else {
            spdlog::warn("JsonParse: Array element is not string, skipping");
        }
    }
    spdlog::debug("JsonParse: Converted array to {} strings", out.size());
    return out;
}
