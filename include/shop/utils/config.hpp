#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "expected.hpp"

namespace shop::utils {

enum class ConfigError : std::uint8_t {
    FILE_NOT_FOUND,
    INVALID_JSON,
    KEY_NOT_FOUND,
    TYPE_MISMATCH
};

inline const char* configErrorToString(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ConfigError::INVALID_JSON:
            return "INVALID_JSON";
        case ConfigError::KEY_NOT_FOUND:
            return "KEY_NOT_FOUND";
        case ConfigError::TYPE_MISMATCH:
            return "TYPE_MISMATCH";
    }
    return "UNKNOWN";
}

// Flat key/value configuration loaded from JSON.
// Nested objects are flattened into dotted keys ({"http":{"port":8080}} -> "http.port")
// and are also reachable as sections ("http" -> Config with key "port").
class Config {
  public:
    Config() = default;
    ~Config() = default;

    Config(const Config&) = default;
    Config& operator=(const Config&) = default;
    Config(Config&&) = default;
    Config& operator=(Config&&) = default;

    // Loading replaces any previously loaded content only on success
    [[nodiscard]] Expected<void, ConfigError> loadFromFile(const std::string& config_file);
    [[nodiscard]] Expected<void, ConfigError> loadFromJson(std::string_view json_string);

    [[nodiscard]] Expected<std::string, ConfigError> getString(std::string_view key) const;
    [[nodiscard]] Expected<int, ConfigError> getInt(std::string_view key) const;
    [[nodiscard]] Expected<double, ConfigError> getDouble(std::string_view key) const;
    [[nodiscard]] Expected<bool, ConfigError> getBool(std::string_view key) const;

    [[nodiscard]] std::string getString(std::string_view key, std::string_view default_value) const;
    [[nodiscard]] int getInt(std::string_view key, int default_value) const noexcept;
    [[nodiscard]] double getDouble(std::string_view key, double default_value) const noexcept;
    [[nodiscard]] bool getBool(std::string_view key, bool default_value) const noexcept;

    void setString(std::string_view key, std::string_view value);
    void setInt(std::string_view key, int value);
    void setDouble(std::string_view key, double value);
    void setBool(std::string_view key, bool value);

    [[nodiscard]] bool hasKey(std::string_view key) const;
    [[nodiscard]] std::vector<std::string> getKeys() const;
    void clear() noexcept;

    [[nodiscard]] Expected<std::shared_ptr<Config>, ConfigError> getSection(
        std::string_view section_name) const;

  private:
    std::map<std::string, std::string, std::less<>> config_data_;
    std::map<std::string, std::shared_ptr<Config>, std::less<>> sections_;

    [[nodiscard]] Expected<std::string, ConfigError> getValue(std::string_view key) const;
    void flatten(const nlohmann::json& object, const std::string& prefix);
};

}  // namespace shop::utils
