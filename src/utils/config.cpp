#include "shop/utils/config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace shop::utils {

namespace {
bool isTruthy(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

bool isFalsy(const std::string& value) {
    return value == "false" || value == "0" || value == "no";
}

// Scalar JSON values are stored in their textual form
std::string scalarToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}
}  // namespace

Expected<void, ConfigError> Config::loadFromFile(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        return ConfigError::FILE_NOT_FOUND;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return loadFromJson(buffer.str());
}

Expected<void, ConfigError> Config::loadFromJson(std::string_view json_string) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_string.begin(), json_string.end());
    } catch (const nlohmann::json::parse_error&) {
        return ConfigError::INVALID_JSON;
    }

    if (!root.is_object()) {
        return ConfigError::INVALID_JSON;
    }

    Config loaded;
    loaded.flatten(root, "");
    *this = std::move(loaded);
    return {};
}

void Config::flatten(const nlohmann::json& object, const std::string& prefix) {
    for (const auto& [key, value] : object.items()) {
        std::string full_key = prefix.empty() ? key : prefix + "." + key;
        if (value.is_object()) {
            auto section = std::make_shared<Config>();
            section->flatten(value, "");
            sections_[full_key] = section;
            flatten(value, full_key);
        } else {
            config_data_[full_key] = scalarToString(value);
        }
    }
}

Expected<std::string, ConfigError> Config::getString(std::string_view key) const {
    return getValue(key);
}

Expected<int, ConfigError> Config::getInt(std::string_view key) const {
    auto result = getValue(key);
    if (!result) {
        return result.error();
    }

    try {
        std::size_t consumed = 0;
        int value = std::stoi(result.value(), &consumed);
        if (consumed != result.value().size()) {
            return ConfigError::TYPE_MISMATCH;
        }
        return value;
    } catch (const std::logic_error&) {
        return ConfigError::TYPE_MISMATCH;
    }
}

Expected<double, ConfigError> Config::getDouble(std::string_view key) const {
    auto result = getValue(key);
    if (!result) {
        return result.error();
    }

    try {
        return std::stod(result.value());
    } catch (const std::logic_error&) {
        return ConfigError::TYPE_MISMATCH;
    }
}

Expected<bool, ConfigError> Config::getBool(std::string_view key) const {
    auto result = getValue(key);
    if (!result) {
        return result.error();
    }

    const std::string& value = result.value();
    if (isTruthy(value)) {
        return true;
    }
    if (isFalsy(value)) {
        return false;
    }
    return ConfigError::TYPE_MISMATCH;
}

std::string Config::getString(std::string_view key, std::string_view default_value) const {
    auto it = config_data_.find(key);
    return (it != config_data_.end()) ? it->second : std::string(default_value);
}

int Config::getInt(std::string_view key, int default_value) const noexcept {
    auto result = getInt(key);
    return result ? result.value() : default_value;
}

double Config::getDouble(std::string_view key, double default_value) const noexcept {
    auto result = getDouble(key);
    return result ? result.value() : default_value;
}

bool Config::getBool(std::string_view key, bool default_value) const noexcept {
    auto result = getBool(key);
    return result ? result.value() : default_value;
}

void Config::setString(std::string_view key, std::string_view value) {
    config_data_[std::string(key)] = std::string(value);
}

void Config::setInt(std::string_view key, int value) {
    config_data_[std::string(key)] = std::to_string(value);
}

void Config::setDouble(std::string_view key, double value) {
    config_data_[std::string(key)] = std::to_string(value);
}

void Config::setBool(std::string_view key, bool value) {
    config_data_[std::string(key)] = value ? "true" : "false";
}

bool Config::hasKey(std::string_view key) const {
    return config_data_.contains(key);
}

std::vector<std::string> Config::getKeys() const {
    std::vector<std::string> keys;
    keys.reserve(config_data_.size());
    for (const auto& [key, value] : config_data_) {
        keys.push_back(key);
    }
    return keys;
}

void Config::clear() noexcept {
    config_data_.clear();
    sections_.clear();
}

Expected<std::shared_ptr<Config>, ConfigError> Config::getSection(
    std::string_view section_name) const {
    auto it = sections_.find(section_name);
    if (it != sections_.end()) {
        return it->second;
    }
    return ConfigError::KEY_NOT_FOUND;
}

Expected<std::string, ConfigError> Config::getValue(std::string_view key) const {
    auto it = config_data_.find(key);
    if (it != config_data_.end()) {
        return it->second;
    }
    return ConfigError::KEY_NOT_FOUND;
}

}  // namespace shop::utils
