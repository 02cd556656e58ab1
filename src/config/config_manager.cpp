/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "brdocs/config/config_manager.h"
#include "brdocs/utils/string_utils.h"

#include <cstdlib>
#include <limits>

#include <spdlog/spdlog.h>

namespace brdocs {

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_.find(key);
    if (it != config_.end()) {
        return it->second;
    }

    const char* env = std::getenv(key.c_str());
    if (env) {
        return std::string(env);
    }

    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::string value = getString(key);
    if (utils::isBlank(value)) {
        return defaultValue;
    }

    auto parsed = utils::parseInteger(value);
    if (!parsed || *parsed < std::numeric_limits<int>::min() || *parsed > std::numeric_limits<int>::max()) {
        spdlog::warn("Failed to parse integer config '{}': {} (using default: {})",
                     key, value, defaultValue);
        return defaultValue;
    }
    return static_cast<int>(*parsed);
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    const std::string lowerValue = utils::toLower(utils::trim(value));

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    } else if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})",
                 key, value, defaultValue);
    return defaultValue;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
    spdlog::debug("Config set: {} = {}", key, value);
}

void ConfigManager::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::loadFromEnvironment() {
    for (const char* key : {LOG_LEVEL, LOG_FILE, DEFAULT_HINT, OUTPUT_STYLE, OUTPUT_JSON, BENCH_COUNT}) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
        }
    }
}

} // namespace brdocs
