/**
 * @file config_manager.cpp
 * @brief Override map backed by the process environment
 */

#include "taxid/common/config_manager.h"
#include "taxid/common/exceptions.h"
#include "taxid/utils/string_utils.h"
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace taxid {
namespace common {

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
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = config_.find(key);
        if (it != config_.end()) return it->second;
    }
    return getEnv(key, defaultValue);
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    const std::string raw = getString(key);
    if (raw.empty()) return defaultValue;

    const std::string flag = utils::toLower(utils::trim(raw));
    if (flag == "true" || flag == "1" || flag == "yes" || flag == "on") return true;
    if (flag == "false" || flag == "0" || flag == "no" || flag == "off") return false;

    throw ConfigException(key + "='" + raw + "' is not a boolean");
}

std::optional<std::string> ConfigManager::getOptional(const std::string& key) const {
    if (!has(key)) {
        return std::nullopt;
    }
    return getString(key);
}

bool ConfigManager::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.find(key) != config_.end() || std::getenv(key.c_str()) != nullptr;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::loadFromEnvironment() {
    int loaded = 0;
    for (const char* key : {LOG_LEVEL, LOG_FILE, OUTPUT_PRETTY, DEFAULT_SEPARATOR}) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
            ++loaded;
        }
    }
    spdlog::debug("ConfigManager loaded {} TAXID_* keys from the environment", loaded);
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

} // namespace common
} // namespace taxid
