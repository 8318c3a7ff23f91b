/**
 * @file config_manager.h
 * @brief Process-wide settings for taxid tools
 *
 * Values come from runtime overrides first, then the environment. The
 * TAXID_* keys below are copied from the environment at first use.
 */

#pragma once

#include <string>
#include <map>
#include <optional>
#include <mutex>
#include <memory>

namespace taxid {
namespace common {

class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /// @brief Override, else environment, else @p defaultValue
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Boolean value
     *
     * true/false, 1/0, yes/no, on/off (case-insensitive); @p defaultValue
     * when unset.
     * @throws ConfigException for any other spelling
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /// @brief Value only when set as an override or in the environment
    std::optional<std::string> getOptional(const std::string& key) const;

    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /// @brief Drop a runtime override (the environment is untouched)
    void unset(const std::string& key);

    /// @brief Copy the TAXID_* keys from the environment into the override map
    void loadFromEnvironment();

    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    // Keys
    static constexpr const char* LOG_LEVEL = "TAXID_LOG_LEVEL";                  ///< spdlog level name
    static constexpr const char* LOG_FILE = "TAXID_LOG_FILE";                    ///< rotating log file path
    static constexpr const char* OUTPUT_PRETTY = "TAXID_OUTPUT_PRETTY";          ///< indent CLI JSON
    static constexpr const char* DEFAULT_SEPARATOR = "TAXID_DEFAULT_SEPARATOR";  ///< CLI format separator
};

} // namespace common
} // namespace taxid
