/**
 * @file config_manager.h
 * @brief Centralized configuration for brdocs front-ends
 *
 * Features:
 * - Environment fallback with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace brdocs {

/**
 * @brief Configuration Manager (Singleton)
 *
 * Values set explicitly take precedence over the environment.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparseable values log a warning and yield defaultValue.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/1/yes/on and false/0/no/off in any case.
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    void set(const std::string& key, const std::string& value);

    /// @brief Drop an explicitly set value; the environment still applies
    void remove(const std::string& key);

    /**
     * @brief Load the recognized keys from the environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys

    // Logging
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";

    // Document handling
    static constexpr const char* DEFAULT_HINT = "BRDOCS_DEFAULT_HINT";
    static constexpr const char* OUTPUT_STYLE = "BRDOCS_OUTPUT_STYLE";
    static constexpr const char* OUTPUT_JSON = "BRDOCS_OUTPUT_JSON";

    // Benchmark
    static constexpr const char* BENCH_COUNT = "BRDOCS_BENCH_COUNT";
};

} // namespace brdocs
