#pragma once

/**
 * @file config_manager.hpp
 * @brief Configuration Manager - Load/Save talkgraph.json
 *
 * Handles:
 * - Built-in defaults
 * - Loading a JSON config file on top of the defaults
 * - Saving the current configuration atomically
 * - Applying the logging section to the Logger
 */

#include "TalkGraph/core/result.hpp"
#include "TalkGraph/runtime/runtime_config.hpp"
#include <functional>
#include <string>

namespace TalkGraph::runtime {

/**
 * @brief Callback for configuration changes
 */
using ConfigChangeCallback = std::function<void(const TalkConfig&)>;

/**
 * @brief Configuration Manager
 *
 * Keys missing from a config file keep their current values, so a file
 * only needs to mention what it overrides. A key with the wrong JSON type
 * is an error naming that key; on error the configuration is unchanged.
 */
class ConfigManager {
public:
  ConfigManager() = default;
  ~ConfigManager() = default;

  // Non-copyable
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  /**
   * @brief Load a config file on top of the current configuration
   * @return Success or error message
   */
  Result<void> loadFromFile(const std::string& path);

  /**
   * @brief Apply a JSON document on top of the current configuration
   */
  Result<void> parseJson(const std::string& json);

  /**
   * @brief Write the configuration (temp file, then rename)
   */
  Result<void> saveToFile(const std::string& path) const;

  [[nodiscard]] std::string serializeToJson() const;

  [[nodiscard]] const TalkConfig& getConfig() const { return m_config; }
  TalkConfig& getConfigMutable() { return m_config; }

  void resetToDefaults();

  /**
   * @brief Configure the Logger from the logging section
   * @return Error if the level name is unknown or the log file can't be opened
   */
  Result<void> applyLogging() const;

  void setOnConfigChanged(ConfigChangeCallback callback);
  void notifyConfigChanged();

  // Convenience setters
  void setLogLevel(const std::string& level);
  void setHonourEndFlag(bool honour);
  void setWarningsAsErrors(bool enabled);
  void setNarratorName(const std::string& name);

private:
  TalkConfig m_config;
  ConfigChangeCallback m_onConfigChanged;
};

} // namespace TalkGraph::runtime
