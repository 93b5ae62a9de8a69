/**
 * @file config_manager.cpp
 * @brief Configuration Manager implementation
 */

#include "TalkGraph/runtime/config_manager.hpp"
#include "TalkGraph/core/logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace TalkGraph::runtime {

namespace {

using json = nlohmann::json;

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

const json* section(const json& root, const char* key) {
  auto it = root.find(key);
  if (it == root.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("'") + key + "' must be an object");
  }
  return &*it;
}

void readBool(const json& obj, const char* sectionName, const char* key, bool& out) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  if (!it->is_boolean()) {
    throw ConfigError(std::string("'") + sectionName + "." + key + "' must be a boolean");
  }
  out = it->get<bool>();
}

void readOptionalBool(const json& obj, const char* sectionName, const char* key,
                      std::optional<bool>& out) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  if (it->is_null()) {
    out.reset();
    return;
  }
  if (!it->is_boolean()) {
    throw ConfigError(std::string("'") + sectionName + "." + key + "' must be a boolean");
  }
  out = it->get<bool>();
}

void readString(const json& obj, const char* sectionName, const char* key, std::string& out) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  if (!it->is_string()) {
    throw ConfigError(std::string("'") + sectionName + "." + key + "' must be a string");
  }
  out = it->get<std::string>();
}

} // namespace

Result<void> ConfigManager::loadFromFile(const std::string& path) {
  std::error_code ec;
  const bool found = fs::exists(path, ec);
  if (ec) {
    return Result<void>::error("Cannot access file: " + path + " (" + ec.message() + ")");
  }
  if (!found) {
    return Result<void>::error("File not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<void>::error("Cannot open file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto result = parseJson(buffer.str());
  if (result.isError()) {
    return Result<void>::error(path + ": " + result.error());
  }

  TALKGRAPH_LOG_INFO("Configuration loaded from " + path);
  return Result<void>::ok();
}

Result<void> ConfigManager::parseJson(const std::string& text) {
  TalkConfig config = m_config;

  try {
    json root = json::parse(text);
    if (!root.is_object()) {
      return Result<void>::error("Config document must be a JSON object");
    }

    if (auto it = root.find("version"); it != root.end()) {
      if (!it->is_string()) {
        return Result<void>::error("'version' must be a string");
      }
      config.version = it->get<std::string>();
    }

    if (const json* logging = section(root, "logging")) {
      readString(*logging, "logging", "level", config.logging.level);
      readBool(*logging, "logging", "log_to_file", config.logging.logToFile);
      readString(*logging, "logging", "log_file", config.logging.logFile);
      readOptionalBool(*logging, "logging", "use_colors", config.logging.useColors);

      if (!core::parseLogLevel(config.logging.level).has_value()) {
        return Result<void>::error("'logging.level' has unknown value '" + config.logging.level +
                                   "'");
      }
    }

    if (const json* compile = section(root, "compile")) {
      readBool(*compile, "compile", "honour_end_flag", config.compile.honourEndFlag);
      readBool(*compile, "compile", "run_validator", config.compile.runValidator);
      readBool(*compile, "compile", "warnings_as_errors", config.compile.warningsAsErrors);
      readBool(*compile, "compile", "report_unused", config.compile.reportUnused);
      readBool(*compile, "compile", "report_unreachable", config.compile.reportUnreachable);
    }

    if (const json* player = section(root, "player")) {
      readString(*player, "player", "narrator_name", config.player.narratorName);
      readBool(*player, "player", "show_choice_numbers", config.player.showChoiceNumbers);
      readBool(*player, "player", "mark_seen_lines", config.player.markSeenLines);
    }
  } catch (const ConfigError& e) {
    return Result<void>::error(e.what());
  } catch (const json::exception& e) {
    return Result<void>::error(std::string("Invalid JSON: ") + e.what());
  }

  m_config = std::move(config);
  notifyConfigChanged();
  return Result<void>::ok();
}

Result<void> ConfigManager::saveToFile(const std::string& path) const {
  try {
    fs::path target(path);
    if (target.has_parent_path()) {
      fs::create_directories(target.parent_path());
    }

    // Write atomically (write to temp, then rename)
    std::string tempPath = path + ".tmp";
    {
      std::ofstream file(tempPath);
      if (!file.is_open()) {
        return Result<void>::error("Cannot open file for writing: " + path);
      }
      file << serializeToJson();
    }
    fs::rename(tempPath, path);

    TALKGRAPH_LOG_INFO("Configuration saved to " + path);
    return Result<void>::ok();
  } catch (const std::exception& e) {
    return Result<void>::error(std::string("Failed to save config: ") + e.what());
  }
}

std::string ConfigManager::serializeToJson() const {
  json root = {
      {"version", m_config.version},
      {"logging",
       {{"level", m_config.logging.level},
        {"log_to_file", m_config.logging.logToFile},
        {"log_file", m_config.logging.logFile}}},
      {"compile",
       {{"honour_end_flag", m_config.compile.honourEndFlag},
        {"run_validator", m_config.compile.runValidator},
        {"warnings_as_errors", m_config.compile.warningsAsErrors},
        {"report_unused", m_config.compile.reportUnused},
        {"report_unreachable", m_config.compile.reportUnreachable}}},
      {"player",
       {{"narrator_name", m_config.player.narratorName},
        {"show_choice_numbers", m_config.player.showChoiceNumbers},
        {"mark_seen_lines", m_config.player.markSeenLines}}},
  };
  if (m_config.logging.useColors.has_value()) {
    root["logging"]["use_colors"] = *m_config.logging.useColors;
  }
  return root.dump(2);
}

void ConfigManager::resetToDefaults() {
  m_config = TalkConfig();
  notifyConfigChanged();
}

Result<void> ConfigManager::applyLogging() const {
  auto level = core::parseLogLevel(m_config.logging.level);
  if (!level.has_value()) {
    return Result<void>::error("Unknown log level: " + m_config.logging.level);
  }

  auto& logger = core::Logger::instance();
  logger.setLevel(*level);
  if (m_config.logging.useColors.has_value()) {
    logger.setUseColors(*m_config.logging.useColors);
  }

  if (m_config.logging.logToFile) {
    if (!logger.setOutputFile(m_config.logging.logFile)) {
      return Result<void>::error("Cannot open log file: " + m_config.logging.logFile);
    }
  } else {
    logger.closeOutputFile();
  }
  return Result<void>::ok();
}

void ConfigManager::setOnConfigChanged(ConfigChangeCallback callback) {
  m_onConfigChanged = std::move(callback);
}

void ConfigManager::notifyConfigChanged() {
  if (m_onConfigChanged) {
    m_onConfigChanged(m_config);
  }
}

void ConfigManager::setLogLevel(const std::string& level) {
  m_config.logging.level = level;
  notifyConfigChanged();
}

void ConfigManager::setHonourEndFlag(bool honour) {
  m_config.compile.honourEndFlag = honour;
  notifyConfigChanged();
}

void ConfigManager::setWarningsAsErrors(bool enabled) {
  m_config.compile.warningsAsErrors = enabled;
  notifyConfigChanged();
}

void ConfigManager::setNarratorName(const std::string& name) {
  m_config.player.narratorName = name;
  notifyConfigChanged();
}

} // namespace TalkGraph::runtime
