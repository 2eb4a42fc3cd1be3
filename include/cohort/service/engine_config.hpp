#pragma once
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace cohort {

struct EngineConfig {
  // Session defaults
  int default_threshold;
  int min_participants;
  int max_participants;

  // Orchestration policy: non-terminal sessions older than this are expired
  int session_timeout_seconds;

  // Persistence ("" keeps sessions in memory)
  std::string store_directory;

  // Audit trail ("" keeps entries in memory only)
  std::string audit_log_path;

  EngineConfig(const std::string &configFile = "cohort.json") {
    // Set defaults
    default_threshold = 2;
    min_participants = 2;
    max_participants = 1000;
    session_timeout_seconds = 3600;
    store_directory = "";
    audit_log_path = "";

    // Try to load from config file
    std::ifstream file(configFile);
    if (file.is_open()) {
      try {
        nlohmann::json config;
        file >> config;

        if (config.contains("default_threshold")) default_threshold = config["default_threshold"];
        if (config.contains("min_participants")) min_participants = config["min_participants"];
        if (config.contains("max_participants")) max_participants = config["max_participants"];
        if (config.contains("session_timeout_seconds")) session_timeout_seconds = config["session_timeout_seconds"];
        if (config.contains("store_directory")) store_directory = config["store_directory"];
        if (config.contains("audit_log_path")) audit_log_path = config["audit_log_path"];

        validate();
      } catch (const std::exception &e) {
        throw std::runtime_error("Failed to load config from " + configFile + ": " + e.what());
      }
    } else {
      validate();
    }
  }

private:
  void validate() {
    if (min_participants < 1) {
      throw std::invalid_argument("Invalid min_participants: " + std::to_string(min_participants) + ". Must be >= 1");
    }

    if (max_participants < min_participants) {
      throw std::invalid_argument("Invalid max_participants: " + std::to_string(max_participants) + ". Must be >= min_participants (" + std::to_string(min_participants) + ")");
    }

    if (max_participants > 1000) {
      throw std::invalid_argument("Invalid max_participants: " + std::to_string(max_participants) + ". Must be <= 1000");
    }

    if (default_threshold < 1 || default_threshold > min_participants) {
      throw std::invalid_argument("Invalid default_threshold: " + std::to_string(default_threshold) + ". Must be 1-min_participants (" + std::to_string(min_participants) + ")");
    }

    if (session_timeout_seconds < 1) {
      throw std::invalid_argument("Invalid session_timeout_seconds: " + std::to_string(session_timeout_seconds) + ". Must be >= 1");
    }
  }
};

} // namespace cohort
