#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace octant {

struct FileSinkConfig_t {
  bool enabled = false;
  std::string path = "logs/octant.log";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

// Per-component log files, one per GetClass() name.
struct ClassSinkConfig_t {
  bool enabled = false;
  std::string directory = "logs/components";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

class Logger {
 public:
  static void Initialize();
  static std::shared_ptr<spdlog::logger> Get();
  static std::shared_ptr<spdlog::logger> GetClass(const std::string& name);
  static void SetEnabled(bool enabled);
  static void SetLevel(spdlog::level::level_enum level);
  static spdlog::level::level_enum ParseLevel(const std::string& value);
  static void ConfigureFileSink(const FileSinkConfig_t& config);
  static void ConfigureClassSink(const ClassSinkConfig_t& config);
  // Applies the "logging" section of a configuration document.
  static void Configure(const nlohmann::json& loggingNode);
};

} // namespace octant
