#include "octant/core/Logger.hpp"

#include <filesystem>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace octant {

namespace {

constexpr const char* kLoggerName = "octant";
constexpr const char* kPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> gLogger;
bool gEnabled = true;
spdlog::level::level_enum gLevel = spdlog::level::info;
FileSinkConfig_t gFileConfig{};
ClassSinkConfig_t gClassConfig{};
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> gClassLoggers;

void DropClassLoggers() {
  for (const auto& entry : gClassLoggers) {
    spdlog::drop(entry.first);
  }
  gClassLoggers.clear();
}

void BuildLogger() {
  spdlog::drop(kLoggerName);
  gLogger.reset();
  if (!gEnabled) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (gFileConfig.enabled) {
    const std::filesystem::path logPath(gFileConfig.path);
    if (logPath.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(logPath.parent_path(), ec);
    }
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          gFileConfig.path, gFileConfig.maxSizeBytes, gFileConfig.maxFiles));
    } catch (const spdlog::spdlog_ex& ex) {
      spdlog::warn("octant: file sink '{}' unavailable ({}), logging to stdout only", gFileConfig.path, ex.what());
    }
  }

  gLogger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  gLogger->set_pattern(kPattern);
  gLogger->set_level(gLevel);
  spdlog::register_logger(gLogger);
}

std::shared_ptr<spdlog::logger> BuildClassLogger(const std::string& name) {
  const std::filesystem::path dir(gClassConfig.directory);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  const std::filesystem::path path = dir / (name + ".log");
  try {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path.string(), gClassConfig.maxSizeBytes, gClassConfig.maxFiles);
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_pattern(kPattern);
    logger->set_level(gLevel);
    spdlog::register_logger(logger);
    return logger;
  } catch (const spdlog::spdlog_ex&) {
    return nullptr;
  }
}

} // namespace

void Logger::Initialize() {
  if (!gLogger && gEnabled) {
    BuildLogger();
  }
}

std::shared_ptr<spdlog::logger> Logger::Get() {
  if (!gEnabled) {
    return nullptr;
  }
  if (!gLogger) {
    Initialize();
  }
  return gLogger;
}

std::shared_ptr<spdlog::logger> Logger::GetClass(const std::string& name) {
  if (!gEnabled || !gClassConfig.enabled) {
    return Get();
  }
  auto it = gClassLoggers.find(name);
  if (it != gClassLoggers.end()) {
    return it->second;
  }
  auto logger = BuildClassLogger(name);
  if (!logger) {
    return Get();
  }
  gClassLoggers[name] = logger;
  return logger;
}

void Logger::SetEnabled(bool enabled) {
  gEnabled = enabled;
  DropClassLoggers();
  BuildLogger();
}

void Logger::SetLevel(spdlog::level::level_enum level) {
  gLevel = level;
  if (gLogger) {
    gLogger->set_level(level);
  }
  for (auto& entry : gClassLoggers) {
    entry.second->set_level(level);
  }
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& value) {
  if (value == "trace") {
    return spdlog::level::trace;
  }
  if (value == "debug") {
    return spdlog::level::debug;
  }
  if (value == "warn" || value == "warning") {
    return spdlog::level::warn;
  }
  if (value == "error") {
    return spdlog::level::err;
  }
  if (value == "critical") {
    return spdlog::level::critical;
  }
  if (value == "off") {
    return spdlog::level::off;
  }
  return spdlog::level::info;
}

void Logger::ConfigureFileSink(const FileSinkConfig_t& config) {
  gFileConfig = config;
  BuildLogger();
}

void Logger::ConfigureClassSink(const ClassSinkConfig_t& config) {
  gClassConfig = config;
  DropClassLoggers();
}

void Logger::Configure(const nlohmann::json& loggingNode) {
  if (!loggingNode.is_object()) {
    return;
  }
  const auto fileNode = loggingNode.value("file", nlohmann::json::object());
  FileSinkConfig_t fileConfig;
  fileConfig.enabled = fileNode.value("enabled", fileConfig.enabled);
  fileConfig.path = fileNode.value("path", fileConfig.path);
  fileConfig.maxSizeBytes = fileNode.value("maxSizeBytes", fileConfig.maxSizeBytes);
  fileConfig.maxFiles = fileNode.value("maxFiles", fileConfig.maxFiles);

  const auto classNode = loggingNode.value("componentLogs", nlohmann::json::object());
  ClassSinkConfig_t classConfig;
  classConfig.enabled = classNode.value("enabled", classConfig.enabled);
  classConfig.directory = classNode.value("directory", classConfig.directory);
  classConfig.maxSizeBytes = classNode.value("maxSizeBytes", classConfig.maxSizeBytes);
  classConfig.maxFiles = classNode.value("maxFiles", classConfig.maxFiles);

  gEnabled = loggingNode.value("enabled", true);
  gLevel = ParseLevel(loggingNode.value("level", std::string("info")));
  ConfigureClassSink(classConfig);
  ConfigureFileSink(fileConfig);
}

} // namespace octant
